#include "SliceRender/SliceCamera.h"
#include <glm/gtc/matrix_transform.hpp>

namespace Octaview::SliceRender {

glm::mat4 makeViewMatrix(const CameraState& camera) {
    glm::mat4 view = glm::translate(glm::mat4(1.0f), camera.translation);
    view = glm::rotate(view, camera.yRotation, glm::vec3(0.0f, 1.0f, 0.0f));
    view = glm::rotate(view, camera.xRotation, glm::vec3(1.0f, 0.0f, 0.0f));
    return view;
}

glm::mat4 makeProjectionMatrix(float fov, const Viewport& viewport) {
    const float aspect = viewport.height > 0
        ? static_cast<float>(viewport.width) / static_cast<float>(viewport.height)
        : 1.0f;
    return glm::perspective(fov, aspect, NEAR_PLANE, FAR_PLANE);
}

glm::vec3 viewDirection(const CameraState& camera) {
    const glm::mat4 cameraToWorld = glm::inverse(makeViewMatrix(camera));
    return glm::normalize(glm::vec3(cameraToWorld * glm::vec4(0.0f, 0.0f, -1.0f, 0.0f)));
}

glm::vec3 cameraPosition(const CameraState& camera) {
    const glm::mat4 cameraToWorld = glm::inverse(makeViewMatrix(camera));
    return glm::vec3(cameraToWorld * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
}

} // namespace Octaview::SliceRender
