#pragma once

#include "SliceRender/SliceTypes.h"
#include <glm/glm.hpp>

namespace Octaview::SliceRender {

constexpr float DEFAULT_FOV = 0.2f;       // vertical, radians
constexpr float NEAR_PLANE = 0.1f;
constexpr float FAR_PLANE = 100.0f;

/**
 * Immutable camera snapshot supplied once per frame.
 *
 * The view matrix is T(translation) * Ry(yRotation) * Rx(xRotation) and maps
 * world points into camera space, where the camera looks down -z.
 */
struct CameraState {
    glm::vec3 translation{0.0f, 0.0f, -6.0f};
    float xRotation = 0.0f;  // pitch, radians
    float yRotation = 0.0f;  // yaw, radians
};

glm::mat4 makeViewMatrix(const CameraState& camera);

glm::mat4 makeProjectionMatrix(float fov, const Viewport& viewport);

// World-space direction the camera looks along (unit length).
glm::vec3 viewDirection(const CameraState& camera);

// World-space position of the camera eye.
glm::vec3 cameraPosition(const CameraState& camera);

} // namespace Octaview::SliceRender
