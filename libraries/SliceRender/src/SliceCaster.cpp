#include "SliceRender/SliceCaster.h"

namespace Octaview::SliceRender {

const char* CastStatusToString(CastStatus status) {
    switch (status) {
        case CastStatus::Hit:              return "Hit";
        case CastStatus::ColumnEmpty:      return "ColumnEmpty";
        case CastStatus::OutsideFootprint: return "OutsideFootprint";
    }
    return "Unknown";
}

CastParameters CastParameters::FromCamera(const CameraState& camera, float fov,
                                          const Viewport& viewport, const SliceGeometry& geometry) {
    CastParameters params;
    params.projection = makeProjectionMatrix(fov, viewport);
    params.view = makeViewMatrix(camera);
    params.viewport = viewport;
    params.geometry = geometry;
    return params;
}

std::optional<uint32_t> firstOpaqueInColumn(const Slice& slice, uint32_t x, uint32_t y) {
    for (uint32_t z = 0; z < SLICE_DIM; ++z) {
        if (slice[sliceIndex(x, y, z)] > 0) {
            return z;
        }
    }
    return std::nullopt;
}

SliceCaster::SliceCaster(const Slice& slice, const CastParameters& params,
                         const CasterPalette& palette)
    : m_slice(slice)
    , m_params(params)
    , m_palette(palette)
{
    m_inverseProjection = glm::inverse(params.projection);
    m_cameraOrigin = glm::vec3(params.view * glm::vec4(params.geometry.origin, 1.0f));
    m_cameraStep = glm::vec3(params.view * glm::vec4(params.geometry.step, 0.0f));
}

glm::vec3 SliceCaster::rayDirection(const glm::vec2& fragCoord) const {
    const glm::vec2 resolution(static_cast<float>(m_params.viewport.width),
                               static_cast<float>(m_params.viewport.height));
    const glm::vec2 ndc = 2.0f * fragCoord / resolution - 1.0f;

    // Point on the near plane in camera space
    glm::vec4 nearPoint = m_inverseProjection * glm::vec4(ndc, -1.0f, 1.0f);
    nearPoint /= nearPoint.w;

    return glm::normalize(glm::vec3(nearPoint));
}

glm::vec3 SliceCaster::sliceSpaceIndex(const glm::vec2& fragCoord) const {
    const glm::vec3 v = rayDirection(fragCoord);

    // Plane through the slice origin facing the ray; ray starts at the eye
    const float t = glm::dot(m_cameraOrigin, v) / glm::dot(v, v);
    const glm::vec3 intersection = t * v;

    return (intersection - m_cameraOrigin) / m_cameraStep;
}

std::optional<glm::uvec2> SliceCaster::locateColumn(const glm::vec2& fragCoord) const {
    const glm::vec3 index = sliceSpaceIndex(fragCoord);
    const float limit = static_cast<float>(SLICE_DIM);

    // Written so NaN (zero step component) fails the test
    const bool insideX = index.x >= 0.0f && index.x < limit;
    const bool insideY = index.y >= 0.0f && index.y < limit;
    if (!insideX || !insideY) {
        return std::nullopt;
    }

    return glm::uvec2(static_cast<uint32_t>(index.x), static_cast<uint32_t>(index.y));
}

CastResult SliceCaster::castPixel(const glm::vec2& fragCoord) const {
    CastResult result;

    const auto column = locateColumn(fragCoord);
    if (!column) {
        result.status = CastStatus::OutsideFootprint;
        result.color = m_palette.miss;
        return result;
    }

    result.column = sliceIndex(column->x, column->y, 0);

    const auto z = firstOpaqueInColumn(m_slice, column->x, column->y);
    if (!z) {
        result.status = CastStatus::ColumnEmpty;
        result.color = m_palette.background;
        return result;
    }

    const uint32_t opacity = m_slice[sliceIndex(column->x, column->y, *z)];
    const float intensity = static_cast<float>(opacity) / 255.0f;

    result.status = CastStatus::Hit;
    result.z = *z;
    result.opacity = static_cast<uint8_t>(opacity);
    result.color = glm::vec4(glm::vec3(m_palette.hit) * intensity, m_palette.hit.a);
    return result;
}

} // namespace Octaview::SliceRender
