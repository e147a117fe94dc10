#pragma once

#include "SliceRender/SliceTypes.h"
#include "SliceRender/SliceCamera.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Octaview::SliceRender {

/**
 * Everything the external draw call consumes for one frame.
 */
struct SliceUniforms {
    glm::mat4 projection{1.0f};
    glm::mat4 view{1.0f};
    glm::vec2 resolution{0.0f};
    float fov = DEFAULT_FOV;
    glm::vec3 sliceOrigin{0.0f};
    glm::vec3 step{0.0f};
    Slice slice{};
};

SliceUniforms makeSliceUniforms(const SampledSlice& sampled, const CameraState& camera,
                                float fov, const Viewport& viewport);

// ============================================================================
// std140 Layout
// ============================================================================

/**
 * Byte offsets of the uniform block, in declaration order:
 *
 *   layout(std140) uniform SliceBlock {
 *       mat4  uProjection;
 *       mat4  uView;
 *       vec2  uResolution;
 *       float uFOV;
 *       vec3  uSliceOrigin;
 *       vec3  uStep;
 *       uint  uSlice[512];   // array stride rounds up to 16
 *   };
 */
namespace Std140 {
constexpr size_t PROJECTION_OFFSET = 0;
constexpr size_t VIEW_OFFSET = 64;
constexpr size_t RESOLUTION_OFFSET = 128;
constexpr size_t FOV_OFFSET = 136;
constexpr size_t SLICE_ORIGIN_OFFSET = 144;
constexpr size_t STEP_OFFSET = 160;
constexpr size_t SLICE_OFFSET = 176;
constexpr size_t SLICE_STRIDE = 16;
constexpr size_t BLOCK_SIZE = SLICE_OFFSET + SLICE_STRIDE * SLICE_VOXEL_COUNT;
} // namespace Std140

std::vector<uint8_t> packStd140(const SliceUniforms& uniforms);

/**
 * Write the packed block as raw bytes.
 * @return false on IO failure, with the reason in error
 */
bool writeStd140(const SliceUniforms& uniforms, const std::filesystem::path& path, std::string& error);

} // namespace Octaview::SliceRender
