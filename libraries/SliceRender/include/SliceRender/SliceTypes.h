#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>

namespace Octaview::SliceRender {

// ============================================================================
// Slice Buffer
// ============================================================================

constexpr uint32_t SLICE_DIM = 8;
constexpr uint32_t SLICE_VOXEL_COUNT = SLICE_DIM * SLICE_DIM * SLICE_DIM;

/**
 * 8x8x8 camera-aligned sampling of the octree. Entries are opacities in
 * [0,255], widened to 32 bits to match the uniform array layout.
 * Always fully populated; out-of-cube samples are 0.
 */
using Slice = std::array<uint32_t, SLICE_VOXEL_COUNT>;

constexpr uint32_t sliceIndex(uint32_t x, uint32_t y, uint32_t z) {
    return x | (y << 3) | (z << 6);
}

/**
 * Parameters that, together with the octree, fully determine a slice.
 * The caster needs exactly these values to invert the mapping.
 */
struct SliceGeometry {
    glm::vec3 origin{0.0f};  // world-space sample position of voxel (0,0,0)
    glm::vec3 step{0.0f};    // world-space spacing per slice axis
    uint32_t depth = 0;      // octree level; voxel side is 1/2^depth
};

struct SampledSlice {
    Slice voxels{};
    SliceGeometry geometry;
};

struct Viewport {
    uint32_t width = 300;
    uint32_t height = 300;
};

} // namespace Octaview::SliceRender
