#include "OctreePresets.h"
#include <utility>

namespace Octaview::SVO {

uint8_t octantMeanOpacity(const std::vector<PackedEntry>& values, size_t octantStart) {
    uint32_t sum = 0;
    for (uint32_t slot = 0; slot < OCTANT_SIZE; ++slot) {
        sum += decode(values[octantStart + slot]).opacity;
    }
    return static_cast<uint8_t>((sum + OCTANT_SIZE / 2) / OCTANT_SIZE);
}

namespace {

/**
 * Chain of `levels` octants where each level's lower four slots (z = 0) point
 * at the next octant and the last octant holds opaque z = 0 leaves.
 * Octants are written in array order but branch opacities are filled in
 * deepest-first, since each depends on its child's mean.
 */
Octree buildBottomChain(uint32_t levels) {
    std::vector<PackedEntry> values(levels * OCTANT_SIZE, 0);

    const size_t leafStart = (levels - 1) * OCTANT_SIZE;
    for (uint32_t slot = 0; slot < 4; ++slot) {
        values[leafStart + slot] = OPACITY_OPAQUE;
    }

    for (int octant = static_cast<int>(levels) - 2; octant >= 0; --octant) {
        const size_t start = static_cast<size_t>(octant) * OCTANT_SIZE;
        const uint32_t childStart = static_cast<uint32_t>(start + OCTANT_SIZE);
        const uint8_t mean = octantMeanOpacity(values, childStart);
        for (uint32_t slot = 0; slot < 4; ++slot) {
            values[start + slot] = pack(mean, childStart);
        }
    }

    return Octree(std::move(values));
}

} // namespace

namespace OctreePresets {

Octree empty() {
    return Octree(std::vector<PackedEntry>(OCTANT_SIZE, OPACITY_TRANSPARENT));
}

Octree solid() {
    return Octree(std::vector<PackedEntry>(OCTANT_SIZE, OPACITY_OPAQUE));
}

Octree lowerHalf() {
    return buildBottomChain(2);
}

Octree bottomPlane() {
    return buildBottomChain(5);
}

const std::vector<std::string>& presetNames() {
    static const std::vector<std::string> names = {
        "empty", "solid", "lower_half", "bottom_plane"
    };
    return names;
}

std::optional<Octree> makePreset(const std::string& name) {
    if (name == "empty") return empty();
    if (name == "solid") return solid();
    if (name == "lower_half") return lowerHalf();
    if (name == "bottom_plane") return bottomPlane();
    return std::nullopt;
}

} // namespace OctreePresets

} // namespace Octaview::SVO
