#pragma once

#include "Octree.h"
#include <optional>
#include <string>
#include <vector>

namespace Octaview::SVO {

/**
 * Named fixture octrees used by the CLI, scene configs and tests.
 *
 * Branch opacities are always the rounded mean of their 8 children, so the
 * fixtures sample sensibly at depths coarser than their leaves.
 */
namespace OctreePresets {

// Single transparent root octant.
Octree empty();

// Single fully opaque root octant.
Octree solid();

// Two levels: the z < 0.25 quarter is opaque, everything else transparent.
Octree lowerHalf();

// Five levels: a 32x32x32 volume whose bottom layer (z < 1/32) is opaque.
Octree bottomPlane();

// Names accepted by makePreset: "empty", "solid", "lower_half", "bottom_plane".
const std::vector<std::string>& presetNames();

std::optional<Octree> makePreset(const std::string& name);

} // namespace OctreePresets

// Rounded mean opacity of the octant starting at octantStart.
uint8_t octantMeanOpacity(const std::vector<PackedEntry>& values, size_t octantStart);

} // namespace Octaview::SVO
