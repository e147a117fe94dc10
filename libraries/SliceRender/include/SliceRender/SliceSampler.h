#pragma once

#include "SliceRender/SliceTypes.h"
#include "Octree.h"
#include "ILoggable.h"
#include <string>

namespace Octaview::SliceRender {

// ============================================================================
// Sampling Functions
// ============================================================================

/**
 * World-space spacing between adjacent slice samples along each axis.
 *
 * For axis A with orthogonal tilt components tB, tC:
 *   step.A = sqrt(1 + tB^2 + tC^2) * sqrt(3) / (2^depth * 8)
 *
 * The tilt is the normalized ray direction with its dominant component
 * removed (ties pick x, then y, then z), so an axis-aligned ray yields three
 * equal steps. A zero direction is treated as axis-aligned.
 */
glm::vec3 computeStep(const glm::vec3& rayDirection, uint32_t depth);

// Side length of one slice step at depth for an axis-aligned ray.
float baseStep(uint32_t depth);

/**
 * Opacity of the octree voxel containing point, descending at most
 * targetDepth levels.
 *
 * - Any coordinate outside [0,1] returns 0.
 * - A point on a node boundary belongs to the upper half.
 * - A leaf above targetDepth returns its opacity immediately.
 * - Otherwise the opacity of octree[octantIndex] is returned, octantIndex
 *   being the start of the octant reached at targetDepth (the root at 0).
 *
 * The octree must be well formed (see Octree::validate).
 */
uint8_t sampleOpacity(const SVO::Octree& octree, const glm::vec3& point, uint32_t targetDepth);

/**
 * Fill all 512 entries of a slice. Sample (x,y,z) is taken at
 * origin + (x*step.x, y*step.y, z*step.z); the offsets are independent
 * world-axis deltas, not a camera basis.
 */
SampledSlice sampleSlice(const glm::vec3& origin, const glm::vec3& rayDirection,
                         uint32_t depth, const SVO::Octree& octree);

// ============================================================================
// Slice Inspection
// ============================================================================

struct SliceStatistics {
    uint32_t nonZero = 0;
    uint32_t opaque = 0;        // opacity == 255
    uint32_t occupiedColumns = 0;
};

SliceStatistics computeSliceStatistics(const Slice& slice);

/**
 * Human-readable dump: one 8x8 grid per z layer, y rows top to bottom,
 * '.' for 0, '#' for 255 and a hex digit of the high nibble otherwise.
 */
std::string formatSlice(const Slice& slice);

// ============================================================================
// SliceSampler
// ============================================================================

/**
 * Logging wrapper around sampleSlice used by the application.
 */
class SliceSampler : public Log::ILoggable {
public:
    SliceSampler();

    SampledSlice sample(const SVO::Octree& octree, const glm::vec3& origin,
                        const glm::vec3& rayDirection, uint32_t depth) const;
};

} // namespace Octaview::SliceRender
