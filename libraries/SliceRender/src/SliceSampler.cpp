#include "SliceRender/SliceSampler.h"
#include <cmath>
#include <sstream>

namespace Octaview::SliceRender {

namespace {

constexpr float SQRT_3 = 1.7320508075688772f;

glm::vec3 tiltComponents(const glm::vec3& rayDirection) {
    const float length = glm::length(rayDirection);
    if (!(length > 0.0f)) {
        return glm::vec3(0.0f);
    }

    glm::vec3 tilt = rayDirection / length;
    const glm::vec3 magnitude = glm::abs(tilt);

    int dominant = 0;
    if (magnitude.y > magnitude[dominant]) dominant = 1;
    if (magnitude.z > magnitude[dominant]) dominant = 2;

    tilt[dominant] = 0.0f;
    return tilt;
}

bool insideUnitCube(const glm::vec3& p) {
    return p.x >= 0.0f && p.x <= 1.0f &&
           p.y >= 0.0f && p.y <= 1.0f &&
           p.z >= 0.0f && p.z <= 1.0f;
}

} // namespace

float baseStep(uint32_t depth) {
    return SQRT_3 / std::ldexp(static_cast<float>(SLICE_DIM), static_cast<int>(depth));
}

glm::vec3 computeStep(const glm::vec3& rayDirection, uint32_t depth) {
    const glm::vec3 t = tiltComponents(rayDirection);
    const float base = baseStep(depth);

    return glm::vec3(
        std::sqrt(1.0f + t.y * t.y + t.z * t.z) * base,
        std::sqrt(1.0f + t.x * t.x + t.z * t.z) * base,
        std::sqrt(1.0f + t.x * t.x + t.y * t.y) * base
    );
}

uint8_t sampleOpacity(const SVO::Octree& octree, const glm::vec3& point, uint32_t targetDepth) {
    if (!insideUnitCube(point)) {
        return SVO::OPACITY_TRANSPARENT;
    }

    uint32_t octantIndex = 0;
    glm::vec3 nodeOrigin(0.0f);

    for (uint32_t currentDepth = 0; currentDepth < targetDepth; ++currentDepth) {
        const float nodeSize = std::ldexp(1.0f, -static_cast<int>(currentDepth + 1));
        const glm::vec3 mid = nodeOrigin + nodeSize;

        const uint32_t x = point.x >= mid.x ? 1u : 0u;
        const uint32_t y = point.y >= mid.y ? 1u : 0u;
        const uint32_t z = point.z >= mid.z ? 1u : 0u;

        const SVO::DecodedEntry entry = octree.at(octantIndex + SVO::slotIndex(x, y, z));
        if (entry.isLeaf) {
            return entry.opacity;
        }

        octantIndex = entry.childIndex;
        nodeOrigin += glm::vec3(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)) * nodeSize;
    }

    return octree.at(octantIndex).opacity;
}

SampledSlice sampleSlice(const glm::vec3& origin, const glm::vec3& rayDirection,
                         uint32_t depth, const SVO::Octree& octree) {
    SampledSlice result;
    result.geometry.origin = origin;
    result.geometry.step = computeStep(rayDirection, depth);
    result.geometry.depth = depth;

    const glm::vec3& step = result.geometry.step;

    for (uint32_t x = 0; x < SLICE_DIM; ++x) {
        for (uint32_t y = 0; y < SLICE_DIM; ++y) {
            // One core: 8 samples along z for column (x, y)
            for (uint32_t z = 0; z < SLICE_DIM; ++z) {
                const glm::vec3 samplePoint = origin + glm::vec3(
                    static_cast<float>(x) * step.x,
                    static_cast<float>(y) * step.y,
                    static_cast<float>(z) * step.z);
                result.voxels[sliceIndex(x, y, z)] = sampleOpacity(octree, samplePoint, depth);
            }
        }
    }

    return result;
}

SliceStatistics computeSliceStatistics(const Slice& slice) {
    SliceStatistics stats;
    for (uint32_t x = 0; x < SLICE_DIM; ++x) {
        for (uint32_t y = 0; y < SLICE_DIM; ++y) {
            bool occupied = false;
            for (uint32_t z = 0; z < SLICE_DIM; ++z) {
                const uint32_t value = slice[sliceIndex(x, y, z)];
                if (value > 0) {
                    ++stats.nonZero;
                    occupied = true;
                }
                if (value == SVO::OPACITY_OPAQUE) {
                    ++stats.opaque;
                }
            }
            if (occupied) {
                ++stats.occupiedColumns;
            }
        }
    }
    return stats;
}

std::string formatSlice(const Slice& slice) {
    static const char HEX[] = "0123456789abcdef";

    std::ostringstream out;
    for (uint32_t z = 0; z < SLICE_DIM; ++z) {
        out << "z=" << z << "\n";
        for (int y = static_cast<int>(SLICE_DIM) - 1; y >= 0; --y) {
            out << "  ";
            for (uint32_t x = 0; x < SLICE_DIM; ++x) {
                const uint32_t value = slice[sliceIndex(x, static_cast<uint32_t>(y), z)];
                if (value == 0) {
                    out << '.';
                } else if (value >= SVO::OPACITY_OPAQUE) {
                    out << '#';
                } else {
                    out << HEX[(value >> 4) & 0xF];
                }
            }
            out << "\n";
        }
    }
    return out.str();
}

// ============================================================================
// SliceSampler
// ============================================================================

SliceSampler::SliceSampler() {
    InitializeLogger("SliceSampler");
}

SampledSlice SliceSampler::sample(const SVO::Octree& octree, const glm::vec3& origin,
                                  const glm::vec3& rayDirection, uint32_t depth) const {
    if (!(glm::length(rayDirection) > 0.0f)) {
        OCTAVIEW_LOG_WARNING("Zero ray direction, sampling as axis-aligned");
    }

    SampledSlice result = sampleSlice(origin, rayDirection, depth, octree);

    const SliceStatistics stats = computeSliceStatistics(result.voxels);
    std::ostringstream oss;
    oss << "Sampled depth " << depth
        << " at (" << origin.x << ", " << origin.y << ", " << origin.z << ")"
        << " step (" << result.geometry.step.x << ", " << result.geometry.step.y
        << ", " << result.geometry.step.z << "): "
        << stats.nonZero << " non-zero, " << stats.opaque << " opaque, "
        << stats.occupiedColumns << "/64 columns occupied";
    OCTAVIEW_LOG_INFO(oss.str());

    return result;
}

} // namespace Octaview::SliceRender
