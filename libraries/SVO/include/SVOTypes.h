#pragma once

#include <cstdint>

namespace Octaview::SVO {

// ============================================================================
// Packed Octree Entry
// ============================================================================

/**
 * Every octree entry is a 32-bit unsigned integer:
 *
 *   bits  0-7 : opacity     (0 = transparent, 255 = opaque)
 *   bits 8-31 : childIndex  (absolute index of the child octant, 0 = leaf)
 *
 *     value      = (childIndex << 8) | opacity
 *     opacity    = value & 0xFF
 *     childIndex = value >> 8
 *
 * A value is a leaf iff childIndex == 0, i.e. iff value < 256. A branch's
 * opacity field holds the mean opacity of its eight children and is used when
 * sampling stops above the branch's children.
 *
 * Entries are grouped into octants of 8. Within an octant a child is addressed
 * by a 3-bit slot, one bit per axis: slot = x | (y << 1) | (z << 2).
 */
using PackedEntry = uint32_t;

constexpr uint32_t OCTANT_SIZE = 8;
constexpr uint32_t OPACITY_BITS = 8;
constexpr uint32_t OPACITY_MASK = 0xFFu;
constexpr uint32_t MAX_CHILD_INDEX = 0xFFFFFFu;  // 24 bits
constexpr uint8_t OPACITY_TRANSPARENT = 0;
constexpr uint8_t OPACITY_OPAQUE = 255;

struct DecodedEntry {
    uint8_t opacity = 0;
    uint32_t childIndex = 0;
    bool isLeaf = true;

    bool operator==(const DecodedEntry& other) const {
        return opacity == other.opacity && childIndex == other.childIndex && isLeaf == other.isLeaf;
    }
};

constexpr DecodedEntry decode(PackedEntry value) {
    const uint32_t childIndex = value >> OPACITY_BITS;
    return DecodedEntry{
        static_cast<uint8_t>(value & OPACITY_MASK),
        childIndex,
        childIndex == 0
    };
}

// childIndex is truncated to 24 bits
constexpr PackedEntry pack(uint8_t opacity, uint32_t childIndex) {
    return ((childIndex & MAX_CHILD_INDEX) << OPACITY_BITS) | opacity;
}

constexpr uint32_t slotIndex(uint32_t x, uint32_t y, uint32_t z) {
    return (x & 1u) | ((y & 1u) << 1) | ((z & 1u) << 2);
}

constexpr bool isLeafValue(PackedEntry value) {
    return value < (1u << OPACITY_BITS);
}

} // namespace Octaview::SVO
