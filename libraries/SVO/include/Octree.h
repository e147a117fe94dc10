#pragma once

#include "SVOTypes.h"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace Octaview::SVO {

/**
 * Sparse voxel octree stored as a flat array of packed entries.
 *
 * The array is a sequence of octants (8 consecutive entries). Octant 0 is the
 * root and covers the unit cube [0,1]^3. A branch entry points at the first
 * entry of its child octant, which must come later in the array; this keeps
 * descent finite and acyclic.
 *
 * Example: a two-level octree where only the bottom quarter (z < 0.25) is
 * opaque. The root's four z=0 slots share the child octant at index 8:
 *
 * | Index | Value            | Meaning                   |
 * | ----- | ---------------- | ------------------------- |
 * | 0-3   | pack(128, 8)     | branch -> octant at 8     |
 * | 4-7   | 0                | transparent leaf          |
 * | 8-11  | 255              | opaque leaf               |
 * | 12-15 | 0                | transparent leaf          |
 *
 * The store is read-only once built. Building octrees from volumetric source
 * data happens elsewhere.
 */
class Octree {
public:
    Octree() = default;
    explicit Octree(std::vector<PackedEntry> values);
    Octree(std::initializer_list<PackedEntry> values);

    // Decode the entry at an absolute index. index must be < size().
    DecodedEntry at(size_t index) const;

    PackedEntry rawAt(size_t index) const;

    size_t size() const { return m_values.size(); }
    size_t octantCount() const { return m_values.size() / OCTANT_SIZE; }
    bool empty() const { return m_values.empty(); }


    /**
     * Check the structural invariants.
     *
     * @return Error messages, empty when the octree is well formed:
     *  - non-empty and a whole number of octants
     *  - every branch points strictly past its own octant
     *  - every branch points at the start of an octant inside the array
     */
    std::vector<std::string> validate() const;

    bool isValid() const { return validate().empty(); }

    // Deepest level reachable from the root, counting the root octant as 1.
    // Only meaningful on a valid octree.
    int maxDepth() const;

    bool operator==(const Octree& other) const { return m_values == other.m_values; }

private:
    std::vector<PackedEntry> m_values;
};

} // namespace Octaview::SVO
