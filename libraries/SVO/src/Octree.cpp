#include "Octree.h"
#include <algorithm>
#include <cassert>
#include <utility>

namespace Octaview::SVO {

Octree::Octree(std::vector<PackedEntry> values)
    : m_values(std::move(values)) {}

Octree::Octree(std::initializer_list<PackedEntry> values)
    : m_values(values) {}

DecodedEntry Octree::at(size_t index) const {
    assert(index < m_values.size() && "Octree index out of range");
    return decode(m_values[index]);
}

PackedEntry Octree::rawAt(size_t index) const {
    assert(index < m_values.size() && "Octree index out of range");
    return m_values[index];
}

std::vector<std::string> Octree::validate() const {
    std::vector<std::string> errors;

    if (m_values.empty()) {
        errors.push_back("Octree is empty (needs at least the root octant)");
        return errors;
    }

    if (m_values.size() % OCTANT_SIZE != 0) {
        errors.push_back("Octree size " + std::to_string(m_values.size()) +
                         " is not a multiple of " + std::to_string(OCTANT_SIZE));
    }

    for (size_t i = 0; i < m_values.size(); ++i) {
        const DecodedEntry entry = decode(m_values[i]);
        if (entry.isLeaf) {
            continue;
        }

        const size_t octantStart = i - (i % OCTANT_SIZE);
        const std::string where = "Entry " + std::to_string(i) + ": child index " +
                                  std::to_string(entry.childIndex);

        if (entry.childIndex <= octantStart) {
            errors.push_back(where + " does not point past its own octant at " +
                             std::to_string(octantStart));
        }
        if (entry.childIndex % OCTANT_SIZE != 0) {
            errors.push_back(where + " is not octant-aligned");
        }
        if (static_cast<size_t>(entry.childIndex) + OCTANT_SIZE > m_values.size()) {
            errors.push_back(where + " points outside the array (size " +
                             std::to_string(m_values.size()) + ")");
        }
    }

    return errors;
}

int Octree::maxDepth() const {
    if (m_values.size() < OCTANT_SIZE) {
        return 0;
    }

    // Children always follow their parent, so one forward pass settles depths.
    std::vector<int> octantDepth(octantCount(), 0);
    octantDepth[0] = 1;
    int deepest = 1;

    for (size_t i = 0; i < octantCount() * OCTANT_SIZE; ++i) {
        const int depth = octantDepth[i / OCTANT_SIZE];
        if (depth == 0) {
            continue;  // unreachable octant
        }
        const DecodedEntry entry = decode(m_values[i]);
        if (entry.isLeaf) {
            continue;
        }
        const size_t child = entry.childIndex / OCTANT_SIZE;
        if (child < octantDepth.size()) {
            octantDepth[child] = std::max(octantDepth[child], depth + 1);
            deepest = std::max(deepest, depth + 1);
        }
    }

    return deepest;
}

} // namespace Octaview::SVO
