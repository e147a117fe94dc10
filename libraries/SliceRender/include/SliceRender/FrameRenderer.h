#pragma once

#include "SliceRender/SliceCaster.h"
#include "ILoggable.h"
#include <glm/gtc/type_precision.hpp>
#include <cstdint>
#include <vector>

namespace Octaview::SliceRender {

/**
 * Tightly packed RGBA8 image, row 0 at the top.
 */
struct Image {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    glm::u8vec4 pixel(uint32_t x, uint32_t row) const;
    size_t byteSize() const { return pixels.size(); }
};

struct FrameStats {
    uint32_t hits = 0;
    uint32_t emptyColumns = 0;
    uint32_t misses = 0;

    uint32_t total() const { return hits + emptyColumns + misses; }

    FrameStats& operator+=(const FrameStats& other) {
        hits += other.hits;
        emptyColumns += other.emptyColumns;
        misses += other.misses;
        return *this;
    }
};

struct RenderedFrame {
    Image image;
    FrameStats stats;
};

/**
 * Runs the slice caster once per pixel on the CPU.
 *
 * Rows are split into contiguous bands, one std::async task per band. Each
 * band writes only its own rows and returns its own counts, so tasks share
 * no mutable state. All bands are joined before the frame is returned.
 */
class FrameRenderer : public Log::ILoggable {
public:
    /**
     * @param parallelism Number of bands; 0 uses hardware concurrency
     */
    explicit FrameRenderer(uint32_t parallelism = 0);

    RenderedFrame render(const SliceCaster& caster) const;

    RenderedFrame render(const SampledSlice& sampled, const CameraState& camera, float fov,
                         const Viewport& viewport, const CasterPalette& palette = CasterPalette{}) const;

    uint32_t parallelism() const { return m_parallelism; }

private:
    uint32_t m_parallelism;
};

// Float RGBA in [0,1] to RGBA8 with rounding.
glm::u8vec4 toRGBA8(const glm::vec4& color);

} // namespace Octaview::SliceRender
