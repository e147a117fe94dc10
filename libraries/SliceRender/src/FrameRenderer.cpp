#include "SliceRender/FrameRenderer.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <sstream>
#include <thread>

namespace Octaview::SliceRender {

glm::u8vec4 Image::pixel(uint32_t x, uint32_t row) const {
    const size_t offset = (static_cast<size_t>(row) * width + x) * 4;
    return glm::u8vec4(pixels[offset], pixels[offset + 1], pixels[offset + 2], pixels[offset + 3]);
}

glm::u8vec4 toRGBA8(const glm::vec4& color) {
    const glm::vec4 scaled = glm::clamp(color, 0.0f, 1.0f) * 255.0f + 0.5f;
    return glm::u8vec4(scaled);
}

namespace {

FrameStats renderBand(const SliceCaster& caster, Image& image, uint32_t rowBegin, uint32_t rowEnd) {
    FrameStats stats;

    for (uint32_t row = rowBegin; row < rowEnd; ++row) {
        // Image rows run top-down, fragment coordinates bottom-up
        const float fragY = static_cast<float>(image.height - 1 - row) + 0.5f;

        for (uint32_t x = 0; x < image.width; ++x) {
            const CastResult result = caster.castPixel(glm::vec2(static_cast<float>(x) + 0.5f, fragY));

            switch (result.status) {
                case CastStatus::Hit:              ++stats.hits; break;
                case CastStatus::ColumnEmpty:      ++stats.emptyColumns; break;
                case CastStatus::OutsideFootprint: ++stats.misses; break;
            }

            const glm::u8vec4 rgba = toRGBA8(result.color);
            const size_t offset = (static_cast<size_t>(row) * image.width + x) * 4;
            image.pixels[offset + 0] = rgba.r;
            image.pixels[offset + 1] = rgba.g;
            image.pixels[offset + 2] = rgba.b;
            image.pixels[offset + 3] = rgba.a;
        }
    }

    return stats;
}

} // namespace

FrameRenderer::FrameRenderer(uint32_t parallelism)
    : m_parallelism(parallelism > 0 ? parallelism : std::max(1u, std::thread::hardware_concurrency()))
{
    InitializeLogger("FrameRenderer");
}

RenderedFrame FrameRenderer::render(const SliceCaster& caster) const {
    const Viewport& viewport = caster.parameters().viewport;

    RenderedFrame frame;
    frame.image.width = viewport.width;
    frame.image.height = viewport.height;
    frame.image.pixels.assign(static_cast<size_t>(viewport.width) * viewport.height * 4, 0);

    if (viewport.width == 0 || viewport.height == 0) {
        OCTAVIEW_LOG_WARNING("Empty viewport, nothing rendered");
        return frame;
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    const uint32_t bandCount = std::min(m_parallelism, viewport.height);
    const uint32_t rowsPerBand = (viewport.height + bandCount - 1) / bandCount;

    std::vector<std::future<FrameStats>> futures;
    futures.reserve(bandCount);

    for (uint32_t rowBegin = 0; rowBegin < viewport.height; rowBegin += rowsPerBand) {
        const uint32_t rowEnd = std::min(rowBegin + rowsPerBand, viewport.height);
        futures.push_back(std::async(std::launch::async,
            [&caster, &frame, rowBegin, rowEnd]() {
                return renderBand(caster, frame.image, rowBegin, rowEnd);
            }
        ));
    }

    for (auto& future : futures) {
        frame.stats += future.get();
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    auto elapsedMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    std::ostringstream oss;
    oss << "Rendered " << viewport.width << "x" << viewport.height
        << " in " << futures.size() << " bands (" << elapsedMs << " ms): "
        << frame.stats.hits << " hit, " << frame.stats.emptyColumns << " empty, "
        << frame.stats.misses << " miss";
    OCTAVIEW_LOG_INFO(oss.str());

    return frame;
}

RenderedFrame FrameRenderer::render(const SampledSlice& sampled, const CameraState& camera, float fov,
                                    const Viewport& viewport, const CasterPalette& palette) const {
    const CastParameters params = CastParameters::FromCamera(camera, fov, viewport, sampled.geometry);
    const SliceCaster caster(sampled.voxels, params, palette);
    return render(caster);
}

} // namespace Octaview::SliceRender
