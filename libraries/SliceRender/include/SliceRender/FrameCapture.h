#pragma once

#include "SliceRender/FrameRenderer.h"
#include "ILoggable.h"
#include <filesystem>
#include <string>

namespace Octaview::SliceRender {

/// Resolution mode for frame capture
enum class CaptureResolution {
    Full,      // Capture at full resolution
    Quarter    // Capture at 1/4 resolution (half width, half height)
};

/// Result of a capture operation
struct CaptureResult {
    bool success = false;
    std::filesystem::path savedPath;
    std::string errorMessage;
    uint32_t capturedWidth = 0;
    uint32_t capturedHeight = 0;
};

/**
 * @brief Writes rendered frames to PNG files
 *
 * Uses stb_image_write for PNG encoding and stb_image_resize2 for the
 * quarter-resolution mode. Missing parent directories are created.
 */
class FrameCapture : public Log::ILoggable {
public:
    FrameCapture();

    CaptureResult Capture(const Image& image, const std::filesystem::path& path,
                          CaptureResolution resolution = CaptureResolution::Full) const;

    /// Convenience wrapper: full resolution, false on failure (logged as error)
    bool WritePng(const Image& image, const std::filesystem::path& path) const;
};

} // namespace Octaview::SliceRender
