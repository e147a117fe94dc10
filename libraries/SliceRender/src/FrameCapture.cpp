#include "SliceRender/FrameCapture.h"
#include <algorithm>
#include <vector>

// STB implementations - only define here to avoid multiple definition errors
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image_resize2.h"

namespace Octaview::SliceRender {

FrameCapture::FrameCapture() {
    InitializeLogger("FrameCapture");
}

CaptureResult FrameCapture::Capture(const Image& image, const std::filesystem::path& path,
                                    CaptureResolution resolution) const {
    CaptureResult result;

    if (image.width == 0 || image.height == 0 ||
        image.pixels.size() != static_cast<size_t>(image.width) * image.height * 4) {
        result.errorMessage = "Image is empty or has inconsistent dimensions";
        OCTAVIEW_LOG_ERROR(result.errorMessage);
        return result;
    }

    // Create output directory
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            result.errorMessage = "Failed to create output directory: " + ec.message();
            OCTAVIEW_LOG_ERROR(result.errorMessage);
            return result;
        }
    }

    uint32_t width = image.width;
    uint32_t height = image.height;
    bool success = false;

    if (resolution == CaptureResolution::Quarter) {
        width = std::max(image.width / 2, 1u);
        height = std::max(image.height / 2, 1u);
        std::vector<uint8_t> resized(static_cast<size_t>(width) * height * 4);

        const unsigned char* resizedPixels = stbir_resize_uint8_linear(
            image.pixels.data(), static_cast<int>(image.width), static_cast<int>(image.height),
            static_cast<int>(image.width * 4),
            resized.data(), static_cast<int>(width), static_cast<int>(height), static_cast<int>(width * 4),
            STBIR_RGBA
        );
        if (!resizedPixels) {
            result.errorMessage = "Failed to resize frame to quarter resolution";
            OCTAVIEW_LOG_ERROR(result.errorMessage);
            return result;
        }

        success = stbi_write_png(
            path.string().c_str(),
            static_cast<int>(width),
            static_cast<int>(height),
            4,
            resized.data(),
            static_cast<int>(width * 4)
        ) != 0;
    } else {
        success = stbi_write_png(
            path.string().c_str(),
            static_cast<int>(width),
            static_cast<int>(height),
            4,
            image.pixels.data(),
            static_cast<int>(width * 4)
        ) != 0;
    }

    if (!success) {
        result.errorMessage = "Failed to write PNG file " + path.string();
        OCTAVIEW_LOG_ERROR(result.errorMessage);
        return result;
    }

    result.success = true;
    result.savedPath = path;
    result.capturedWidth = width;
    result.capturedHeight = height;
    OCTAVIEW_LOG_INFO("Saved " + std::to_string(width) + "x" + std::to_string(height) +
                      " frame to " + path.string());
    return result;
}

bool FrameCapture::WritePng(const Image& image, const std::filesystem::path& path) const {
    return Capture(image, path, CaptureResolution::Full).success;
}

} // namespace Octaview::SliceRender
