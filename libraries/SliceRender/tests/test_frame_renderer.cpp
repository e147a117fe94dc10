#include <gtest/gtest.h>
#include "SliceRender/FrameRenderer.h"
#include "SliceRender/FrameCapture.h"
#include "SliceRender/SliceSampler.h"
#include "OctreePresets.h"
#include <algorithm>
#include <filesystem>

using namespace Octaview::SliceRender;
using namespace Octaview::SVO;

namespace {

struct Scene {
    SampledSlice sampled;
    CameraState camera;
    Viewport viewport{48, 32};
};

// Solid slice filling the middle of the frame
Scene makeSolidScene() {
    Scene scene;
    const float s = baseStep(2);
    const glm::vec3 origin(0.25f);
    scene.camera.translation = glm::vec3(-(origin.x + 4.0f * s), -(origin.y + 4.0f * s), -3.0f);
    scene.sampled = sampleSlice(origin, viewDirection(scene.camera), 2, OctreePresets::solid());
    return scene;
}

} // namespace

// ===========================================================================
// FrameRenderer
// ===========================================================================

TEST(FrameRendererTest, ImageMatchesViewport) {
    Scene scene = makeSolidScene();
    FrameRenderer renderer(4);

    RenderedFrame frame = renderer.render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);

    EXPECT_EQ(frame.image.width, 48u);
    EXPECT_EQ(frame.image.height, 32u);
    EXPECT_EQ(frame.image.byteSize(), 48u * 32u * 4u);
    EXPECT_EQ(frame.stats.total(), 48u * 32u);
}

TEST(FrameRendererTest, SolidSliceHitsCentreAndMissesCorners) {
    Scene scene = makeSolidScene();
    FrameRenderer renderer;

    CasterPalette palette;
    RenderedFrame frame = renderer.render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport, palette);

    EXPECT_GT(frame.stats.hits, 0u);
    EXPECT_GT(frame.stats.misses, 0u);
    EXPECT_EQ(frame.stats.emptyColumns, 0u);

    EXPECT_EQ(frame.image.pixel(24, 16), toRGBA8(palette.hit));
    EXPECT_EQ(frame.image.pixel(0, 0), toRGBA8(palette.miss));
    EXPECT_EQ(frame.image.pixel(47, 31), toRGBA8(palette.miss));
}

TEST(FrameRendererTest, ResultIsIndependentOfBandCount) {
    Scene scene = makeSolidScene();
    scene.sampled.voxels[sliceIndex(2, 6, 0)] = 0;  // break the symmetry

    RenderedFrame single = FrameRenderer(1).render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);
    RenderedFrame many = FrameRenderer(7).render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);
    RenderedFrame tooMany = FrameRenderer(500).render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);

    EXPECT_EQ(single.image.pixels, many.image.pixels);
    EXPECT_EQ(single.image.pixels, tooMany.image.pixels);
    EXPECT_EQ(single.stats.hits, many.stats.hits);
    EXPECT_EQ(single.stats.misses, tooMany.stats.misses);
}

TEST(FrameRendererTest, RowZeroIsTopOfFrame) {
    Scene scene = makeSolidScene();
    scene.sampled.voxels.fill(0);
    // Only the top slice row (y = 7) is opaque
    for (uint32_t x = 0; x < 8; ++x) {
        scene.sampled.voxels[sliceIndex(x, 7, 0)] = 255;
    }

    RenderedFrame frame = FrameRenderer(2).render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);

    uint32_t firstHitRow = scene.viewport.height;
    uint32_t lastHitRow = 0;
    for (uint32_t row = 0; row < frame.image.height; ++row) {
        if (frame.image.pixel(24, row) == toRGBA8(CasterPalette{}.hit)) {
            firstHitRow = std::min(firstHitRow, row);
            lastHitRow = std::max(lastHitRow, row);
        }
    }
    ASSERT_LT(firstHitRow, scene.viewport.height);
    EXPECT_LT(lastHitRow, scene.viewport.height / 2);
}

TEST(FrameRendererTest, LogsFrameSummary) {
    Scene scene = makeSolidScene();
    FrameRenderer renderer(2);
    renderer.SetLoggerEnabled(true);

    renderer.render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);

    std::string logs = renderer.GetLogger()->ExtractLogs();
    EXPECT_NE(logs.find("Rendered 48x32"), std::string::npos);
}

TEST(FrameRendererTest, ColourConversionRoundsAndClamps) {
    EXPECT_EQ(toRGBA8(glm::vec4(0.0f, 0.5f, 1.0f, 2.0f)), glm::u8vec4(0, 128, 255, 255));
    EXPECT_EQ(toRGBA8(glm::vec4(-1.0f, 0.2f, 0.05f, 0.0f)), glm::u8vec4(0, 51, 13, 0));
}

// ===========================================================================
// FrameCapture
// ===========================================================================

class FrameCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        outputDir = std::filesystem::temp_directory_path() / "octaview_capture_test";
        std::filesystem::remove_all(outputDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(outputDir);
    }

    std::filesystem::path outputDir;
};

TEST_F(FrameCaptureTest, WritesPngIntoNewDirectory) {
    Scene scene = makeSolidScene();
    RenderedFrame frame = FrameRenderer(2).render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);

    FrameCapture capture;
    const auto path = outputDir / "frames" / "solid.png";
    ASSERT_TRUE(capture.WritePng(frame.image, path));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_GT(std::filesystem::file_size(path), 0u);
}

TEST_F(FrameCaptureTest, QuarterResolutionHalvesEachAxis) {
    Scene scene = makeSolidScene();
    RenderedFrame frame = FrameRenderer(2).render(scene.sampled, scene.camera, DEFAULT_FOV, scene.viewport);

    FrameCapture capture;
    CaptureResult result = capture.Capture(frame.image, outputDir / "quarter.png", CaptureResolution::Quarter);

    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(result.capturedWidth, 24u);
    EXPECT_EQ(result.capturedHeight, 16u);
}

TEST_F(FrameCaptureTest, EmptyImageIsRejected) {
    FrameCapture capture;
    capture.SetLoggerEnabled(true);

    CaptureResult result = capture.Capture(Image{}, outputDir / "empty.png");

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
    EXPECT_NE(capture.GetLogger()->ExtractLogs().find("[ERROR]"), std::string::npos);
}

TEST_F(FrameCaptureTest, UnwritablePathReportsFailure) {
    Image image;
    image.width = 2;
    image.height = 2;
    image.pixels.assign(16, 255);

    FrameCapture capture;
    EXPECT_FALSE(capture.WritePng(image, "/proc/octaview_capture/forbidden.png"));
}
