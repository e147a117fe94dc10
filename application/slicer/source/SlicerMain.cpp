/**
 * @file SlicerMain.cpp
 * @brief Headless slice renderer
 *
 * 1. Parses CLI arguments and resolves the scene config
 * 2. Samples one 8x8x8 slice from the octree
 * 3. Casts every pixel of the viewport against the slice
 * 4. Writes the frame as PNG (and optionally the uniform block)
 *
 * Usage:
 *   octaview_slicer --preset bottom_plane --depth 5 --output plane.png
 *   octaview_slicer --config scene.json --uniforms block.bin --dump-slice
 *
 * See --help for full options.
 */

#include "SlicerCLI.h"
#include <Config/SceneConfig.h>
#include <SliceRender/FrameCapture.h>
#include <SliceRender/FrameRenderer.h>
#include <SliceRender/SliceSampler.h>
#include <SliceRender/SliceUniforms.h>
#include <Logger.h>
#include <iostream>
#include <memory>

namespace {

template <typename Component>
void AttachLogger(Component& component, Octaview::Log::Logger* parent, bool verbose) {
    component.SetLoggerEnabled(true);
    component.SetLoggerTerminalOutput(verbose);
    component.RegisterToParentLogger(parent);
}

void ReportErrors(Octaview::Log::Logger& logger, const std::string& header,
                  const std::vector<std::string>& errors) {
    logger.Error(header);
    for (const auto& error : errors) {
        logger.Error("  - " + error);
    }
    std::cerr << header << "\n";  // User-facing error
    for (const auto& error : errors) {
        std::cerr << "  - " << error << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace Octaview;
    using namespace Octaview::Slicer;

    // Create logger for slicer main
    auto mainLogger = std::make_shared<Log::Logger>("SlicerMain", true);

    // Parse command line arguments
    auto opts = ParseCommandLine(argc, argv);
    mainLogger->SetTerminalOutput(opts.verbose);

    // Handle parse errors
    if (opts.hasError) {
        ReportErrors(*mainLogger, "Error: " + opts.parseError, {"Use --help for usage information"});
        return 1;
    }

    // Show help
    if (opts.showHelp) {
        PrintHelp();
        return 0;
    }

    // Resolve scene configuration
    std::string loadError;
    auto config = opts.BuildSceneConfig(loadError);
    if (!config) {
        ReportErrors(*mainLogger, "Failed to load configuration:", {loadError});
        return 1;
    }

    // Save config and exit
    if (opts.saveConfig) {
        if (Config::SceneConfigLoader::SaveToFile(*config, opts.saveConfigPath)) {
            mainLogger->Info("Configuration saved to: " + opts.saveConfigPath.string());
            std::cout << "Configuration saved to: " << opts.saveConfigPath.string() << "\n";  // User-facing output
            return 0;
        }
        ReportErrors(*mainLogger, "Error: Failed to save configuration to: " + opts.saveConfigPath.string(), {});
        return 1;
    }

    auto errors = config->Validate();
    if (!errors.empty()) {
        ReportErrors(*mainLogger, "Configuration errors:", errors);
        return 1;
    }

    auto octree = config->BuildOctree();
    if (!octree) {
        ReportErrors(*mainLogger, "Configuration errors:", {"Unknown octree preset '" + config->octreePreset + "'"});
        return 1;
    }

    // Sample
    SliceRender::SliceSampler sampler;
    AttachLogger(sampler, mainLogger.get(), opts.verbose);

    const glm::vec3 rayDirection = SliceRender::viewDirection(config->camera);
    SliceRender::SampledSlice sampled = sampler.sample(*octree, config->sliceOrigin, rayDirection, config->depth);

    if (opts.dumpSlice) {
        std::cout << SliceRender::formatSlice(sampled.voxels);
    }

    // Uniform block for an external draw call
    if (!config->outputUniforms.empty()) {
        auto uniforms = SliceRender::makeSliceUniforms(sampled, config->camera, config->fov, config->viewport);
        std::string writeError;
        if (!SliceRender::writeStd140(uniforms, config->outputUniforms, writeError)) {
            ReportErrors(*mainLogger, "Error: Failed to write uniform block:", {writeError});
            return 1;
        }
        mainLogger->Info("Uniform block written to: " + config->outputUniforms);
    }

    // Render
    SliceRender::FrameRenderer renderer;
    AttachLogger(renderer, mainLogger.get(), opts.verbose);

    SliceRender::RenderedFrame frame = renderer.render(
        sampled, config->camera, config->fov, config->viewport, config->palette);

    // Capture
    SliceRender::FrameCapture capture;
    AttachLogger(capture, mainLogger.get(), opts.verbose);

    const auto resolution = opts.quarterResolution
        ? SliceRender::CaptureResolution::Quarter
        : SliceRender::CaptureResolution::Full;
    SliceRender::CaptureResult saved = capture.Capture(frame.image, config->outputImage, resolution);
    if (!saved.success) {
        ReportErrors(*mainLogger, "Error: Failed to save frame:", {saved.errorMessage});
        return 1;
    }

    // Summary (user-facing output)
    std::cout << "Rendered " << config->viewport.width << "x" << config->viewport.height
              << " at depth " << config->depth << ": "
              << frame.stats.hits << " hit, "
              << frame.stats.emptyColumns << " empty, "
              << frame.stats.misses << " outside slice\n"
              << "Saved " << saved.capturedWidth << "x" << saved.capturedHeight
              << " frame to " << saved.savedPath.string() << "\n";

    return 0;
}
