#pragma once

#include <Config/SceneConfig.h>
#include <glm/glm.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Octaview::Slicer {

/**
 * @brief Command line options for the slicer executable
 *
 * Every scene option overrides the matching value of the config file (or of
 * the built-in defaults when no config file is given).
 *
 * Usage:
 *   octaview_slicer [options]
 *     --config FILE        JSON scene config
 *     --save-config FILE   Write the resolved scene config and exit
 *     --output FILE        PNG output path
 *     --uniforms FILE      Also write the std140 uniform block
 *     --preset NAME        Octree preset: empty, solid, lower_half, bottom_plane
 *     --depth N            Octree depth to sample
 *     --origin X,Y,Z       Slice origin in world space
 *     --translation X,Y,Z  Camera translation
 *     --yaw R              Camera y rotation (radians)
 *     --pitch R            Camera x rotation (radians)
 *     --fov R              Vertical field of view (radians)
 *     --width N            Viewport width
 *     --height N           Viewport height
 *     --quarter            Save the PNG at half width and height
 *     --dump-slice         Print the sampled slice
 *     --verbose            Echo component logs to the terminal
 *     --help               Show help message
 */
struct SlicerCLIOptions {
    // Configuration file
    std::filesystem::path configPath;
    bool hasConfigFile = false;

    // Config save
    bool saveConfig = false;
    std::filesystem::path saveConfigPath;

    // Scene overrides
    std::optional<std::string> outputImage;
    std::optional<std::string> uniformsPath;
    std::optional<std::string> preset;
    std::optional<uint32_t> depth;
    std::optional<glm::vec3> origin;
    std::optional<glm::vec3> translation;
    std::optional<float> yaw;
    std::optional<float> pitch;
    std::optional<float> fov;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;

    // Output behaviour
    bool quarterResolution = false;
    bool dumpSlice = false;
    bool verbose = false;

    // Help flag
    bool showHelp = false;

    // Parse error (if any)
    std::string parseError;
    bool hasError = false;

    /**
     * @brief Copy every set override into config
     */
    void ApplyOverrides(Config::SceneConfig& config) const;

    /**
     * @brief Load the config file (if any) and apply overrides
     *
     * @param error Receives the load error
     * @return Resolved scene config, or nullopt when the file cannot be loaded
     */
    std::optional<Config::SceneConfig> BuildSceneConfig(std::string& error) const;
};

/**
 * @brief Parse command line arguments into options struct
 *
 * @param argc Argument count from main()
 * @param argv Argument vector from main()
 * @return Parsed options (check hasError for parse failures)
 */
SlicerCLIOptions ParseCommandLine(int argc, char* argv[]);

/**
 * @brief Print usage help message to stdout
 */
void PrintHelp();

/**
 * @brief Parse comma-separated list of float values
 *
 * @param str Input string like "0.1,0.2,0.3"
 * @return Vector of parsed values (invalid entries are skipped)
 */
std::vector<float> ParseFloatList(const std::string& str);

} // namespace Octaview::Slicer
