#include "SlicerCLI.h"
#include <OctreePresets.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>

namespace Octaview::Slicer {

namespace {

// Trim whitespace from string
std::string Trim(const std::string& str) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    auto start = std::find_if_not(str.begin(), str.end(), isSpace);
    auto end = std::find_if_not(str.rbegin(), str.rend(), isSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Check if argument matches short or long form
bool ArgMatches(const char* arg, const char* shortForm, const char* longForm) {
    return (shortForm && std::strcmp(arg, shortForm) == 0) ||
           (longForm && std::strcmp(arg, longForm) == 0);
}

// Get next argument value safely
const char* GetNextArg(int argc, char* argv[], int& i, const char* argName) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << argName << " requires a value\n";  // User-facing error
        return nullptr;
    }
    return argv[++i];
}

void SetError(SlicerCLIOptions& opts, const std::string& message) {
    opts.hasError = true;
    opts.parseError = message;
}

bool ParseUint(const char* val, const char* argName, std::optional<uint32_t>& out, SlicerCLIOptions& opts) {
    try {
        size_t consumed = 0;
        const unsigned long value = std::stoul(val, &consumed);
        if (consumed != std::strlen(val) || std::strchr(val, '-') != nullptr ||
            value > std::numeric_limits<uint32_t>::max()) {
            SetError(opts, "Invalid value for " + std::string(argName) + ": " + val);
            return false;
        }
        out = static_cast<uint32_t>(value);
        return true;
    } catch (const std::exception&) {
        SetError(opts, "Invalid value for " + std::string(argName) + ": " + val);
        return false;
    }
}

bool ParseFloat(const char* val, const char* argName, std::optional<float>& out, SlicerCLIOptions& opts) {
    try {
        size_t consumed = 0;
        const float value = std::stof(val, &consumed);
        if (consumed != std::strlen(val)) {
            SetError(opts, "Invalid value for " + std::string(argName) + ": " + val);
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        SetError(opts, "Invalid value for " + std::string(argName) + ": " + val);
        return false;
    }
}

// Parse one whole field; trailing characters make it invalid
bool ParseFloatField(const std::string& field, float& out) {
    const std::string token = Trim(field);
    if (token.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        out = std::stof(token, &consumed);
        return consumed == token.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseVec3(const char* val, const char* argName, std::optional<glm::vec3>& out, SlicerCLIOptions& opts) {
    std::vector<std::string> fields;
    std::stringstream ss(val);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (std::strlen(val) > 0 && val[std::strlen(val) - 1] == ',') {
        fields.emplace_back();
    }

    glm::vec3 result(0.0f);
    bool valid = fields.size() == 3;
    for (size_t i = 0; valid && i < 3; ++i) {
        valid = ParseFloatField(fields[i], result[static_cast<int>(i)]);
    }

    if (!valid) {
        SetError(opts, std::string(argName) + " expects three comma-separated numbers, got: " + val);
        return false;
    }
    out = result;
    return true;
}

} // anonymous namespace

std::vector<float> ParseFloatList(const std::string& str) {
    std::vector<float> result;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = Trim(token);
        if (!token.empty()) {
            try {
                result.push_back(std::stof(token));
            } catch (const std::exception&) {
                // Skip invalid values
            }
        }
    }
    return result;
}

SlicerCLIOptions ParseCommandLine(int argc, char* argv[]) {
    SlicerCLIOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help
        if (ArgMatches(arg, "-h", "--help")) {
            opts.showHelp = true;
            return opts;
        }

        // Config file
        if (ArgMatches(arg, "-c", "--config")) {
            const char* val = GetNextArg(argc, argv, i, "--config");
            if (!val) {
                SetError(opts, "--config requires a file path");
                return opts;
            }
            opts.configPath = val;
            opts.hasConfigFile = true;
            continue;
        }

        if (ArgMatches(arg, nullptr, "--save-config")) {
            const char* val = GetNextArg(argc, argv, i, "--save-config");
            if (!val) {
                SetError(opts, "--save-config requires a file path");
                return opts;
            }
            opts.saveConfigPath = val;
            opts.saveConfig = true;
            continue;
        }

        // Output files
        if (ArgMatches(arg, "-o", "--output")) {
            const char* val = GetNextArg(argc, argv, i, "--output");
            if (!val) {
                SetError(opts, "--output requires a file path");
                return opts;
            }
            opts.outputImage = val;
            continue;
        }

        if (ArgMatches(arg, "-u", "--uniforms")) {
            const char* val = GetNextArg(argc, argv, i, "--uniforms");
            if (!val) {
                SetError(opts, "--uniforms requires a file path");
                return opts;
            }
            opts.uniformsPath = val;
            continue;
        }

        // Octree
        if (ArgMatches(arg, "-p", "--preset")) {
            const char* val = GetNextArg(argc, argv, i, "--preset");
            if (!val) {
                SetError(opts, "--preset requires a name");
                return opts;
            }
            opts.preset = val;
            continue;
        }

        if (ArgMatches(arg, "-d", "--depth")) {
            const char* val = GetNextArg(argc, argv, i, "--depth");
            if (!val) {
                SetError(opts, "--depth requires a number");
                return opts;
            }
            if (!ParseUint(val, "--depth", opts.depth, opts)) {
                return opts;
            }
            continue;
        }

        if (ArgMatches(arg, nullptr, "--origin")) {
            const char* val = GetNextArg(argc, argv, i, "--origin");
            if (!val) {
                SetError(opts, "--origin requires X,Y,Z");
                return opts;
            }
            if (!ParseVec3(val, "--origin", opts.origin, opts)) {
                return opts;
            }
            continue;
        }

        // Camera
        if (ArgMatches(arg, "-t", "--translation")) {
            const char* val = GetNextArg(argc, argv, i, "--translation");
            if (!val) {
                SetError(opts, "--translation requires X,Y,Z");
                return opts;
            }
            if (!ParseVec3(val, "--translation", opts.translation, opts)) {
                return opts;
            }
            continue;
        }

        if (ArgMatches(arg, nullptr, "--yaw")) {
            const char* val = GetNextArg(argc, argv, i, "--yaw");
            if (!val) {
                SetError(opts, "--yaw requires an angle in radians");
                return opts;
            }
            if (!ParseFloat(val, "--yaw", opts.yaw, opts)) {
                return opts;
            }
            continue;
        }

        if (ArgMatches(arg, nullptr, "--pitch")) {
            const char* val = GetNextArg(argc, argv, i, "--pitch");
            if (!val) {
                SetError(opts, "--pitch requires an angle in radians");
                return opts;
            }
            if (!ParseFloat(val, "--pitch", opts.pitch, opts)) {
                return opts;
            }
            continue;
        }

        if (ArgMatches(arg, nullptr, "--fov")) {
            const char* val = GetNextArg(argc, argv, i, "--fov");
            if (!val) {
                SetError(opts, "--fov requires an angle in radians");
                return opts;
            }
            if (!ParseFloat(val, "--fov", opts.fov, opts)) {
                return opts;
            }
            continue;
        }

        // Viewport
        if (ArgMatches(arg, nullptr, "--width")) {
            const char* val = GetNextArg(argc, argv, i, "--width");
            if (!val) {
                SetError(opts, "--width requires a number");
                return opts;
            }
            if (!ParseUint(val, "--width", opts.width, opts)) {
                return opts;
            }
            continue;
        }

        if (ArgMatches(arg, nullptr, "--height")) {
            const char* val = GetNextArg(argc, argv, i, "--height");
            if (!val) {
                SetError(opts, "--height requires a number");
                return opts;
            }
            if (!ParseUint(val, "--height", opts.height, opts)) {
                return opts;
            }
            continue;
        }

        // Flags
        if (ArgMatches(arg, nullptr, "--quarter")) {
            opts.quarterResolution = true;
            continue;
        }

        if (ArgMatches(arg, nullptr, "--dump-slice")) {
            opts.dumpSlice = true;
            continue;
        }

        if (ArgMatches(arg, "-v", "--verbose")) {
            opts.verbose = true;
            continue;
        }

        SetError(opts, "Unknown argument: " + std::string(arg));
        return opts;
    }

    return opts;
}

void SlicerCLIOptions::ApplyOverrides(Config::SceneConfig& config) const {
    if (preset) {
        config.octreePreset = *preset;
        config.octreeValues.clear();
    }
    if (depth) config.depth = *depth;
    if (origin) config.sliceOrigin = *origin;
    if (translation) config.camera.translation = *translation;
    if (yaw) config.camera.yRotation = *yaw;
    if (pitch) config.camera.xRotation = *pitch;
    if (fov) config.fov = *fov;
    if (width) config.viewport.width = *width;
    if (height) config.viewport.height = *height;
    if (outputImage) config.outputImage = *outputImage;
    if (uniformsPath) config.outputUniforms = *uniformsPath;
}

std::optional<Config::SceneConfig> SlicerCLIOptions::BuildSceneConfig(std::string& error) const {
    Config::SceneConfig config;

    if (hasConfigFile) {
        auto loaded = Config::SceneConfigLoader::LoadFromFile(configPath, &error);
        if (!loaded) {
            return std::nullopt;
        }
        config = *loaded;
    }

    ApplyOverrides(config);
    return config;
}

void PrintHelp() {
    std::string presets;
    for (const auto& name : SVO::OctreePresets::presetNames()) {
        presets += (presets.empty() ? "" : ", ") + name;
    }

    std::cout << R"(
Octaview Slicer - sparse voxel octree slice renderer

Usage: octaview_slicer [options]

Configuration:
  -c, --config FILE        JSON scene configuration
      --save-config FILE   Write the resolved configuration and exit

Output:
  -o, --output FILE        PNG output path (default: octaview_frame.png)
  -u, --uniforms FILE      Also write the std140 uniform block (8368 bytes)
      --quarter            Save the PNG at half width and half height
      --dump-slice         Print the sampled 8x8x8 slice

Octree:
  -p, --preset NAME        Octree preset (default: lower_half)
  -d, --depth N            Octree depth to sample (default: 2)
      --origin X,Y,Z       Slice origin in world space (default: 0,0,0)

Camera:
  -t, --translation X,Y,Z  Camera translation (default: 0,0,-6)
      --yaw R              Rotation about y in radians (default: 0)
      --pitch R            Rotation about x in radians (default: 0)
      --fov R              Vertical field of view in radians (default: 0.2)
      --width N            Viewport width in pixels (default: 300)
      --height N           Viewport height in pixels (default: 300)

Other:
  -v, --verbose            Echo component logs to the terminal
  -h, --help               Show this help message
)";
    std::cout << "\nPresets: " << presets << "\n\n";
}

} // namespace Octaview::Slicer
