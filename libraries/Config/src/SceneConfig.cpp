#include "Config/SceneConfig.h"
#include "OctreePresets.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Octaview::Config {

namespace {

constexpr float PI = 3.14159265358979323846f;

template <int N>
glm::vec<N, float> ReadVector(const nlohmann::json& value, const std::string& key) {
    if (!value.is_array() || value.size() != static_cast<size_t>(N)) {
        throw std::invalid_argument(key + " must be an array of " + std::to_string(N) + " numbers");
    }
    glm::vec<N, float> result(0.0f);
    for (int i = 0; i < N; ++i) {
        if (!value[i].is_number()) {
            throw std::invalid_argument(key + " must be an array of " + std::to_string(N) + " numbers");
        }
        result[i] = value[i].get<float>();
    }
    return result;
}

uint32_t ReadUnsigned(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(key + " must be a non-negative integer, got " + value.dump());
    }
    return value.get<uint32_t>();
}

template <int N>
nlohmann::json WriteVector(const glm::vec<N, float>& value) {
    nlohmann::json array = nlohmann::json::array();
    for (int i = 0; i < N; ++i) {
        array.push_back(value[i]);
    }
    return array;
}

bool ColorInRange(const glm::vec4& color) {
    for (int i = 0; i < 4; ++i) {
        if (!(color[i] >= 0.0f && color[i] <= 1.0f)) {
            return false;
        }
    }
    return true;
}

nlohmann::json ToJson(const SceneConfig& config) {
    nlohmann::json j;

    j["octree"]["preset"] = config.octreePreset;
    if (config.UsesExplicitOctree()) {
        j["octree"]["values"] = config.octreeValues;
    }

    j["slice"]["depth"] = config.depth;
    j["slice"]["origin"] = WriteVector<3>(config.sliceOrigin);

    j["camera"]["translation"] = WriteVector<3>(config.camera.translation);
    j["camera"]["x_rotation"] = config.camera.xRotation;
    j["camera"]["y_rotation"] = config.camera.yRotation;
    j["camera"]["fov"] = config.fov;

    j["viewport"]["width"] = config.viewport.width;
    j["viewport"]["height"] = config.viewport.height;

    j["palette"]["hit"] = WriteVector<4>(config.palette.hit);
    j["palette"]["miss"] = WriteVector<4>(config.palette.miss);
    j["palette"]["background"] = WriteVector<4>(config.palette.background);

    j["output"]["image"] = config.outputImage;
    if (!config.outputUniforms.empty()) {
        j["output"]["uniforms"] = config.outputUniforms;
    }

    return j;
}

} // namespace

// ============================================================================
// SceneConfig
// ============================================================================

std::vector<std::string> SceneConfig::Validate() const {
    std::vector<std::string> errors;

    if (viewport.width == 0 || viewport.width > MAX_VIEWPORT_DIMENSION) {
        errors.push_back("viewport.width must be in [1, " + std::to_string(MAX_VIEWPORT_DIMENSION) +
                         "], got " + std::to_string(viewport.width));
    }
    if (viewport.height == 0 || viewport.height > MAX_VIEWPORT_DIMENSION) {
        errors.push_back("viewport.height must be in [1, " + std::to_string(MAX_VIEWPORT_DIMENSION) +
                         "], got " + std::to_string(viewport.height));
    }

    if (depth > MAX_DEPTH) {
        errors.push_back("slice.depth must be in [0, " + std::to_string(MAX_DEPTH) +
                         "], got " + std::to_string(depth));
    }

    if (!(fov > 0.0f && fov < PI)) {
        errors.push_back("camera.fov must be in (0, pi) radians, got " + std::to_string(fov));
    }

    if (!ColorInRange(palette.hit) || !ColorInRange(palette.miss) || !ColorInRange(palette.background)) {
        errors.push_back("palette colours must have every channel in [0, 1]");
    }

    if (outputImage.empty()) {
        errors.push_back("output.image must not be empty");
    }

    if (UsesExplicitOctree()) {
        for (const auto& error : SVO::Octree(octreeValues).validate()) {
            errors.push_back("octree.values: " + error);
        }
    } else {
        const auto& names = SVO::OctreePresets::presetNames();
        if (std::find(names.begin(), names.end(), octreePreset) == names.end()) {
            std::string known;
            for (const auto& name : names) {
                known += (known.empty() ? "" : ", ") + name;
            }
            errors.push_back("Unknown octree preset '" + octreePreset + "' (known: " + known + ")");
        }
    }

    return errors;
}

std::optional<SVO::Octree> SceneConfig::BuildOctree() const {
    if (UsesExplicitOctree()) {
        return SVO::Octree(octreeValues);
    }
    return SVO::OctreePresets::makePreset(octreePreset);
}

// ============================================================================
// SceneConfigLoader
// ============================================================================

std::optional<SceneConfig> SceneConfigLoader::LoadFromFile(const std::filesystem::path& filepath,
                                                           std::string* error) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        if (error) *error = "Cannot open config file: " + filepath.string();
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return ParseConfigObject(&j);
    } catch (const std::exception& e) {
        if (error) *error = filepath.string() + ": " + e.what();
        return std::nullopt;
    }
}

bool SceneConfigLoader::SaveToFile(const SceneConfig& config, const std::filesystem::path& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << ToJson(config).dump(2) << "\n";
    return static_cast<bool>(file);
}

std::optional<SceneConfig> SceneConfigLoader::ParseFromString(const std::string& jsonString,
                                                              std::string* error) {
    try {
        nlohmann::json j = nlohmann::json::parse(jsonString);
        return ParseConfigObject(&j);
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }
}

std::string SceneConfigLoader::SerializeToString(const SceneConfig& config) {
    return ToJson(config).dump(2);
}

SceneConfig SceneConfigLoader::ParseConfigObject(const void* jsonObject) {
    const nlohmann::json& j = *static_cast<const nlohmann::json*>(jsonObject);
    SceneConfig config;

    if (!j.is_object()) {
        throw std::invalid_argument("Scene config must be a JSON object");
    }

    if (j.contains("octree")) {
        auto& octree = j["octree"];
        if (octree.contains("preset")) config.octreePreset = octree["preset"].get<std::string>();
        if (octree.contains("values")) config.octreeValues = octree["values"].get<std::vector<SVO::PackedEntry>>();
    }

    if (j.contains("slice")) {
        auto& slice = j["slice"];
        if (slice.contains("depth")) config.depth = ReadUnsigned(slice["depth"], "slice.depth");
        if (slice.contains("origin")) config.sliceOrigin = ReadVector<3>(slice["origin"], "slice.origin");
    }

    if (j.contains("camera")) {
        auto& camera = j["camera"];
        if (camera.contains("translation")) {
            config.camera.translation = ReadVector<3>(camera["translation"], "camera.translation");
        }
        if (camera.contains("x_rotation")) config.camera.xRotation = camera["x_rotation"].get<float>();
        if (camera.contains("y_rotation")) config.camera.yRotation = camera["y_rotation"].get<float>();
        if (camera.contains("fov")) config.fov = camera["fov"].get<float>();
    }

    if (j.contains("viewport")) {
        auto& viewport = j["viewport"];
        if (viewport.contains("width")) config.viewport.width = ReadUnsigned(viewport["width"], "viewport.width");
        if (viewport.contains("height")) config.viewport.height = ReadUnsigned(viewport["height"], "viewport.height");
    }

    if (j.contains("palette")) {
        auto& palette = j["palette"];
        if (palette.contains("hit")) config.palette.hit = ReadVector<4>(palette["hit"], "palette.hit");
        if (palette.contains("miss")) config.palette.miss = ReadVector<4>(palette["miss"], "palette.miss");
        if (palette.contains("background")) {
            config.palette.background = ReadVector<4>(palette["background"], "palette.background");
        }
    }

    if (j.contains("output")) {
        auto& output = j["output"];
        if (output.contains("image")) config.outputImage = output["image"].get<std::string>();
        if (output.contains("uniforms")) config.outputUniforms = output["uniforms"].get<std::string>();
    }

    return config;
}

} // namespace Octaview::Config
