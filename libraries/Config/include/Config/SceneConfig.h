#pragma once

#include "Octree.h"
#include "SliceRender/SliceCamera.h"
#include "SliceRender/SliceCaster.h"
#include "SliceRender/SliceTypes.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Octaview::Config {

/**
 * @brief Everything needed to sample and render one frame
 *
 * JSON layout (all keys optional, defaults shown):
 * @code
 * {
 *   "octree":   { "preset": "lower_half", "values": [ ... ] },
 *   "slice":    { "depth": 2, "origin": [0, 0, 0] },
 *   "camera":   { "translation": [0, 0, -6], "x_rotation": 0, "y_rotation": 0, "fov": 0.2 },
 *   "viewport": { "width": 300, "height": 300 },
 *   "palette":  { "hit": [1,1,1,1], "miss": [0.05,0.05,0.08,1], "background": [0,0,0,0] },
 *   "output":   { "image": "octaview_frame.png", "uniforms": "" }
 * }
 * @endcode
 * A non-empty "values" array takes precedence over "preset".
 */
struct SceneConfig {
    // Octree source
    std::string octreePreset = "lower_half";
    std::vector<SVO::PackedEntry> octreeValues;

    // Slice
    uint32_t depth = 2;
    glm::vec3 sliceOrigin{0.0f};

    // Camera
    SliceRender::CameraState camera;
    float fov = SliceRender::DEFAULT_FOV;

    SliceRender::Viewport viewport;
    SliceRender::CasterPalette palette;

    // Output
    std::string outputImage = "octaview_frame.png";
    std::string outputUniforms;  // empty = not written

    static constexpr uint32_t MAX_VIEWPORT_DIMENSION = 8192;
    static constexpr uint32_t MAX_DEPTH = 24;

    /**
     * @brief Validate configuration
     * @return List of validation errors (empty if valid)
     */
    std::vector<std::string> Validate() const;

    bool IsValid() const { return Validate().empty(); }

    bool UsesExplicitOctree() const { return !octreeValues.empty(); }

    /// Resolve the octree source; nullopt for an unknown preset
    std::optional<SVO::Octree> BuildOctree() const;
};

/// Load and save scene configurations as JSON
class SceneConfigLoader {
public:
    /// Load scene configuration from JSON file
    /// @param filepath Path to JSON config file
    /// @param error Receives the IO or parse error message (optional)
    /// @return Configuration if successful, empty optional on error
    static std::optional<SceneConfig> LoadFromFile(const std::filesystem::path& filepath,
                                                   std::string* error = nullptr);

    /// Save configuration to JSON file
    static bool SaveToFile(const SceneConfig& config, const std::filesystem::path& filepath);

    /// Parse configuration from JSON string
    static std::optional<SceneConfig> ParseFromString(const std::string& jsonString,
                                                      std::string* error = nullptr);

    /// Serialize configuration to JSON string
    static std::string SerializeToString(const SceneConfig& config);

private:
    static SceneConfig ParseConfigObject(const void* jsonObject);
};

} // namespace Octaview::Config
