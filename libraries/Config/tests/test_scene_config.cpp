#include <gtest/gtest.h>
#include "Config/SceneConfig.h"
#include "OctreePresets.h"
#include <filesystem>
#include <fstream>

using namespace Octaview::Config;
using namespace Octaview;

namespace {

bool hasErrorContaining(const std::vector<std::string>& errors, const std::string& text) {
    for (const auto& error : errors) {
        if (error.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Defaults
// ============================================================================

TEST(SceneConfigTest, DefaultsAreValid) {
    SceneConfig config;

    EXPECT_EQ(config.octreePreset, "lower_half");
    EXPECT_EQ(config.depth, 2u);
    EXPECT_EQ(config.camera.translation, glm::vec3(0.0f, 0.0f, -6.0f));
    EXPECT_FLOAT_EQ(config.fov, 0.2f);
    EXPECT_EQ(config.viewport.width, 300u);
    EXPECT_EQ(config.viewport.height, 300u);
    EXPECT_EQ(config.outputImage, "octaview_frame.png");
    EXPECT_TRUE(config.outputUniforms.empty());
    EXPECT_TRUE(config.Validate().empty());
}

TEST(SceneConfigTest, BuildOctreeUsesPresetByDefault) {
    SceneConfig config;
    auto octree = config.BuildOctree();
    ASSERT_TRUE(octree.has_value());
    EXPECT_EQ(*octree, SVO::OctreePresets::lowerHalf());
}

TEST(SceneConfigTest, ExplicitValuesOverridePreset) {
    SceneConfig config;
    config.octreePreset = "solid";
    config.octreeValues = {1, 2, 3, 4, 5, 6, 7, 8};

    auto octree = config.BuildOctree();
    ASSERT_TRUE(octree.has_value());
    EXPECT_EQ(octree->rawAt(7), 8u);
}

// ============================================================================
// Validation
// ============================================================================

TEST(SceneConfigValidationTest, ViewportBounds) {
    SceneConfig config;
    config.viewport.width = 0;
    config.viewport.height = 9000;

    auto errors = config.Validate();
    EXPECT_TRUE(hasErrorContaining(errors, "viewport.width"));
    EXPECT_TRUE(hasErrorContaining(errors, "viewport.height"));
}

TEST(SceneConfigValidationTest, DepthBounds) {
    SceneConfig config;
    config.depth = 24;
    EXPECT_TRUE(config.IsValid());

    config.depth = 25;
    EXPECT_TRUE(hasErrorContaining(config.Validate(), "slice.depth"));
}

TEST(SceneConfigValidationTest, FovMustBeOpenInterval) {
    SceneConfig config;
    for (float fov : {0.0f, -0.1f, 3.2f}) {
        config.fov = fov;
        EXPECT_TRUE(hasErrorContaining(config.Validate(), "camera.fov")) << fov;
    }
    config.fov = 1.5f;
    EXPECT_TRUE(config.IsValid());
}

TEST(SceneConfigValidationTest, UnknownPresetListsKnownOnes) {
    SceneConfig config;
    config.octreePreset = "teapot";

    auto errors = config.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("teapot"), std::string::npos);
    EXPECT_NE(errors[0].find("bottom_plane"), std::string::npos);
    EXPECT_FALSE(config.BuildOctree().has_value());
}

TEST(SceneConfigValidationTest, MalformedExplicitOctreeIsReported) {
    SceneConfig config;
    config.octreeValues = {SVO::pack(0, 8), 0, 0, 0, 0, 0, 0, 0};

    auto errors = config.Validate();
    EXPECT_TRUE(hasErrorContaining(errors, "octree.values"));
    EXPECT_TRUE(hasErrorContaining(errors, "outside the array"));
}

TEST(SceneConfigValidationTest, PaletteChannelsInRange) {
    SceneConfig config;
    config.palette.miss = glm::vec4(1.5f, 0.0f, 0.0f, 1.0f);
    EXPECT_TRUE(hasErrorContaining(config.Validate(), "palette"));
}

// ============================================================================
// Parsing
// ============================================================================

TEST(SceneConfigLoaderTest, ParsesEverySection) {
    const std::string json = R"({
        "octree":   { "preset": "bottom_plane" },
        "slice":    { "depth": 5, "origin": [0.1, 0.2, 0.0] },
        "camera":   { "translation": [1, 2, -3], "x_rotation": 0.5, "y_rotation": -0.25, "fov": 0.4 },
        "viewport": { "width": 640, "height": 480 },
        "palette":  { "hit": [1, 0, 0, 1], "miss": [0, 0, 0, 1], "background": [0, 0, 1, 0.5] },
        "output":   { "image": "out/frame.png", "uniforms": "out/block.bin" }
    })";

    std::string error;
    auto config = SceneConfigLoader::ParseFromString(json, &error);
    ASSERT_TRUE(config.has_value()) << error;

    EXPECT_EQ(config->octreePreset, "bottom_plane");
    EXPECT_EQ(config->depth, 5u);
    EXPECT_FLOAT_EQ(config->sliceOrigin.y, 0.2f);
    EXPECT_EQ(config->camera.translation, glm::vec3(1.0f, 2.0f, -3.0f));
    EXPECT_FLOAT_EQ(config->camera.xRotation, 0.5f);
    EXPECT_FLOAT_EQ(config->camera.yRotation, -0.25f);
    EXPECT_FLOAT_EQ(config->fov, 0.4f);
    EXPECT_EQ(config->viewport.width, 640u);
    EXPECT_EQ(config->viewport.height, 480u);
    EXPECT_EQ(config->palette.hit, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
    EXPECT_FLOAT_EQ(config->palette.background.a, 0.5f);
    EXPECT_EQ(config->outputImage, "out/frame.png");
    EXPECT_EQ(config->outputUniforms, "out/block.bin");
    EXPECT_TRUE(config->IsValid());
}

TEST(SceneConfigLoaderTest, MissingKeysKeepDefaults) {
    auto config = SceneConfigLoader::ParseFromString(R"({ "slice": { "depth": 3 } })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->depth, 3u);
    EXPECT_EQ(config->octreePreset, "lower_half");
    EXPECT_EQ(config->viewport.width, 300u);
}

TEST(SceneConfigLoaderTest, ExplicitValuesParse) {
    auto config = SceneConfigLoader::ParseFromString(
        R"({ "octree": { "values": [2048, 0, 0, 0, 0, 0, 0, 0, 255, 0, 0, 0, 0, 0, 0, 0] } })");
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->octreeValues.size(), 16u);
    EXPECT_EQ(config->octreeValues[0], 2048u);
    EXPECT_TRUE(config->IsValid());
}

TEST(SceneConfigLoaderTest, SyntaxErrorIsReported) {
    std::string error;
    auto config = SceneConfigLoader::ParseFromString("{ \"slice\": ", &error);
    EXPECT_FALSE(config.has_value());
    EXPECT_FALSE(error.empty());
}

TEST(SceneConfigLoaderTest, WrongShapesAreReported) {
    std::string error;
    EXPECT_FALSE(SceneConfigLoader::ParseFromString(R"({ "slice": { "origin": [1, 2] } })", &error).has_value());
    EXPECT_NE(error.find("slice.origin"), std::string::npos);

    EXPECT_FALSE(SceneConfigLoader::ParseFromString(R"({ "viewport": { "width": "wide" } })", &error).has_value());
    EXPECT_FALSE(SceneConfigLoader::ParseFromString(R"([1, 2, 3])", &error).has_value());
}

TEST(SceneConfigLoaderTest, IntegerFieldsRejectFractionsAndNegatives) {
    std::string error;
    EXPECT_FALSE(SceneConfigLoader::ParseFromString(R"({ "slice": { "depth": 2.9 } })", &error).has_value());
    EXPECT_NE(error.find("slice.depth"), std::string::npos);

    EXPECT_FALSE(SceneConfigLoader::ParseFromString(R"({ "viewport": { "width": -1 } })", &error).has_value());
    EXPECT_NE(error.find("viewport.width"), std::string::npos);

    EXPECT_FALSE(SceneConfigLoader::ParseFromString(R"({ "viewport": { "height": 4294967296 } })", &error).has_value());
    EXPECT_NE(error.find("viewport.height"), std::string::npos);

    auto config = SceneConfigLoader::ParseFromString(R"({ "slice": { "depth": 5 }, "viewport": { "width": 64 } })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->depth, 5u);
    EXPECT_EQ(config->viewport.width, 64u);
}

TEST(SceneConfigLoaderTest, SerializeRoundTrip) {
    SceneConfig original;
    original.octreeValues = {SVO::pack(128, 8), 0, 0, 0, 0, 0, 0, 0, 255, 255, 255, 255, 0, 0, 0, 0};
    original.depth = 7;
    original.sliceOrigin = glm::vec3(0.25f, 0.5f, 0.125f);
    original.camera.xRotation = 0.75f;
    original.fov = 0.35f;
    original.viewport = {128, 64};
    original.outputUniforms = "block.bin";

    auto parsed = SceneConfigLoader::ParseFromString(SceneConfigLoader::SerializeToString(original));
    ASSERT_TRUE(parsed.has_value());

    EXPECT_EQ(parsed->octreeValues, original.octreeValues);
    EXPECT_EQ(parsed->depth, original.depth);
    EXPECT_EQ(parsed->sliceOrigin, original.sliceOrigin);
    EXPECT_FLOAT_EQ(parsed->camera.xRotation, 0.75f);
    EXPECT_FLOAT_EQ(parsed->fov, 0.35f);
    EXPECT_EQ(parsed->viewport.width, 128u);
    EXPECT_EQ(parsed->outputUniforms, "block.bin");
    EXPECT_EQ(parsed->palette.miss, original.palette.miss);
}

// ============================================================================
// Files
// ============================================================================

class SceneConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() / "octaview_scene_config_test.json";
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::filesystem::remove(path);
    }

    std::filesystem::path path;
};

TEST_F(SceneConfigFileTest, SaveThenLoad) {
    SceneConfig config;
    config.octreePreset = "solid";
    config.viewport.width = 77;

    ASSERT_TRUE(SceneConfigLoader::SaveToFile(config, path));

    std::string error;
    auto loaded = SceneConfigLoader::LoadFromFile(path, &error);
    ASSERT_TRUE(loaded.has_value()) << error;
    EXPECT_EQ(loaded->octreePreset, "solid");
    EXPECT_EQ(loaded->viewport.width, 77u);
}

TEST_F(SceneConfigFileTest, MissingFileReportsPath) {
    std::string error;
    auto loaded = SceneConfigLoader::LoadFromFile(path, &error);
    EXPECT_FALSE(loaded.has_value());
    EXPECT_NE(error.find("octaview_scene_config_test.json"), std::string::npos);
}

TEST_F(SceneConfigFileTest, InvalidJsonFileReportsError) {
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    std::string error;
    EXPECT_FALSE(SceneConfigLoader::LoadFromFile(path, &error).has_value());
    EXPECT_FALSE(error.empty());
}
