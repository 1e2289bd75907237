#include <gtest/gtest.h>

#include <map>
#include <string>

#include "render/render_config.h"

namespace {

voxquad::render::EnvironmentLookup lookupFrom(const std::map<std::string, std::string>& values) {
    return [&values](const char* name) -> const char* {
        const auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

TEST(RenderConfigTest, DefaultsAreUsableWithoutEnvironment) {
    voxquad::render::RenderConfig config{};
    const std::map<std::string, std::string> empty;
    voxquad::render::applyEnvironmentOverrides(config, lookupFrom(empty));

    EXPECT_EQ(config.slotCapacity, 4096u);
    EXPECT_EQ(config.builderWorkerCount, 1u);
    EXPECT_EQ(config.orientation.rotationMask, 0u);
    EXPECT_EQ(config.atlas.tilesPerRow, 16u);
    EXPECT_EQ(config.shaderDirectory, "shaders");
    EXPECT_TRUE(voxquad::render::isValidOcclusionCurve(config.occlusionCurve));
}

TEST(RenderConfigTest, ReadsEveryOverride) {
    const std::map<std::string, std::string> values = {
        {"VOXQUAD_SLOT_CAPACITY", "1024"},
        {"VOXQUAD_BUILDER_WORKERS", "4"},
        {"VOXQUAD_AO_MINIMUM", "0.5"},
        {"VOXQUAD_AO_EXPONENT", "2"},
        {"VOXQUAD_ROTATION_MASK", "0x30"},
        {"VOXQUAD_FLIP_UV_X_MASK", "5"},
        {"VOXQUAD_FLIP_UV_Y_MASK", "0x3f"},
        {"VOXQUAD_ATLAS_TILES_X", "32"},
        {"VOXQUAD_ATLAS_TILES_Y", "8"},
        {"VOXQUAD_SHADER_DIR", "/opt/voxquad/shaders"}
    };
    voxquad::render::RenderConfig config{};
    voxquad::render::applyEnvironmentOverrides(config, lookupFrom(values));

    EXPECT_EQ(config.slotCapacity, 1024u);
    EXPECT_EQ(config.builderWorkerCount, 4u);
    EXPECT_FLOAT_EQ(config.occlusionCurve.minimum, 0.5f);
    EXPECT_FLOAT_EQ(config.occlusionCurve.exponent, 2.0f);
    EXPECT_EQ(config.orientation.rotationMask, 0x30u);
    EXPECT_EQ(config.orientation.flipUvXMask, 5u);
    EXPECT_EQ(config.orientation.flipUvYMask, 0x3Fu);
    EXPECT_EQ(config.atlas.tilesPerRow, 32u);
    EXPECT_EQ(config.atlas.tilesPerColumn, 8u);
    EXPECT_EQ(config.shaderDirectory, "/opt/voxquad/shaders");
}

TEST(RenderConfigTest, MalformedValuesKeepCurrentSetting) {
    const std::map<std::string, std::string> values = {
        {"VOXQUAD_SLOT_CAPACITY", "0"},
        {"VOXQUAD_BUILDER_WORKERS", "four"},
        {"VOXQUAD_AO_MINIMUM", "1.5"},
        {"VOXQUAD_AO_EXPONENT", "nan"},
        {"VOXQUAD_ROTATION_MASK", "0x1000"},
        {"VOXQUAD_FLIP_UV_X_MASK", "-1"},
        {"VOXQUAD_ATLAS_TILES_X", "0"},
        {"VOXQUAD_SHADER_DIR", ""}
    };
    voxquad::render::RenderConfig config{};
    config.slotCapacity = 77u;
    voxquad::render::applyEnvironmentOverrides(config, lookupFrom(values));

    const voxquad::render::RenderConfig defaults{};
    EXPECT_EQ(config.slotCapacity, 77u);
    EXPECT_EQ(config.builderWorkerCount, defaults.builderWorkerCount);
    EXPECT_FLOAT_EQ(config.occlusionCurve.minimum, defaults.occlusionCurve.minimum);
    EXPECT_FLOAT_EQ(config.occlusionCurve.exponent, defaults.occlusionCurve.exponent);
    EXPECT_EQ(config.orientation.rotationMask, 0u);
    EXPECT_EQ(config.orientation.flipUvXMask, 0u);
    EXPECT_EQ(config.atlas.tilesPerRow, defaults.atlas.tilesPerRow);
    EXPECT_EQ(config.shaderDirectory, defaults.shaderDirectory);
}

TEST(RenderConfigTest, OcclusionCurveValidation) {
    EXPECT_TRUE(voxquad::render::isValidOcclusionCurve({0.0f, 1.0f}));
    EXPECT_FALSE(voxquad::render::isValidOcclusionCurve({-0.1f, 1.0f}));
    EXPECT_FALSE(voxquad::render::isValidOcclusionCurve({0.5f, 0.0f}));
}

} // namespace
