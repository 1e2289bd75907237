#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace voxquad::render {

// Per-face atlas orientation fixes, baked into shaders at pipeline build time.
// rotationMask holds two bits per face (face f at bits 2f..2f+1), the flip masks one bit per face.
struct OrientationConfig {
    std::uint32_t rotationMask = 0;
    std::uint32_t flipUvXMask = 0;
    std::uint32_t flipUvYMask = 0;
};

// Maps an ambient occlusion level in [0, 3] to a light factor in [minimum, 1].
struct OcclusionCurve {
    float minimum = 0.35f;
    float exponent = 1.6f;
};

// Square tiles on a regular grid. FaceTexture tiles index into it.
struct AtlasLayout {
    std::uint32_t tilesPerRow = 16;
    std::uint32_t tilesPerColumn = 16;
};

struct RenderConfig {
    OrientationConfig orientation{};
    OcclusionCurve occlusionCurve{};
    AtlasLayout atlas{};
    std::uint32_t slotCapacity = 4096;
    std::uint32_t builderWorkerCount = 1;
    // Compiled SPIR-V variants, as written by voxquad_shaderc.
    std::string shaderDirectory = "shaders";
};

using EnvironmentLookup = std::function<const char*(const char*)>;

// Reads the VOXQUAD_* overrides: SLOT_CAPACITY, BUILDER_WORKERS, AO_MINIMUM, AO_EXPONENT,
// ROTATION_MASK, FLIP_UV_X_MASK, FLIP_UV_Y_MASK, ATLAS_TILES_X, ATLAS_TILES_Y and SHADER_DIR.
// Malformed or out-of-range values are logged and leave the current value in place.
void applyEnvironmentOverrides(RenderConfig& config);
void applyEnvironmentOverrides(RenderConfig& config, const EnvironmentLookup& lookup);

[[nodiscard]] bool isValidOcclusionCurve(const OcclusionCurve& curve);

} // namespace voxquad::render
