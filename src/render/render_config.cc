#include "render/render_config.h"

#include "core/log.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>

namespace voxquad::render {

namespace {

constexpr std::uint32_t kMaxSlotCapacity = 1u << 20u;
constexpr std::uint32_t kMaxBuilderWorkers = 64u;
// Two bits per face for rotation, one for each flip.
constexpr std::uint32_t kMaxRotationMask = (1u << 12u) - 1u;
constexpr std::uint32_t kMaxFlipMask = (1u << 6u) - 1u;
constexpr std::uint32_t kMaxAtlasTiles = 1u << 16u;

std::optional<std::uint32_t> parseUint(const char* text, int base) {
    if (text == nullptr || text[0] == '\0' || text[0] == '-') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(text, &end, base);
    if (errno != 0 || end == text || *end != '\0' || value > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

std::optional<float> parseFloat(const char* text) {
    if (text == nullptr || text[0] == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const float value = std::strtof(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

void overrideUint(
    const EnvironmentLookup& lookup,
    const char* name,
    std::uint32_t minValue,
    std::uint32_t maxValue,
    std::uint32_t& inOutValue,
    int base = 10
) {
    const char* text = lookup(name);
    if (text == nullptr) {
        return;
    }
    const std::optional<std::uint32_t> parsed = parseUint(text, base);
    if (!parsed.has_value() || *parsed < minValue || *parsed > maxValue) {
        VQ_LOGW("config") << "ignoring " << name << "=" << text << " (expected integer in ["
                          << minValue << ", " << maxValue << "]), keeping " << inOutValue;
        return;
    }
    inOutValue = *parsed;
    VQ_LOGD("config") << name << "=" << inOutValue;
}

void overrideFloat(
    const EnvironmentLookup& lookup,
    const char* name,
    float minValue,
    float maxValue,
    float& inOutValue
) {
    const char* text = lookup(name);
    if (text == nullptr) {
        return;
    }
    const std::optional<float> parsed = parseFloat(text);
    if (!parsed.has_value() || *parsed < minValue || *parsed > maxValue) {
        VQ_LOGW("config") << "ignoring " << name << "=" << text << " (expected number in ["
                          << minValue << ", " << maxValue << "]), keeping " << inOutValue;
        return;
    }
    inOutValue = *parsed;
    VQ_LOGD("config") << name << "=" << inOutValue;
}

void overrideString(const EnvironmentLookup& lookup, const char* name, std::string& inOutValue) {
    const char* text = lookup(name);
    if (text == nullptr) {
        return;
    }
    if (text[0] == '\0') {
        VQ_LOGW("config") << "ignoring empty " << name << ", keeping " << inOutValue;
        return;
    }
    inOutValue = text;
    VQ_LOGD("config") << name << "=" << inOutValue;
}

} // namespace

void applyEnvironmentOverrides(RenderConfig& config) {
    applyEnvironmentOverrides(config, [](const char* name) -> const char* {
        return std::getenv(name);
    });
}

void applyEnvironmentOverrides(RenderConfig& config, const EnvironmentLookup& lookup) {
    overrideUint(lookup, "VOXQUAD_SLOT_CAPACITY", 1u, kMaxSlotCapacity, config.slotCapacity);
    overrideUint(lookup, "VOXQUAD_BUILDER_WORKERS", 1u, kMaxBuilderWorkers, config.builderWorkerCount);
    overrideFloat(lookup, "VOXQUAD_AO_MINIMUM", 0.0f, 1.0f, config.occlusionCurve.minimum);
    overrideFloat(lookup, "VOXQUAD_AO_EXPONENT", 0.05f, 16.0f, config.occlusionCurve.exponent);
    // Masks accept hex ("0x0c") as well as decimal.
    overrideUint(lookup, "VOXQUAD_ROTATION_MASK", 0u, kMaxRotationMask, config.orientation.rotationMask, 0);
    overrideUint(lookup, "VOXQUAD_FLIP_UV_X_MASK", 0u, kMaxFlipMask, config.orientation.flipUvXMask, 0);
    overrideUint(lookup, "VOXQUAD_FLIP_UV_Y_MASK", 0u, kMaxFlipMask, config.orientation.flipUvYMask, 0);
    overrideUint(lookup, "VOXQUAD_ATLAS_TILES_X", 1u, kMaxAtlasTiles, config.atlas.tilesPerRow);
    overrideUint(lookup, "VOXQUAD_ATLAS_TILES_Y", 1u, kMaxAtlasTiles, config.atlas.tilesPerColumn);
    overrideString(lookup, "VOXQUAD_SHADER_DIR", config.shaderDirectory);
}

bool isValidOcclusionCurve(const OcclusionCurve& curve) {
    return curve.minimum >= 0.0f && curve.minimum <= 1.0f && curve.exponent > 0.0f;
}

} // namespace voxquad::render
