#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>

#include "core/face.h"
#include "math/math.h"
#include "render/chunk_draw_types.h"
#include "render/quad.h"
#include "render/render_config.h"

namespace voxquad::render {

// Structural vertex stage variants. Each mask value is a separately compiled shader; the host
// reference below is a template over the same mask so no branch depends on it at runtime.
using VertexFeatureMask = std::uint32_t;

constexpr VertexFeatureMask kVertexFeatureNone = 0u;
constexpr VertexFeatureMask kVertexFeatureNormals = 1u << 0u;
constexpr VertexFeatureMask kVertexFeatureMotionVectors = 1u << 1u;
constexpr VertexFeatureMask kVertexFeatureInstanceIndex = 1u << 2u;
constexpr VertexFeatureMask kVertexFeatureVertexColor = 1u << 3u;
constexpr VertexFeatureMask kVertexFeatureDepthClampOrtho = 1u << 4u;
constexpr VertexFeatureMask kVertexFeatureDeferred = 1u << 5u;
constexpr VertexFeatureMask kVertexFeatureAll = (1u << 6u) - 1u;

// Deferred output needs both the normal and the motion attributes.
constexpr bool emitsNormals(VertexFeatureMask features) {
    return (features & (kVertexFeatureNormals | kVertexFeatureDeferred)) != 0u;
}

constexpr bool emitsMotionVectors(VertexFeatureMask features) {
    return (features & (kVertexFeatureMotionVectors | kVertexFeatureDeferred)) != 0u;
}

struct ViewUniforms {
    math::Matrix4 viewProjection{};
    math::Matrix4 previousViewProjection{};
};

struct VertexFetchContext {
    std::span<const PackedQuad> quads;
    std::span<const ChunkInstanceData> instances;
    ViewUniforms view{};
    OrientationConfig orientation{};
};

// Geometry outputs, plus the uv and texture id an alpha-tested prepass fragment reads.
struct PrepassVertexOutput {
    math::Vector4 clipPosition{};
    math::Vector2 uv{};
    std::uint32_t textureId = 0;
    math::Vector3 worldNormal{};
    math::Vector4 previousClipPosition{};
    math::Vector4 unclampedClipPosition{};
    std::uint32_t instanceIndex = 0;
};

struct ChunkVertexOutput {
    math::Vector4 clipPosition{};
    math::Vector3 worldPosition{};
    math::Vector3 localPosition{};
    // Oriented atlas coordinate in voxel units. Wraps per voxel in the fragment stage.
    math::Vector2 uv{};
    // Unrotated position inside the quad, used to interpolate corner occlusion.
    math::Vector2 quadLocal{};
    std::uint32_t textureId = 0;
    std::uint32_t quadIndex = 0;
    std::uint32_t occlusionSlot = 0;

    math::Vector3 worldNormal{};
    // xyz tangent along +u, w handedness of the bitangent.
    math::Vector4 worldTangent{};
    math::Vector4 previousClipPosition{};
    std::uint32_t instanceIndex = 0;
    math::Vector4 color{};
    math::Vector4 unclampedClipPosition{};
};

[[nodiscard]] std::uint32_t effectiveRotation(const PackedQuad& quad, const OrientationConfig& orientation);
[[nodiscard]] bool effectiveFlipX(const PackedQuad& quad, const OrientationConfig& orientation);
[[nodiscard]] bool effectiveFlipY(const PackedQuad& quad, const OrientationConfig& orientation);

// Rotates about the origin in 90 degree steps: (u, v) -> (v, -u) -> (-u, -v) -> (-v, u),
// then negates u and/or v for the flips.
[[nodiscard]] math::Vector2 orientUv(const math::Vector2& uv, std::uint32_t rotation, bool flipX, bool flipY);
[[nodiscard]] math::Vector2 orientedQuadUv(const PackedQuad& quad, std::uint32_t corner, const OrientationConfig& orientation);

// World directions of the face's projected (u, v) axes.
void faceBasis(core::Face face, math::Vector3& outU, math::Vector3& outV);
[[nodiscard]] math::Vector4 orientedTangent(const PackedQuad& quad, const OrientationConfig& orientation);

[[nodiscard]] math::Vector4 unpackRgba8(std::uint32_t packed);

// Orthographic shadow views clamp geometry behind the near plane onto it instead of clipping.
[[nodiscard]] inline math::Vector4 clampOrthoDepth(const math::Vector4& clipPosition) {
    math::Vector4 clamped = clipPosition;
    clamped.z = std::min(clamped.z, 1.0f);
    return clamped;
}

// Screen-space motion in NDC units, current minus previous.
[[nodiscard]] math::Vector2 computeMotionVector(const math::Vector4& clipPosition, const math::Vector4& previousClipPosition);

struct QuadVertexRef {
    const PackedQuad* quad = nullptr;
    const ChunkInstanceData* instance = nullptr;
    std::uint32_t quadIndex = 0;
    std::uint32_t corner = 0;
};

// quadIndex = vertexIndex / 4 + instance.baseQuadOffset, corner = vertexIndex % 4.
// std::nullopt when either index is outside the bound buffers.
[[nodiscard]] std::optional<QuadVertexRef> fetchQuadVertex(
    const VertexFetchContext& context,
    std::uint32_t instanceIndex,
    std::uint32_t vertexIndex
);

template <VertexFeatureMask Features>
[[nodiscard]] std::optional<PrepassVertexOutput> reconstructPrepassVertex(
    const VertexFetchContext& context,
    std::uint32_t instanceIndex,
    std::uint32_t vertexIndex
) {
    const std::optional<QuadVertexRef> ref = fetchQuadVertex(context, instanceIndex, vertexIndex);
    if (!ref.has_value()) {
        return std::nullopt;
    }

    const math::Vector3 localPosition = extractPosition(*ref->quad, ref->corner);
    const math::Vector3 worldPosition = math::Vector3{
        ref->instance->worldOffset[0],
        ref->instance->worldOffset[1],
        ref->instance->worldOffset[2]
    } + localPosition;
    const math::Vector4 worldPoint{worldPosition, 1.0f};

    PrepassVertexOutput out{};
    out.clipPosition = context.view.viewProjection * worldPoint;
    out.uv = orientedQuadUv(*ref->quad, ref->corner, context.orientation);
    out.textureId = extractTextureId(*ref->quad);
    if constexpr (emitsNormals(Features)) {
        out.worldNormal = extractNormal(*ref->quad);
    }
    if constexpr (emitsMotionVectors(Features)) {
        out.previousClipPosition = context.view.previousViewProjection * worldPoint;
    }
    if constexpr ((Features & kVertexFeatureInstanceIndex) != 0u) {
        out.instanceIndex = instanceIndex;
    }
    if constexpr ((Features & kVertexFeatureDepthClampOrtho) != 0u) {
        out.unclampedClipPosition = out.clipPosition;
        out.clipPosition = clampOrthoDepth(out.clipPosition);
    }
    return out;
}

template <VertexFeatureMask Features>
[[nodiscard]] std::optional<ChunkVertexOutput> reconstructVertex(
    const VertexFetchContext& context,
    std::uint32_t instanceIndex,
    std::uint32_t vertexIndex
) {
    const std::optional<QuadVertexRef> ref = fetchQuadVertex(context, instanceIndex, vertexIndex);
    if (!ref.has_value()) {
        return std::nullopt;
    }
    const PackedQuad& quad = *ref->quad;
    const ChunkInstanceData& instance = *ref->instance;

    ChunkVertexOutput out{};
    out.localPosition = extractPosition(quad, ref->corner);
    out.worldPosition = math::Vector3{
        instance.worldOffset[0],
        instance.worldOffset[1],
        instance.worldOffset[2]
    } + out.localPosition;
    const math::Vector4 worldPoint{out.worldPosition, 1.0f};
    out.clipPosition = context.view.viewProjection * worldPoint;
    out.uv = orientedQuadUv(quad, ref->corner, context.orientation);
    out.quadLocal = extractUv(quad, ref->corner);
    out.textureId = extractTextureId(quad);
    out.quadIndex = ref->quadIndex;
    out.occlusionSlot = instance.occlusionSlot;

    if constexpr (emitsNormals(Features)) {
        out.worldNormal = extractNormal(quad);
        out.worldTangent = orientedTangent(quad, context.orientation);
    }
    if constexpr (emitsMotionVectors(Features)) {
        out.previousClipPosition = context.view.previousViewProjection * worldPoint;
    }
    if constexpr ((Features & kVertexFeatureInstanceIndex) != 0u) {
        out.instanceIndex = instanceIndex;
    }
    if constexpr ((Features & kVertexFeatureVertexColor) != 0u) {
        out.color = unpackRgba8(instance.tint);
    }
    if constexpr ((Features & kVertexFeatureDepthClampOrtho) != 0u) {
        out.unclampedClipPosition = out.clipPosition;
        out.clipPosition = clampOrthoDepth(out.clipPosition);
    }
    return out;
}

} // namespace voxquad::render
