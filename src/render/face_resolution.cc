#include "render/face_resolution.h"

#include <algorithm>
#include <cmath>

namespace voxquad::render {

namespace {

const FaceTexture kFallbackFaceTexture{};

core::Cell3i liftCell(core::Axis axis, int layer, int u, int v) {
    switch (axis) {
    case core::Axis::X:
        return core::Cell3i{layer, u, v};
    case core::Axis::Y:
        return core::Cell3i{u, layer, v};
    case core::Axis::Z:
    default:
        return core::Cell3i{u, v, layer};
    }
}

bool isOccludedCell(std::span<const std::uint32_t> words, const core::Cell3i& cell) {
    return isOccluded(words, cell.x, cell.y, cell.z);
}

float fract(float value) {
    return value - std::floor(value);
}

} // namespace

std::optional<std::uint32_t> occlusionBitIndex(int x, int y, int z) {
    constexpr int kMin = -1;
    constexpr int kMax = static_cast<int>(kChunkEdge);
    if (x < kMin || x > kMax || y < kMin || y > kMax || z < kMin || z > kMax) {
        return std::nullopt;
    }
    constexpr std::uint32_t kDim = kChunkOcclusionDimensions;
    return static_cast<std::uint32_t>(x + 1) +
           (static_cast<std::uint32_t>(y + 1) * kDim) +
           (static_cast<std::uint32_t>(z + 1) * kDim * kDim);
}

bool isOccluded(std::span<const std::uint32_t> words, int x, int y, int z) {
    const std::optional<std::uint32_t> bit = occlusionBitIndex(x, y, z);
    if (!bit.has_value() || (*bit / 32u) >= words.size()) {
        return false;
    }
    return ((words[*bit / 32u] >> (*bit % 32u)) & 1u) != 0u;
}

void setOccluded(std::span<std::uint32_t> words, int x, int y, int z, bool solid) {
    const std::optional<std::uint32_t> bit = occlusionBitIndex(x, y, z);
    if (!bit.has_value() || (*bit / 32u) >= words.size()) {
        return;
    }
    const std::uint32_t mask = 1u << (*bit % 32u);
    if (solid) {
        words[*bit / 32u] |= mask;
    } else {
        words[*bit / 32u] &= ~mask;
    }
}

std::span<const std::uint32_t> occlusionSlab(std::span<const std::uint32_t> buffer, std::uint32_t slot) {
    if (!occlusionSlotFits(slot, buffer.size() / kChunkOcclusionBufferSize)) {
        return {};
    }
    return buffer.subspan(static_cast<std::size_t>(slot) * kChunkOcclusionBufferSize, kChunkOcclusionBufferSize);
}

std::uint32_t cornerOcclusionLevel(bool side1, bool side2, bool corner) {
    if (side1 && side2) {
        return 0u;
    }
    const std::uint32_t occluders = (side1 ? 1u : 0u) + (side2 ? 1u : 0u) + (corner ? 1u : 0u);
    return kMaxOcclusionLevel - occluders;
}

std::uint32_t quadCornerOcclusion(std::span<const std::uint32_t> words, const PackedQuad& quad) {
    const core::Face face = extractFace(quad);
    const core::Axis axis = axisFromFace(face);
    const QuadCoord min = extractMin(quad);
    // Layer of air voxels the face looks into.
    const int layer = static_cast<int>(extractMagnitude(quad)) + (core::isPositiveFace(face) ? 1 : -1);

    std::uint32_t packed = 0;
    for (std::uint32_t corner = 0; corner < kQuadVertexCount; ++corner) {
        const QuadCoord point = rectangleCorner2d(quad, corner);
        const bool atMinU = point.x == min.x;
        const bool atMinV = point.y == min.y;
        const int u = static_cast<int>(point.x);
        const int v = static_cast<int>(point.y);
        const int insideU = atMinU ? u : u - 1;
        const int outsideU = atMinU ? u - 1 : u;
        const int insideV = atMinV ? v : v - 1;
        const int outsideV = atMinV ? v - 1 : v;

        const bool side1 = isOccludedCell(words, liftCell(axis, layer, outsideU, insideV));
        const bool side2 = isOccludedCell(words, liftCell(axis, layer, insideU, outsideV));
        const bool diagonal = isOccludedCell(words, liftCell(axis, layer, outsideU, outsideV));
        packed |= cornerOcclusionLevel(side1, side2, diagonal) << (corner * 2u);
    }
    return packed;
}

std::uint32_t unpackCornerOcclusion(std::uint32_t packed, std::uint32_t corner) {
    return (packed >> ((corner & 3u) * 2u)) & 3u;
}

float interpolateOcclusion(std::uint32_t packed, const math::Vector2& t) {
    const float tu = std::clamp(t.x, 0.0f, 1.0f);
    const float tv = std::clamp(t.y, 0.0f, 1.0f);
    const float topLeft = static_cast<float>(unpackCornerOcclusion(packed, 0u));
    const float topRight = static_cast<float>(unpackCornerOcclusion(packed, 1u));
    const float bottomLeft = static_cast<float>(unpackCornerOcclusion(packed, 2u));
    const float bottomRight = static_cast<float>(unpackCornerOcclusion(packed, 3u));
    const float bottom = bottomLeft + ((bottomRight - bottomLeft) * tu);
    const float top = topLeft + ((topRight - topLeft) * tu);
    return bottom + ((top - bottom) * tv);
}

float applyOcclusionCurve(const OcclusionCurve& curve, float level) {
    const float normalized = std::clamp(level / static_cast<float>(kMaxOcclusionLevel), 0.0f, 1.0f);
    const float minimum = std::clamp(curve.minimum, 0.0f, 1.0f);
    const float exponent = std::max(curve.exponent, 1e-3f);
    return minimum + ((1.0f - minimum) * std::pow(normalized, exponent));
}

const FaceTexture& resolveFaceTexture(std::span<const FaceTexture> faces, std::uint32_t textureId) {
    if (textureId >= faces.size()) {
        return kFallbackFaceTexture;
    }
    return faces[textureId];
}

math::Vector2 atlasUv(const AtlasLayout& atlas, std::uint32_t packedTile, const math::Vector2& uv) {
    const float tilesX = static_cast<float>(std::max(1u, atlas.tilesPerRow));
    const float tilesY = static_cast<float>(std::max(1u, atlas.tilesPerColumn));
    return math::Vector2{
        (static_cast<float>(atlasTileX(packedTile)) + fract(uv.x)) / tilesX,
        (static_cast<float>(atlasTileY(packedTile)) + fract(uv.y)) / tilesY
    };
}

ResolvedFace resolveFace(const FaceResolveContext& context, const ChunkVertexOutput& fragment) {
    const FaceTexture& face = resolveFaceTexture(context.faces, fragment.textureId);

    ResolvedFace resolved{};
    resolved.colorUv = atlasUv(context.atlas, face.colorTile, fragment.uv);
    resolved.hasNormalMap = (face.flags & kFaceTextureHasNormalMapBit) != 0u;
    if (resolved.hasNormalMap) {
        resolved.normalUv = atlasUv(context.atlas, face.normalTile, fragment.uv);
    }

    const std::span<const std::uint32_t> slab = occlusionSlab(context.occlusion, fragment.occlusionSlot);
    if (!slab.empty() && fragment.quadIndex < context.quads.size()) {
        const PackedQuad& quad = context.quads[fragment.quadIndex];
        const QuadCoord min = extractMin(quad);
        const QuadCoord max = extractMax(quad);
        const float width = static_cast<float>(max.x - min.x);
        const float height = static_cast<float>(max.y - min.y);
        const math::Vector2 t{
            width > 0.0f ? fragment.quadLocal.x / width : 0.0f,
            height > 0.0f ? fragment.quadLocal.y / height : 0.0f
        };
        resolved.occlusionLevel = interpolateOcclusion(quadCornerOcclusion(slab, quad), t);
    }
    resolved.occlusion = applyOcclusionCurve(context.occlusionCurve, resolved.occlusionLevel);
    return resolved;
}

} // namespace voxquad::render
