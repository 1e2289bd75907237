#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "math/math.h"
#include "render/chunk_draw_types.h"
#include "render/quad.h"
#include "render/render_config.h"
#include "render/vertex_reconstruction.h"

namespace voxquad::render {

constexpr std::uint32_t kMaxOcclusionLevel = 3;

// Bit index of voxel (x, y, z) in a chunk occlusion map. Coordinates include the apron, so
// each component must be in [-1, kChunkEdge].
[[nodiscard]] std::optional<std::uint32_t> occlusionBitIndex(int x, int y, int z);

// Voxels outside the apron read as empty.
[[nodiscard]] bool isOccluded(std::span<const std::uint32_t> words, int x, int y, int z);
void setOccluded(std::span<std::uint32_t> words, int x, int y, int z, bool solid);

// Slabs beyond slotCapacity do not exist in the bound occlusion buffer and read as fully lit.
[[nodiscard]] constexpr bool occlusionSlotFits(std::uint32_t slot, std::uint64_t slotCapacity) {
    return slot < slotCapacity;
}

// Slab of the shared occlusion buffer owned by one chunk. Empty when the slot is out of range.
[[nodiscard]] std::span<const std::uint32_t> occlusionSlab(std::span<const std::uint32_t> buffer, std::uint32_t slot);

// Classic vertex AO: 3 is fully lit, 0 is a corner with both side neighbours solid.
[[nodiscard]] std::uint32_t cornerOcclusionLevel(bool side1, bool side2, bool corner);

// Levels of the four rectangle corners, two bits each, corner k at bits 2k..2k+1 in the
// unswapped layout of kQuadIndexPattern.
[[nodiscard]] std::uint32_t quadCornerOcclusion(std::span<const std::uint32_t> words, const PackedQuad& quad);
[[nodiscard]] std::uint32_t unpackCornerOcclusion(std::uint32_t packed, std::uint32_t corner);

// Bilinear level at t in [0, 1]^2, t = (0, 0) at the quad min corner.
[[nodiscard]] float interpolateOcclusion(std::uint32_t packed, const math::Vector2& t);

// Monotonic remap of a level in [0, 3] to a light factor: minimum at 0, 1 at 3.
[[nodiscard]] float applyOcclusionCurve(const OcclusionCurve& curve, float level);

// Texture ids outside the table resolve to a fallback descriptor (tile 0, no normal map).
[[nodiscard]] const FaceTexture& resolveFaceTexture(std::span<const FaceTexture> faces, std::uint32_t textureId);

// Wraps the oriented uv per voxel and places it inside the atlas tile.
[[nodiscard]] math::Vector2 atlasUv(const AtlasLayout& atlas, std::uint32_t packedTile, const math::Vector2& uv);

struct FaceResolveContext {
    std::span<const FaceTexture> faces;
    std::span<const PackedQuad> quads;
    // All chunk slabs back to back, kChunkOcclusionBufferSize words each.
    std::span<const std::uint32_t> occlusion;
    AtlasLayout atlas{};
    OcclusionCurve occlusionCurve{};
};

struct ResolvedFace {
    math::Vector2 colorUv{};
    bool hasNormalMap = false;
    math::Vector2 normalUv{};
    float occlusionLevel = static_cast<float>(kMaxOcclusionLevel);
    float occlusion = 1.0f;
};

// Fragment stage reference. Reads only; takes the interpolated vertex outputs.
[[nodiscard]] ResolvedFace resolveFace(const FaceResolveContext& context, const ChunkVertexOutput& fragment);

} // namespace voxquad::render
