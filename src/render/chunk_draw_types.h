#pragma once

#include <array>
#include <cstdint>

#include "render/quad.h"

namespace voxquad::render {

// Device-visible records. Layouts are shared with src/render/shaders/chunk_types.slang.

constexpr std::uint32_t kChunkMetadataFlagHidden = 1u << 0u;

// Written by the external streaming/culling stage, one per resident chunk.
struct alignas(16) GpuChunkMetadata {
    float origin[3] = {0.0f, 0.0f, 0.0f};
    std::uint32_t flags = 0;
    std::uint32_t quadBaseOffset = 0;
    std::uint32_t quadCount = 0;
    std::uint32_t tint = 0xFFFFFFFFu;
    // Slab of the shared occlusion buffer holding this chunk's occupancy bits.
    std::uint32_t occlusionSlot = 0;
};

// One per draw slot. All-zero is the inert record.
struct alignas(16) ChunkInstanceData {
    float worldOffset[4] = {0.0f, 0.0f, 0.0f, 0.0f};
    std::uint32_t baseQuadOffset = 0;
    std::uint32_t slotIndex = 0;
    std::uint32_t tint = 0;
    std::uint32_t occlusionSlot = 0;
};

// Same layout as VkDrawIndexedIndirectCommand. All-zero draws nothing.
struct IndexedIndirectArgs {
    std::uint32_t indexCount = 0;
    std::uint32_t instanceCount = 0;
    std::uint32_t firstIndex = 0;
    std::int32_t vertexOffset = 0;
    std::uint32_t firstInstance = 0;
};

static_assert(sizeof(GpuChunkMetadata) == 32, "GpuChunkMetadata must match the shader-side layout");
static_assert(sizeof(ChunkInstanceData) == 32, "ChunkInstanceData must match the shader-side layout");
static_assert(sizeof(IndexedIndirectArgs) == 20, "IndexedIndirectArgs must match the indirect command layout");

constexpr std::uint32_t kFaceTextureHasNormalMapBit = 1u << 0u;

// Per texture id. Atlas tiles are packed as (x | y << 16).
struct FaceTexture {
    std::uint32_t flags = 0;
    std::uint32_t colorTile = 0;
    std::uint32_t normalTile = 0;
    std::uint32_t reserved = 0;
};

static_assert(sizeof(FaceTexture) == 16, "FaceTexture must match the shader-side layout");

constexpr std::uint32_t packAtlasTile(std::uint32_t x, std::uint32_t y) {
    return (x & 0xFFFFu) | ((y & 0xFFFFu) << 16u);
}

constexpr std::uint32_t atlasTileX(std::uint32_t packed) {
    return packed & 0xFFFFu;
}

constexpr std::uint32_t atlasTileY(std::uint32_t packed) {
    return packed >> 16u;
}

constexpr std::uint32_t packRgba8(std::uint32_t r, std::uint32_t g, std::uint32_t b, std::uint32_t a) {
    return (r & 0xFFu) | ((g & 0xFFu) << 8u) | ((b & 0xFFu) << 16u) | ((a & 0xFFu) << 24u);
}

// Occupancy bitset over a chunk plus a one voxel apron on every side, so corners on the chunk
// border can see their neighbours. Voxel (x, y, z) in [-1, kChunkEdge] maps to bit
// (x + 1) + (y + 1) * D + (z + 1) * D * D with D = kChunkOcclusionDimensions.
constexpr std::uint32_t kChunkOcclusionDimensions = kChunkEdge + 2u;
constexpr std::uint32_t kChunkOcclusionBitCount =
    kChunkOcclusionDimensions * kChunkOcclusionDimensions * kChunkOcclusionDimensions;
constexpr std::uint32_t kChunkOcclusionBufferSize = (kChunkOcclusionBitCount + 31u) / 32u;

using ChunkOcclusionWords = std::array<std::uint32_t, kChunkOcclusionBufferSize>;

} // namespace voxquad::render
