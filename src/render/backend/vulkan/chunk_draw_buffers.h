#pragma once

#include <cstdint>
#include <span>

#include <vulkan/vulkan.h>

#include "render/backend/vulkan/buffer_allocator.h"
#include "render/chunk_draw_types.h"
#include "render/quad.h"
#include "render/render_config.h"
#include "render/vertex_reconstruction.h"

namespace voxquad::render::vulkan {

struct ChunkDrawBufferSizes {
    // Draw slots N: one instance record and one indirect command per slot.
    std::uint32_t slotCapacity = 4096;
    std::uint32_t metadataCapacity = 4096;
    std::uint32_t quadCapacity = 1u << 20u;
    std::uint32_t faceTextureCapacity = 1024;
    std::uint32_t occlusionSlotCapacity = 4096;
};

// Matches ChunkViewUniforms in chunk_types.slang.
struct GpuChunkViewUniforms {
    float viewProjection[16];
    float previousViewProjection[16];
    float occlusionCurve[4];
};

static_assert(sizeof(GpuChunkViewUniforms) == 144, "GpuChunkViewUniforms must match the shader-side layout");

// Every buffer the chunk passes bind. Inputs are host-visible and written in place; the
// instance and indirect buffers are written by the build compute pass only.
class ChunkDrawBuffers {
public:
    bool init(BufferAllocator& allocator, const ChunkDrawBufferSizes& sizes);
    void shutdown();

    bool uploadQuads(std::span<const PackedQuad> quads, std::uint32_t firstQuad);
    // Rejected when any record names an occlusion slot past occlusionSlotCapacity.
    bool uploadMetadata(std::span<const GpuChunkMetadata> metadata, std::uint32_t firstChunk);
    // Replaces this frame's visible list. Rejected when longer than slotCapacity.
    bool uploadVisibleIndices(std::span<const std::uint32_t> metadataIndices);
    bool uploadFaceTextures(std::span<const FaceTexture> faces);
    bool uploadOcclusion(std::uint32_t occlusionSlot, const ChunkOcclusionWords& words);
    bool uploadView(const ViewUniforms& view, const OcclusionCurve& curve);

    [[nodiscard]] const ChunkDrawBufferSizes& sizes() const { return m_sizes; }
    [[nodiscard]] std::uint32_t visibleCount() const { return m_visibleCount; }
    [[nodiscard]] std::uint32_t metadataCount() const { return m_metadataCount; }
    [[nodiscard]] std::uint32_t quadBufferCount() const { return m_sizes.quadCapacity; }

    [[nodiscard]] VkBuffer quadBuffer() const;
    [[nodiscard]] VkBuffer metadataBuffer() const;
    [[nodiscard]] VkBuffer visibleIndexBuffer() const;
    [[nodiscard]] VkBuffer instanceBuffer() const;
    [[nodiscard]] VkBuffer indirectBuffer() const;
    [[nodiscard]] VkBuffer quadIndexBuffer() const;
    [[nodiscard]] VkBuffer faceTextureBuffer() const;
    [[nodiscard]] VkBuffer occlusionBuffer() const;
    [[nodiscard]] VkBuffer viewBuffer() const;

private:
    [[nodiscard]] VkBuffer bufferOf(BufferHandle handle) const;

    BufferAllocator* m_allocator = nullptr;
    ChunkDrawBufferSizes m_sizes{};
    std::uint32_t m_visibleCount = 0;
    std::uint32_t m_metadataCount = 0;

    BufferHandle m_quads = kInvalidBufferHandle;
    BufferHandle m_metadata = kInvalidBufferHandle;
    BufferHandle m_visibleIndices = kInvalidBufferHandle;
    BufferHandle m_instances = kInvalidBufferHandle;
    BufferHandle m_indirect = kInvalidBufferHandle;
    BufferHandle m_quadIndices = kInvalidBufferHandle;
    BufferHandle m_faceTextures = kInvalidBufferHandle;
    BufferHandle m_occlusion = kInvalidBufferHandle;
    BufferHandle m_view = kInvalidBufferHandle;
};

} // namespace voxquad::render::vulkan
