#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include <vulkan/vulkan.h>

#include "render/backend/vulkan/chunk_draw_buffers.h"
#include "render/pipeline_variants.h"
#include "render/render_config.h"

namespace voxquad::render::vulkan {

struct ChunkAttachmentFormats {
    VkFormat color = VK_FORMAT_UNDEFINED;
    VkFormat depth = VK_FORMAT_UNDEFINED;
    VkFormat normal = VK_FORMAT_A2B10G10R10_UNORM_PACK32;
    VkFormat motionVector = VK_FORMAT_R16G16_SFLOAT;
};

struct ChunkAtlasBinding {
    VkImageView imageView = VK_NULL_HANDLE;
    VkSampler sampler = VK_NULL_HANDLE;
};

// Graphics pipelines for the chunk draw, one per ChunkPipelineKey, sharing a single
// descriptor set over the chunk buffers and the texture atlas.
class ChunkQuadPipelines {
public:
    bool init(
        VkDevice device,
        const RenderConfig& config,
        const ChunkDrawBuffers& buffers,
        const ChunkAtlasBinding& atlas,
        const ChunkAttachmentFormats& formats,
        const std::vector<ChunkPipelineKey>& keys
    );
    void shutdown();

    [[nodiscard]] bool hasPipeline(ChunkPipelineKey key) const;

    // Binds the pipeline and issues one indexed draw per slot. Inert slots draw nothing.
    // Viewport and scissor are dynamic and must already be set.
    void recordDraw(VkCommandBuffer commandBuffer, ChunkPipelineKey key, const ChunkDrawBuffers& buffers) const;

private:
    bool createDescriptors(const ChunkDrawBuffers& buffers, const ChunkAtlasBinding& atlas);
    bool createPipelineLayout();
    bool createPipeline(const RenderConfig& config, const ChunkAttachmentFormats& formats, ChunkPipelineKey key);

    VkDevice m_device = VK_NULL_HANDLE;
    VkDescriptorSetLayout m_descriptorSetLayout = VK_NULL_HANDLE;
    VkDescriptorPool m_descriptorPool = VK_NULL_HANDLE;
    VkDescriptorSet m_descriptorSet = VK_NULL_HANDLE;
    VkPipelineLayout m_pipelineLayout = VK_NULL_HANDLE;
    std::unordered_map<ChunkPipelineKey, VkPipeline> m_pipelines;
};

} // namespace voxquad::render::vulkan
