#pragma once

#include <cstdint>
#include <string>

#include <vulkan/vulkan.h>

#include "render/backend/vulkan/chunk_draw_buffers.h"

namespace voxquad::render::vulkan {

// Matches IndirectBuildPush in build_indirect.comp.slang.
struct IndirectBuildPushConstants {
    std::uint32_t slotCount = 0;
    std::uint32_t visibleCount = 0;
    std::uint32_t metadataCount = 0;
    std::uint32_t quadBufferCount = 0;
};

// GPU side of the indirect command build: one invocation per draw slot rewrites that slot's
// instance record and VkDrawIndexedIndirectCommand every frame.
class ChunkIndirectPass {
public:
    bool init(VkDevice device, const std::string& shaderDirectory, const ChunkDrawBuffers& buffers);
    void shutdown();

    // Waits for earlier indirect and vertex reads of the output buffers, dispatches over all
    // slots, then makes the results visible to indirect draws and vertex shader storage reads.
    // Safe to record more than once per submission.
    void record(VkCommandBuffer commandBuffer, const ChunkDrawBuffers& buffers) const;

private:
    bool createDescriptors(const ChunkDrawBuffers& buffers);
    bool createPipeline(const std::string& shaderDirectory);

    VkDevice m_device = VK_NULL_HANDLE;
    VkDescriptorSetLayout m_descriptorSetLayout = VK_NULL_HANDLE;
    VkDescriptorPool m_descriptorPool = VK_NULL_HANDLE;
    VkDescriptorSet m_descriptorSet = VK_NULL_HANDLE;
    VkPipelineLayout m_pipelineLayout = VK_NULL_HANDLE;
    VkPipeline m_pipeline = VK_NULL_HANDLE;
};

} // namespace voxquad::render::vulkan
