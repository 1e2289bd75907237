#include "render/backend/vulkan/chunk_indirect_pass.h"

#include "core/log.h"
#include "render/backend/vulkan/vk_utils.h"
#include "render/indirect_commands.h"
#include "render/pipeline_variants.h"

#include <array>
#include <cstddef>

namespace voxquad::render::vulkan {

static_assert(sizeof(IndexedIndirectArgs) == sizeof(VkDrawIndexedIndirectCommand));
static_assert(offsetof(IndexedIndirectArgs, indexCount) == offsetof(VkDrawIndexedIndirectCommand, indexCount));
static_assert(offsetof(IndexedIndirectArgs, instanceCount) == offsetof(VkDrawIndexedIndirectCommand, instanceCount));
static_assert(offsetof(IndexedIndirectArgs, firstIndex) == offsetof(VkDrawIndexedIndirectCommand, firstIndex));
static_assert(offsetof(IndexedIndirectArgs, vertexOffset) == offsetof(VkDrawIndexedIndirectCommand, vertexOffset));
static_assert(offsetof(IndexedIndirectArgs, firstInstance) == offsetof(VkDrawIndexedIndirectCommand, firstInstance));

namespace {

constexpr std::uint32_t kIndirectBindingCount = 4;

} // namespace

bool ChunkIndirectPass::init(VkDevice device, const std::string& shaderDirectory, const ChunkDrawBuffers& buffers) {
    m_device = device;
    if (!createDescriptors(buffers) || !createPipeline(shaderDirectory)) {
        shutdown();
        return false;
    }
    return true;
}

void ChunkIndirectPass::shutdown() {
    if (m_device == VK_NULL_HANDLE) {
        return;
    }
    if (m_pipeline != VK_NULL_HANDLE) {
        vkDestroyPipeline(m_device, m_pipeline, nullptr);
        m_pipeline = VK_NULL_HANDLE;
    }
    if (m_pipelineLayout != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(m_device, m_pipelineLayout, nullptr);
        m_pipelineLayout = VK_NULL_HANDLE;
    }
    if (m_descriptorPool != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(m_device, m_descriptorPool, nullptr);
        m_descriptorPool = VK_NULL_HANDLE;
        m_descriptorSet = VK_NULL_HANDLE;
    }
    if (m_descriptorSetLayout != VK_NULL_HANDLE) {
        vkDestroyDescriptorSetLayout(m_device, m_descriptorSetLayout, nullptr);
        m_descriptorSetLayout = VK_NULL_HANDLE;
    }
    m_device = VK_NULL_HANDLE;
}

bool ChunkIndirectPass::createDescriptors(const ChunkDrawBuffers& buffers) {
    std::array<VkDescriptorSetLayoutBinding, kIndirectBindingCount> bindings{};
    for (std::uint32_t i = 0; i < kIndirectBindingCount; ++i) {
        bindings[i].binding = i;
        bindings[i].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        bindings[i].descriptorCount = 1;
        bindings[i].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    }

    VkDescriptorSetLayoutCreateInfo layoutCreateInfo{};
    layoutCreateInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutCreateInfo.bindingCount = static_cast<std::uint32_t>(bindings.size());
    layoutCreateInfo.pBindings = bindings.data();
    VkResult result = vkCreateDescriptorSetLayout(m_device, &layoutCreateInfo, nullptr, &m_descriptorSetLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateDescriptorSetLayout(chunkIndirect)", result);
        return false;
    }

    const VkDescriptorPoolSize poolSize{VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, kIndirectBindingCount};
    VkDescriptorPoolCreateInfo poolCreateInfo{};
    poolCreateInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolCreateInfo.maxSets = 1;
    poolCreateInfo.poolSizeCount = 1;
    poolCreateInfo.pPoolSizes = &poolSize;
    result = vkCreateDescriptorPool(m_device, &poolCreateInfo, nullptr, &m_descriptorPool);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateDescriptorPool(chunkIndirect)", result);
        return false;
    }

    VkDescriptorSetAllocateInfo allocateInfo{};
    allocateInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocateInfo.descriptorPool = m_descriptorPool;
    allocateInfo.descriptorSetCount = 1;
    allocateInfo.pSetLayouts = &m_descriptorSetLayout;
    result = vkAllocateDescriptorSets(m_device, &allocateInfo, &m_descriptorSet);
    if (result != VK_SUCCESS) {
        logVkFailure("vkAllocateDescriptorSets(chunkIndirect)", result);
        return false;
    }

    const std::array<VkDescriptorBufferInfo, kIndirectBindingCount> bufferInfos = {{
        {buffers.metadataBuffer(), 0, VK_WHOLE_SIZE},
        {buffers.visibleIndexBuffer(), 0, VK_WHOLE_SIZE},
        {buffers.instanceBuffer(), 0, VK_WHOLE_SIZE},
        {buffers.indirectBuffer(), 0, VK_WHOLE_SIZE}
    }};
    std::array<VkWriteDescriptorSet, kIndirectBindingCount> writes{};
    for (std::uint32_t i = 0; i < kIndirectBindingCount; ++i) {
        writes[i].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[i].dstSet = m_descriptorSet;
        writes[i].dstBinding = i;
        writes[i].descriptorCount = 1;
        writes[i].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        writes[i].pBufferInfo = &bufferInfos[i];
    }
    vkUpdateDescriptorSets(m_device, static_cast<std::uint32_t>(writes.size()), writes.data(), 0, nullptr);
    nameVkObject(m_device, VK_OBJECT_TYPE_DESCRIPTOR_SET, m_descriptorSet, "chunk.indirect.set");
    return true;
}

bool ChunkIndirectPass::createPipeline(const std::string& shaderDirectory) {
    VkPushConstantRange pushConstantRange{};
    pushConstantRange.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    pushConstantRange.offset = 0;
    pushConstantRange.size = sizeof(IndirectBuildPushConstants);

    VkPipelineLayoutCreateInfo layoutCreateInfo{};
    layoutCreateInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutCreateInfo.setLayoutCount = 1;
    layoutCreateInfo.pSetLayouts = &m_descriptorSetLayout;
    layoutCreateInfo.pushConstantRangeCount = 1;
    layoutCreateInfo.pPushConstantRanges = &pushConstantRange;
    VkResult result = vkCreatePipelineLayout(m_device, &layoutCreateInfo, nullptr, &m_pipelineLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreatePipelineLayout(chunkIndirect)", result);
        return false;
    }

    VkShaderModule shaderModule = VK_NULL_HANDLE;
    const std::string shaderPath = shaderDirectory + "/" + kIndirectBuildShaderFile;
    if (!createShaderModule(m_device, shaderPath, "chunk.build_indirect.comp", shaderModule)) {
        return false;
    }

    VkComputePipelineCreateInfo pipelineCreateInfo{};
    pipelineCreateInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipelineCreateInfo.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    pipelineCreateInfo.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    pipelineCreateInfo.stage.module = shaderModule;
    pipelineCreateInfo.stage.pName = "main";
    pipelineCreateInfo.layout = m_pipelineLayout;
    result = vkCreateComputePipelines(m_device, VK_NULL_HANDLE, 1, &pipelineCreateInfo, nullptr, &m_pipeline);
    vkDestroyShaderModule(m_device, shaderModule, nullptr);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateComputePipelines(chunkIndirect)", result);
        return false;
    }
    nameVkObject(m_device, VK_OBJECT_TYPE_PIPELINE, m_pipeline, "pipeline.chunkIndirect");
    VQ_LOGI("vulkan") << "pipeline config (chunkIndirect): workgroup=" << kIndirectBuildWorkgroupSize;
    return true;
}

void ChunkIndirectPass::record(VkCommandBuffer commandBuffer, const ChunkDrawBuffers& buffers) const {
    if (m_pipeline == VK_NULL_HANDLE) {
        return;
    }

    // Draws recorded from an earlier build in this submission must finish reading the
    // instance and indirect buffers before the dispatch overwrites them.
    std::array<VkBufferMemoryBarrier2, 2> readBarriers{};
    readBarriers[0].sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2;
    readBarriers[0].srcStageMask = VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT;
    readBarriers[0].srcAccessMask = VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT;
    readBarriers[0].dstStageMask = VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT;
    readBarriers[0].dstAccessMask = VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
    readBarriers[0].srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    readBarriers[0].dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    readBarriers[0].buffer = buffers.indirectBuffer();
    readBarriers[0].offset = 0;
    readBarriers[0].size = VK_WHOLE_SIZE;

    readBarriers[1] = readBarriers[0];
    readBarriers[1].srcStageMask = VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT;
    readBarriers[1].srcAccessMask = VK_ACCESS_2_SHADER_STORAGE_READ_BIT;
    readBarriers[1].buffer = buffers.instanceBuffer();

    VkDependencyInfo readDependency{};
    readDependency.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    readDependency.bufferMemoryBarrierCount = static_cast<std::uint32_t>(readBarriers.size());
    readDependency.pBufferMemoryBarriers = readBarriers.data();
    vkCmdPipelineBarrier2(commandBuffer, &readDependency);

    IndirectBuildPushConstants push{};
    push.slotCount = buffers.sizes().slotCapacity;
    push.visibleCount = buffers.visibleCount();
    push.metadataCount = buffers.metadataCount();
    push.quadBufferCount = buffers.quadBufferCount();

    vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_COMPUTE, m_pipeline);
    vkCmdBindDescriptorSets(
        commandBuffer,
        VK_PIPELINE_BIND_POINT_COMPUTE,
        m_pipelineLayout,
        0,
        1,
        &m_descriptorSet,
        0,
        nullptr
    );
    vkCmdPushConstants(
        commandBuffer,
        m_pipelineLayout,
        VK_SHADER_STAGE_COMPUTE_BIT,
        0,
        sizeof(push),
        &push
    );
    vkCmdDispatch(commandBuffer, indirectBuildGroupCount(push.slotCount), 1, 1);

    std::array<VkBufferMemoryBarrier2, 2> bufferBarriers{};
    bufferBarriers[0].sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2;
    bufferBarriers[0].srcStageMask = VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT;
    bufferBarriers[0].srcAccessMask = VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
    bufferBarriers[0].dstStageMask = VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT;
    bufferBarriers[0].dstAccessMask = VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT;
    bufferBarriers[0].srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    bufferBarriers[0].dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    bufferBarriers[0].buffer = buffers.indirectBuffer();
    bufferBarriers[0].offset = 0;
    bufferBarriers[0].size = VK_WHOLE_SIZE;

    bufferBarriers[1] = bufferBarriers[0];
    bufferBarriers[1].dstStageMask = VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT;
    bufferBarriers[1].dstAccessMask = VK_ACCESS_2_SHADER_STORAGE_READ_BIT;
    bufferBarriers[1].buffer = buffers.instanceBuffer();

    VkDependencyInfo dependencyInfo{};
    dependencyInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    dependencyInfo.bufferMemoryBarrierCount = static_cast<std::uint32_t>(bufferBarriers.size());
    dependencyInfo.pBufferMemoryBarriers = bufferBarriers.data();
    vkCmdPipelineBarrier2(commandBuffer, &dependencyInfo);
}

} // namespace voxquad::render::vulkan
