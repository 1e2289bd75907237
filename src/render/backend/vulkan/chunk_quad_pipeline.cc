#include "render/backend/vulkan/chunk_quad_pipeline.h"

#include "core/log.h"
#include "render/backend/vulkan/vk_utils.h"

#include <array>
#include <optional>
#include <string>

namespace voxquad::render::vulkan {

namespace {

constexpr std::uint32_t kBindingQuads = 0;
constexpr std::uint32_t kBindingInstances = 1;
constexpr std::uint32_t kBindingView = 2;
constexpr std::uint32_t kBindingFaceTextures = 3;
constexpr std::uint32_t kBindingOcclusion = 4;
constexpr std::uint32_t kBindingAtlas = 5;
constexpr std::uint32_t kChunkBindingCount = 6;

VkFormat prepassTargetFormat(PrepassTarget target, const ChunkAttachmentFormats& formats) {
    return target == PrepassTarget::Normal ? formats.normal : formats.motionVector;
}

} // namespace

bool ChunkQuadPipelines::init(
    VkDevice device,
    const RenderConfig& config,
    const ChunkDrawBuffers& buffers,
    const ChunkAtlasBinding& atlas,
    const ChunkAttachmentFormats& formats,
    const std::vector<ChunkPipelineKey>& keys
) {
    m_device = device;
    if (formats.depth == VK_FORMAT_UNDEFINED) {
        VQ_LOGE("vulkan") << "chunk pipelines need a depth format";
        return false;
    }
    if (!createDescriptors(buffers, atlas) || !createPipelineLayout()) {
        shutdown();
        return false;
    }
    for (const ChunkPipelineKey key : keys) {
        if (!createPipeline(config, formats, key)) {
            shutdown();
            return false;
        }
    }
    return true;
}

void ChunkQuadPipelines::shutdown() {
    if (m_device == VK_NULL_HANDLE) {
        return;
    }
    for (const auto& [key, pipeline] : m_pipelines) {
        vkDestroyPipeline(m_device, pipeline, nullptr);
    }
    m_pipelines.clear();
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

bool ChunkQuadPipelines::hasPipeline(ChunkPipelineKey key) const {
    return m_pipelines.find(key) != m_pipelines.end();
}

bool ChunkQuadPipelines::createDescriptors(const ChunkDrawBuffers& buffers, const ChunkAtlasBinding& atlas) {
    constexpr VkShaderStageFlags kVertexFragment = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
    const std::array<VkDescriptorSetLayoutBinding, kChunkBindingCount> bindings = {{
        {kBindingQuads, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, kVertexFragment, nullptr},
        {kBindingInstances, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, VK_SHADER_STAGE_VERTEX_BIT, nullptr},
        {kBindingView, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1, kVertexFragment, nullptr},
        {kBindingFaceTextures, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, VK_SHADER_STAGE_FRAGMENT_BIT, nullptr},
        {kBindingOcclusion, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, VK_SHADER_STAGE_FRAGMENT_BIT, nullptr},
        {kBindingAtlas, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 1, VK_SHADER_STAGE_FRAGMENT_BIT, nullptr}
    }};

    VkDescriptorSetLayoutCreateInfo layoutCreateInfo{};
    layoutCreateInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutCreateInfo.bindingCount = static_cast<std::uint32_t>(bindings.size());
    layoutCreateInfo.pBindings = bindings.data();
    VkResult result = vkCreateDescriptorSetLayout(m_device, &layoutCreateInfo, nullptr, &m_descriptorSetLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateDescriptorSetLayout(chunkQuad)", result);
        return false;
    }

    const std::array<VkDescriptorPoolSize, 3> poolSizes = {{
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 4},
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1},
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 1}
    }};
    VkDescriptorPoolCreateInfo poolCreateInfo{};
    poolCreateInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolCreateInfo.maxSets = 1;
    poolCreateInfo.poolSizeCount = static_cast<std::uint32_t>(poolSizes.size());
    poolCreateInfo.pPoolSizes = poolSizes.data();
    result = vkCreateDescriptorPool(m_device, &poolCreateInfo, nullptr, &m_descriptorPool);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateDescriptorPool(chunkQuad)", result);
        return false;
    }

    VkDescriptorSetAllocateInfo allocateInfo{};
    allocateInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocateInfo.descriptorPool = m_descriptorPool;
    allocateInfo.descriptorSetCount = 1;
    allocateInfo.pSetLayouts = &m_descriptorSetLayout;
    result = vkAllocateDescriptorSets(m_device, &allocateInfo, &m_descriptorSet);
    if (result != VK_SUCCESS) {
        logVkFailure("vkAllocateDescriptorSets(chunkQuad)", result);
        return false;
    }

    const std::array<VkDescriptorBufferInfo, 5> bufferInfos = {{
        {buffers.quadBuffer(), 0, VK_WHOLE_SIZE},
        {buffers.instanceBuffer(), 0, VK_WHOLE_SIZE},
        {buffers.viewBuffer(), 0, VK_WHOLE_SIZE},
        {buffers.faceTextureBuffer(), 0, VK_WHOLE_SIZE},
        {buffers.occlusionBuffer(), 0, VK_WHOLE_SIZE}
    }};
    VkDescriptorImageInfo atlasInfo{};
    atlasInfo.sampler = atlas.sampler;
    atlasInfo.imageView = atlas.imageView;
    atlasInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    std::array<VkWriteDescriptorSet, kChunkBindingCount> writes{};
    for (std::uint32_t i = 0; i < kChunkBindingCount; ++i) {
        writes[i].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[i].dstSet = m_descriptorSet;
        writes[i].dstBinding = i;
        writes[i].descriptorCount = 1;
        writes[i].descriptorType = bindings[i].descriptorType;
        if (i == kBindingAtlas) {
            writes[i].pImageInfo = &atlasInfo;
        } else {
            writes[i].pBufferInfo = &bufferInfos[i];
        }
    }
    const std::uint32_t writeCount = (atlas.imageView != VK_NULL_HANDLE && atlas.sampler != VK_NULL_HANDLE)
        ? kChunkBindingCount
        : kChunkBindingCount - 1u;
    if (writeCount != kChunkBindingCount) {
        VQ_LOGW("vulkan") << "chunk atlas not bound; fragment passes must not sample it";
    }
    vkUpdateDescriptorSets(m_device, writeCount, writes.data(), 0, nullptr);
    nameVkObject(m_device, VK_OBJECT_TYPE_DESCRIPTOR_SET, m_descriptorSet, "chunk.quad.set");
    return true;
}

bool ChunkQuadPipelines::createPipelineLayout() {
    VkPipelineLayoutCreateInfo layoutCreateInfo{};
    layoutCreateInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutCreateInfo.setLayoutCount = 1;
    layoutCreateInfo.pSetLayouts = &m_descriptorSetLayout;
    const VkResult result = vkCreatePipelineLayout(m_device, &layoutCreateInfo, nullptr, &m_pipelineLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreatePipelineLayout(chunkQuad)", result);
        return false;
    }
    return true;
}

bool ChunkQuadPipelines::createPipeline(
    const RenderConfig& config,
    const ChunkAttachmentFormats& formats,
    ChunkPipelineKey key
) {
    const bool prepass = isPrepassKey(key);
    if (!prepass && formats.color == VK_FORMAT_UNDEFINED) {
        VQ_LOGE("vulkan") << "main chunk pipeline needs a color format";
        return false;
    }

    std::array<VkShaderModule, 2> shaderModules = {VK_NULL_HANDLE, VK_NULL_HANDLE};
    const std::string vertexPath = config.shaderDirectory + "/" + chunkVertexShaderFile(key);
    if (!createShaderModule(m_device, vertexPath, "chunk.quad.vert", shaderModules[0])) {
        return false;
    }
    const std::optional<std::string> fragmentFile = chunkFragmentShaderFile(key);
    if (fragmentFile.has_value()) {
        const std::string fragmentPath = config.shaderDirectory + "/" + *fragmentFile;
        if (!createShaderModule(m_device, fragmentPath, "chunk.quad.frag", shaderModules[1])) {
            destroyShaderModules(m_device, shaderModules);
            return false;
        }
    }

    std::array<VkPipelineShaderStageCreateInfo, 2> shaderStages{};
    shaderStages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    shaderStages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
    shaderStages[0].module = shaderModules[0];
    shaderStages[0].pName = "main";
    shaderStages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    shaderStages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    shaderStages[1].module = shaderModules[1];
    shaderStages[1].pName = "main";
    const std::uint32_t stageCount = fragmentFile.has_value() ? 2u : 1u;

    // Vertices are pulled from the quad storage buffer.
    VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
    vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.depthClampEnable = VK_FALSE;
    rasterizer.rasterizerDiscardEnable = VK_FALSE;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth = 1.0f;
    rasterizer.cullMode = VK_CULL_MODE_BACK_BIT;
    rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    // Reverse-Z: nearer fragments have larger depth.
    VkPipelineDepthStencilStateCreateInfo depthStencil{};
    depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depthStencil.depthTestEnable = VK_TRUE;
    depthStencil.depthWriteEnable = VK_TRUE;
    depthStencil.depthCompareOp = VK_COMPARE_OP_GREATER_OR_EQUAL;

    std::vector<VkFormat> colorFormats;
    if (!prepass) {
        colorFormats.push_back(formats.color);
    } else {
        for (const PrepassTarget target : prepassColorTargets(key)) {
            colorFormats.push_back(prepassTargetFormat(target, formats));
        }
    }

    VkPipelineColorBlendAttachmentState colorBlendAttachment{};
    colorBlendAttachment.colorWriteMask =
        VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    const std::vector<VkPipelineColorBlendAttachmentState> blendAttachments(colorFormats.size(), colorBlendAttachment);

    VkPipelineColorBlendStateCreateInfo colorBlending{};
    colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlending.attachmentCount = static_cast<std::uint32_t>(blendAttachments.size());
    colorBlending.pAttachments = blendAttachments.data();

    const std::array<VkDynamicState, 2> dynamicStates = {
        VK_DYNAMIC_STATE_VIEWPORT,
        VK_DYNAMIC_STATE_SCISSOR
    };
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = static_cast<std::uint32_t>(dynamicStates.size());
    dynamicState.pDynamicStates = dynamicStates.data();

    VkPipelineRenderingCreateInfo renderingCreateInfo{};
    renderingCreateInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    renderingCreateInfo.colorAttachmentCount = static_cast<std::uint32_t>(colorFormats.size());
    renderingCreateInfo.pColorAttachmentFormats = colorFormats.data();
    renderingCreateInfo.depthAttachmentFormat = formats.depth;

    VkGraphicsPipelineCreateInfo pipelineCreateInfo{};
    pipelineCreateInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineCreateInfo.pNext = &renderingCreateInfo;
    pipelineCreateInfo.stageCount = stageCount;
    pipelineCreateInfo.pStages = shaderStages.data();
    pipelineCreateInfo.pVertexInputState = &vertexInputInfo;
    pipelineCreateInfo.pInputAssemblyState = &inputAssembly;
    pipelineCreateInfo.pViewportState = &viewportState;
    pipelineCreateInfo.pRasterizationState = &rasterizer;
    pipelineCreateInfo.pMultisampleState = &multisampling;
    pipelineCreateInfo.pDepthStencilState = &depthStencil;
    pipelineCreateInfo.pColorBlendState = &colorBlending;
    pipelineCreateInfo.pDynamicState = &dynamicState;
    pipelineCreateInfo.layout = m_pipelineLayout;

    VkPipeline pipeline = VK_NULL_HANDLE;
    const VkResult result = vkCreateGraphicsPipelines(m_device, VK_NULL_HANDLE, 1, &pipelineCreateInfo, nullptr, &pipeline);
    destroyShaderModules(m_device, shaderModules);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateGraphicsPipelines(chunkQuad)", result);
        return false;
    }

    m_pipelines[key] = pipeline;
    nameVkObject(
        m_device,
        VK_OBJECT_TYPE_PIPELINE,
        pipeline,
        "pipeline.chunkQuad.key" + std::to_string(key)
    );
    VQ_LOGI("vulkan") << "pipeline config (chunkQuad): key=0x" << std::hex << key << std::dec
                      << ", prepass=" << (prepass ? "yes" : "no")
                      << ", colorTargets=" << colorFormats.size()
                      << ", fragment=" << (fragmentFile.has_value() ? "yes" : "no");
    return true;
}

void ChunkQuadPipelines::recordDraw(
    VkCommandBuffer commandBuffer,
    ChunkPipelineKey key,
    const ChunkDrawBuffers& buffers
) const {
    const auto it = m_pipelines.find(key);
    if (it == m_pipelines.end()) {
        VQ_LOGW("vulkan") << "no chunk pipeline for key 0x" << std::hex << key << std::dec;
        return;
    }

    vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, it->second);
    vkCmdBindDescriptorSets(
        commandBuffer,
        VK_PIPELINE_BIND_POINT_GRAPHICS,
        m_pipelineLayout,
        0,
        1,
        &m_descriptorSet,
        0,
        nullptr
    );
    vkCmdBindIndexBuffer(commandBuffer, buffers.quadIndexBuffer(), 0, VK_INDEX_TYPE_UINT32);
    // Needs the multiDrawIndirect device feature when more than one slot is allocated.
    vkCmdDrawIndexedIndirect(
        commandBuffer,
        buffers.indirectBuffer(),
        0,
        buffers.sizes().slotCapacity,
        sizeof(IndexedIndirectArgs)
    );
}

} // namespace voxquad::render::vulkan
