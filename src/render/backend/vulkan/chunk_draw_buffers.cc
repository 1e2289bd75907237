#include "render/backend/vulkan/chunk_draw_buffers.h"

#include "core/log.h"
#include "render/face_resolution.h"

#include <algorithm>
#include <cstring>
#include <vector>

namespace voxquad::render::vulkan {

namespace {

template <typename T>
std::span<const std::uint8_t> asBytes(std::span<const T> values) {
    return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(values.data()), values.size_bytes());
}

bool checkRange(const char* what, std::uint64_t first, std::uint64_t count, std::uint64_t capacity) {
    if (first + count > capacity) {
        VQ_LOGE("vulkan") << what << " upload out of range: first=" << first << ", count=" << count
                          << ", capacity=" << capacity;
        return false;
    }
    return true;
}

} // namespace

bool ChunkDrawBuffers::init(BufferAllocator& allocator, const ChunkDrawBufferSizes& sizes) {
    m_allocator = &allocator;
    m_sizes = sizes;
    m_sizes.slotCapacity = std::max(1u, m_sizes.slotCapacity);

    const VkDeviceSize slotCount = m_sizes.slotCapacity;
    m_quads = allocator.create({
        .size = sizeof(PackedQuad) * static_cast<VkDeviceSize>(std::max(1u, m_sizes.quadCapacity)),
        .usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
        .memory = BufferMemory::HostMapped,
        .debugName = "chunk.quads"
    });
    m_metadata = allocator.create({
        .size = sizeof(GpuChunkMetadata) * static_cast<VkDeviceSize>(std::max(1u, m_sizes.metadataCapacity)),
        .usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
        .memory = BufferMemory::HostMapped,
        .debugName = "chunk.metadata"
    });
    m_visibleIndices = allocator.create({
        .size = sizeof(std::uint32_t) * slotCount,
        .usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
        .memory = BufferMemory::HostMapped,
        .debugName = "chunk.visibleIndices"
    });
    m_instances = allocator.create({
        .size = sizeof(ChunkInstanceData) * slotCount,
        .usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
        .memory = BufferMemory::DeviceLocal,
        .debugName = "chunk.instances"
    });
    m_indirect = allocator.create({
        .size = sizeof(IndexedIndirectArgs) * slotCount,
        .usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT,
        .memory = BufferMemory::DeviceLocal,
        .debugName = "chunk.indirectArgs"
    });
    m_quadIndices = allocator.create({
        .size = sizeof(std::uint32_t) * static_cast<VkDeviceSize>(kMaxQuadsPerChunk) * kQuadIndexCount,
        .usage = VK_BUFFER_USAGE_INDEX_BUFFER_BIT,
        .memory = BufferMemory::HostMapped,
        .debugName = "chunk.quadIndices"
    });
    m_faceTextures = allocator.create({
        .size = sizeof(FaceTexture) * static_cast<VkDeviceSize>(std::max(1u, m_sizes.faceTextureCapacity)),
        .usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
        .memory = BufferMemory::HostMapped,
        .debugName = "chunk.faceTextures"
    });
    m_occlusion = allocator.create({
        .size = sizeof(std::uint32_t) * static_cast<VkDeviceSize>(kChunkOcclusionBufferSize) *
                std::max(1u, m_sizes.occlusionSlotCapacity),
        .usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
        .memory = BufferMemory::HostMapped,
        .debugName = "chunk.occlusion"
    });
    m_view = allocator.create({
        .size = sizeof(GpuChunkViewUniforms),
        .usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
        .memory = BufferMemory::HostMapped,
        .debugName = "chunk.view"
    });

    const BufferHandle handles[] = {
        m_quads, m_metadata, m_visibleIndices, m_instances, m_indirect,
        m_quadIndices, m_faceTextures, m_occlusion, m_view
    };
    for (const BufferHandle handle : handles) {
        if (handle == kInvalidBufferHandle) {
            VQ_LOGE("vulkan") << "chunk draw buffer allocation failed";
            shutdown();
            return false;
        }
    }

    std::vector<std::uint32_t> indices(static_cast<std::size_t>(kMaxQuadsPerChunk) * kQuadIndexCount);
    fillQuadIndices(indices);
    if (!allocator.write(m_quadIndices, 0, asBytes(std::span<const std::uint32_t>(indices)))) {
        shutdown();
        return false;
    }

    VQ_LOGI("vulkan") << "chunk draw buffers ready: slots=" << m_sizes.slotCapacity
                      << ", quads=" << m_sizes.quadCapacity
                      << ", metadata=" << m_sizes.metadataCapacity;
    return true;
}

VkBuffer ChunkDrawBuffers::bufferOf(BufferHandle handle) const {
    return m_allocator != nullptr ? m_allocator->buffer(handle) : VK_NULL_HANDLE;
}

void ChunkDrawBuffers::shutdown() {
    if (m_allocator == nullptr) {
        return;
    }
    BufferHandle* handles[] = {
        &m_quads, &m_metadata, &m_visibleIndices, &m_instances, &m_indirect,
        &m_quadIndices, &m_faceTextures, &m_occlusion, &m_view
    };
    for (BufferHandle* handle : handles) {
        m_allocator->destroy(*handle);
        *handle = kInvalidBufferHandle;
    }
    m_visibleCount = 0;
    m_metadataCount = 0;
    m_allocator = nullptr;
}

bool ChunkDrawBuffers::uploadQuads(std::span<const PackedQuad> quads, std::uint32_t firstQuad) {
    if (!checkRange("quad", firstQuad, quads.size(), m_sizes.quadCapacity)) {
        return false;
    }
    return m_allocator->write(m_quads, sizeof(PackedQuad) * static_cast<VkDeviceSize>(firstQuad), asBytes(quads));
}

bool ChunkDrawBuffers::uploadMetadata(std::span<const GpuChunkMetadata> metadata, std::uint32_t firstChunk) {
    if (!checkRange("metadata", firstChunk, metadata.size(), m_sizes.metadataCapacity)) {
        return false;
    }
    for (std::size_t i = 0; i < metadata.size(); ++i) {
        if (!occlusionSlotFits(metadata[i].occlusionSlot, m_sizes.occlusionSlotCapacity)) {
            VQ_LOGE("vulkan") << "chunk metadata " << (firstChunk + i) << " names occlusion slot "
                              << metadata[i].occlusionSlot << ", capacity=" << m_sizes.occlusionSlotCapacity;
            return false;
        }
    }
    if (!m_allocator->write(
            m_metadata,
            sizeof(GpuChunkMetadata) * static_cast<VkDeviceSize>(firstChunk),
            asBytes(metadata)
        )) {
        return false;
    }
    m_metadataCount = std::max(m_metadataCount, firstChunk + static_cast<std::uint32_t>(metadata.size()));
    return true;
}

bool ChunkDrawBuffers::uploadVisibleIndices(std::span<const std::uint32_t> metadataIndices) {
    if (metadataIndices.size() > m_sizes.slotCapacity) {
        VQ_LOGE("vulkan") << "visible list exceeds slot capacity: visible=" << metadataIndices.size()
                          << ", slots=" << m_sizes.slotCapacity;
        return false;
    }
    if (!m_allocator->write(m_visibleIndices, 0, asBytes(metadataIndices))) {
        return false;
    }
    m_visibleCount = static_cast<std::uint32_t>(metadataIndices.size());
    return true;
}

bool ChunkDrawBuffers::uploadFaceTextures(std::span<const FaceTexture> faces) {
    if (!checkRange("face texture", 0, faces.size(), m_sizes.faceTextureCapacity)) {
        return false;
    }
    return m_allocator->write(m_faceTextures, 0, asBytes(faces));
}

bool ChunkDrawBuffers::uploadOcclusion(std::uint32_t occlusionSlot, const ChunkOcclusionWords& words) {
    if (!checkRange("occlusion", occlusionSlot, 1, m_sizes.occlusionSlotCapacity)) {
        return false;
    }
    return m_allocator->write(
        m_occlusion,
        sizeof(ChunkOcclusionWords) * static_cast<VkDeviceSize>(occlusionSlot),
        asBytes(std::span<const std::uint32_t>(words))
    );
}

bool ChunkDrawBuffers::uploadView(const ViewUniforms& view, const OcclusionCurve& curve) {
    GpuChunkViewUniforms uniforms{};
    std::memcpy(uniforms.viewProjection, view.viewProjection.m, sizeof(uniforms.viewProjection));
    std::memcpy(uniforms.previousViewProjection, view.previousViewProjection.m, sizeof(uniforms.previousViewProjection));
    uniforms.occlusionCurve[0] = curve.minimum;
    uniforms.occlusionCurve[1] = curve.exponent;
    return m_allocator->write(
        m_view,
        0,
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(&uniforms), sizeof(uniforms))
    );
}

VkBuffer ChunkDrawBuffers::quadBuffer() const { return bufferOf(m_quads); }
VkBuffer ChunkDrawBuffers::metadataBuffer() const { return bufferOf(m_metadata); }
VkBuffer ChunkDrawBuffers::visibleIndexBuffer() const { return bufferOf(m_visibleIndices); }
VkBuffer ChunkDrawBuffers::instanceBuffer() const { return bufferOf(m_instances); }
VkBuffer ChunkDrawBuffers::indirectBuffer() const { return bufferOf(m_indirect); }
VkBuffer ChunkDrawBuffers::quadIndexBuffer() const { return bufferOf(m_quadIndices); }
VkBuffer ChunkDrawBuffers::faceTextureBuffer() const { return bufferOf(m_faceTextures); }
VkBuffer ChunkDrawBuffers::occlusionBuffer() const { return bufferOf(m_occlusion); }
VkBuffer ChunkDrawBuffers::viewBuffer() const { return bufferOf(m_view); }

} // namespace voxquad::render::vulkan
