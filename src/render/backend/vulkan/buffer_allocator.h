#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <vulkan/vulkan.h>
#if defined(VOXQUAD_HAS_VMA)
#include <vk_mem_alloc.h>
#endif

namespace voxquad::render::vulkan {

// Slot index into BufferAllocator. 0 is reserved as the null handle.
using BufferHandle = std::uint32_t;
constexpr BufferHandle kInvalidBufferHandle = 0;

enum class BufferMemory : std::uint8_t {
    // Written only by the GPU (instances, indirect arguments).
    DeviceLocal,
    // Persistently mapped, coherent host writes (quads, metadata, visible lists, uniforms).
    HostMapped
};

struct BufferDesc {
    VkDeviceSize size = 0;
    VkBufferUsageFlags usage = 0;
    BufferMemory memory = BufferMemory::DeviceLocal;
    const char* debugName = nullptr;
};

// Backing store for the chunk draw buffers. Allocates through VMA when one is
// supplied, otherwise binds a dedicated vkAllocateMemory block per buffer.
class BufferAllocator {
public:
    bool init(VkPhysicalDevice physicalDevice, VkDevice device
#if defined(VOXQUAD_HAS_VMA)
        , VmaAllocator vma
#endif
    );
    void shutdown();

    [[nodiscard]] BufferHandle create(const BufferDesc& desc);
    void destroy(BufferHandle handle);

    [[nodiscard]] VkBuffer buffer(BufferHandle handle) const;
    [[nodiscard]] VkDeviceSize size(BufferHandle handle) const;

    // Copies into a HostMapped buffer. Nothing is written when [offset, offset + bytes) overruns it.
    bool write(BufferHandle handle, VkDeviceSize offset, std::span<const std::uint8_t> bytes);

private:
    struct Entry {
        VkBuffer buffer = VK_NULL_HANDLE;
#if defined(VOXQUAD_HAS_VMA)
        VmaAllocation allocation = VK_NULL_HANDLE;
#endif
        VkDeviceMemory memory = VK_NULL_HANDLE;
        void* mapped = nullptr;
        VkDeviceSize size = 0;
        bool live = false;
    };

    bool allocateDedicated(const BufferDesc& desc, const VkBufferCreateInfo& createInfo, Entry& entry);
    [[nodiscard]] std::optional<std::uint32_t> memoryTypeFor(std::uint32_t typeBits, VkMemoryPropertyFlags flags) const;
    [[nodiscard]] const Entry* lookup(BufferHandle handle) const;
    [[nodiscard]] Entry* lookup(BufferHandle handle);
    void release(Entry& entry);

    VkPhysicalDevice m_physicalDevice = VK_NULL_HANDLE;
    VkDevice m_device = VK_NULL_HANDLE;
#if defined(VOXQUAD_HAS_VMA)
    VmaAllocator m_vma = VK_NULL_HANDLE;
#endif
    std::vector<Entry> m_entries;
    std::vector<BufferHandle> m_recycled;
};

} // namespace voxquad::render::vulkan
