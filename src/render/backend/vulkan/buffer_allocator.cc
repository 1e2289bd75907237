#include "render/backend/vulkan/buffer_allocator.h"

#include "core/log.h"
#include "render/backend/vulkan/vk_utils.h"

#include <cstring>

namespace voxquad::render::vulkan {
namespace {

VkMemoryPropertyFlags memoryFlags(BufferMemory memory) {
    return memory == BufferMemory::HostMapped
        ? (VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT)
        : VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
}

const char* labelOf(const BufferDesc& desc) {
    return desc.debugName != nullptr ? desc.debugName : "<unnamed>";
}

} // namespace

bool BufferAllocator::init(VkPhysicalDevice physicalDevice, VkDevice device
#if defined(VOXQUAD_HAS_VMA)
    , VmaAllocator vma
#endif
) {
    m_physicalDevice = physicalDevice;
    m_device = device;
#if defined(VOXQUAD_HAS_VMA)
    m_vma = vma;
#endif
    m_recycled.clear();
    m_entries.assign(1, Entry{});
    return m_physicalDevice != VK_NULL_HANDLE && m_device != VK_NULL_HANDLE;
}

void BufferAllocator::shutdown() {
    if (m_device != VK_NULL_HANDLE) {
        for (Entry& entry : m_entries) {
            if (entry.live) {
                release(entry);
            }
        }
    }
    m_entries.clear();
    m_recycled.clear();
    m_physicalDevice = VK_NULL_HANDLE;
    m_device = VK_NULL_HANDLE;
#if defined(VOXQUAD_HAS_VMA)
    m_vma = VK_NULL_HANDLE;
#endif
}

BufferHandle BufferAllocator::create(const BufferDesc& desc) {
    if (m_device == VK_NULL_HANDLE || desc.size == 0) {
        VQ_LOGE("vulkan") << "buffer " << labelOf(desc) << " requested without a device or with zero size";
        return kInvalidBufferHandle;
    }

    VkBufferCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    createInfo.size = desc.size;
    createInfo.usage = desc.usage;
    createInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    Entry entry{};
    entry.size = desc.size;

    bool allocated = false;
#if defined(VOXQUAD_HAS_VMA)
    if (m_vma != VK_NULL_HANDLE) {
        VmaAllocationCreateInfo vmaInfo{};
        vmaInfo.usage = VMA_MEMORY_USAGE_AUTO;
        vmaInfo.requiredFlags = memoryFlags(desc.memory);
        if (desc.memory == BufferMemory::HostMapped) {
            vmaInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }
        VmaAllocationInfo allocationInfo{};
        const VkResult result =
            vmaCreateBuffer(m_vma, &createInfo, &vmaInfo, &entry.buffer, &entry.allocation, &allocationInfo);
        if (result != VK_SUCCESS) {
            logVkFailure("vmaCreateBuffer", result);
            return kInvalidBufferHandle;
        }
        entry.mapped = allocationInfo.pMappedData;
        allocated = true;
    }
#endif
    if (!allocated && !allocateDedicated(desc, createInfo, entry)) {
        return kInvalidBufferHandle;
    }
    entry.live = true;

    if (desc.debugName != nullptr) {
        nameVkObject(m_device, VK_OBJECT_TYPE_BUFFER, entry.buffer, desc.debugName);
    }
    VQ_LOGD("vulkan") << "buffer " << labelOf(desc) << ": " << static_cast<unsigned long long>(desc.size)
                      << " bytes, " << (desc.memory == BufferMemory::HostMapped ? "host mapped" : "device local");

    if (m_recycled.empty()) {
        m_entries.push_back(entry);
        return static_cast<BufferHandle>(m_entries.size() - 1);
    }
    const BufferHandle handle = m_recycled.back();
    m_recycled.pop_back();
    m_entries[handle] = entry;
    return handle;
}

bool BufferAllocator::allocateDedicated(const BufferDesc& desc, const VkBufferCreateInfo& createInfo, Entry& entry) {
    VkResult result = vkCreateBuffer(m_device, &createInfo, nullptr, &entry.buffer);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateBuffer", result);
        return false;
    }

    VkMemoryRequirements requirements{};
    vkGetBufferMemoryRequirements(m_device, entry.buffer, &requirements);
    const std::optional<std::uint32_t> typeIndex = memoryTypeFor(requirements.memoryTypeBits, memoryFlags(desc.memory));
    if (!typeIndex) {
        VQ_LOGE("vulkan") << "no compatible memory type for buffer " << labelOf(desc);
        vkDestroyBuffer(m_device, entry.buffer, nullptr);
        entry.buffer = VK_NULL_HANDLE;
        return false;
    }

    VkMemoryAllocateInfo allocateInfo{};
    allocateInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocateInfo.allocationSize = requirements.size;
    allocateInfo.memoryTypeIndex = *typeIndex;
    result = vkAllocateMemory(m_device, &allocateInfo, nullptr, &entry.memory);
    if (result == VK_SUCCESS) {
        result = vkBindBufferMemory(m_device, entry.buffer, entry.memory, 0);
    }
    if (result == VK_SUCCESS && desc.memory == BufferMemory::HostMapped) {
        result = vkMapMemory(m_device, entry.memory, 0, VK_WHOLE_SIZE, 0, &entry.mapped);
    }
    if (result != VK_SUCCESS) {
        logVkFailure("buffer memory setup", result);
        vkDestroyBuffer(m_device, entry.buffer, nullptr);
        if (entry.memory != VK_NULL_HANDLE) {
            vkFreeMemory(m_device, entry.memory, nullptr);
        }
        entry = Entry{};
        return false;
    }
    return true;
}

void BufferAllocator::destroy(BufferHandle handle) {
    if (Entry* entry = lookup(handle)) {
        release(*entry);
        m_recycled.push_back(handle);
    }
}

VkBuffer BufferAllocator::buffer(BufferHandle handle) const {
    const Entry* entry = lookup(handle);
    return entry != nullptr ? entry->buffer : VK_NULL_HANDLE;
}

VkDeviceSize BufferAllocator::size(BufferHandle handle) const {
    const Entry* entry = lookup(handle);
    return entry != nullptr ? entry->size : 0;
}

bool BufferAllocator::write(BufferHandle handle, VkDeviceSize offset, std::span<const std::uint8_t> bytes) {
    Entry* entry = lookup(handle);
    if (entry == nullptr || entry->mapped == nullptr) {
        VQ_LOGE("vulkan") << "buffer " << handle << " is not host mapped";
        return false;
    }
    if (offset > entry->size || bytes.size() > entry->size - offset) {
        VQ_LOGE("vulkan") << "write of " << bytes.size() << " bytes at " << static_cast<unsigned long long>(offset)
                          << " overruns buffer " << handle << " (" << static_cast<unsigned long long>(entry->size)
                          << " bytes)";
        return false;
    }
    std::memcpy(static_cast<std::uint8_t*>(entry->mapped) + offset, bytes.data(), bytes.size());
    return true;
}

std::optional<std::uint32_t> BufferAllocator::memoryTypeFor(std::uint32_t typeBits, VkMemoryPropertyFlags flags) const {
    VkPhysicalDeviceMemoryProperties properties{};
    vkGetPhysicalDeviceMemoryProperties(m_physicalDevice, &properties);
    for (std::uint32_t index = 0; index < properties.memoryTypeCount; ++index) {
        if ((typeBits & (1u << index)) != 0 && (properties.memoryTypes[index].propertyFlags & flags) == flags) {
            return index;
        }
    }
    return std::nullopt;
}

const BufferAllocator::Entry* BufferAllocator::lookup(BufferHandle handle) const {
    if (handle == kInvalidBufferHandle || handle >= m_entries.size() || !m_entries[handle].live) {
        return nullptr;
    }
    return &m_entries[handle];
}

BufferAllocator::Entry* BufferAllocator::lookup(BufferHandle handle) {
    return const_cast<Entry*>(static_cast<const BufferAllocator*>(this)->lookup(handle));
}

void BufferAllocator::release(Entry& entry) {
#if defined(VOXQUAD_HAS_VMA)
    if (entry.allocation != VK_NULL_HANDLE) {
        vmaDestroyBuffer(m_vma, entry.buffer, entry.allocation);
        entry = Entry{};
        return;
    }
#endif
    if (entry.mapped != nullptr) {
        vkUnmapMemory(m_device, entry.memory);
    }
    vkDestroyBuffer(m_device, entry.buffer, nullptr);
    vkFreeMemory(m_device, entry.memory, nullptr);
    entry = Entry{};
}

} // namespace voxquad::render::vulkan
