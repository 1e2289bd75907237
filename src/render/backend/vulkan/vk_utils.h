#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <vulkan/vulkan.h>

namespace voxquad::render::vulkan {

inline constexpr std::uint32_t kSpirvMagic = 0x07230203u;

[[nodiscard]] const char* vkResultName(VkResult result);
void logVkFailure(const char* what, VkResult result);

// Labels an object for validation layers and capture tools. Silent when
// VK_EXT_debug_utils is not enabled on the device.
void nameVkObjectHandle(VkDevice device, VkObjectType type, std::uint64_t handle, std::string_view name);

template <typename HandleT>
void nameVkObject(VkDevice device, VkObjectType type, HandleT handle, std::string_view name) {
    if constexpr (std::is_pointer_v<HandleT>) {
        nameVkObjectHandle(device, type, reinterpret_cast<std::uint64_t>(handle), name);
    } else {
        nameVkObjectHandle(device, type, static_cast<std::uint64_t>(handle), name);
    }
}

// Whole-file SPIR-V load. Rejects empty files, sizes that are not a word multiple
// and files without the SPIR-V magic number.
[[nodiscard]] std::optional<std::vector<std::uint32_t>> loadSpirvWords(const std::string& path);

bool createShaderModule(VkDevice device, const std::string& path, const char* debugName, VkShaderModule& outModule);
void destroyShaderModules(VkDevice device, std::span<const VkShaderModule> modules);

} // namespace voxquad::render::vulkan
