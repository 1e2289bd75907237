#include "render/backend/vulkan/vk_utils.h"

#include "core/log.h"

#include <fstream>

namespace voxquad::render::vulkan {

const char* vkResultName(VkResult result) {
    switch (result) {
    case VK_SUCCESS: return "VK_SUCCESS";
    case VK_NOT_READY: return "VK_NOT_READY";
    case VK_TIMEOUT: return "VK_TIMEOUT";
    case VK_INCOMPLETE: return "VK_INCOMPLETE";
    case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
    case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
    case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
    case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
    case VK_ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
    case VK_ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
    case VK_ERROR_TOO_MANY_OBJECTS: return "VK_ERROR_TOO_MANY_OBJECTS";
    case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
    case VK_ERROR_OUT_OF_POOL_MEMORY: return "VK_ERROR_OUT_OF_POOL_MEMORY";
    case VK_ERROR_FRAGMENTED_POOL: return "VK_ERROR_FRAGMENTED_POOL";
    case VK_ERROR_INVALID_SHADER_NV: return "VK_ERROR_INVALID_SHADER_NV";
    default: return "VK_RESULT_UNKNOWN";
    }
}

void logVkFailure(const char* what, VkResult result) {
    VQ_LOGE("vulkan") << what << " returned " << vkResultName(result) << " (" << static_cast<int>(result) << ")";
}

void nameVkObjectHandle(VkDevice device, VkObjectType type, std::uint64_t handle, std::string_view name) {
    if (device == VK_NULL_HANDLE || handle == 0 || name.empty()) {
        return;
    }
    const auto setName = reinterpret_cast<PFN_vkSetDebugUtilsObjectNameEXT>(
        vkGetDeviceProcAddr(device, "vkSetDebugUtilsObjectNameEXT")
    );
    if (setName == nullptr) {
        return;
    }

    const std::string label(name);
    VkDebugUtilsObjectNameInfoEXT info{};
    info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
    info.objectType = type;
    info.objectHandle = handle;
    info.pObjectName = label.c_str();
    if (const VkResult result = setName(device, &info); result != VK_SUCCESS) {
        VQ_LOGW("vulkan") << "could not label " << label << ": " << vkResultName(result);
    }
}

std::optional<std::vector<std::uint32_t>> loadSpirvWords(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        VQ_LOGE("vulkan") << "cannot open SPIR-V file " << path;
        return std::nullopt;
    }
    file.seekg(0, std::ios::end);
    const std::streamoff byteCount = file.tellg();
    file.seekg(0, std::ios::beg);
    if (byteCount <= 0 || byteCount % static_cast<std::streamoff>(sizeof(std::uint32_t)) != 0) {
        VQ_LOGE("vulkan") << "SPIR-V file " << path << " has bad size " << byteCount;
        return std::nullopt;
    }

    std::vector<std::uint32_t> words(static_cast<std::size_t>(byteCount) / sizeof(std::uint32_t));
    if (!file.read(reinterpret_cast<char*>(words.data()), byteCount)) {
        VQ_LOGE("vulkan") << "short read on SPIR-V file " << path;
        return std::nullopt;
    }
    if (words.front() != kSpirvMagic) {
        VQ_LOGE("vulkan") << path << " is not a SPIR-V module";
        return std::nullopt;
    }
    return words;
}

bool createShaderModule(VkDevice device, const std::string& path, const char* debugName, VkShaderModule& outModule) {
    outModule = VK_NULL_HANDLE;
    const std::optional<std::vector<std::uint32_t>> words = loadSpirvWords(path);
    if (!words) {
        VQ_LOGE("vulkan") << "shader " << debugName << " unavailable";
        return false;
    }

    VkShaderModuleCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    info.codeSize = words->size() * sizeof(std::uint32_t);
    info.pCode = words->data();
    if (const VkResult result = vkCreateShaderModule(device, &info, nullptr, &outModule); result != VK_SUCCESS) {
        outModule = VK_NULL_HANDLE;
        logVkFailure("vkCreateShaderModule", result);
        return false;
    }
    nameVkObject(device, VK_OBJECT_TYPE_SHADER_MODULE, outModule, debugName);
    return true;
}

void destroyShaderModules(VkDevice device, std::span<const VkShaderModule> modules) {
    for (const VkShaderModule module : modules) {
        if (module != VK_NULL_HANDLE) {
            vkDestroyShaderModule(device, module, nullptr);
        }
    }
}

} // namespace voxquad::render::vulkan
