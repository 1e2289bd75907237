// Compiles the VMA implementation once for voxquad_vulkan.
#if defined(VOXQUAD_HAS_VMA)
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#endif
