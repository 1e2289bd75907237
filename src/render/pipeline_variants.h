#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "render/render_config.h"
#include "render/vertex_reconstruction.h"

namespace voxquad::render {

// Selects a chunk pipeline. A key with no prepass bit is the main shading pass.
using ChunkPipelineKey = std::uint32_t;

constexpr ChunkPipelineKey kChunkPipelineMain = 0u;
constexpr ChunkPipelineKey kChunkPipelineDepthPrepass = 1u << 0u;
constexpr ChunkPipelineKey kChunkPipelineNormalPrepass = 1u << 1u;
constexpr ChunkPipelineKey kChunkPipelineMotionVectorPrepass = 1u << 2u;
constexpr ChunkPipelineKey kChunkPipelineDeferredPrepass = 1u << 3u;
constexpr ChunkPipelineKey kChunkPipelineDepthClampOrtho = 1u << 4u;
constexpr ChunkPipelineKey kChunkPipelineMayDiscard = 1u << 5u;

constexpr ChunkPipelineKey kChunkPipelinePrepassMask =
    kChunkPipelineDepthPrepass | kChunkPipelineNormalPrepass |
    kChunkPipelineMotionVectorPrepass | kChunkPipelineDeferredPrepass;

[[nodiscard]] constexpr bool isPrepassKey(ChunkPipelineKey key) {
    return (key & kChunkPipelinePrepassMask) != 0u;
}

struct ShaderDefine {
    std::string name;
    std::optional<std::uint32_t> value;

    bool operator==(const ShaderDefine&) const = default;
};

enum class PrepassTarget : std::uint8_t {
    Normal,
    MotionVector
};

enum class ShaderStage : std::uint8_t {
    Vertex,
    Fragment,
    Compute
};

[[nodiscard]] const char* shaderStageName(ShaderStage stage);

// PREPASS_PIPELINE plus the per-target switches read by the chunk shaders.
[[nodiscard]] std::vector<ShaderDefine> prepassShaderDefines(ChunkPipelineKey key);

// VERTEX_NORMALS, VERTEX_MOTION_VECTORS, ... for the chunk vertex shader.
[[nodiscard]] std::vector<ShaderDefine> vertexFeatureDefines(VertexFeatureMask features);

// Packed quad layout, occlusion buffer shape and orientation masks. Every chunk shader variant
// is compiled with these.
[[nodiscard]] std::vector<ShaderDefine> shaderConstantDefines(const RenderConfig& config);

// Color attachments written by a prepass, in attachment order. Deferred targets are not
// produced by this pipeline.
[[nodiscard]] std::vector<PrepassTarget> prepassColorTargets(ChunkPipelineKey key);

[[nodiscard]] bool prepassNeedsFragment(ChunkPipelineKey key);

[[nodiscard]] VertexFeatureMask vertexFeaturesForKey(ChunkPipelineKey key);

// e.g. "chunk_quad.vert.f0d.slang.spv". variantBits is the vertex feature mask for vertex
// modules and the pipeline key for prepass fragment modules.
[[nodiscard]] std::string shaderVariantFileName(std::string_view stem, ShaderStage stage, std::uint32_t variantBits);

// Slang compiler arguments for one define, "-DNAME" or "-DNAME=VALUE".
[[nodiscard]] std::string formatDefineArgument(const ShaderDefine& define);

constexpr const char* kIndirectBuildShaderFile = "build_indirect.comp.slang.spv";

[[nodiscard]] std::string chunkVertexShaderFile(ChunkPipelineKey key);
// std::nullopt for depth-only prepasses that run without a fragment stage.
[[nodiscard]] std::optional<std::string> chunkFragmentShaderFile(ChunkPipelineKey key);

struct ChunkShaderVariant {
    ChunkPipelineKey key = kChunkPipelineMain;
    ShaderStage stage = ShaderStage::Vertex;
    std::string sourceFile;
    std::string outputFile;
    std::vector<ShaderDefine> defines;
};

// Every SPIR-V module the Vulkan backend loads for the given pipeline keys, including the
// indirect build compute shader.
[[nodiscard]] std::vector<ChunkShaderVariant> chunkShaderVariants(
    const RenderConfig& config,
    const std::vector<ChunkPipelineKey>& keys
);

// Keys the backend builds pipelines for.
[[nodiscard]] std::vector<ChunkPipelineKey> defaultChunkPipelineKeys();

} // namespace voxquad::render
