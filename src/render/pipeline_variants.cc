#include "render/pipeline_variants.h"

#include "render/chunk_draw_types.h"
#include "render/indirect_commands.h"
#include "render/quad.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace voxquad::render {

namespace {

constexpr const char* kChunkVertexSource = "chunk_quad.vert.slang";
constexpr const char* kChunkFragmentSource = "chunk_quad.frag.slang";
constexpr const char* kChunkPrepassFragmentSource = "chunk_quad_prepass.frag.slang";
constexpr const char* kIndirectBuildSource = "build_indirect.comp.slang";

constexpr const char* kChunkStem = "chunk_quad";
constexpr const char* kChunkPrepassStem = "chunk_quad_prepass";

void appendFlag(std::vector<ShaderDefine>& defines, const char* name) {
    defines.push_back(ShaderDefine{name, std::nullopt});
}

void appendValue(std::vector<ShaderDefine>& defines, const char* name, std::uint32_t value) {
    defines.push_back(ShaderDefine{name, value});
}

bool hasBit(ChunkPipelineKey key, ChunkPipelineKey bit) {
    return (key & bit) != 0u;
}

} // namespace

const char* shaderStageName(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::Vertex:
        return "vert";
    case ShaderStage::Fragment:
        return "frag";
    case ShaderStage::Compute:
        return "comp";
    default:
        return "unknown";
    }
}

std::vector<ShaderDefine> prepassShaderDefines(ChunkPipelineKey key) {
    std::vector<ShaderDefine> defines;
    if (!isPrepassKey(key)) {
        if (hasBit(key, kChunkPipelineDepthClampOrtho)) {
            appendFlag(defines, "DEPTH_CLAMP_ORTHO");
        }
        return defines;
    }

    const bool normal = hasBit(key, kChunkPipelineNormalPrepass);
    const bool motion = hasBit(key, kChunkPipelineMotionVectorPrepass);
    const bool deferred = hasBit(key, kChunkPipelineDeferredPrepass);

    appendFlag(defines, "PREPASS_PIPELINE");
    if (normal) {
        appendFlag(defines, "NORMAL_PREPASS");
    }
    if (motion) {
        appendFlag(defines, "MOTION_VECTOR_PREPASS");
    }
    if (deferred) {
        appendFlag(defines, "DEFERRED_PREPASS");
    }
    if (normal || deferred) {
        appendFlag(defines, "NORMAL_PREPASS_OR_DEFERRED_PREPASS");
    }
    if (motion || deferred) {
        appendFlag(defines, "MOTION_VECTOR_PREPASS_OR_DEFERRED_PREPASS");
    }
    if (hasBit(key, kChunkPipelineDepthClampOrtho)) {
        appendFlag(defines, "DEPTH_CLAMP_ORTHO");
    }
    if (prepassNeedsFragment(key)) {
        appendFlag(defines, "PREPASS_FRAGMENT");
    }
    if (hasBit(key, kChunkPipelineMayDiscard)) {
        appendFlag(defines, "MAY_DISCARD");
    }
    return defines;
}

std::vector<ShaderDefine> vertexFeatureDefines(VertexFeatureMask features) {
    std::vector<ShaderDefine> defines;
    if ((features & kVertexFeatureNormals) != 0u) {
        appendFlag(defines, "VERTEX_NORMALS");
    }
    if ((features & kVertexFeatureMotionVectors) != 0u) {
        appendFlag(defines, "VERTEX_MOTION_VECTORS");
    }
    if ((features & kVertexFeatureInstanceIndex) != 0u) {
        appendFlag(defines, "VERTEX_INSTANCE_INDEX");
    }
    if ((features & kVertexFeatureVertexColor) != 0u) {
        appendFlag(defines, "VERTEX_COLOR");
    }
    if ((features & kVertexFeatureDepthClampOrtho) != 0u) {
        appendFlag(defines, "DEPTH_CLAMP_ORTHO");
    }
    if ((features & kVertexFeatureDeferred) != 0u) {
        appendFlag(defines, "DEFERRED");
    }
    return defines;
}

std::vector<ShaderDefine> shaderConstantDefines(const RenderConfig& config) {
    std::vector<ShaderDefine> defines;
    appendValue(defines, "QUAD_ROTATION_SHIFT", PackedQuad::kRotationShift);
    appendValue(defines, "QUAD_ROTATION_MASK", PackedQuad::kRotationMask);
    appendValue(defines, "QUAD_FLIP_UV_X_BIT", PackedQuad::kFlipUvXBit);
    appendValue(defines, "QUAD_FLIP_UV_Y_BIT", PackedQuad::kFlipUvYBit);
    appendValue(defines, "QUAD_FACE_SHIFT", PackedQuad::kFaceShift);
    appendValue(defines, "QUAD_FACE_MASK", PackedQuad::kFaceMask);
    appendValue(defines, "QUAD_COORD_MASK", PackedQuad::kCoordMask);
    appendValue(defines, "QUAD_SHIFT_MIN_X", PackedQuad::kShiftMinX);
    appendValue(defines, "QUAD_SHIFT_MIN_Y", PackedQuad::kShiftMinY);
    appendValue(defines, "QUAD_SHIFT_MAX_X", PackedQuad::kShiftMaxX);
    appendValue(defines, "QUAD_SHIFT_MAX_Y", PackedQuad::kShiftMaxY);
    appendValue(defines, "QUAD_SHIFT_MAGNITUDE", PackedQuad::kShiftMagnitude);
    appendValue(defines, "MAX_QUADS_PER_CHUNK", kMaxQuadsPerChunk);
    appendValue(defines, "CHUNK_EDGE", kChunkEdge);
    appendValue(defines, "CHUNK_OCCLUSION_DIMENSIONS", kChunkOcclusionDimensions);
    appendValue(defines, "CHUNK_OCCLUSION_BUFFER_SIZE", kChunkOcclusionBufferSize);
    appendValue(defines, "CHUNK_METADATA_FLAG_HIDDEN", kChunkMetadataFlagHidden);
    appendValue(defines, "FACE_TEXTURE_HAS_NORMAL_MAP_BIT", kFaceTextureHasNormalMapBit);
    appendValue(defines, "INDIRECT_WORKGROUP_SIZE", kIndirectBuildWorkgroupSize);
    appendValue(defines, "ROTATION_CORRECTION_MASK", config.orientation.rotationMask);
    appendValue(defines, "FLIP_UV_X_MASK", config.orientation.flipUvXMask);
    appendValue(defines, "FLIP_UV_Y_MASK", config.orientation.flipUvYMask);
    appendValue(defines, "ATLAS_TILES_X", std::max(1u, config.atlas.tilesPerRow));
    appendValue(defines, "ATLAS_TILES_Y", std::max(1u, config.atlas.tilesPerColumn));
    return defines;
}

std::vector<PrepassTarget> prepassColorTargets(ChunkPipelineKey key) {
    std::vector<PrepassTarget> targets;
    if (!isPrepassKey(key)) {
        return targets;
    }
    if (hasBit(key, kChunkPipelineNormalPrepass)) {
        targets.push_back(PrepassTarget::Normal);
    }
    if (hasBit(key, kChunkPipelineMotionVectorPrepass)) {
        targets.push_back(PrepassTarget::MotionVector);
    }
    return targets;
}

bool prepassNeedsFragment(ChunkPipelineKey key) {
    if (!isPrepassKey(key)) {
        return true;
    }
    return !prepassColorTargets(key).empty() ||
           hasBit(key, kChunkPipelineDepthClampOrtho) ||
           hasBit(key, kChunkPipelineMayDiscard);
}

VertexFeatureMask vertexFeaturesForKey(ChunkPipelineKey key) {
    VertexFeatureMask features = kVertexFeatureNone;
    if (!isPrepassKey(key)) {
        features = kVertexFeatureNormals | kVertexFeatureInstanceIndex | kVertexFeatureVertexColor;
    } else {
        if (hasBit(key, kChunkPipelineNormalPrepass)) {
            features |= kVertexFeatureNormals;
        }
        if (hasBit(key, kChunkPipelineMotionVectorPrepass)) {
            features |= kVertexFeatureMotionVectors;
        }
        if (hasBit(key, kChunkPipelineDeferredPrepass)) {
            features |= kVertexFeatureDeferred;
        }
    }
    if (hasBit(key, kChunkPipelineDepthClampOrtho)) {
        features |= kVertexFeatureDepthClampOrtho;
    }
    return features;
}

std::string shaderVariantFileName(std::string_view stem, ShaderStage stage, std::uint32_t variantBits) {
    char suffix[32] = {};
    std::snprintf(suffix, sizeof(suffix), ".%s.f%02x.slang.spv", shaderStageName(stage), variantBits & 0xFFu);
    std::string name(stem);
    name += suffix;
    return name;
}

std::string formatDefineArgument(const ShaderDefine& define) {
    std::string argument = "-D" + define.name;
    if (define.value.has_value()) {
        argument += "=" + std::to_string(*define.value);
    }
    return argument;
}

std::string chunkVertexShaderFile(ChunkPipelineKey key) {
    return shaderVariantFileName(
        isPrepassKey(key) ? kChunkPrepassStem : kChunkStem,
        ShaderStage::Vertex,
        vertexFeaturesForKey(key)
    );
}

std::optional<std::string> chunkFragmentShaderFile(ChunkPipelineKey key) {
    if (!isPrepassKey(key)) {
        return shaderVariantFileName(kChunkStem, ShaderStage::Fragment, key);
    }
    if (!prepassNeedsFragment(key)) {
        return std::nullopt;
    }
    return shaderVariantFileName(kChunkPrepassStem, ShaderStage::Fragment, key);
}

std::vector<ChunkShaderVariant> chunkShaderVariants(
    const RenderConfig& config,
    const std::vector<ChunkPipelineKey>& keys
) {
    const std::vector<ShaderDefine> constants = shaderConstantDefines(config);
    std::vector<ChunkShaderVariant> variants;

    auto appendVariant = [&variants](ChunkShaderVariant variant) {
        const bool seen = std::any_of(variants.begin(), variants.end(), [&variant](const ChunkShaderVariant& existing) {
            return existing.outputFile == variant.outputFile;
        });
        if (!seen) {
            variants.push_back(std::move(variant));
        }
    };

    for (const ChunkPipelineKey key : keys) {
        ChunkShaderVariant vertex{};
        vertex.key = key;
        vertex.stage = ShaderStage::Vertex;
        vertex.sourceFile = kChunkVertexSource;
        vertex.outputFile = chunkVertexShaderFile(key);
        vertex.defines = constants;
        for (ShaderDefine& define : vertexFeatureDefines(vertexFeaturesForKey(key))) {
            vertex.defines.push_back(std::move(define));
        }
        if (isPrepassKey(key)) {
            appendFlag(vertex.defines, "PREPASS_PIPELINE");
        }
        appendVariant(std::move(vertex));

        const std::optional<std::string> fragmentFile = chunkFragmentShaderFile(key);
        if (!fragmentFile.has_value()) {
            continue;
        }
        ChunkShaderVariant fragment{};
        fragment.key = key;
        fragment.stage = ShaderStage::Fragment;
        fragment.sourceFile = isPrepassKey(key) ? kChunkPrepassFragmentSource : kChunkFragmentSource;
        fragment.outputFile = *fragmentFile;
        fragment.defines = constants;
        for (ShaderDefine& define : prepassShaderDefines(key)) {
            fragment.defines.push_back(std::move(define));
        }
        appendVariant(std::move(fragment));
    }

    ChunkShaderVariant indirect{};
    indirect.key = kChunkPipelineMain;
    indirect.stage = ShaderStage::Compute;
    indirect.sourceFile = kIndirectBuildSource;
    indirect.outputFile = kIndirectBuildShaderFile;
    indirect.defines = constants;
    appendVariant(std::move(indirect));
    return variants;
}

std::vector<ChunkPipelineKey> defaultChunkPipelineKeys() {
    return {
        kChunkPipelineMain,
        kChunkPipelineDepthPrepass,
        kChunkPipelineDepthPrepass | kChunkPipelineNormalPrepass,
        kChunkPipelineDepthPrepass | kChunkPipelineNormalPrepass | kChunkPipelineMotionVectorPrepass,
        kChunkPipelineDepthPrepass | kChunkPipelineDepthClampOrtho
    };
}

} // namespace voxquad::render
