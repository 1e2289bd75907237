#include "render/indirect_commands.h"

#include "core/log.h"

#include <algorithm>
#include <thread>
#include <vector>

namespace voxquad::render {

namespace {

void buildSlotRange(
    std::uint32_t begin,
    std::uint32_t end,
    const IndirectBuildInputs& inputs,
    const IndirectBuildOutputs& outputs
) {
    for (std::uint32_t slot = begin; slot < end; ++slot) {
        buildIndirectSlot(slot, inputs, outputs);
    }
}

} // namespace

const char* indirectBuildStatusName(IndirectBuildStatus status) {
    switch (status) {
    case IndirectBuildStatus::Ok:
        return "ok";
    case IndirectBuildStatus::OutputSizeMismatch:
        return "output size mismatch";
    case IndirectBuildStatus::VisibleListExceedsCapacity:
        return "visible list exceeds slot capacity";
    default:
        return "unknown";
    }
}

IndirectBuildStatus validateIndirectBuild(
    const IndirectBuildInputs& inputs,
    const IndirectBuildOutputs& outputs
) {
    if (outputs.instanceData.size() != outputs.indirectArgs.size()) {
        return IndirectBuildStatus::OutputSizeMismatch;
    }
    if (inputs.metadataIndices.size() > outputs.indirectArgs.size()) {
        return IndirectBuildStatus::VisibleListExceedsCapacity;
    }
    return IndirectBuildStatus::Ok;
}

bool isDegenerate(const IndexedIndirectArgs& args) {
    return args.indexCount == 0u || args.instanceCount == 0u;
}

std::uint32_t drawnQuadCount(const GpuChunkMetadata& metadata) {
    return std::min(metadata.quadCount, kMaxQuadsPerChunk);
}

bool quadRangeFits(const GpuChunkMetadata& metadata, std::uint32_t quadBufferCount) {
    return metadata.quadBaseOffset <= quadBufferCount &&
           drawnQuadCount(metadata) <= quadBufferCount - metadata.quadBaseOffset;
}

void buildIndirectSlot(
    std::uint32_t slot,
    const IndirectBuildInputs& inputs,
    const IndirectBuildOutputs& outputs
) {
    ChunkInstanceData& instance = outputs.instanceData[slot];
    IndexedIndirectArgs& args = outputs.indirectArgs[slot];

    instance = ChunkInstanceData{};
    args = IndexedIndirectArgs{};

    if (slot >= inputs.metadataIndices.size()) {
        return;
    }
    const std::uint32_t metadataIndex = inputs.metadataIndices[slot];
    if (metadataIndex >= inputs.allMetadata.size()) {
        return;
    }
    const GpuChunkMetadata& metadata = inputs.allMetadata[metadataIndex];
    if ((metadata.flags & kChunkMetadataFlagHidden) != 0u || metadata.quadCount == 0u) {
        return;
    }
    if (!quadRangeFits(metadata, inputs.quadBufferCount)) {
        return;
    }

    instance.worldOffset[0] = metadata.origin[0];
    instance.worldOffset[1] = metadata.origin[1];
    instance.worldOffset[2] = metadata.origin[2];
    instance.worldOffset[3] = 1.0f;
    instance.baseQuadOffset = metadata.quadBaseOffset;
    instance.slotIndex = slot;
    instance.tint = metadata.tint;
    instance.occlusionSlot = metadata.occlusionSlot;

    // Vertex ids restart at zero per draw; the shader adds baseQuadOffset itself. The shared
    // index buffer only covers kMaxQuadsPerChunk quads.
    args.indexCount = drawnQuadCount(metadata) * kQuadIndexCount;
    args.instanceCount = 1u;
    args.firstIndex = 0u;
    args.vertexOffset = 0;
    args.firstInstance = slot;
}

std::optional<IndirectBuildStats> buildIndirectCommands(
    const IndirectBuildInputs& inputs,
    const IndirectBuildOutputs& outputs,
    const IndirectBuildOptions& options
) {
    const IndirectBuildStatus status = validateIndirectBuild(inputs, outputs);
    if (status != IndirectBuildStatus::Ok) {
        VQ_LOGE("indirect") << "build rejected: " << indirectBuildStatusName(status)
                            << " (instances=" << outputs.instanceData.size()
                            << ", args=" << outputs.indirectArgs.size()
                            << ", visible=" << inputs.metadataIndices.size() << ")";
        return std::nullopt;
    }

    const std::uint32_t slotCount = static_cast<std::uint32_t>(outputs.indirectArgs.size());
    const std::uint32_t minGrain = std::max(1u, options.minSlotsPerWorker);
    const std::uint32_t maxWorkers = std::max(1u, (slotCount + minGrain - 1u) / minGrain);
    const std::uint32_t workerCount = std::clamp(options.workerCount, 1u, maxWorkers);

    if (workerCount <= 1u) {
        buildSlotRange(0u, slotCount, inputs, outputs);
    } else {
        const std::uint32_t rangeSize = (slotCount + workerCount - 1u) / workerCount;
        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (std::uint32_t worker = 0; worker < workerCount; ++worker) {
            const std::uint32_t begin = worker * rangeSize;
            const std::uint32_t end = std::min(slotCount, begin + rangeSize);
            if (begin >= end) {
                break;
            }
            workers.emplace_back([begin, end, &inputs, &outputs]() {
                buildSlotRange(begin, end, inputs, outputs);
            });
        }
        for (std::thread& thread : workers) {
            thread.join();
        }
    }

    IndirectBuildStats stats{};
    stats.slotCount = slotCount;
    for (const IndexedIndirectArgs& args : outputs.indirectArgs) {
        if (!isDegenerate(args)) {
            ++stats.liveSlotCount;
            stats.totalIndexCount += args.indexCount;
        }
    }
    VQ_LOGT("indirect") << "built " << stats.slotCount << " slots, live=" << stats.liveSlotCount
                        << ", indices=" << stats.totalIndexCount << ", workers=" << workerCount;
    return stats;
}

} // namespace voxquad::render
