#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "render/chunk_draw_types.h"

namespace voxquad::render {

// Must match [numthreads] in build_indirect.comp.slang.
constexpr std::uint32_t kIndirectBuildWorkgroupSize = 64;

struct IndirectBuildInputs {
    std::span<const GpuChunkMetadata> allMetadata;
    // Visible chunks for this frame, in draw order.
    std::span<const std::uint32_t> metadataIndices;
    // Number of PackedQuad records in the bound quad buffer. A chunk whose quad range
    // runs past it gets an inert slot.
    std::uint32_t quadBufferCount = 0;
};

// Both spans have the same length: the fixed slot capacity N of this frame's buffers.
struct IndirectBuildOutputs {
    std::span<ChunkInstanceData> instanceData;
    std::span<IndexedIndirectArgs> indirectArgs;
};

struct IndirectBuildOptions {
    std::uint32_t workerCount = 1;
    std::uint32_t minSlotsPerWorker = 256;
};

struct IndirectBuildStats {
    std::uint32_t slotCount = 0;
    std::uint32_t liveSlotCount = 0;
    std::uint64_t totalIndexCount = 0;
};

enum class IndirectBuildStatus : std::uint8_t {
    Ok = 0,
    OutputSizeMismatch,
    VisibleListExceedsCapacity
};

[[nodiscard]] const char* indirectBuildStatusName(IndirectBuildStatus status);

// Capacity rules owned by whoever allocates the frame buffers.
[[nodiscard]] IndirectBuildStatus validateIndirectBuild(
    const IndirectBuildInputs& inputs,
    const IndirectBuildOutputs& outputs
);

[[nodiscard]] bool isDegenerate(const IndexedIndirectArgs& args);

// Quad count a draw of this chunk reads: quadCount capped to the shared index buffer.
[[nodiscard]] std::uint32_t drawnQuadCount(const GpuChunkMetadata& metadata);

// True when [quadBaseOffset, quadBaseOffset + drawnQuadCount) lies inside the quad buffer.
[[nodiscard]] bool quadRangeFits(const GpuChunkMetadata& metadata, std::uint32_t quadBufferCount);

// Work of one compute invocation: clear slot to the degenerate record, then fill it from
// metadata when the slot maps to a visible, drawable chunk. Only slot is written.
void buildIndirectSlot(
    std::uint32_t slot,
    const IndirectBuildInputs& inputs,
    const IndirectBuildOutputs& outputs
);

// Host reference for the build pass. Runs buildIndirectSlot over every slot, split in
// contiguous ranges across workers. Returns std::nullopt without writing when validation fails.
[[nodiscard]] std::optional<IndirectBuildStats> buildIndirectCommands(
    const IndirectBuildInputs& inputs,
    const IndirectBuildOutputs& outputs,
    const IndirectBuildOptions& options = {}
);

[[nodiscard]] constexpr std::uint32_t indirectBuildGroupCount(std::uint32_t slotCount) {
    return (slotCount + (kIndirectBuildWorkgroupSize - 1u)) / kIndirectBuildWorkgroupSize;
}

} // namespace voxquad::render
