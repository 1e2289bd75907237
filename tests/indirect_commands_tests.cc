#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "render/chunk_draw_types.h"
#include "render/indirect_commands.h"
#include "render/quad.h"

namespace {

// Large enough for every quad range the metadata tables below produce.
constexpr std::uint32_t kQuadBufferCount = 1u << 20u;

voxquad::render::GpuChunkMetadata makeMetadata(float x, std::uint32_t quadBase, std::uint32_t quadCount) {
    voxquad::render::GpuChunkMetadata metadata{};
    metadata.origin[0] = x;
    metadata.origin[1] = 2.0f * x;
    metadata.origin[2] = -x;
    metadata.quadBaseOffset = quadBase;
    metadata.quadCount = quadCount;
    metadata.tint = 0x80FF40FFu;
    metadata.occlusionSlot = static_cast<std::uint32_t>(x);
    return metadata;
}

std::vector<voxquad::render::GpuChunkMetadata> makeMetadataTable(std::uint32_t count) {
    std::vector<voxquad::render::GpuChunkMetadata> table;
    for (std::uint32_t i = 0; i < count; ++i) {
        table.push_back(makeMetadata(static_cast<float>(i), i * 100u, i + 1u));
    }
    return table;
}

struct SlotBuffers {
    explicit SlotBuffers(std::size_t slots) : instances(slots), args(slots) {}

    voxquad::render::IndirectBuildOutputs outputs() {
        return voxquad::render::IndirectBuildOutputs{instances, args};
    }

    std::vector<voxquad::render::ChunkInstanceData> instances;
    std::vector<voxquad::render::IndexedIndirectArgs> args;
};

TEST(IndirectCommandsTest, VisibleChunksFillLeadingSlotsAndRestStayInert) {
    const std::vector<voxquad::render::GpuChunkMetadata> metadata = makeMetadataTable(8);
    const std::vector<std::uint32_t> visible = {5u, 2u};
    SlotBuffers buffers(4);

    const auto stats = voxquad::render::buildIndirectCommands({metadata, visible, kQuadBufferCount}, buffers.outputs());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->slotCount, 4u);
    EXPECT_EQ(stats->liveSlotCount, 2u);
    EXPECT_EQ(stats->totalIndexCount, (6u + 3u) * voxquad::render::kQuadIndexCount);

    const voxquad::render::IndexedIndirectArgs& slot0 = buffers.args[0];
    EXPECT_EQ(slot0.indexCount, 6u * voxquad::render::kQuadIndexCount);
    EXPECT_EQ(slot0.instanceCount, 1u);
    EXPECT_EQ(slot0.firstIndex, 0u);
    EXPECT_EQ(slot0.vertexOffset, 0);
    EXPECT_EQ(slot0.firstInstance, 0u);
    EXPECT_FLOAT_EQ(buffers.instances[0].worldOffset[0], 5.0f);
    EXPECT_FLOAT_EQ(buffers.instances[0].worldOffset[1], 10.0f);
    EXPECT_FLOAT_EQ(buffers.instances[0].worldOffset[2], -5.0f);
    EXPECT_FLOAT_EQ(buffers.instances[0].worldOffset[3], 1.0f);
    EXPECT_EQ(buffers.instances[0].baseQuadOffset, 500u);
    EXPECT_EQ(buffers.instances[0].slotIndex, 0u);
    EXPECT_EQ(buffers.instances[0].tint, 0x80FF40FFu);
    EXPECT_EQ(buffers.instances[0].occlusionSlot, 5u);

    EXPECT_EQ(buffers.args[1].indexCount, 3u * voxquad::render::kQuadIndexCount);
    EXPECT_EQ(buffers.args[1].firstInstance, 1u);
    EXPECT_EQ(buffers.instances[1].baseQuadOffset, 200u);
    EXPECT_EQ(buffers.instances[1].slotIndex, 1u);

    for (std::size_t slot = 2; slot < 4; ++slot) {
        EXPECT_TRUE(voxquad::render::isDegenerate(buffers.args[slot]));
        EXPECT_EQ(buffers.args[slot].indexCount, 0u);
        EXPECT_EQ(buffers.instances[slot].baseQuadOffset, 0u);
        EXPECT_FLOAT_EQ(buffers.instances[slot].worldOffset[3], 0.0f);
    }
}

TEST(IndirectCommandsTest, HiddenEmptyAndOutOfRangeChunksProduceInertSlots) {
    std::vector<voxquad::render::GpuChunkMetadata> metadata = makeMetadataTable(4);
    metadata[1].flags |= voxquad::render::kChunkMetadataFlagHidden;
    metadata[2].quadCount = 0u;
    const std::vector<std::uint32_t> visible = {1u, 2u, 99u, 3u};
    SlotBuffers buffers(4);

    const auto stats = voxquad::render::buildIndirectCommands({metadata, visible, kQuadBufferCount}, buffers.outputs());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->liveSlotCount, 1u);
    EXPECT_TRUE(voxquad::render::isDegenerate(buffers.args[0]));
    EXPECT_TRUE(voxquad::render::isDegenerate(buffers.args[1]));
    EXPECT_TRUE(voxquad::render::isDegenerate(buffers.args[2]));
    EXPECT_FALSE(voxquad::render::isDegenerate(buffers.args[3]));
    EXPECT_EQ(buffers.args[3].firstInstance, 3u);
    EXPECT_EQ(buffers.instances[3].slotIndex, 3u);
}

TEST(IndirectCommandsTest, ShrinkingVisibleListClearsStaleSlots) {
    const std::vector<voxquad::render::GpuChunkMetadata> metadata = makeMetadataTable(4);
    SlotBuffers buffers(4);

    const std::vector<std::uint32_t> frame0 = {0u, 1u, 2u, 3u};
    ASSERT_TRUE(voxquad::render::buildIndirectCommands({metadata, frame0, kQuadBufferCount}, buffers.outputs()).has_value());
    EXPECT_FALSE(voxquad::render::isDegenerate(buffers.args[3]));

    const std::vector<std::uint32_t> frame1 = {3u};
    const auto stats = voxquad::render::buildIndirectCommands({metadata, frame1, kQuadBufferCount}, buffers.outputs());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->liveSlotCount, 1u);
    EXPECT_EQ(buffers.instances[0].baseQuadOffset, 300u);
    for (std::size_t slot = 1; slot < 4; ++slot) {
        EXPECT_TRUE(voxquad::render::isDegenerate(buffers.args[slot]));
        EXPECT_EQ(buffers.instances[slot].tint, 0u);
    }
}

TEST(IndirectCommandsTest, IndexCountIsClampedToSharedIndexBuffer) {
    std::vector<voxquad::render::GpuChunkMetadata> metadata = {
        makeMetadata(0.0f, 0u, voxquad::render::kMaxQuadsPerChunk + 10u)
    };
    const std::vector<std::uint32_t> visible = {0u};
    SlotBuffers buffers(1);

    ASSERT_TRUE(voxquad::render::buildIndirectCommands({metadata, visible, kQuadBufferCount}, buffers.outputs()).has_value());
    EXPECT_EQ(buffers.args[0].indexCount, voxquad::render::kMaxQuadsPerChunk * voxquad::render::kQuadIndexCount);
}

TEST(IndirectCommandsTest, ChunkOverrunningQuadBufferGetsInertSlot) {
    const std::vector<voxquad::render::GpuChunkMetadata> metadata = {
        makeMetadata(0.0f, 10u, 20u),
        makeMetadata(1.0f, 0u, 16u),
        makeMetadata(2.0f, 17u, 1u),
        makeMetadata(3.0f, 12u, 4u)
    };
    const std::vector<std::uint32_t> visible = {0u, 1u, 2u, 3u};
    SlotBuffers buffers(4);

    const auto stats = voxquad::render::buildIndirectCommands({metadata, visible, 16u}, buffers.outputs());
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->liveSlotCount, 2u);
    EXPECT_TRUE(voxquad::render::isDegenerate(buffers.args[0]));
    EXPECT_EQ(buffers.instances[0].baseQuadOffset, 0u);
    EXPECT_EQ(buffers.args[1].indexCount, 16u * voxquad::render::kQuadIndexCount);
    EXPECT_TRUE(voxquad::render::isDegenerate(buffers.args[2]));
    EXPECT_EQ(buffers.args[3].indexCount, 4u * voxquad::render::kQuadIndexCount);
}

TEST(IndirectCommandsTest, QuadRangeCheckUsesClampedCountAndAvoidsOverflow) {
    voxquad::render::GpuChunkMetadata metadata = makeMetadata(0.0f, 8u, voxquad::render::kMaxQuadsPerChunk + 50u);
    EXPECT_EQ(voxquad::render::drawnQuadCount(metadata), voxquad::render::kMaxQuadsPerChunk);
    EXPECT_TRUE(voxquad::render::quadRangeFits(metadata, voxquad::render::kMaxQuadsPerChunk + 8u));
    EXPECT_FALSE(voxquad::render::quadRangeFits(metadata, voxquad::render::kMaxQuadsPerChunk + 7u));

    metadata.quadBaseOffset = 0xFFFFFFF0u;
    metadata.quadCount = 0x20u;
    EXPECT_FALSE(voxquad::render::quadRangeFits(metadata, 0xFFFFFFFFu));
    EXPECT_FALSE(voxquad::render::quadRangeFits(metadata, 4u));
}

TEST(IndirectCommandsTest, WorkerCountDoesNotChangeOutput) {
    const std::vector<voxquad::render::GpuChunkMetadata> metadata = makeMetadataTable(64);
    std::vector<std::uint32_t> visible;
    for (std::uint32_t i = 0; i < 900; ++i) {
        visible.push_back((i * 7u) % 70u);
    }

    SlotBuffers serial(1024);
    SlotBuffers parallel(1024);
    voxquad::render::IndirectBuildOptions parallelOptions{};
    parallelOptions.workerCount = 4;
    parallelOptions.minSlotsPerWorker = 64;

    const auto serialStats = voxquad::render::buildIndirectCommands({metadata, visible, kQuadBufferCount}, serial.outputs());
    const auto parallelStats =
        voxquad::render::buildIndirectCommands({metadata, visible, kQuadBufferCount}, parallel.outputs(), parallelOptions);
    ASSERT_TRUE(serialStats.has_value());
    ASSERT_TRUE(parallelStats.has_value());
    EXPECT_EQ(serialStats->liveSlotCount, parallelStats->liveSlotCount);
    EXPECT_EQ(serialStats->totalIndexCount, parallelStats->totalIndexCount);

    for (std::size_t slot = 0; slot < serial.args.size(); ++slot) {
        EXPECT_EQ(serial.args[slot].indexCount, parallel.args[slot].indexCount);
        EXPECT_EQ(serial.args[slot].firstInstance, parallel.args[slot].firstInstance);
        EXPECT_EQ(serial.instances[slot].baseQuadOffset, parallel.instances[slot].baseQuadOffset);
        EXPECT_EQ(serial.instances[slot].occlusionSlot, parallel.instances[slot].occlusionSlot);
    }
}

TEST(IndirectCommandsTest, RejectsVisibleListLongerThanSlotCapacity) {
    const std::vector<voxquad::render::GpuChunkMetadata> metadata = makeMetadataTable(4);
    const std::vector<std::uint32_t> visible = {0u, 1u, 2u};
    SlotBuffers buffers(2);
    buffers.args[0].indexCount = 42u;

    EXPECT_EQ(
        voxquad::render::validateIndirectBuild({metadata, visible, kQuadBufferCount}, buffers.outputs()),
        voxquad::render::IndirectBuildStatus::VisibleListExceedsCapacity
    );
    EXPECT_FALSE(voxquad::render::buildIndirectCommands({metadata, visible, kQuadBufferCount}, buffers.outputs()).has_value());
    EXPECT_EQ(buffers.args[0].indexCount, 42u);
}

TEST(IndirectCommandsTest, RejectsMismatchedOutputSizes) {
    const std::vector<voxquad::render::GpuChunkMetadata> metadata = makeMetadataTable(1);
    const std::vector<std::uint32_t> visible = {0u};
    std::vector<voxquad::render::ChunkInstanceData> instances(2);
    std::vector<voxquad::render::IndexedIndirectArgs> args(3);

    EXPECT_EQ(
        voxquad::render::validateIndirectBuild({metadata, visible, kQuadBufferCount}, {instances, args}),
        voxquad::render::IndirectBuildStatus::OutputSizeMismatch
    );
}

TEST(IndirectCommandsTest, GroupCountCoversEverySlot) {
    EXPECT_EQ(voxquad::render::indirectBuildGroupCount(0u), 0u);
    EXPECT_EQ(voxquad::render::indirectBuildGroupCount(1u), 1u);
    EXPECT_EQ(voxquad::render::indirectBuildGroupCount(64u), 1u);
    EXPECT_EQ(voxquad::render::indirectBuildGroupCount(65u), 2u);
}

} // namespace
