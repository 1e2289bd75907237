#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "core/face.h"
#include "math/math.h"
#include "render/chunk_draw_types.h"
#include "render/quad.h"
#include "render/vertex_reconstruction.h"

namespace {

voxquad::render::PackedQuad makeQuad(voxquad::core::Face face, std::uint32_t rotation, bool flipX, bool flipY) {
    return voxquad::render::encode(
        face,
        9u,
        voxquad::render::QuadCoord{1u, 2u},
        voxquad::render::QuadCoord{4u, 7u},
        17u,
        rotation,
        flipX,
        flipY
    );
}

struct ChunkFixture {
    ChunkFixture() {
        quads.push_back(makeQuad(voxquad::core::Face::PosX, 0u, false, false));
        quads.push_back(makeQuad(voxquad::core::Face::NegY, 0u, false, false));
        quads.push_back(makeQuad(voxquad::core::Face::PosZ, 0u, false, false));

        voxquad::render::ChunkInstanceData instance{};
        instance.worldOffset[0] = 32.0f;
        instance.worldOffset[1] = 0.0f;
        instance.worldOffset[2] = -32.0f;
        instance.worldOffset[3] = 1.0f;
        instance.baseQuadOffset = 1u;
        instance.tint = voxquad::render::packRgba8(255u, 0u, 51u, 255u);
        instance.occlusionSlot = 7u;
        instances.push_back(instance);
    }

    voxquad::render::VertexFetchContext context() const {
        voxquad::render::VertexFetchContext result{};
        result.quads = quads;
        result.instances = instances;
        return result;
    }

    std::vector<voxquad::render::PackedQuad> quads;
    std::vector<voxquad::render::ChunkInstanceData> instances;
};

TEST(VertexReconstructionTest, OrientUvRotatesInQuarterTurns) {
    const voxquad::math::Vector2 uv{2.0f, 1.0f};
    EXPECT_EQ(voxquad::render::orientUv(uv, 0u, false, false), (voxquad::math::Vector2{2.0f, 1.0f}));
    EXPECT_EQ(voxquad::render::orientUv(uv, 1u, false, false), (voxquad::math::Vector2{1.0f, -2.0f}));
    EXPECT_EQ(voxquad::render::orientUv(uv, 2u, false, false), (voxquad::math::Vector2{-2.0f, -1.0f}));
    EXPECT_EQ(voxquad::render::orientUv(uv, 3u, false, false), (voxquad::math::Vector2{-1.0f, 2.0f}));
}

TEST(VertexReconstructionTest, FlipsApplyAfterRotation) {
    const voxquad::math::Vector2 uv{2.0f, 1.0f};
    EXPECT_EQ(voxquad::render::orientUv(uv, 0u, true, false), (voxquad::math::Vector2{-2.0f, 1.0f}));
    EXPECT_EQ(voxquad::render::orientUv(uv, 0u, false, true), (voxquad::math::Vector2{2.0f, -1.0f}));
    EXPECT_EQ(voxquad::render::orientUv(uv, 1u, true, false), (voxquad::math::Vector2{-1.0f, -2.0f}));
}

TEST(VertexReconstructionTest, OrientationMasksCorrectPerFace) {
    const voxquad::render::PackedQuad top = makeQuad(voxquad::core::Face::PosY, 1u, false, true);
    const voxquad::render::PackedQuad side = makeQuad(voxquad::core::Face::PosX, 1u, false, true);

    voxquad::render::OrientationConfig orientation{};
    orientation.rotationMask = 3u << 4u;
    orientation.flipUvXMask = 1u << 2u;
    orientation.flipUvYMask = 1u << 2u;

    EXPECT_EQ(voxquad::render::effectiveRotation(top, orientation), 2u);
    EXPECT_TRUE(voxquad::render::effectiveFlipX(top, orientation));
    EXPECT_FALSE(voxquad::render::effectiveFlipY(top, orientation));

    EXPECT_EQ(voxquad::render::effectiveRotation(side, orientation), 1u);
    EXPECT_FALSE(voxquad::render::effectiveFlipX(side, orientation));
    EXPECT_TRUE(voxquad::render::effectiveFlipY(side, orientation));
}

TEST(VertexReconstructionTest, TangentHandednessFollowsMirroring) {
    const voxquad::render::OrientationConfig orientation{};

    const voxquad::math::Vector4 plain =
        voxquad::render::orientedTangent(makeQuad(voxquad::core::Face::PosZ, 0u, false, false), orientation);
    EXPECT_EQ(plain.xyz(), (voxquad::math::Vector3{1.0f, 0.0f, 0.0f}));
    EXPECT_FLOAT_EQ(plain.w, 1.0f);

    const voxquad::math::Vector4 mirrored =
        voxquad::render::orientedTangent(makeQuad(voxquad::core::Face::PosZ, 0u, true, false), orientation);
    EXPECT_EQ(mirrored.xyz(), (voxquad::math::Vector3{-1.0f, 0.0f, 0.0f}));
    EXPECT_FLOAT_EQ(mirrored.w, -1.0f);

    const voxquad::math::Vector4 rotated =
        voxquad::render::orientedTangent(makeQuad(voxquad::core::Face::PosZ, 2u, false, false), orientation);
    EXPECT_FLOAT_EQ(rotated.w, 1.0f);
}

TEST(VertexReconstructionTest, FetchAddsBaseQuadOffset) {
    const ChunkFixture fixture;
    const auto ref = voxquad::render::fetchQuadVertex(fixture.context(), 0u, 5u);
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->quadIndex, 2u);
    EXPECT_EQ(ref->corner, 1u);
    EXPECT_EQ(ref->quad, &fixture.quads[2]);
}

TEST(VertexReconstructionTest, FetchRejectsIndicesOutsideBoundBuffers) {
    const ChunkFixture fixture;
    EXPECT_FALSE(voxquad::render::fetchQuadVertex(fixture.context(), 1u, 0u).has_value());
    EXPECT_FALSE(voxquad::render::fetchQuadVertex(fixture.context(), 0u, 8u).has_value());
    EXPECT_FALSE(voxquad::render::reconstructVertex<voxquad::render::kVertexFeatureAll>(fixture.context(), 0u, 8u)
                     .has_value());
}

TEST(VertexReconstructionTest, FullVertexPlacesCornerInWorldSpace) {
    const ChunkFixture fixture;
    const auto vertex =
        voxquad::render::reconstructVertex<voxquad::render::kVertexFeatureAll>(fixture.context(), 0u, 5u);
    ASSERT_TRUE(vertex.has_value());

    const voxquad::math::Vector3 local =
        voxquad::render::extractPosition(fixture.quads[2], 1u);
    EXPECT_EQ(vertex->localPosition, local);
    EXPECT_EQ(vertex->worldPosition, (voxquad::math::Vector3{local.x + 32.0f, local.y, local.z - 32.0f}));
    EXPECT_EQ(vertex->clipPosition, (voxquad::math::Vector4{vertex->worldPosition, 1.0f}));
    EXPECT_EQ(vertex->worldNormal, (voxquad::math::Vector3{0.0f, 0.0f, 1.0f}));
    EXPECT_EQ(vertex->textureId, 17u);
    EXPECT_EQ(vertex->quadIndex, 2u);
    EXPECT_EQ(vertex->occlusionSlot, 7u);
    EXPECT_EQ(vertex->instanceIndex, 0u);
    EXPECT_FLOAT_EQ(vertex->color.x, 1.0f);
    EXPECT_FLOAT_EQ(vertex->color.y, 0.0f);
    EXPECT_NEAR(vertex->color.z, 0.2f, 1e-6f);
    EXPECT_FLOAT_EQ(vertex->color.w, 1.0f);
    EXPECT_EQ(vertex->quadLocal, voxquad::render::extractUv(fixture.quads[2], 1u));
}

TEST(VertexReconstructionTest, MinimalVariantLeavesOptionalOutputsUnset) {
    ChunkFixture fixture;
    fixture.instances.push_back(fixture.instances[0]);
    const auto vertex =
        voxquad::render::reconstructVertex<voxquad::render::kVertexFeatureNone>(fixture.context(), 1u, 0u);
    ASSERT_TRUE(vertex.has_value());
    EXPECT_EQ(vertex->worldNormal, voxquad::math::Vector3{});
    EXPECT_EQ(vertex->instanceIndex, 0u);
    EXPECT_EQ(vertex->color, voxquad::math::Vector4{});
}

TEST(VertexReconstructionTest, OrthoDepthClampKeepsUnclampedPosition) {
    const ChunkFixture fixture;
    voxquad::render::VertexFetchContext context = fixture.context();
    context.view.viewProjection = voxquad::math::Matrix4::translation(voxquad::math::Vector3{0.0f, 0.0f, 5.0f});

    constexpr voxquad::render::VertexFeatureMask kShadowFeatures =
        voxquad::render::kVertexFeatureDepthClampOrtho;
    const auto vertex = voxquad::render::reconstructPrepassVertex<kShadowFeatures>(context, 0u, 0u);
    ASSERT_TRUE(vertex.has_value());
    EXPECT_FLOAT_EQ(vertex->clipPosition.z, 1.0f);
    EXPECT_GT(vertex->unclampedClipPosition.z, 1.0f);
    EXPECT_FLOAT_EQ(vertex->clipPosition.x, vertex->unclampedClipPosition.x);
}

TEST(VertexReconstructionTest, DeferredPrepassEmitsNormalAndHistory) {
    const ChunkFixture fixture;
    voxquad::render::VertexFetchContext context = fixture.context();
    context.view.previousViewProjection =
        voxquad::math::Matrix4::translation(voxquad::math::Vector3{-1.0f, 0.0f, 0.0f});

    const auto vertex =
        voxquad::render::reconstructPrepassVertex<voxquad::render::kVertexFeatureDeferred>(context, 0u, 0u);
    ASSERT_TRUE(vertex.has_value());
    EXPECT_EQ(vertex->worldNormal, (voxquad::math::Vector3{0.0f, -1.0f, 0.0f}));
    EXPECT_FLOAT_EQ(vertex->previousClipPosition.x, vertex->clipPosition.x - 1.0f);

    const voxquad::math::Vector2 motion =
        voxquad::render::computeMotionVector(vertex->clipPosition, vertex->previousClipPosition);
    EXPECT_FLOAT_EQ(motion.x, 1.0f);
    EXPECT_FLOAT_EQ(motion.y, 0.0f);
}

TEST(VertexReconstructionTest, UnpackRgba8ReadsLowByteAsRed) {
    const voxquad::math::Vector4 color = voxquad::render::unpackRgba8(0xFF000080u);
    EXPECT_NEAR(color.x, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(color.y, 0.0f);
    EXPECT_FLOAT_EQ(color.z, 0.0f);
    EXPECT_FLOAT_EQ(color.w, 1.0f);
}

TEST(VertexReconstructionTest, PrepassCarriesAlphaTestInputsOnly) {
    const ChunkFixture fixture;
    const auto prepass =
        voxquad::render::reconstructPrepassVertex<voxquad::render::kVertexFeatureNone>(fixture.context(), 0u, 6u);
    const auto full =
        voxquad::render::reconstructVertex<voxquad::render::kVertexFeatureAll>(fixture.context(), 0u, 6u);
    ASSERT_TRUE(prepass.has_value());
    ASSERT_TRUE(full.has_value());
    EXPECT_FLOAT_EQ(prepass->clipPosition.x, full->clipPosition.x);
    EXPECT_FLOAT_EQ(prepass->clipPosition.y, full->clipPosition.y);
    EXPECT_EQ(prepass->uv, full->uv);
    EXPECT_EQ(prepass->textureId, 17u);
    EXPECT_EQ(prepass->worldNormal, voxquad::math::Vector3{});
}

} // namespace
