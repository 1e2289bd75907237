#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>
#include <vector>

#include "core/face.h"
#include "math/math.h"
#include "render/quad.h"

namespace {

voxquad::render::PackedQuad makeQuad(voxquad::core::Face face, std::uint32_t magnitude) {
    return voxquad::render::encode(
        face,
        magnitude,
        voxquad::render::QuadCoord{1u, 2u},
        voxquad::render::QuadCoord{4u, 7u},
        9u,
        0u,
        false,
        false
    );
}

TEST(QuadCodecTest, EncodeDecodePreservesEveryField) {
    voxquad::render::QuadFields fields{};
    fields.face = voxquad::core::Face::NegZ;
    fields.axisMagnitude = 31u;
    fields.min = voxquad::render::QuadCoord{0u, 5u};
    fields.max = voxquad::render::QuadCoord{32u, 32u};
    fields.textureId = 0xABCDEFu;
    fields.rotation = 3u;
    fields.flipX = true;
    fields.flipY = false;

    const voxquad::render::PackedQuad quad = voxquad::render::encode(fields);
    EXPECT_TRUE(voxquad::render::isWellFormed(quad));
    EXPECT_EQ(voxquad::render::decode(quad), fields);
    EXPECT_EQ(voxquad::render::extractFace(quad), voxquad::core::Face::NegZ);
    EXPECT_EQ(voxquad::render::extractMagnitude(quad), 31u);
    EXPECT_EQ(voxquad::render::extractTextureId(quad), 0xABCDEFu);
    EXPECT_EQ(voxquad::render::extractRotation(quad), 3u);
    EXPECT_TRUE(voxquad::render::extractFlipX(quad));
    EXPECT_FALSE(voxquad::render::extractFlipY(quad));
}

TEST(QuadCodecTest, FaceIdsFollowAxisPairs) {
    EXPECT_EQ(voxquad::core::faceIndex(voxquad::core::Face::PosX), 0u);
    EXPECT_EQ(voxquad::core::faceIndex(voxquad::core::Face::NegX), 1u);
    EXPECT_EQ(voxquad::core::faceIndex(voxquad::core::Face::PosY), 2u);
    EXPECT_EQ(voxquad::core::faceIndex(voxquad::core::Face::NegY), 3u);
    EXPECT_EQ(voxquad::core::faceIndex(voxquad::core::Face::PosZ), 4u);
    EXPECT_EQ(voxquad::core::faceIndex(voxquad::core::Face::NegZ), 5u);

    for (const voxquad::core::Face face : voxquad::core::kAllFaces) {
        EXPECT_EQ(voxquad::core::oppositeFace(voxquad::core::oppositeFace(face)), face);
        EXPECT_EQ(
            voxquad::render::axisFromFace(face),
            voxquad::render::axisFromFace(voxquad::core::oppositeFace(face))
        );
        const voxquad::render::PackedQuad quad = makeQuad(face, 3u);
        EXPECT_EQ(voxquad::render::extractNormal(quad), voxquad::core::faceToUnitVector(face));
    }
    EXPECT_EQ(voxquad::render::axisFromFace(voxquad::core::Face::NegX), voxquad::core::Axis::X);
    EXPECT_EQ(voxquad::render::axisFromFace(voxquad::core::Face::PosY), voxquad::core::Axis::Y);
    EXPECT_EQ(voxquad::render::axisFromFace(voxquad::core::Face::NegZ), voxquad::core::Axis::Z);
}

TEST(QuadCodecTest, PositiveFacesSitOnTheFarSideOfTheirVoxelLayer) {
    const voxquad::render::PackedQuad top = makeQuad(voxquad::core::Face::PosY, 3u);
    const voxquad::render::PackedQuad bottom = makeQuad(voxquad::core::Face::NegY, 3u);
    for (std::uint32_t corner = 0; corner < voxquad::render::kQuadVertexCount; ++corner) {
        EXPECT_FLOAT_EQ(voxquad::render::extractPosition(top, corner).y, 4.0f);
        EXPECT_FLOAT_EQ(voxquad::render::extractPosition(bottom, corner).y, 3.0f);
    }

    const voxquad::math::Vector3 corner0 = voxquad::render::extractPosition(top, 0u);
    EXPECT_FLOAT_EQ(corner0.x, 1.0f);
    EXPECT_FLOAT_EQ(corner0.z, 7.0f);
}

TEST(QuadCodecTest, BothTrianglesFaceOutwardForEveryFace) {
    for (const voxquad::core::Face face : voxquad::core::kAllFaces) {
        const voxquad::render::PackedQuad quad = makeQuad(face, 10u);
        const voxquad::math::Vector3 normal = voxquad::core::faceToUnitVector(face);
        for (std::size_t triangle = 0; triangle < 2; ++triangle) {
            const voxquad::math::Vector3 a =
                voxquad::render::extractPosition(quad, voxquad::render::kQuadIndexPattern[triangle * 3]);
            const voxquad::math::Vector3 b =
                voxquad::render::extractPosition(quad, voxquad::render::kQuadIndexPattern[(triangle * 3) + 1]);
            const voxquad::math::Vector3 c =
                voxquad::render::extractPosition(quad, voxquad::render::kQuadIndexPattern[(triangle * 3) + 2]);
            const voxquad::math::Vector3 winding = voxquad::math::cross(b - a, c - a);
            EXPECT_GT(voxquad::math::dot(winding, normal), 0.0f)
                << "face " << voxquad::core::faceName(face) << " triangle " << triangle;
        }
    }
}

TEST(QuadCodecTest, OppositeFacesProjectToTheSameRectangle) {
    const std::array<std::array<voxquad::core::Face, 2>, 3> pairs = {{
        {voxquad::core::Face::PosX, voxquad::core::Face::NegX},
        {voxquad::core::Face::PosY, voxquad::core::Face::NegY},
        {voxquad::core::Face::PosZ, voxquad::core::Face::NegZ}
    }};
    for (const auto& pair : pairs) {
        const voxquad::render::PackedQuad positive = makeQuad(pair[0], 5u);
        const voxquad::render::PackedQuad negative = makeQuad(pair[1], 5u);
        const voxquad::core::Axis axis = voxquad::render::axisFromFace(pair[0]);

        std::vector<std::pair<float, float>> positiveUvs;
        std::vector<std::pair<float, float>> negativeUvs;
        for (std::uint32_t corner = 0; corner < voxquad::render::kQuadVertexCount; ++corner) {
            const voxquad::math::Vector2 projected =
                voxquad::render::projectTo2d(voxquad::render::extractPosition(positive, corner), axis);
            const voxquad::render::QuadCoord expected = voxquad::render::extractCorner2d(positive, corner);
            EXPECT_FLOAT_EQ(projected.x, static_cast<float>(expected.x));
            EXPECT_FLOAT_EQ(projected.y, static_cast<float>(expected.y));

            const voxquad::math::Vector2 uvPositive = voxquad::render::extractUv(positive, corner);
            const voxquad::math::Vector2 uvNegative = voxquad::render::extractUv(negative, corner);
            positiveUvs.emplace_back(uvPositive.x, uvPositive.y);
            negativeUvs.emplace_back(uvNegative.x, uvNegative.y);
        }
        std::sort(positiveUvs.begin(), positiveUvs.end());
        std::sort(negativeUvs.begin(), negativeUvs.end());
        EXPECT_EQ(positiveUvs, negativeUvs);
    }
}

TEST(QuadCodecTest, ExtractUvIsRelativeToQuadMin) {
    const voxquad::render::PackedQuad quad = makeQuad(voxquad::core::Face::NegZ, 0u);
    const voxquad::math::Vector2 uv0 = voxquad::render::extractUv(quad, 0u);
    const voxquad::math::Vector2 uv3 = voxquad::render::extractUv(quad, 3u);
    EXPECT_FLOAT_EQ(uv0.x, 0.0f);
    EXPECT_FLOAT_EQ(uv0.y, 5.0f);
    EXPECT_FLOAT_EQ(uv3.x, 3.0f);
    EXPECT_FLOAT_EQ(uv3.y, 0.0f);
}

TEST(QuadCodecTest, LiftTo3dInvertsProjectTo2d) {
    const voxquad::math::Vector3 position{3.0f, 8.0f, 21.0f};
    for (const voxquad::core::Axis axis : {voxquad::core::Axis::X, voxquad::core::Axis::Y, voxquad::core::Axis::Z}) {
        const voxquad::math::Vector2 projected = voxquad::render::projectTo2d(position, axis);
        const float plane = axis == voxquad::core::Axis::X ? position.x
                          : axis == voxquad::core::Axis::Y ? position.y
                                                           : position.z;
        EXPECT_EQ(voxquad::render::liftTo3d(projected, plane, axis), position);
    }
}

TEST(QuadCodecTest, TryEncodeRejectsOutOfRangeFields) {
    voxquad::render::QuadFields valid{};
    valid.face = voxquad::core::Face::PosX;
    valid.min = voxquad::render::QuadCoord{0u, 0u};
    valid.max = voxquad::render::QuadCoord{32u, 32u};
    valid.axisMagnitude = 31u;
    valid.rotation = 3u;
    ASSERT_TRUE(voxquad::render::tryEncode(valid).has_value());

    voxquad::render::QuadFields inverted = valid;
    inverted.min = voxquad::render::QuadCoord{5u, 0u};
    inverted.max = voxquad::render::QuadCoord{4u, 1u};
    EXPECT_FALSE(voxquad::render::tryEncode(inverted).has_value());

    voxquad::render::QuadFields tooWide = valid;
    tooWide.max = voxquad::render::QuadCoord{33u, 1u};
    EXPECT_FALSE(voxquad::render::tryEncode(tooWide).has_value());

    voxquad::render::QuadFields deepLayer = valid;
    deepLayer.axisMagnitude = 32u;
    EXPECT_FALSE(voxquad::render::tryEncode(deepLayer).has_value());

    voxquad::render::QuadFields overRotated = valid;
    overRotated.rotation = 4u;
    EXPECT_FALSE(voxquad::render::tryEncode(overRotated).has_value());
}

TEST(QuadCodecTest, InvalidFaceBitsAreNotWellFormed) {
    voxquad::render::PackedQuad quad = makeQuad(voxquad::core::Face::PosX, 0u);
    quad.bitfields |= 7u << voxquad::render::PackedQuad::kFaceShift;
    EXPECT_FALSE(voxquad::render::isWellFormed(quad));
}

TEST(QuadCodecTest, FillQuadIndicesRepeatsPatternPerQuad) {
    std::vector<std::uint32_t> indices(2 * voxquad::render::kQuadIndexCount);
    voxquad::render::fillQuadIndices(indices);
    const std::vector<std::uint32_t> expected = {0, 1, 2, 1, 3, 2, 4, 5, 6, 5, 7, 6};
    EXPECT_EQ(indices, expected);
}

TEST(QuadCodecTest, MaxQuadsPerChunkCoversCheckerboard) {
    EXPECT_EQ(voxquad::render::kMaxQuadsPerChunk, 98304u);
}

} // namespace
