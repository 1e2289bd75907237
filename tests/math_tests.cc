#include <gtest/gtest.h>

#include <cmath>

#include "math/math.h"

namespace {

TEST(MathTest, NormalizeProducesUnitLengthAndHandlesZero) {
    const voxquad::math::Vector3 n = voxquad::math::normalize(voxquad::math::Vector3{0.0f, 3.0f, 4.0f});
    EXPECT_NEAR(voxquad::math::length(n), 1.0f, 1e-5f);
    EXPECT_FLOAT_EQ(n.y, 0.6f);
    EXPECT_EQ(voxquad::math::normalize(voxquad::math::Vector3{}), voxquad::math::Vector3{});
}

TEST(MathTest, CrossFollowsRightHandRule) {
    const voxquad::math::Vector3 x{1.0f, 0.0f, 0.0f};
    const voxquad::math::Vector3 y{0.0f, 1.0f, 0.0f};
    EXPECT_EQ(voxquad::math::cross(x, y), (voxquad::math::Vector3{0.0f, 0.0f, 1.0f}));
    EXPECT_FLOAT_EQ(voxquad::math::dot(x, y), 0.0f);
}

TEST(MathTest, MatrixProductComposesTranslations) {
    const voxquad::math::Matrix4 a = voxquad::math::Matrix4::translation(voxquad::math::Vector3{1.0f, 2.0f, 3.0f});
    const voxquad::math::Matrix4 b = voxquad::math::Matrix4::translation(voxquad::math::Vector3{-4.0f, 0.0f, 1.0f});
    const voxquad::math::Vector4 p = (a * b) * voxquad::math::Vector4{0.0f, 0.0f, 0.0f, 1.0f};
    EXPECT_EQ(p, (voxquad::math::Vector4{-3.0f, 2.0f, 4.0f, 1.0f}));
}

TEST(MathTest, ReverseZPerspectiveMapsNearToOneAndFarToZero) {
    const voxquad::math::Matrix4 projection =
        voxquad::math::perspectiveVulkanReverseZ(voxquad::math::radians(60.0f), 16.0f / 9.0f, 0.1f, 100.0f);

    const voxquad::math::Vector4 nearPoint = projection * voxquad::math::Vector4{0.0f, 0.0f, -0.1f, 1.0f};
    const voxquad::math::Vector4 farPoint = projection * voxquad::math::Vector4{0.0f, 0.0f, -100.0f, 1.0f};
    EXPECT_NEAR(nearPoint.z / nearPoint.w, 1.0f, 1e-5f);
    EXPECT_NEAR(farPoint.z / farPoint.w, 0.0f, 1e-5f);
}

TEST(MathTest, ReverseZOrthographicPushesCasterBehindNearAboveOne) {
    const voxquad::math::Matrix4 projection =
        voxquad::math::orthographicVulkanReverseZ(-10.0f, 10.0f, -10.0f, 10.0f, 1.0f, 50.0f);

    const voxquad::math::Vector4 nearPoint = projection * voxquad::math::Vector4{0.0f, 0.0f, -1.0f, 1.0f};
    const voxquad::math::Vector4 farPoint = projection * voxquad::math::Vector4{0.0f, 0.0f, -50.0f, 1.0f};
    const voxquad::math::Vector4 behindNear = projection * voxquad::math::Vector4{0.0f, 0.0f, 4.0f, 1.0f};
    EXPECT_NEAR(nearPoint.z, 1.0f, 1e-5f);
    EXPECT_NEAR(farPoint.z, 0.0f, 1e-5f);
    EXPECT_GT(behindNear.z, 1.0f);
    EXPECT_FLOAT_EQ(nearPoint.w, 1.0f);
}

} // namespace
