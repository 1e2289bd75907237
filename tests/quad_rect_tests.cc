#include <gtest/gtest.h>

#include <cstdint>

#include "core/face.h"
#include "math/math.h"
#include "render/quad.h"
#include "render/quad_rect.h"

namespace {

TEST(QuadRectTest, FromPointsIgnoresCornerOrder) {
    const voxquad::render::QuadRect a = voxquad::render::QuadRect::fromPoints(
        voxquad::math::Vector2{4.0f, 1.0f},
        voxquad::math::Vector2{1.0f, 6.0f}
    );
    const voxquad::render::QuadRect b = voxquad::render::QuadRect::fromPoints(
        voxquad::math::Vector2{1.0f, 6.0f},
        voxquad::math::Vector2{4.0f, 1.0f}
    );
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.min(), (voxquad::math::Vector2{1.0f, 1.0f}));
    EXPECT_EQ(a.max(), (voxquad::math::Vector2{4.0f, 6.0f}));
    EXPECT_FLOAT_EQ(a.width(), 3.0f);
    EXPECT_FLOAT_EQ(a.height(), 5.0f);
}

TEST(QuadRectTest, WidenRejectsNegativeExtent) {
    const voxquad::render::QuadRect rect = voxquad::render::QuadRect::fromMinMax(
        voxquad::math::Vector2{0.0f, 0.0f},
        voxquad::math::Vector2{2.0f, 1.0f}
    );
    const auto wider = rect.widen(3.0f);
    ASSERT_TRUE(wider.has_value());
    EXPECT_FLOAT_EQ(wider->width(), 5.0f);
    EXPECT_FLOAT_EQ(wider->height(), 1.0f);

    EXPECT_TRUE(rect.widen(-2.0f).has_value());
    EXPECT_FALSE(rect.widen(-2.5f).has_value());
    EXPECT_FALSE(rect.heighten(-1.5f).has_value());
}

TEST(QuadRectTest, GrowUntilStopsAtFirstBlockedStep) {
    const voxquad::render::QuadRect seed = voxquad::render::QuadRect::fromMinMax(
        voxquad::math::Vector2{3.0f, 3.0f},
        voxquad::math::Vector2{4.0f, 4.0f}
    );

    const voxquad::render::QuadRect wide = seed.widenUntil(1.0f, 10u, [](std::uint32_t n) {
        return n == 4u;
    });
    EXPECT_FLOAT_EQ(wide.width(), 5.0f);

    const voxquad::render::QuadRect tall = seed.heightenUntil(1.0f, 6u, [](std::uint32_t) {
        return false;
    });
    EXPECT_FLOAT_EQ(tall.height(), 7.0f);

    const voxquad::render::QuadRect blocked = seed.widenUntil(1.0f, 10u, [](std::uint32_t) {
        return true;
    });
    EXPECT_EQ(blocked, seed);
}

TEST(QuadRectTest, PacksGridAlignedRectangle) {
    const voxquad::render::QuadRect rect = voxquad::render::QuadRect::fromMinMax(
        voxquad::math::Vector2{2.0f, 0.0f},
        voxquad::math::Vector2{32.0f, 5.0f}
    );
    const auto fields = rect.toQuadFields(voxquad::core::Face::NegX, 7u, 12u, 2u, true, false);
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(fields->face, voxquad::core::Face::NegX);
    EXPECT_EQ(fields->axisMagnitude, 7u);
    EXPECT_EQ(fields->min, (voxquad::render::QuadCoord{2u, 0u}));
    EXPECT_EQ(fields->max, (voxquad::render::QuadCoord{32u, 5u}));
    EXPECT_EQ(fields->textureId, 12u);
    EXPECT_EQ(fields->rotation, 2u);
    EXPECT_TRUE(fields->flipX);

    const voxquad::render::PackedQuad quad = voxquad::render::encode(*fields);
    EXPECT_EQ(voxquad::render::extractMin(quad), fields->min);
    EXPECT_EQ(voxquad::render::extractMax(quad), fields->max);
}

TEST(QuadRectTest, RejectsOffGridOrOutOfChunkRectangles) {
    const voxquad::render::QuadRect fractional = voxquad::render::QuadRect::fromMinMax(
        voxquad::math::Vector2{0.5f, 0.0f},
        voxquad::math::Vector2{2.0f, 1.0f}
    );
    EXPECT_FALSE(fractional.toQuadFields(voxquad::core::Face::PosY, 0u, 0u).has_value());

    const voxquad::render::QuadRect tooLarge = voxquad::render::QuadRect::fromMinMax(
        voxquad::math::Vector2{0.0f, 0.0f},
        voxquad::math::Vector2{33.0f, 1.0f}
    );
    EXPECT_FALSE(tooLarge.toQuadFields(voxquad::core::Face::PosY, 0u, 0u).has_value());
}

} // namespace
