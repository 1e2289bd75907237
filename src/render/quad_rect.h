#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "core/face.h"
#include "math/math.h"
#include "render/quad.h"

namespace voxquad::render {

// Float rectangle used by host-side meshers while growing a greedy quad, before it is packed.
class QuadRect {
public:
    QuadRect() = default;

    [[nodiscard]] static QuadRect fromMinMax(const math::Vector2& min, const math::Vector2& max);
    // Corners may be given in any order.
    [[nodiscard]] static QuadRect fromPoints(const math::Vector2& a, const math::Vector2& b);

    [[nodiscard]] math::Vector2 min() const { return math::Vector2{m_x, m_y}; }
    [[nodiscard]] math::Vector2 max() const { return math::Vector2{m_x + m_width, m_y + m_height}; }
    [[nodiscard]] float width() const { return m_width; }
    [[nodiscard]] float height() const { return m_height; }

    // Grow or shrink along one edge. A result with negative extent is rejected.
    [[nodiscard]] std::optional<QuadRect> widen(float amount) const;
    [[nodiscard]] std::optional<QuadRect> heighten(float amount) const;

    // Steps n = 0, 1, ... until stop(n) or n == ceiling, then grows by n * step.
    [[nodiscard]] QuadRect widenUntil(float step, std::uint32_t ceiling, const std::function<bool(std::uint32_t)>& stop) const;
    [[nodiscard]] QuadRect heightenUntil(float step, std::uint32_t ceiling, const std::function<bool(std::uint32_t)>& stop) const;

    // Packs the rectangle as a face on voxel layer axisMagnitude. Fails on non-integral or
    // out-of-chunk coordinates.
    [[nodiscard]] std::optional<QuadFields> toQuadFields(
        core::Face face,
        std::uint32_t axisMagnitude,
        std::uint32_t textureId,
        std::uint32_t rotation = 0,
        bool flipX = false,
        bool flipY = false
    ) const;

    bool operator==(const QuadRect&) const = default;

private:
    float m_x = 0.0f;
    float m_y = 0.0f;
    float m_width = 0.0f;
    float m_height = 0.0f;
};

} // namespace voxquad::render
