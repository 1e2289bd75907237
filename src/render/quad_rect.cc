#include "render/quad_rect.h"

#include "core/log.h"

#include <algorithm>
#include <cmath>

namespace voxquad::render {

namespace {

std::optional<std::uint32_t> toGridCoordinate(float value) {
    const float rounded = std::round(value);
    if (std::abs(value - rounded) > 1e-4f || rounded < 0.0f || rounded > static_cast<float>(kMaxQuadCoordinate)) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(rounded);
}

std::uint32_t countSteps(std::uint32_t ceiling, const std::function<bool(std::uint32_t)>& stop) {
    std::uint32_t n = 0;
    while (n < ceiling && !stop(n)) {
        ++n;
    }
    return n;
}

} // namespace

QuadRect QuadRect::fromMinMax(const math::Vector2& min, const math::Vector2& max) {
    QuadRect rect{};
    rect.m_x = min.x;
    rect.m_y = min.y;
    rect.m_width = std::abs(max.x - min.x);
    rect.m_height = std::abs(max.y - min.y);
    return rect;
}

QuadRect QuadRect::fromPoints(const math::Vector2& a, const math::Vector2& b) {
    return fromMinMax(
        math::Vector2{std::min(a.x, b.x), std::min(a.y, b.y)},
        math::Vector2{std::max(a.x, b.x), std::max(a.y, b.y)}
    );
}

std::optional<QuadRect> QuadRect::widen(float amount) const {
    if (m_width + amount < 0.0f) {
        VQ_LOGW("quad") << "widen by " << amount << " would give negative width " << (m_width + amount);
        return std::nullopt;
    }
    QuadRect result = *this;
    result.m_width += amount;
    return result;
}

std::optional<QuadRect> QuadRect::heighten(float amount) const {
    if (m_height + amount < 0.0f) {
        VQ_LOGW("quad") << "heighten by " << amount << " would give negative height " << (m_height + amount);
        return std::nullopt;
    }
    QuadRect result = *this;
    result.m_height += amount;
    return result;
}

QuadRect QuadRect::widenUntil(float step, std::uint32_t ceiling, const std::function<bool(std::uint32_t)>& stop) const {
    QuadRect result = *this;
    result.m_width = std::max(0.0f, m_width + (static_cast<float>(countSteps(ceiling, stop)) * step));
    return result;
}

QuadRect QuadRect::heightenUntil(float step, std::uint32_t ceiling, const std::function<bool(std::uint32_t)>& stop) const {
    QuadRect result = *this;
    result.m_height = std::max(0.0f, m_height + (static_cast<float>(countSteps(ceiling, stop)) * step));
    return result;
}

std::optional<QuadFields> QuadRect::toQuadFields(
    core::Face face,
    std::uint32_t axisMagnitude,
    std::uint32_t textureId,
    std::uint32_t rotation,
    bool flipX,
    bool flipY
) const {
    const math::Vector2 lo = min();
    const math::Vector2 hi = max();
    const std::optional<std::uint32_t> minX = toGridCoordinate(lo.x);
    const std::optional<std::uint32_t> minY = toGridCoordinate(lo.y);
    const std::optional<std::uint32_t> maxX = toGridCoordinate(hi.x);
    const std::optional<std::uint32_t> maxY = toGridCoordinate(hi.y);
    if (!minX.has_value() || !minY.has_value() || !maxX.has_value() || !maxY.has_value()) {
        VQ_LOGE("quad") << "rectangle is not on the chunk grid: min=(" << lo.x << ", " << lo.y
                        << "), max=(" << hi.x << ", " << hi.y << ")";
        return std::nullopt;
    }

    QuadFields fields{};
    fields.face = face;
    fields.axisMagnitude = axisMagnitude;
    fields.min = QuadCoord{*minX, *minY};
    fields.max = QuadCoord{*maxX, *maxY};
    fields.textureId = textureId;
    fields.rotation = rotation;
    fields.flipX = flipX;
    fields.flipY = flipY;
    return fields;
}

} // namespace voxquad::render
