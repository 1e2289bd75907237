#include "render/quad.h"

#include "core/log.h"

namespace voxquad::render {

namespace {

constexpr std::uint32_t packCoord(std::uint32_t value, std::uint32_t shift) {
    return (value & PackedQuad::kCoordMask) << shift;
}

constexpr std::uint32_t unpackCoord(std::uint32_t bounds, std::uint32_t shift) {
    return (bounds >> shift) & PackedQuad::kCoordMask;
}

// Unswapped rectangle corner, see kQuadIndexPattern.
QuadCoord canonicalCorner(const QuadCoord& min, const QuadCoord& max, std::uint32_t corner) {
    switch (corner & 3u) {
    case 0u: return QuadCoord{min.x, max.y};
    case 1u: return QuadCoord{max.x, max.y};
    case 2u: return QuadCoord{min.x, min.y};
    case 3u:
    default:
        return QuadCoord{max.x, min.y};
    }
}

} // namespace

PackedQuad encode(
    core::Face face,
    std::uint32_t axisMagnitude,
    QuadCoord min,
    QuadCoord max,
    std::uint32_t textureId,
    std::uint32_t rotation,
    bool flipX,
    bool flipY
) {
    PackedQuad quad{};
    quad.textureId = textureId;

    quad.bitfields = (rotation & PackedQuad::kRotationMask) << PackedQuad::kRotationShift;
    if (flipX) {
        quad.bitfields |= PackedQuad::kFlipUvXBit;
    }
    if (flipY) {
        quad.bitfields |= PackedQuad::kFlipUvYBit;
    }
    quad.bitfields |= (static_cast<std::uint32_t>(core::faceIndex(face)) & PackedQuad::kFaceMask)
                      << PackedQuad::kFaceShift;

    quad.bounds = packCoord(min.x, PackedQuad::kShiftMinX) |
                  packCoord(min.y, PackedQuad::kShiftMinY) |
                  packCoord(max.x, PackedQuad::kShiftMaxX) |
                  packCoord(max.y, PackedQuad::kShiftMaxY) |
                  packCoord(axisMagnitude, PackedQuad::kShiftMagnitude);
    return quad;
}

PackedQuad encode(const QuadFields& fields) {
    return encode(
        fields.face,
        fields.axisMagnitude,
        fields.min,
        fields.max,
        fields.textureId,
        fields.rotation,
        fields.flipX,
        fields.flipY
    );
}

std::optional<PackedQuad> tryEncode(const QuadFields& fields) {
    if (core::faceIndex(fields.face) >= core::kFaceCount) {
        VQ_LOGE("quad") << "invalid face id " << static_cast<std::uint32_t>(core::faceIndex(fields.face));
        return std::nullopt;
    }
    if (fields.min.x > fields.max.x || fields.min.y > fields.max.y) {
        VQ_LOGE("quad") << "inverted bounds: min=(" << fields.min.x << ", " << fields.min.y
                        << "), max=(" << fields.max.x << ", " << fields.max.y << ")";
        return std::nullopt;
    }
    if (fields.max.x > kMaxQuadCoordinate || fields.max.y > kMaxQuadCoordinate) {
        VQ_LOGE("quad") << "bounds exceed chunk edge " << kMaxQuadCoordinate << ": max=("
                        << fields.max.x << ", " << fields.max.y << ")";
        return std::nullopt;
    }
    if (fields.axisMagnitude > kMaxAxisMagnitude) {
        VQ_LOGE("quad") << "axis magnitude out of range: " << fields.axisMagnitude;
        return std::nullopt;
    }
    if (fields.rotation > kMaxQuadRotation) {
        VQ_LOGE("quad") << "rotation out of range: " << fields.rotation;
        return std::nullopt;
    }
    return encode(fields);
}

QuadFields decode(const PackedQuad& quad) {
    QuadFields fields{};
    fields.face = extractFace(quad);
    fields.axisMagnitude = extractMagnitude(quad);
    fields.min = extractMin(quad);
    fields.max = extractMax(quad);
    fields.textureId = extractTextureId(quad);
    fields.rotation = extractRotation(quad);
    fields.flipX = extractFlipX(quad);
    fields.flipY = extractFlipY(quad);
    return fields;
}

bool isWellFormed(const PackedQuad& quad) {
    const std::uint32_t faceId = (quad.bitfields >> PackedQuad::kFaceShift) & PackedQuad::kFaceMask;
    if (faceId >= core::kFaceCount) {
        return false;
    }
    const QuadCoord min = extractMin(quad);
    const QuadCoord max = extractMax(quad);
    return min.x <= max.x && min.y <= max.y &&
           max.x <= kMaxQuadCoordinate && max.y <= kMaxQuadCoordinate &&
           extractMagnitude(quad) <= kMaxAxisMagnitude;
}

core::Face extractFace(const PackedQuad& quad) {
    return static_cast<core::Face>((quad.bitfields >> PackedQuad::kFaceShift) & PackedQuad::kFaceMask);
}

math::Vector3 extractNormal(const PackedQuad& quad) {
    return core::faceToUnitVector(extractFace(quad));
}

QuadCoord extractMin(const PackedQuad& quad) {
    return QuadCoord{
        unpackCoord(quad.bounds, PackedQuad::kShiftMinX),
        unpackCoord(quad.bounds, PackedQuad::kShiftMinY)
    };
}

QuadCoord extractMax(const PackedQuad& quad) {
    return QuadCoord{
        unpackCoord(quad.bounds, PackedQuad::kShiftMaxX),
        unpackCoord(quad.bounds, PackedQuad::kShiftMaxY)
    };
}

std::uint32_t extractMagnitude(const PackedQuad& quad) {
    return unpackCoord(quad.bounds, PackedQuad::kShiftMagnitude);
}

std::uint32_t extractTextureId(const PackedQuad& quad) {
    return quad.textureId;
}

std::uint32_t extractRotation(const PackedQuad& quad) {
    return (quad.bitfields >> PackedQuad::kRotationShift) & PackedQuad::kRotationMask;
}

bool extractFlipX(const PackedQuad& quad) {
    return (quad.bitfields & PackedQuad::kFlipUvXBit) != 0u;
}

bool extractFlipY(const PackedQuad& quad) {
    return (quad.bitfields & PackedQuad::kFlipUvYBit) != 0u;
}

bool faceSwapsCorners(core::Face face) {
    // Corner order (0, 1, 2) winds along -(u x v). That is outward for -X, +Y and -Z only.
    return face == core::Face::PosX || face == core::Face::NegY || face == core::Face::PosZ;
}

QuadCoord rectangleCorner2d(const PackedQuad& quad, std::uint32_t corner) {
    return canonicalCorner(extractMin(quad), extractMax(quad), corner);
}

QuadCoord extractCorner2d(const PackedQuad& quad, std::uint32_t corner) {
    std::uint32_t canonical = corner & 3u;
    if (faceSwapsCorners(extractFace(quad)) && (canonical == 1u || canonical == 2u)) {
        canonical ^= 3u;
    }
    return rectangleCorner2d(quad, canonical);
}

math::Vector3 extractPosition(const PackedQuad& quad, std::uint32_t corner) {
    const core::Face face = extractFace(quad);
    const QuadCoord corner2d = extractCorner2d(quad, corner);
    const std::uint32_t plane = extractMagnitude(quad) + (core::isPositiveFace(face) ? 1u : 0u);
    return liftTo3d(
        math::Vector2{static_cast<float>(corner2d.x), static_cast<float>(corner2d.y)},
        static_cast<float>(plane),
        axisFromFace(face)
    );
}

math::Vector2 extractUv(const PackedQuad& quad, std::uint32_t corner) {
    const QuadCoord min = extractMin(quad);
    const math::Vector2 projected = projectTo2d(extractPosition(quad, corner), axisFromFace(extractFace(quad)));
    return projected - math::Vector2{static_cast<float>(min.x), static_cast<float>(min.y)};
}

core::Axis axisFromFace(core::Face face) {
    return core::faceAxis(face);
}

math::Vector2 projectTo2d(const math::Vector3& position, core::Axis axis) {
    switch (axis) {
    case core::Axis::X:
        return math::Vector2{position.y, position.z};
    case core::Axis::Y:
        return math::Vector2{position.x, position.z};
    case core::Axis::Z:
    default:
        return math::Vector2{position.x, position.y};
    }
}

math::Vector3 liftTo3d(const math::Vector2& uv, float planeCoordinate, core::Axis axis) {
    switch (axis) {
    case core::Axis::X:
        return math::Vector3{planeCoordinate, uv.x, uv.y};
    case core::Axis::Y:
        return math::Vector3{uv.x, planeCoordinate, uv.y};
    case core::Axis::Z:
    default:
        return math::Vector3{uv.x, uv.y, planeCoordinate};
    }
}

void fillQuadIndices(std::span<std::uint32_t> outIndices) {
    const std::size_t quadCount = outIndices.size() / kQuadIndexCount;
    for (std::size_t quadIndex = 0; quadIndex < quadCount; ++quadIndex) {
        const std::uint32_t baseVertex = static_cast<std::uint32_t>(quadIndex) * kQuadVertexCount;
        for (std::size_t i = 0; i < kQuadIndexCount; ++i) {
            outIndices[(quadIndex * kQuadIndexCount) + i] = baseVertex + kQuadIndexPattern[i];
        }
    }
}

} // namespace voxquad::render
