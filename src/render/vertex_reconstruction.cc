#include "render/vertex_reconstruction.h"

namespace voxquad::render {

std::uint32_t effectiveRotation(const PackedQuad& quad, const OrientationConfig& orientation) {
    const std::uint32_t faceId = core::faceIndex(extractFace(quad));
    const std::uint32_t correction = (orientation.rotationMask >> (faceId * 2u)) & PackedQuad::kRotationMask;
    return extractRotation(quad) ^ correction;
}

bool effectiveFlipX(const PackedQuad& quad, const OrientationConfig& orientation) {
    const std::uint32_t faceId = core::faceIndex(extractFace(quad));
    return extractFlipX(quad) != (((orientation.flipUvXMask >> faceId) & 1u) != 0u);
}

bool effectiveFlipY(const PackedQuad& quad, const OrientationConfig& orientation) {
    const std::uint32_t faceId = core::faceIndex(extractFace(quad));
    return extractFlipY(quad) != (((orientation.flipUvYMask >> faceId) & 1u) != 0u);
}

math::Vector2 orientUv(const math::Vector2& uv, std::uint32_t rotation, bool flipX, bool flipY) {
    math::Vector2 result{};
    switch (rotation & 3u) {
    case 0u:
        result = uv;
        break;
    case 1u:
        result = math::Vector2{uv.y, -uv.x};
        break;
    case 2u:
        result = math::Vector2{-uv.x, -uv.y};
        break;
    case 3u:
    default:
        result = math::Vector2{-uv.y, uv.x};
        break;
    }
    if (flipX) {
        result.x = -result.x;
    }
    if (flipY) {
        result.y = -result.y;
    }
    return result;
}

math::Vector2 orientedQuadUv(const PackedQuad& quad, std::uint32_t corner, const OrientationConfig& orientation) {
    return orientUv(
        extractUv(quad, corner),
        effectiveRotation(quad, orientation),
        effectiveFlipX(quad, orientation),
        effectiveFlipY(quad, orientation)
    );
}

void faceBasis(core::Face face, math::Vector3& outU, math::Vector3& outV) {
    switch (axisFromFace(face)) {
    case core::Axis::X:
        outU = math::Vector3{0.0f, 1.0f, 0.0f};
        outV = math::Vector3{0.0f, 0.0f, 1.0f};
        break;
    case core::Axis::Y:
        outU = math::Vector3{1.0f, 0.0f, 0.0f};
        outV = math::Vector3{0.0f, 0.0f, 1.0f};
        break;
    case core::Axis::Z:
    default:
        outU = math::Vector3{1.0f, 0.0f, 0.0f};
        outV = math::Vector3{0.0f, 1.0f, 0.0f};
        break;
    }
}

math::Vector4 orientedTangent(const PackedQuad& quad, const OrientationConfig& orientation) {
    const core::Face face = extractFace(quad);
    math::Vector3 basisU{};
    math::Vector3 basisV{};
    faceBasis(face, basisU, basisV);

    // orientUv is linear, so its images of the unit axes are the columns of its matrix.
    const std::uint32_t rotation = effectiveRotation(quad, orientation);
    const bool flipX = effectiveFlipX(quad, orientation);
    const bool flipY = effectiveFlipY(quad, orientation);
    const math::Vector2 column0 = orientUv(math::Vector2{1.0f, 0.0f}, rotation, flipX, flipY);
    const math::Vector2 column1 = orientUv(math::Vector2{0.0f, 1.0f}, rotation, flipX, flipY);

    const math::Vector3 tangent = (basisU * column0.x) + (basisV * column1.x);
    const math::Vector3 bitangent = (basisU * column0.y) + (basisV * column1.y);
    const math::Vector3 normal = core::faceToUnitVector(face);
    const float handedness = math::dot(math::cross(normal, tangent), bitangent) >= 0.0f ? 1.0f : -1.0f;
    return math::Vector4{tangent, handedness};
}

math::Vector4 unpackRgba8(std::uint32_t packed) {
    constexpr float kInv255 = 1.0f / 255.0f;
    return math::Vector4{
        static_cast<float>(packed & 0xFFu) * kInv255,
        static_cast<float>((packed >> 8u) & 0xFFu) * kInv255,
        static_cast<float>((packed >> 16u) & 0xFFu) * kInv255,
        static_cast<float>((packed >> 24u) & 0xFFu) * kInv255
    };
}

math::Vector2 computeMotionVector(const math::Vector4& clipPosition, const math::Vector4& previousClipPosition) {
    if (clipPosition.w == 0.0f || previousClipPosition.w == 0.0f) {
        return math::Vector2{};
    }
    const math::Vector2 current{clipPosition.x / clipPosition.w, clipPosition.y / clipPosition.w};
    const math::Vector2 previous{
        previousClipPosition.x / previousClipPosition.w,
        previousClipPosition.y / previousClipPosition.w
    };
    return current - previous;
}

std::optional<QuadVertexRef> fetchQuadVertex(
    const VertexFetchContext& context,
    std::uint32_t instanceIndex,
    std::uint32_t vertexIndex
) {
    if (instanceIndex >= context.instances.size()) {
        return std::nullopt;
    }
    const ChunkInstanceData& instance = context.instances[instanceIndex];
    const std::uint64_t quadIndex =
        static_cast<std::uint64_t>(vertexIndex / kQuadVertexCount) + instance.baseQuadOffset;
    if (quadIndex >= context.quads.size()) {
        return std::nullopt;
    }

    QuadVertexRef ref{};
    ref.quad = &context.quads[static_cast<std::size_t>(quadIndex)];
    ref.instance = &instance;
    ref.quadIndex = static_cast<std::uint32_t>(quadIndex);
    ref.corner = vertexIndex % kQuadVertexCount;
    return ref;
}

} // namespace voxquad::render
