#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include "core/face.h"
#include "math/math.h"

namespace voxquad::render {

// Chunks are cubes of kChunkEdge voxels. Quad rectangle coordinates sit on voxel grid lines, so
// they range over [0, kChunkEdge]; the axis magnitude names a voxel layer and ranges over [0, kChunkEdge).
constexpr std::uint32_t kChunkEdge = 32;
constexpr std::uint32_t kMaxQuadCoordinate = kChunkEdge;
constexpr std::uint32_t kMaxAxisMagnitude = kChunkEdge - 1;
constexpr std::uint32_t kMaxQuadRotation = 3;

constexpr std::uint32_t kQuadVertexCount = 4;
constexpr std::uint32_t kQuadIndexCount = 6;

// Checkerboard fill is the worst case: half the voxels solid, each exposing six faces.
constexpr std::uint32_t kMaxQuadsPerChunk = (kChunkEdge * kChunkEdge * kChunkEdge / 2u) * core::kFaceCount;

// Shared index pattern per quad. Corner layout in the quad's projected plane:
//
//   0---1
//   |   |
//   2---3
//
// Triangles (0, 1, 2) and (1, 3, 2). extractPosition() keeps every face counter-clockwise
// when viewed from outside the voxel.
constexpr std::array<std::uint32_t, kQuadIndexCount> kQuadIndexPattern = {0u, 1u, 2u, 1u, 3u, 2u};

struct QuadCoord {
    std::uint32_t x = 0;
    std::uint32_t y = 0;

    constexpr bool operator==(const QuadCoord&) const = default;
};

// Packed greedy-merged voxel face, read by the vertex stage straight from a storage buffer.
//
// textureId: index into the FaceTexture table.
//
// Bit layout in bitfields (LSB -> MSB):
// - bits 0..1: texture rotation in 90 degree steps
// - bit  2   : flip texture u
// - bit  3   : flip texture v
// - bits 4..6: face id (0..5 for +/-X, +/-Y, +/-Z)
//
// Bit layout in bounds (LSB -> MSB):
// - bits  0.. 5: min.x (0..32)
// - bits  6..11: min.y (0..32)
// - bits 12..17: max.x (0..32)
// - bits 18..23: max.y (0..32)
// - bits 24..29: axis magnitude (0..31)
//
// Shaders mirror these constants through the defines built by shaderConstantDefines().
struct PackedQuad {
    std::uint32_t textureId = 0;
    std::uint32_t bitfields = 0;
    std::uint32_t bounds = 0;

    static constexpr std::uint32_t kRotationShift = 0;
    static constexpr std::uint32_t kRotationMask = 0x3u;
    static constexpr std::uint32_t kFlipUvXBit = 1u << 2u;
    static constexpr std::uint32_t kFlipUvYBit = 1u << 3u;
    static constexpr std::uint32_t kFaceShift = 4;
    static constexpr std::uint32_t kFaceMask = 0x7u;

    static constexpr std::uint32_t kCoordMask = 0x3Fu;
    static constexpr std::uint32_t kShiftMinX = 0;
    static constexpr std::uint32_t kShiftMinY = 6;
    static constexpr std::uint32_t kShiftMaxX = 12;
    static constexpr std::uint32_t kShiftMaxY = 18;
    static constexpr std::uint32_t kShiftMagnitude = 24;

    constexpr bool operator==(const PackedQuad&) const = default;
};

static_assert(sizeof(PackedQuad) == 12, "PackedQuad must match the shader-side Quad struct");

struct QuadFields {
    core::Face face = core::Face::PosY;
    std::uint32_t axisMagnitude = 0;
    QuadCoord min{};
    QuadCoord max{};
    std::uint32_t textureId = 0;
    std::uint32_t rotation = 0;
    bool flipX = false;
    bool flipY = false;

    constexpr bool operator==(const QuadFields&) const = default;
};

// Packs a face. Inputs are trusted to be in range; use tryEncode() on untrusted mesher output.
[[nodiscard]] PackedQuad encode(
    core::Face face,
    std::uint32_t axisMagnitude,
    QuadCoord min,
    QuadCoord max,
    std::uint32_t textureId,
    std::uint32_t rotation,
    bool flipX,
    bool flipY
);
[[nodiscard]] PackedQuad encode(const QuadFields& fields);
[[nodiscard]] std::optional<PackedQuad> tryEncode(const QuadFields& fields);

[[nodiscard]] QuadFields decode(const PackedQuad& quad);
[[nodiscard]] bool isWellFormed(const PackedQuad& quad);

[[nodiscard]] core::Face extractFace(const PackedQuad& quad);
[[nodiscard]] math::Vector3 extractNormal(const PackedQuad& quad);
[[nodiscard]] QuadCoord extractMin(const PackedQuad& quad);
[[nodiscard]] QuadCoord extractMax(const PackedQuad& quad);
[[nodiscard]] std::uint32_t extractMagnitude(const PackedQuad& quad);
[[nodiscard]] std::uint32_t extractTextureId(const PackedQuad& quad);
[[nodiscard]] std::uint32_t extractRotation(const PackedQuad& quad);
[[nodiscard]] bool extractFlipX(const PackedQuad& quad);
[[nodiscard]] bool extractFlipY(const PackedQuad& quad);

// True for faces whose (u, v, normal) basis is left-handed. Those faces swap corners 1 and 2
// so the shared index pattern still winds counter-clockwise.
[[nodiscard]] bool faceSwapsCorners(core::Face face);

// Corner of the quad rectangle in its projected plane, in the fixed 0..3 layout above.
[[nodiscard]] QuadCoord rectangleCorner2d(const PackedQuad& quad, std::uint32_t corner);

// Corner of the quad rectangle in its projected plane, after the winding swap.
[[nodiscard]] QuadCoord extractCorner2d(const PackedQuad& quad, std::uint32_t corner);

// Chunk-local position of a corner. Positive faces sit on the far side of their voxel layer.
[[nodiscard]] math::Vector3 extractPosition(const PackedQuad& quad, std::uint32_t corner);

// Projected corner minus quad min, before rotation and flips.
[[nodiscard]] math::Vector2 extractUv(const PackedQuad& quad, std::uint32_t corner);

[[nodiscard]] core::Axis axisFromFace(core::Face face);

// Drops the constant axis and keeps the remaining two in ascending order:
// X -> (y, z), Y -> (x, z), Z -> (x, y). Opposite faces share a basis, so a point and its mirror
// across the face plane project to the same coordinate.
[[nodiscard]] math::Vector2 projectTo2d(const math::Vector3& position, core::Axis axis);

// Inverse of projectTo2d for a point on the plane axis == planeCoordinate.
[[nodiscard]] math::Vector3 liftTo3d(const math::Vector2& uv, float planeCoordinate, core::Axis axis);

// Repeats kQuadIndexPattern across outIndices, offset by four vertices per quad. A trailing
// partial quad is left untouched.
void fillQuadIndices(std::span<std::uint32_t> outIndices);

} // namespace voxquad::render
