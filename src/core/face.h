#pragma once

#include <array>
#include <cstdint>

#include "math/math.h"

// Core face subsystem
// Responsible for: the six axis-aligned face directions and their integer grid offsets.
// Should NOT do: quad packing, rendering state, or chunk storage.
namespace voxquad::core {

struct Cell3i {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;

    constexpr Cell3i() = default;
    constexpr Cell3i(std::int32_t xIn, std::int32_t yIn, std::int32_t zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Cell3i&) const = default;

    constexpr Cell3i operator+(const Cell3i& rhs) const {
        return Cell3i{x + rhs.x, y + rhs.y, z + rhs.z};
    }

    constexpr Cell3i operator-(const Cell3i& rhs) const {
        return Cell3i{x - rhs.x, y - rhs.y, z - rhs.z};
    }
};

// Face ids are stored in 3 bits of a packed quad, keep the numbering stable.
enum class Face : std::uint8_t {
    PosX = 0,
    NegX = 1,
    PosY = 2,
    NegY = 3,
    PosZ = 4,
    NegZ = 5
};

enum class Axis : std::uint8_t {
    X = 0,
    Y = 1,
    Z = 2
};

inline constexpr std::uint32_t kFaceCount = 6;

inline constexpr std::array<Face, kFaceCount> kAllFaces = {
    Face::PosX,
    Face::NegX,
    Face::PosY,
    Face::NegY,
    Face::PosZ,
    Face::NegZ
};

inline constexpr std::uint8_t faceIndex(Face face) {
    return static_cast<std::uint8_t>(face);
}

inline constexpr bool isPositiveFace(Face face) {
    return (faceIndex(face) & 1u) == 0u;
}

inline constexpr Axis faceAxis(Face face) {
    return static_cast<Axis>(faceIndex(face) >> 1u);
}

inline constexpr Face oppositeFace(Face face) {
    return static_cast<Face>(faceIndex(face) ^ 1u);
}

inline constexpr Cell3i faceToOffset(Face face) {
    switch (face) {
    case Face::PosX: return Cell3i{1, 0, 0};
    case Face::NegX: return Cell3i{-1, 0, 0};
    case Face::PosY: return Cell3i{0, 1, 0};
    case Face::NegY: return Cell3i{0, -1, 0};
    case Face::PosZ: return Cell3i{0, 0, 1};
    case Face::NegZ: return Cell3i{0, 0, -1};
    }
    return Cell3i{0, 0, 0};
}

inline constexpr math::Vector3 faceToUnitVector(Face face) {
    switch (face) {
    case Face::PosX: return math::Vector3{1.0f, 0.0f, 0.0f};
    case Face::NegX: return math::Vector3{-1.0f, 0.0f, 0.0f};
    case Face::PosY: return math::Vector3{0.0f, 1.0f, 0.0f};
    case Face::NegY: return math::Vector3{0.0f, -1.0f, 0.0f};
    case Face::PosZ: return math::Vector3{0.0f, 0.0f, 1.0f};
    case Face::NegZ: return math::Vector3{0.0f, 0.0f, -1.0f};
    }
    return math::Vector3{0.0f, 1.0f, 0.0f};
}

inline constexpr const char* faceName(Face face) {
    switch (face) {
    case Face::PosX: return "+X";
    case Face::NegX: return "-X";
    case Face::PosY: return "+Y";
    case Face::NegY: return "-Y";
    case Face::PosZ: return "+Z";
    case Face::NegZ: return "-Z";
    }
    return "?";
}

} // namespace voxquad::core
