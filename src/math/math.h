#pragma once

#include <cmath>

// Small fixed-size vector and matrix types shared by the host references.
// Matrices are row-major and multiply column vectors (clip = M * v).
namespace voxquad::math {

constexpr float kPi = 3.14159265358979323846f;

inline float radians(float degrees) {
    return degrees * kPi / 180.0f;
}

struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float xIn, float yIn) : x(xIn), y(yIn) {}

    constexpr bool operator==(const Vector2&) const = default;

    constexpr Vector2 operator+(const Vector2& o) const { return {x + o.x, y + o.y}; }
    constexpr Vector2 operator-(const Vector2& o) const { return {x - o.x, y - o.y}; }
    constexpr Vector2 operator-() const { return {-x, -y}; }
    constexpr Vector2 operator*(float s) const { return {x * s, y * s}; }
};

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float xIn, float yIn, float zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Vector3&) const = default;

    constexpr Vector3 operator+(const Vector3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    constexpr Vector3 operator-(const Vector3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    constexpr Vector3 operator-() const { return {-x, -y, -z}; }
    constexpr Vector3 operator*(float s) const { return {x * s, y * s, z * s}; }
    constexpr Vector3 operator/(float s) const { return {x / s, y / s, z / s}; }

    Vector3& operator+=(const Vector3& o) {
        *this = *this + o;
        return *this;
    }
};

constexpr Vector3 operator*(float s, const Vector3& v) {
    return v * s;
}

struct Vector4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;

    constexpr Vector4() = default;
    constexpr Vector4(float xIn, float yIn, float zIn, float wIn) : x(xIn), y(yIn), z(zIn), w(wIn) {}
    constexpr explicit Vector4(const Vector3& v, float wIn) : x(v.x), y(v.y), z(v.z), w(wIn) {}

    constexpr bool operator==(const Vector4&) const = default;

    constexpr Vector3 xyz() const { return {x, y, z}; }
};

constexpr float dot(const Vector3& a, const Vector3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

constexpr Vector3 cross(const Vector3& a, const Vector3& b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline float lengthSquared(const Vector3& v) {
    return dot(v, v);
}

inline float length(const Vector3& v) {
    return std::sqrt(dot(v, v));
}

// Zero-length input yields the zero vector.
inline Vector3 normalize(const Vector3& v) {
    const float len = length(v);
    return len > 0.0f ? v * (1.0f / len) : Vector3{};
}

struct Matrix4 {
    float m[16] = {
        1.0f, 0.0f, 0.0f, 0.0f,
        0.0f, 1.0f, 0.0f, 0.0f,
        0.0f, 0.0f, 1.0f, 0.0f,
        0.0f, 0.0f, 0.0f, 1.0f
    };

    float& operator()(int row, int col) { return m[row * 4 + col]; }
    const float& operator()(int row, int col) const { return m[row * 4 + col]; }

    static Matrix4 identity() { return {}; }

    static Matrix4 zero() {
        Matrix4 result;
        for (float& value : result.m) {
            value = 0.0f;
        }
        return result;
    }

    static Matrix4 translation(const Vector3& offset) {
        Matrix4 result;
        result.m[3] = offset.x;
        result.m[7] = offset.y;
        result.m[11] = offset.z;
        return result;
    }
};

inline Vector4 multiply(const Matrix4& mat, const Vector4& v) {
    Vector4 result;
    float* out[4] = {&result.x, &result.y, &result.z, &result.w};
    for (int row = 0; row < 4; ++row) {
        *out[row] = mat(row, 0) * v.x + mat(row, 1) * v.y + mat(row, 2) * v.z + mat(row, 3) * v.w;
    }
    return result;
}

inline Matrix4 multiply(const Matrix4& lhs, const Matrix4& rhs) {
    Matrix4 result = Matrix4::zero();
    for (int i = 0; i < 4; ++i) {
        for (int k = 0; k < 4; ++k) {
            const float scale = lhs(i, k);
            for (int j = 0; j < 4; ++j) {
                result(i, j) += scale * rhs(k, j);
            }
        }
    }
    return result;
}

inline Matrix4 operator*(const Matrix4& lhs, const Matrix4& rhs) {
    return multiply(lhs, rhs);
}

inline Vector4 operator*(const Matrix4& mat, const Vector4& v) {
    return multiply(mat, v);
}

// Reverse-Z for Vulkan clip space: the near plane maps to depth 1 and the far plane to 0.
// Y is flipped so +Y points up on screen.
inline Matrix4 perspectiveVulkanReverseZ(float fovYRadians, float aspectRatio, float nearPlane, float farPlane) {
    const float focal = 1.0f / std::tan(0.5f * fovYRadians);
    const float depthRange = farPlane - nearPlane;

    Matrix4 result = Matrix4::zero();
    result(0, 0) = focal / aspectRatio;
    result(1, 1) = -focal;
    result(2, 2) = nearPlane / depthRange;
    result(2, 3) = nearPlane * farPlane / depthRange;
    result(3, 2) = -1.0f;
    return result;
}

// Points nearer than the near plane land above depth 1 and are clamped by the shadow variant.
inline Matrix4 orthographicVulkanReverseZ(
    float left,
    float right,
    float bottom,
    float top,
    float nearPlane,
    float farPlane
) {
    const float width = right - left;
    const float height = top - bottom;
    const float depthRange = farPlane - nearPlane;

    Matrix4 result;
    result(0, 0) = 2.0f / width;
    result(0, 3) = -(left + right) / width;
    result(1, 1) = -2.0f / height;
    result(1, 3) = (bottom + top) / height;
    result(2, 2) = 1.0f / depthRange;
    result(2, 3) = farPlane / depthRange;
    return result;
}

} // namespace voxquad::math
