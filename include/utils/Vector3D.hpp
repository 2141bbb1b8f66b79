/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>
#include <ostream>

// World-space vector. Y is up; the ocean surface and the build grid lie in XZ.
class Vector3D {
public:
    Vector3D() = default;
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    // Zero-length input yields the zero vector
    Vector3D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 1e-12f) return Vector3D();
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector3D(m_x * invLen, m_y * invLen, m_z * invLen);
    }

    // Projection onto the water plane, normalized
    Vector3D flattened() const {
        return Vector3D(m_x, 0.0f, m_z).normalized();
    }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    Vector3D cross(const Vector3D& v2) const {
        return Vector3D(m_y * v2.m_z - m_z * v2.m_y,
                        m_z * v2.m_x - m_x * v2.m_z,
                        m_x * v2.m_y - m_y * v2.m_x);
    }

    bool isFinite() const {
        return std::isfinite(m_x) && std::isfinite(m_y) && std::isfinite(m_z);
    }

    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    Vector3D& operator+=(const Vector3D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        m_z += v2.m_z;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    Vector3D& operator-=(const Vector3D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        m_z -= v2.m_z;
        return *this;
    }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    Vector3D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }

    static float distance(const Vector3D& a, const Vector3D& b) {
        return (a - b).length();
    }

    static Vector3D lerp(const Vector3D& a, const Vector3D& b, float t) {
        return a + (b - a) * t;
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

// Stream operator for Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, const Vector3D& v) {
    return os << "(" << v.getX() << ", " << v.getY() << ", " << v.getZ() << ")";
}

#endif  // VECTOR_3D_HPP
