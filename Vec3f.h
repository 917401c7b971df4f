#ifndef VEC3F_H
#define VEC3F_H

#include <cassert>
#include <cmath>
#include <ostream>
#include "MathF.h"

struct Vec3f
{
    /* data */
    float x, y, z;

    /* functions */
    Vec3f() : x(0), y(0), z(0) {}
    Vec3f(float X, float Y, float Z) : x(X), y(Y), z(Z) {}

    inline float dotProduct(const Vec3f& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    inline Vec3f crossProduct(const Vec3f& rhs) const noexcept {
        return {y * rhs.z - z * rhs.y,
                z * rhs.x - x * rhs.z,
                x * rhs.y - y * rhs.x};
    }

    inline float lengthSquared() const noexcept {
        return x * x + y * y + z * z;
    }

    inline float length() const noexcept {
        return std::sqrt(lengthSquared());
    }

    // undefined for the zero vector, callers keep their input non-degenerate
    inline Vec3f normalize() const noexcept {
        return *this / length();
    }

    inline bool nearZero() const noexcept {
        return std::fabs(x) < kNearZero && std::fabs(y) < kNearZero && std::fabs(z) < kNearZero;
    }

    inline bool isFinite() const noexcept {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    inline Vec3f operator+(const Vec3f& rhs) const noexcept{
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }

    inline Vec3f operator-(const Vec3f& rhs) const noexcept{
        return {x - rhs.x,  y - rhs.y, z - rhs.z};
    }

    inline Vec3f operator-() const noexcept {
        return {-x, -y, -z};
    }

    inline Vec3f operator*(float val) const noexcept {
        return {x * val, y * val, z * val};
    }

    inline friend Vec3f operator*(float val, const Vec3f& v) noexcept {
        return v * val;
    }

    // color tinting
    inline Vec3f elwiseMult(const Vec3f& rhs) const noexcept {
        return {x * rhs.x, y * rhs.y, z * rhs.z};
    }

    inline Vec3f operator/(float val) const noexcept {
        return {x / val, y / val, z / val};
    }

    inline Vec3f& operator+=(const Vec3f& v) noexcept {
        x += v.x;
        y += v.y;
        z += v.z;
        return *this;
    }

    inline Vec3f& operator*=(float val) noexcept {
        x *= val;
        y *= val;
        z *= val;
        return *this;
    }

    inline bool operator==(const Vec3f& rhs) const noexcept {
        return x == rhs.x && y == rhs.y && z == rhs.z;
    }

    inline bool operator!=(const Vec3f& rhs) const noexcept {
        return !(*this == rhs);
    }

    float operator[](int idx) const noexcept {
        assert(idx >= 0 && idx < 3);
        return (&x)[idx];
    }

    friend std::ostream& operator<<(std::ostream& os, const Vec3f& v);
};

// same storage, the meaning is up to the caller
using Point3 = Vec3f;
using Color = Vec3f;

inline std::ostream& operator<<(std::ostream& os, const Vec3f& v) {
    os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    return os;
}

inline Vec3f Reflect(const Vec3f& v, const Vec3f& n) noexcept {
    return v - 2.0f * v.dotProduct(n) * n;
}

// uv and n are unit vectors, etaRatio = eta_incident / eta_transmitted
inline Vec3f Refract(const Vec3f& uv, const Vec3f& n, float etaRatio) noexcept {
    // rounding can push the dot product past 1
    float cosTheta = std::min((-uv).dotProduct(n), 1.0f);
    Vec3f r_out_perp = etaRatio * (uv + cosTheta * n);
    Vec3f r_out_parallel = -std::sqrt(std::fabs(1.0f - r_out_perp.lengthSquared())) * n;
    return r_out_perp + r_out_parallel;
}

// Schlick's approximation of the Fresnel reflectance
inline float Schlick(float cosine, float refractionRatio) noexcept {
    float r0 = (1.0f - refractionRatio) / (1.0f + refractionRatio);
    r0 = r0 * r0;
    return r0 + (1.0f - r0) * std::pow(1.0f - cosine, 5.0f);
}

#endif // VEC3F_H
