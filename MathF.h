#ifndef MATHF_H
#define MATHF_H

#include <algorithm>
#include <limits>

constexpr float kPi = 3.14159265358979323846f;
constexpr float kInfinity = std::numeric_limits<float>::infinity();

// a scattered direction shorter than this in every component counts as zero
constexpr float kNearZero = 1e-8f;

inline float clampF(float val, float min, float max) noexcept {
    return std::min(std::max(val, min), max);
}

inline float deg2rad(float degrees) noexcept {
    return degrees * kPi / 180.0f;
}

#endif // MATHF_H
