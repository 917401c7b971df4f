#ifndef SAMPLING_H
#define SAMPLING_H

#include <cstdint>
#include <random>
#include "Vec3f.h"

// Every draw goes through the caller's generator. The renderer gives each
// pixel its own std::mt19937, so nothing here is shared between threads.

inline float RandomFloat(std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                         float min, float max)
{
    return min + (max - min) * dist(rng);
}

inline Vec3f RandomVec3f(std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                         float min, float max)
{
    float a = RandomFloat(rng, dist, min, max);
    float b = RandomFloat(rng, dist, min, max);
    float c = RandomFloat(rng, dist, min, max);
    return Vec3f(a, b, c);
}

// rejection sampling from the [-1,1]^3 cube, about 1.9 draws on average
inline Vec3f RandomInUnitSphere(std::mt19937& rng, std::uniform_real_distribution<float>& dist)
{
    while (true) {
        Vec3f p = RandomVec3f(rng, dist, -1.0f, 1.0f);
        if (p.lengthSquared() < 1.0f) return p;
    }
}

inline Vec3f RandomUnitVector(std::mt19937& rng, std::uniform_real_distribution<float>& dist)
{
    while (true) {
        Vec3f p = RandomInUnitSphere(rng, dist);
        // a point this close to the center has no usable direction
        if (p.lengthSquared() > 1e-12f) return p.normalize();
    }
}

inline Vec3f RandomInUnitDisk(std::mt19937& rng, std::uniform_real_distribution<float>& dist)
{
    while (true) {
        float a = RandomFloat(rng, dist, -1.0f, 1.0f);
        float b = RandomFloat(rng, dist, -1.0f, 1.0f);
        Vec3f p(a, b, 0.0f);
        if (p.lengthSquared() < 1.0f) return p;
    }
}

inline Vec3f RandomInHemisphere(const Vec3f& normal, std::mt19937& rng,
                                std::uniform_real_distribution<float>& dist)
{
    Vec3f p = RandomInUnitSphere(rng, dist);
    return p.dotProduct(normal) > 0.0f ? p : -p;
}

// Seed of the generator owned by one pixel. Depends only on the render seed
// and the pixel index, so the image does not depend on the thread layout.
inline uint32_t PixelSeed(uint32_t baseSeed, uint32_t pixelIndex) noexcept
{
    return baseSeed * 0x9E3779B9u + pixelIndex;
}

#endif // SAMPLING_H
