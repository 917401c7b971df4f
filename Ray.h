#ifndef RAY_H
#define RAY_H

#include "Vec3f.h"

struct Ray {
    Point3 origin;
    Vec3f direction;

    Ray() = default;
    Ray(const Point3& o, const Vec3f& d) : origin(o), direction(d) {}

    inline Point3 at(float t) const noexcept {
        return origin + t * direction;
    }
};

#endif // RAY_H
