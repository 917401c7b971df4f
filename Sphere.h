#ifndef SPHERE_H
#define SPHERE_H

#include "HitRecord.h"

struct Sphere
{
    Point3 center;
    float radius;       // negative radius flips the normals inward
    int material_id;

    Sphere() : center(0, 0, 0), radius(0.0f), material_id(-1) {}
    Sphere(const Point3& c, float r, int mat) : center(c), radius(r), material_id(mat) {}
};

// Accepts the smaller root when it lies strictly inside (tMin, tMax), the
// larger one otherwise. rec is left untouched on a miss.
bool HitSphere(const Sphere& sphere, const Ray& ray, float tMin, float tMax, HitRecord& rec) noexcept;

#endif // SPHERE_H
