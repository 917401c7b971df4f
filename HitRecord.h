#ifndef HITRECORD_H
#define HITRECORD_H

#include "Ray.h"

struct HitRecord
{
    Point3 point;
    Vec3f normal;       // unit length, faces the incoming ray
    float t;
    bool front_face;
    int material_id;    // index into Scene::materials

    HitRecord() : t(0.0f), front_face(false), material_id(-1) {}

    inline void SetFaceNormal(const Ray& ray, const Vec3f& outward_normal) noexcept
    {
        front_face = ray.direction.dotProduct(outward_normal) < 0.0f;
        normal = front_face ? outward_normal : -outward_normal;
    }
};

#endif // HITRECORD_H
