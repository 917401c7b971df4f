#include "Scene.h"

#include <cmath>
#include <stdexcept>
#include <string>

// ============== CONSTRUCTION ==============

int Scene::AddMaterial(const Material& material)
{
    materials.push_back(material);
    return static_cast<int>(materials.size()) - 1;
}

void Scene::AddSphere(const Point3& center, float radius, int material_id)
{
    if (radius == 0.0f || !std::isfinite(radius)) {
        throw std::invalid_argument("sphere radius must be finite and non-zero, got "
                                    + std::to_string(radius));
    }
    if (material_id < 0 || material_id >= static_cast<int>(materials.size())) {
        throw std::invalid_argument("sphere refers to unknown material " + std::to_string(material_id));
    }

    spheres.emplace_back(center, radius, material_id);
}

// ============== INTERSECTION ==============

bool HitSphere(const Sphere& sphere, const Ray& ray, float tMin, float tMax, HitRecord& rec) noexcept
{
    Vec3f oc = ray.origin - sphere.center;
    float a = ray.direction.lengthSquared();
    float half_b = oc.dotProduct(ray.direction);
    float c = oc.lengthSquared() - sphere.radius * sphere.radius;

    float discriminant = half_b * half_b - a * c;
    // NaN counts as a miss
    if (!(discriminant >= 0.0f)) {
        return false;
    }

    float sqrtd = std::sqrt(discriminant);

    float root = (-half_b - sqrtd) / a;
    if (root <= tMin || root >= tMax) {
        root = (-half_b + sqrtd) / a;
        if (root <= tMin || root >= tMax) {
            return false;
        }
    }

    rec.t = root;
    rec.point = ray.at(root);
    Vec3f outward_normal = (rec.point - sphere.center) / sphere.radius;
    rec.SetFaceNormal(ray, outward_normal);
    rec.material_id = sphere.material_id;
    return true;
}

bool FindClosestHit(const Ray& ray, const Scene& scene, float tMin, float tMax, HitRecord& closestHit) noexcept
{
    float minT = tMax;
    bool has_intersected = false;
    HitRecord rec;

    for (const Sphere& sphere : scene.spheres)
    {
        if (HitSphere(sphere, ray, tMin, minT, rec))
        {
            has_intersected = true;
            minT = rec.t;
            closestHit = rec;
        }
    }

    return has_intersected;
}
