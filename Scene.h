#ifndef SCENE_H
#define SCENE_H

#include <vector>
#include "Material.h"
#include "Sphere.h"

using std::vector;

// The hittable list. Spheres refer to materials by index, so any number of
// spheres can share one material.
struct Scene
{
    vector<Material> materials;
    vector<Sphere> spheres;

    // Returns the index to pass to AddSphere.
    int AddMaterial(const Material& material);

    // Throws std::invalid_argument for a zero or non-finite radius and for a
    // material index that is not in the arena.
    void AddSphere(const Point3& center, float radius, int material_id);

    const Material& MaterialOf(const HitRecord& rec) const noexcept { return materials[rec.material_id]; }
};

// Nearest hit in (tMin, tMax) over all spheres. Every accepted hit shrinks
// the upper bound, so on equal t the sphere added first wins.
bool FindClosestHit(const Ray& ray, const Scene& scene, float tMin, float tMax, HitRecord& closestHit) noexcept;

#endif // SCENE_H
