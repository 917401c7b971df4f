#ifndef MATERIAL_H
#define MATERIAL_H

#include <cstdint>
#include <ostream>
#include <random>
#include "HitRecord.h"

enum class MaterialType : uint32_t
{
    Lambertian = 0,
    Metal,
    Dielectric,
};

std::ostream& operator<<(std::ostream& os, MaterialType type);

// One record for every variant; fields a variant does not use stay at their
// defaults. Materials are stored once in Scene::materials and shared by index.
struct Material
{
    MaterialType type;
    Color albedo;               // lambertian and metal
    float fuzz;                 // metal, in [0, 1]
    float refraction_index;     // dielectric

    Material() : type(MaterialType::Lambertian), albedo(0, 0, 0), fuzz(0.0f), refraction_index(1.0f) {}
};

Material MakeLambertian(const Color& albedo);
Material MakeMetal(const Color& albedo, float fuzz);
Material MakeDielectric(float refraction_index);

// Returns false when the ray is absorbed. On true, attenuation and scattered
// hold the color filter and the outgoing ray.
bool Scatter(const Material& material, const Ray& rayIn, const HitRecord& rec,
             std::mt19937& rng, std::uniform_real_distribution<float>& dist,
             Color& attenuation, Ray& scattered);

bool ScatterLambertian(const Material& material, const HitRecord& rec,
                       std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                       Color& attenuation, Ray& scattered);
bool ScatterMetal(const Material& material, const Ray& rayIn, const HitRecord& rec,
                  std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                  Color& attenuation, Ray& scattered);
bool ScatterDielectric(const Material& material, const Ray& rayIn, const HitRecord& rec,
                       std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                       Color& attenuation, Ray& scattered);

#endif // MATERIAL_H
