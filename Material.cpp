#include "Material.h"
#include "Sampling.h"

#include <cmath>
#include <stdexcept>
#include <string>

std::ostream& operator<<(std::ostream& os, MaterialType type) {
    switch (type) {
        case MaterialType::Lambertian: return os << "Lambertian";
        case MaterialType::Metal:      return os << "Metal";
        case MaterialType::Dielectric: return os << "Dielectric";
        default:                       return os << "Unknown";
    }
}

// ============== CONSTRUCTION ==============

Material MakeLambertian(const Color& albedo)
{
    Material mat;
    mat.type = MaterialType::Lambertian;
    mat.albedo = albedo;
    return mat;
}

Material MakeMetal(const Color& albedo, float fuzz)
{
    Material mat;
    mat.type = MaterialType::Metal;
    mat.albedo = albedo;
    mat.fuzz = clampF(fuzz, 0.0f, 1.0f);
    return mat;
}

Material MakeDielectric(float refraction_index)
{
    if (!(refraction_index > 0.0f) || !std::isfinite(refraction_index)) {
        throw std::invalid_argument("dielectric refraction index must be positive, got "
                                    + std::to_string(refraction_index));
    }

    Material mat;
    mat.type = MaterialType::Dielectric;
    mat.albedo = Color(1.0f, 1.0f, 1.0f);
    mat.refraction_index = refraction_index;
    return mat;
}

// ============== SCATTERING ==============

bool Scatter(const Material& material, const Ray& rayIn, const HitRecord& rec,
             std::mt19937& rng, std::uniform_real_distribution<float>& dist,
             Color& attenuation, Ray& scattered)
{
    switch (material.type) {
        case MaterialType::Lambertian:
            return ScatterLambertian(material, rec, rng, dist, attenuation, scattered);
        case MaterialType::Metal:
            return ScatterMetal(material, rayIn, rec, rng, dist, attenuation, scattered);
        case MaterialType::Dielectric:
            return ScatterDielectric(material, rayIn, rec, rng, dist, attenuation, scattered);
    }
    return false;
}

bool ScatterLambertian(const Material& material, const HitRecord& rec,
                       std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                       Color& attenuation, Ray& scattered)
{
    Vec3f scatter_direction = rec.normal + RandomUnitVector(rng, dist);

    // the random vector almost cancelled the normal
    if (scatter_direction.nearZero()) {
        scatter_direction = rec.normal;
    }

    scattered = Ray(rec.point, scatter_direction);
    attenuation = material.albedo;
    return true;
}

bool ScatterMetal(const Material& material, const Ray& rayIn, const HitRecord& rec,
                  std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                  Color& attenuation, Ray& scattered)
{
    Vec3f reflected = Reflect(rayIn.direction.normalize(), rec.normal);

    // no draw for a polished surface, the mirror direction stays exact
    if (material.fuzz > 0.0f) {
        reflected += material.fuzz * RandomInUnitSphere(rng, dist);
    }

    scattered = Ray(rec.point, reflected);
    attenuation = material.albedo;
    return scattered.direction.dotProduct(rec.normal) > 0.0f;
}

bool ScatterDielectric(const Material& material, const Ray& rayIn, const HitRecord& rec,
                       std::mt19937& rng, std::uniform_real_distribution<float>& dist,
                       Color& attenuation, Ray& scattered)
{
    attenuation = Color(1.0f, 1.0f, 1.0f);
    float refraction_ratio = rec.front_face ? (1.0f / material.refraction_index) : material.refraction_index;

    Vec3f unit_direction = rayIn.direction.normalize();
    float cos_theta = std::min((-unit_direction).dotProduct(rec.normal), 1.0f);
    float sin_theta = std::sqrt(std::max(0.0f, 1.0f - cos_theta * cos_theta));

    bool cannot_refract = refraction_ratio * sin_theta > 1.0f;

    Vec3f direction;
    if (cannot_refract || Schlick(cos_theta, refraction_ratio) > dist(rng)) {
        direction = Reflect(unit_direction, rec.normal);
    } else {
        direction = Refract(unit_direction, rec.normal, refraction_ratio);
    }

    scattered = Ray(rec.point, direction);
    return true;
}
