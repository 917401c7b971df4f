#include "SceneBuilder.h"
#include "Sampling.h"

#include <random>

SceneDescription BuildTwoSpheresScene()
{
    SceneDescription desc;
    desc.config.image_width = 200;
    desc.config.image_height = 100;
    desc.config.samples_per_pixel = 100;
    desc.config.max_depth = 50;

    int ground = desc.scene.AddMaterial(MakeLambertian(Color(0.8f, 0.8f, 0.0f)));
    int gray = desc.scene.AddMaterial(MakeLambertian(Color(0.5f, 0.5f, 0.5f)));
    desc.scene.AddSphere(Point3(0.0f, -100.0f, -1.0f), 100.0f, ground);
    desc.scene.AddSphere(Point3(0.0f, 0.0f, -1.0f), 0.5f, gray);

    desc.camera_settings.look_from = Point3(0, 0, 0);
    desc.camera_settings.look_at = Point3(0, 0, -1);
    desc.camera_settings.view_up = Vec3f(0, 1, 0);
    desc.camera_settings.vertical_fov_deg = 90.0f;
    desc.camera_settings.aperture = 0.0f;
    desc.camera_settings.focus_distance = 1.0f;
    desc.camera_settings.aspect_ratio = desc.config.aspectRatio();

    desc.image_name = "two_spheres.png";
    return desc;
}

SceneDescription BuildRandomScene(int grid_half_extent, uint32_t seed)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);

    SceneDescription desc;
    desc.config.image_width = 1200;
    desc.config.image_height = 675;
    desc.config.samples_per_pixel = 10;
    desc.config.max_depth = 50;
    desc.config.seed = seed;

    Scene& world = desc.scene;
    const int size = grid_half_extent;
    world.spheres.reserve(4 + (2 * size + 1) * (2 * size + 1));

    int ground = world.AddMaterial(MakeLambertian(Color(0.5f, 0.5f, 0.5f)));
    world.AddSphere(Point3(0.0f, -1000.0f, 0.0f), 1000.0f, ground);

    // keep the small spheres clear of the metal feature sphere
    const Point3 origin_reference(4.0f, 0.2f, 0.0f);

    for (int a = -size; a <= size; a++) {
        for (int b = -size; b <= size; b++) {
            float choose_material = dist(rng);
            float offset_x = dist(rng);
            float offset_z = dist(rng);
            Point3 center(a + 0.9f * offset_x, 0.2f, b + 0.9f * offset_z);

            if ((center - origin_reference).length() <= 0.9f) continue;

            Material sphere_material;
            if (choose_material < 0.8f) {
                // diffuse
                Color c1 = RandomVec3f(rng, dist, 0.0f, 1.0f);
                Color c2 = RandomVec3f(rng, dist, 0.0f, 1.0f);
                sphere_material = MakeLambertian(c1.elwiseMult(c2));
            } else if (choose_material < 0.95f) {
                // metal
                Color albedo = RandomVec3f(rng, dist, 0.5f, 1.0f);
                float fuzz = RandomFloat(rng, dist, 0.0f, 0.5f);
                sphere_material = MakeMetal(albedo, fuzz);
            } else {
                // glass
                sphere_material = MakeDielectric(1.5f);
            }

            world.AddSphere(center, 0.2f, world.AddMaterial(sphere_material));
        }
    }

    world.AddSphere(Point3(0.0f, 1.0f, 0.0f), 1.0f, world.AddMaterial(MakeDielectric(1.5f)));
    world.AddSphere(Point3(-4.0f, 1.0f, 0.0f), 1.0f, world.AddMaterial(MakeLambertian(Color(0.4f, 0.2f, 0.1f))));
    world.AddSphere(Point3(4.0f, 1.0f, 0.0f), 1.0f, world.AddMaterial(MakeMetal(Color(0.7f, 0.6f, 0.5f), 0.0f)));

    desc.camera_settings.look_from = Point3(13.0f, 2.0f, 3.0f);
    desc.camera_settings.look_at = Point3(0.0f, 0.0f, 0.0f);
    desc.camera_settings.view_up = Vec3f(0.0f, 1.0f, 0.0f);
    desc.camera_settings.vertical_fov_deg = 20.0f;
    desc.camera_settings.aperture = 0.1f;
    desc.camera_settings.focus_distance = 10.0f;
    desc.camera_settings.aspect_ratio = desc.config.aspectRatio();

    desc.image_name = "random_scene.png";
    return desc;
}
