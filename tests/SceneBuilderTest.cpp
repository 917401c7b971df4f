#include <gtest/gtest.h>

#include "SceneBuilder.h"

TEST(SceneBuilder, TwoSpheresLayout)
{
    SceneDescription desc = BuildTwoSpheresScene();
    const Scene& scene = desc.scene;

    ASSERT_EQ(2u, scene.spheres.size());
    EXPECT_EQ(Point3(0, -100, -1), scene.spheres[0].center);
    EXPECT_FLOAT_EQ(100.0f, scene.spheres[0].radius);
    EXPECT_EQ(Point3(0, 0, -1), scene.spheres[1].center);
    EXPECT_FLOAT_EQ(0.5f, scene.spheres[1].radius);

    const Material& ground = scene.materials[scene.spheres[0].material_id];
    const Material& small = scene.materials[scene.spheres[1].material_id];
    EXPECT_EQ(MaterialType::Lambertian, ground.type);
    EXPECT_EQ(MaterialType::Lambertian, small.type);
    EXPECT_EQ(Color(0.5f, 0.5f, 0.5f), small.albedo);

    EXPECT_EQ(Point3(0, 0, 0), desc.camera_settings.look_from);
    EXPECT_EQ(Point3(0, 0, -1), desc.camera_settings.look_at);
    EXPECT_FLOAT_EQ(2.0f, desc.camera_settings.aspect_ratio);
    EXPECT_NO_THROW(MakeCamera(desc.camera_settings));
    EXPECT_NO_THROW(desc.config.Validate());
}

TEST(SceneBuilder, RandomSceneIsReproducible)
{
    SceneDescription a = BuildRandomScene(3, 42);
    SceneDescription b = BuildRandomScene(3, 42);

    ASSERT_EQ(a.scene.spheres.size(), b.scene.spheres.size());
    for (size_t i = 0; i < a.scene.spheres.size(); ++i) {
        EXPECT_EQ(a.scene.spheres[i].center, b.scene.spheres[i].center);
        EXPECT_EQ(a.scene.spheres[i].material_id, b.scene.spheres[i].material_id);
    }
    ASSERT_EQ(a.scene.materials.size(), b.scene.materials.size());
    for (size_t i = 0; i < a.scene.materials.size(); ++i) {
        EXPECT_EQ(a.scene.materials[i].type, b.scene.materials[i].type);
        EXPECT_EQ(a.scene.materials[i].albedo, b.scene.materials[i].albedo);
    }

    SceneDescription c = BuildRandomScene(3, 43);
    bool differs = c.scene.spheres.size() != a.scene.spheres.size();
    for (size_t i = 0; !differs && i < a.scene.spheres.size(); ++i) {
        differs = a.scene.spheres[i].center != c.scene.spheres[i].center;
    }
    EXPECT_TRUE(differs);
}

TEST(SceneBuilder, RandomSceneContents)
{
    const int n = 4;
    SceneDescription desc = BuildRandomScene(n, 7);
    const Scene& scene = desc.scene;

    const size_t grid = (2 * n + 1) * (2 * n + 1);
    ASSERT_GE(scene.spheres.size(), 4u);
    ASSERT_LE(scene.spheres.size(), 4u + grid);

    // ground first, the three feature spheres last
    EXPECT_FLOAT_EQ(1000.0f, scene.spheres.front().radius);
    const size_t last = scene.spheres.size() - 1;
    EXPECT_EQ(MaterialType::Dielectric, scene.materials[scene.spheres[last - 2].material_id].type);
    EXPECT_EQ(MaterialType::Lambertian, scene.materials[scene.spheres[last - 1].material_id].type);
    EXPECT_EQ(MaterialType::Metal, scene.materials[scene.spheres[last].material_id].type);
    EXPECT_FLOAT_EQ(0.0f, scene.materials[scene.spheres[last].material_id].fuzz);

    const Point3 reference(4.0f, 0.2f, 0.0f);
    for (size_t i = 1; i + 3 < scene.spheres.size(); ++i) {
        const Sphere& s = scene.spheres[i];
        EXPECT_FLOAT_EQ(0.2f, s.radius);
        EXPECT_FLOAT_EQ(0.2f, s.center.y);
        EXPECT_GT((s.center - reference).length(), 0.9f);

        const Material& m = scene.materials[s.material_id];
        if (m.type == MaterialType::Metal) {
            EXPECT_GE(m.albedo.x, 0.5f);
            EXPECT_LT(m.fuzz, 0.5f);
        } else if (m.type == MaterialType::Dielectric) {
            EXPECT_FLOAT_EQ(1.5f, m.refraction_index);
        }
    }

    EXPECT_NO_THROW(MakeCamera(desc.camera_settings));
    EXPECT_FLOAT_EQ(0.1f, desc.camera_settings.aperture);
}
