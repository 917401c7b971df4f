#include "raytracer.h"
#include "Sampling.h"

#include <cmath>
#include <thread>

// ============== COLOR COMPUTATION ==============

Color BackgroundColor(const Ray& ray) noexcept
{
    Vec3f unit_direction = ray.direction.normalize();
    float t = 0.5f * (unit_direction.y + 1.0f);
    return (1.0f - t) * Color(1.0f, 1.0f, 1.0f) + t * Color(0.5f, 0.7f, 1.0f);
}

Color ComputeColor(const Ray& ray, const Scene& scene, int depth,
                   std::mt19937& rng, std::uniform_real_distribution<float>& dist)
{
    // out of bounces, no more light is gathered
    if (depth <= 0) {
        return Color(0, 0, 0);
    }

    HitRecord closestHit;
    if (!FindClosestHit(ray, scene, EPS_INTERSECTION, kInfinity, closestHit)) {
        return BackgroundColor(ray);
    }

    Color attenuation;
    Ray scattered;
    if (Scatter(scene.MaterialOf(closestHit), ray, closestHit, rng, dist, attenuation, scattered)) {
        return attenuation.elwiseMult(ComputeColor(scattered, scene, depth - 1, rng, dist));
    }

    return Color(0, 0, 0);
}

// ============== PIXEL SAMPLING ==============

Color SamplePixel(const Scene& scene, const Camera& camera, const RenderConfig& config, int row, int col)
{
    const uint32_t pixel_index = static_cast<uint32_t>(row) * static_cast<uint32_t>(config.image_width)
                               + static_cast<uint32_t>(col);
    std::mt19937 rng(PixelSeed(config.seed, pixel_index));
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);

    // a single pixel column or row has no extent to divide by
    const float denominator_u = config.image_width > 1 ? float(config.image_width - 1) : 1.0f;
    const float denominator_v = config.image_height > 1 ? float(config.image_height - 1) : 1.0f;

    // image rows run top-down, t runs bottom-up
    const int j = config.image_height - 1 - row;

    Color color_sum(0.0f, 0.0f, 0.0f);
    for (int s = 0; s < config.samples_per_pixel; ++s) {
        float u = (col + dist(rng)) / denominator_u;
        float v = (j + dist(rng)) / denominator_v;

        Ray ray = ComputeRay(camera, u, v, rng, dist);
        color_sum += ComputeColor(ray, scene, config.max_depth, rng, dist);
    }

    Color color = color_sum / static_cast<float>(config.samples_per_pixel);

    // gamma 2
    return Color(clampF(std::sqrt(color.x), 0.0f, 1.0f),
                 clampF(std::sqrt(color.y), 0.0f, 1.0f),
                 clampF(std::sqrt(color.z), 0.0f, 1.0f));
}

// ============== RENDER LOOP ==============

Image Render(const Scene& scene, const Camera& camera, const RenderConfig& config,
             const ProgressCallback& progress)
{
    config.Validate();

    int team_size = config.thread_count;
    if (team_size == 0) {
        team_size = static_cast<int>(std::thread::hardware_concurrency());
        if (team_size <= 0) team_size = 1;
    }

    const int width  = config.image_width;
    const int height = config.image_height;
    Image image(width, height);

    int rows_done = 0;

    // One scanline per task. A row belongs to exactly one thread and each
    // pixel seeds its own generator, so no locking is needed for the image.
    #pragma omp parallel for schedule(dynamic, 1) num_threads(team_size)
    for (int i = 0; i < height; i++) {
        for (int j = 0; j < width; j++) {
            image.at(i, j) = SamplePixel(scene, camera, config, i, j);
        }

        // count and report under one lock so callers see 1, 2, ..., height
        if (progress) {
            #pragma omp critical(render_progress)
            {
                ++rows_done;
                progress(rows_done, height);
            }
        }
    }

    return image;
}
