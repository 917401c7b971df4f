#ifndef RAYTRACER_H
#define RAYTRACER_H

#include <functional>
#include <random>
#include "Camera.h"
#include "Image.h"
#include "RenderConfig.h"
#include "Scene.h"

// lower bound of every hit query, keeps a scattered ray from hitting the
// surface it starts on
#define EPS_INTERSECTION 0.001f

// Called after each finished scanline with (rows_done, rows_total). Calls are
// serialized but may come from any render thread. Must not throw.
using ProgressCallback = std::function<void(int, int)>;

Color BackgroundColor(const Ray& ray) noexcept;

Color ComputeColor(const Ray& ray, const Scene& scene, int depth,
                   std::mt19937& rng, std::uniform_real_distribution<float>& dist);

// Average of config.samples_per_pixel jittered samples, gamma corrected and
// clamped. The pixel owns its generator, seeded from config.seed.
Color SamplePixel(const Scene& scene, const Camera& camera, const RenderConfig& config, int row, int col);

// Validates config, then renders every scanline in parallel. Row 0 of the
// result is the top of the picture.
Image Render(const Scene& scene, const Camera& camera, const RenderConfig& config,
             const ProgressCallback& progress = ProgressCallback());

#endif // RAYTRACER_H
