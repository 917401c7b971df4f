#include "Camera.h"
#include "Sampling.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

static void ThrowInvalidCamera(const std::string& what)
{
    throw std::invalid_argument("invalid camera: " + what);
}

static void RequireFinite(const Vec3f& v, const char* name)
{
    if (!v.isFinite()) {
        std::ostringstream ss;
        ss << name << " must be finite, got " << v;
        ThrowInvalidCamera(ss.str());
    }
}

static void RequireFinite(float value, const char* name)
{
    if (!std::isfinite(value)) {
        std::ostringstream ss;
        ss << name << " must be finite, got " << value;
        ThrowInvalidCamera(ss.str());
    }
}

Camera MakeCamera(const CameraSettings& settings)
{
    RequireFinite(settings.look_from, "look_from");
    RequireFinite(settings.look_at, "look_at");
    RequireFinite(settings.view_up, "view_up");
    RequireFinite(settings.aspect_ratio, "aspect ratio");
    RequireFinite(settings.aperture, "aperture");
    RequireFinite(settings.focus_distance, "focus distance");

    if (!(settings.vertical_fov_deg > 0.0f && settings.vertical_fov_deg < 180.0f)) {
        std::ostringstream ss;
        ss << "vertical field of view must be in (0, 180) degrees, got " << settings.vertical_fov_deg;
        ThrowInvalidCamera(ss.str());
    }
    if (!(settings.aspect_ratio > 0.0f)) {
        ThrowInvalidCamera("aspect ratio must be positive");
    }
    if (!(settings.aperture >= 0.0f)) {
        ThrowInvalidCamera("aperture must not be negative");
    }
    if (!(settings.focus_distance > 0.0f)) {
        ThrowInvalidCamera("focus distance must be positive");
    }

    Vec3f gaze = settings.look_from - settings.look_at;
    if (gaze.nearZero()) {
        ThrowInvalidCamera("look_from and look_at coincide");
    }
    Vec3f side = settings.view_up.crossProduct(gaze);
    if (side.nearZero()) {
        ThrowInvalidCamera("view_up is parallel to the viewing direction");
    }

    float theta = deg2rad(settings.vertical_fov_deg);
    float h = std::tan(theta * 0.5f);
    float viewport_height = 2.0f * h;
    float viewport_width = settings.aspect_ratio * viewport_height;

    Camera cam;
    cam.w = gaze.normalize();
    cam.u = side.normalize();
    cam.v = cam.w.crossProduct(cam.u);  // already normalized

    cam.origin = settings.look_from;
    cam.horizontal = settings.focus_distance * viewport_width * cam.u;
    cam.vertical = settings.focus_distance * viewport_height * cam.v;
    cam.lower_left_corner = cam.origin - cam.horizontal / 2.0f - cam.vertical / 2.0f
                          - settings.focus_distance * cam.w;
    cam.lens_radius = settings.aperture / 2.0f;

    // finite inputs can still overflow, e.g. a 1e30 focus distance
    if (!cam.horizontal.isFinite() || !cam.vertical.isFinite() || !cam.lower_left_corner.isFinite()) {
        ThrowInvalidCamera("viewport overflows, focus distance or aspect ratio too large");
    }

    return cam;
}

// ============== RAY GENERATION ==============

Ray ComputeRay(const Camera& camera, float s, float t,
               std::mt19937& rng, std::uniform_real_distribution<float>& dist)
{
    Vec3f offset(0.0f, 0.0f, 0.0f);

    // Thin lens: jitter the origin over the aperture, every ray still
    // passes through the same point of the focus plane.
    if (camera.lens_radius > 0.0f) {
        Vec3f rd = camera.lens_radius * RandomInUnitDisk(rng, dist);
        offset = camera.u * rd.x + camera.v * rd.y;
    }

    return Ray(camera.origin + offset,
               camera.lower_left_corner + s * camera.horizontal + t * camera.vertical - camera.origin - offset);
}
