#ifndef CAMERA_H
#define CAMERA_H

#include <random>
#include "Ray.h"

struct CameraSettings
{
    Point3 look_from;
    Point3 look_at;
    Vec3f view_up;
    float vertical_fov_deg;
    float aspect_ratio;
    float aperture;         // lens diameter, 0 is a pinhole
    float focus_distance;

    CameraSettings()
        : look_from(0, 0, 0), look_at(0, 0, -1), view_up(0, 1, 0),
          vertical_fov_deg(90.0f), aspect_ratio(16.0f / 9.0f),
          aperture(0.0f), focus_distance(1.0f) {}
};

// Derived once from CameraSettings, read-only while rendering.
struct Camera
{
    Point3 origin;
    Point3 lower_left_corner;
    Vec3f horizontal, vertical;     // span of the focus plane
    Vec3f u, v, w;                  // w points backwards, away from look_at
    float lens_radius;
};

// Throws std::invalid_argument when the settings do not describe a camera.
Camera MakeCamera(const CameraSettings& settings);

// s and t in [0,1] run left to right and bottom to top over the focus plane.
Ray ComputeRay(const Camera& camera, float s, float t,
               std::mt19937& rng, std::uniform_real_distribution<float>& dist);

#endif // CAMERA_H
