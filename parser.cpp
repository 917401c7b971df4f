#include <fstream>
#include <sstream>
#include "parser.h"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

// ============== MAIN SCENE LOADER ==============

SceneDescription parser::loadFromJson(const string &filepath)
{
    std::ifstream f(filepath);
    if (!f) {
        throw std::runtime_error(filepath + ": cannot open scene file");
    }

    std::stringstream buffer;
    buffer << f.rdbuf();
    return loadFromString(buffer.str(), filepath);
}

SceneDescription parser::loadFromString(const string &text, const string &source_name)
{
    // json::exception and the scene's invalid_argument both end up here,
    // reported against the file they came from
    try {
        json j = json::parse(text);
        return parseScene(j);
    } catch (const std::exception& e) {
        throw std::runtime_error(source_name + ": " + e.what());
    }
}

SceneDescription parser::parseScene(const json& j)
{
    if (!j.contains("Scene")) {
        throw std::runtime_error("missing \"Scene\" root object");
    }
    const auto& s = j.at("Scene");

    SceneDescription desc;

    // --- Render settings ---
    if (s.contains("MaxRecursionDepth")) {
        desc.config.max_depth = parseInt(s.at("MaxRecursionDepth"));
    }
    if (s.contains("SamplesPerPixel")) {
        desc.config.samples_per_pixel = parseInt(s.at("SamplesPerPixel"));
    }
    if (s.contains("Seed")) {
        desc.config.seed = static_cast<uint32_t>(parseInt(s.at("Seed")));
    }
    if (s.contains("Threads")) {
        desc.config.thread_count = parseInt(s.at("Threads"));
    }

    // --- Camera ---
    if (s.contains("Camera")) {
        parseCamera(s.at("Camera"), desc);
    }
    desc.camera_settings.aspect_ratio = desc.config.aspectRatio();

    // --- Materials ---
    std::map<string, int> materialIdToIndex;
    if (s.contains("Materials") && s["Materials"].contains("Material")) {
        int position = 1;
        forEachNode(s["Materials"]["Material"], [&](const json& mj) {
            // unnamed materials are numbered from 1 in file order
            string id = mj.contains("_id") ? idOf(mj.at("_id")) : std::to_string(position);
            if (materialIdToIndex.count(id)) {
                throw std::runtime_error("duplicate material id " + id);
            }
            materialIdToIndex[id] = desc.scene.AddMaterial(parseMaterial(mj));
            ++position;
        });
    }

    // --- Objects ---
    if (s.contains("Objects") && s["Objects"].contains("Sphere")) {
        forEachNode(s["Objects"]["Sphere"], [&](const json& sj) {
            string ref = idOf(sj.at("Material"));
            auto it = materialIdToIndex.find(ref);
            if (it == materialIdToIndex.end()) {
                throw std::runtime_error("sphere refers to undefined material " + ref);
            }

            Vec3f center = parseVec3f(sj.at("Center"));
            float radius = parseFloat(sj.at("Radius"));
            desc.scene.AddSphere(center, radius, it->second);
        });
    }

    return desc;
}

void parser::parseCamera(const json& cj, SceneDescription& desc)
{
    CameraSettings& cam = desc.camera_settings;

    if (cj.contains("Position"))  cam.look_from = parseVec3f(cj.at("Position"));
    if (cj.contains("GazePoint")) cam.look_at = parseVec3f(cj.at("GazePoint"));
    if (cj.contains("Up"))        cam.view_up = parseVec3f(cj.at("Up"));
    if (cj.contains("FovY"))      cam.vertical_fov_deg = parseFloat(cj.at("FovY"));
    if (cj.contains("Aperture"))  cam.aperture = parseFloat(cj.at("Aperture"));

    // without an explicit focus distance the gaze point is in focus
    if (cj.contains("FocusDistance")) {
        cam.focus_distance = parseFloat(cj.at("FocusDistance"));
    } else {
        cam.focus_distance = (cam.look_at - cam.look_from).length();
    }

    // ImageResolution
    if (cj.contains("ImageResolution")) {
        const auto& res = cj.at("ImageResolution");
        if (res.is_array()) {
            if (res.size() != 2) {
                throw std::runtime_error("ImageResolution must hold two integers");
            }
            desc.config.image_width = parseInt(res.at(0));
            desc.config.image_height = parseInt(res.at(1));
        } else {
            std::stringstream ss(res.get<std::string>());
            if (!(ss >> desc.config.image_width >> desc.config.image_height)) {
                throw std::runtime_error("ImageResolution must hold two integers");
            }
        }
    }

    desc.image_name = cj.value("ImageName", "image.png");
}

Material parser::parseMaterial(const json& mj)
{
    std::string t = mj.value("_type", "lambertian");

    MaterialType type;
    if (t == "lambertian" || t == "diffuse") type = MaterialType::Lambertian;
    else if (t == "metal")                   type = MaterialType::Metal;
    else if (t == "dielectric")              type = MaterialType::Dielectric;
    else throw std::runtime_error("unknown material type \"" + t + "\"");

    try {
        switch (type) {
            case MaterialType::Lambertian:
                return MakeLambertian(parseVec3f(mj.at("Albedo")));
            case MaterialType::Metal: {
                float fuzz = mj.contains("Fuzz") ? parseFloat(mj.at("Fuzz")) : 0.0f;
                return MakeMetal(parseVec3f(mj.at("Albedo")), fuzz);
            }
            case MaterialType::Dielectric:
                return MakeDielectric(parseFloat(mj.at("RefractionIndex")));
        }
    } catch (const std::exception& e) {
        std::ostringstream ss;
        ss << type << " material: " << e.what();
        throw std::runtime_error(ss.str());
    }
    throw std::runtime_error("unhandled material type \"" + t + "\"");
}

// ============== SMALL HELPERS ==============

// "x y z" like the rest of the scene format, or a plain [x, y, z] array
Vec3f parser::parseVec3f(const json& node) {
    if (node.is_array()) {
        if (node.size() != 3) {
            throw std::runtime_error("vector needs three components: " + node.dump());
        }
        return Vec3f(parseFloat(node[0]), parseFloat(node[1]), parseFloat(node[2]));
    }

    std::stringstream ss(node.get<std::string>());
    float x, y, z;
    if (!(ss >> x >> y >> z)) {
        throw std::runtime_error("vector needs three components: " + node.dump());
    }
    return Vec3f(x, y, z);
}

float parser::parseFloat(const json& node)
{
    float value;
    if (node.is_number()) {
        double d = node.get<double>();
        if (!(std::fabs(d) <= std::numeric_limits<float>::max())) {
            throw std::runtime_error("expected a finite number, got " + node.dump());
        }
        value = static_cast<float>(d);
    } else {
        const std::string s = node.get<std::string>();
        char* end = nullptr;
        value = std::strtof(s.c_str(), &end);
        if (end == s.c_str()) {
            throw std::runtime_error("expected a number, got \"" + s + "\"");
        }
        // strtof saturates to inf on overflow and accepts "inf"/"nan"
        if (!std::isfinite(value)) {
            throw std::runtime_error("expected a finite number, got \"" + s + "\"");
        }
    }
    return value;
}

int parser::parseInt(const json& node)
{
    // get<int>() would wrap silently
    if (node.is_number_unsigned()) {
        std::uint64_t v = node.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw std::runtime_error("integer out of range: " + node.dump());
        }
        return static_cast<int>(v);
    }
    if (node.is_number_integer()) {
        std::int64_t v = node.get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw std::runtime_error("integer out of range: " + node.dump());
        }
        return static_cast<int>(v);
    }

    try {
        return std::stoi(node.get<std::string>());
    } catch (const std::logic_error&) {
        throw std::runtime_error("expected an integer, got " + node.dump());
    }
}

std::string parser::idOf(const json& node)
{
    return node.is_string() ? node.get<std::string>() : node.dump();
}
