#ifndef PARSER_H
#define PARSER_H

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include "Camera.h"
#include "RenderConfig.h"
#include "Scene.h"

using json = nlohmann::json;
using std::string;

// Everything a scene file describes. camera_settings.aspect_ratio is taken
// from the image resolution.
struct SceneDescription
{
    Scene scene;
    CameraSettings camera_settings;
    RenderConfig config;
    string image_name;
};

struct parser
{
public:
    // API
    // Throws std::runtime_error naming the file on unreadable input,
    // malformed JSON, unknown material types or dangling material ids.
    SceneDescription loadFromJson(const string &filepath);
    SceneDescription loadFromString(const string &text, const string &source_name = "<string>");

private:
    static SceneDescription parseScene(const json& j);
    static void parseCamera(const json& cj, SceneDescription& desc);
    static Material parseMaterial(const json& mj);

    // Small parser helpers
    static Vec3f parseVec3f(const json& node);
    static float parseFloat(const json& node);
    static int parseInt(const json& node);
    static std::string idOf(const json& node);

    // Nodes may hold a single object or an array of them.
    template <class Fn>
    static void forEachNode(const json& node, Fn fn)
    {
        if (node.is_array()) {
            for (const auto& n : node) fn(n);
        } else {
            fn(node);
        }
    }
};

#endif // PARSER_H
