#include "raytracer.h"
#include "ImageWriter.h"
#include "SceneBuilder.h"
#include "Timer.h"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

struct CommandLine
{
    string scene_file;
    string builtin = "random";
    string output;
    std::optional<int> width, height, samples, depth, threads, seed;
    bool verbose = false;
};

static void PrintUsage(const char* prog)
{
    printf("Usage: %s [options]\n"
           "  --scene <file.json>        load the scene from a JSON file\n"
           "  --builtin <name>           two-spheres | random (default: random)\n"
           "  -o <image.png|image.ppm>   output file (default: scene's ImageName)\n"
           "  -w <width> -h <height>     image resolution\n"
           "  -s <samples>               samples per pixel\n"
           "  -d <depth>                 maximum bounce depth\n"
           "  -t <threads>               render threads, 0 = all cores\n"
           "  --seed <n>                 random seed\n"
           "  -v, --verbose              print progress\n"
           "  --help                     show this message\n", prog);
}

static int ParseIntArg(const char* flag, const char* value)
{
    return ParseIntSetting(string("option ") + flag, value);
}

// Returns false when the program should stop after printing usage.
static bool ParseCommandLine(int argc, char* argv[], CommandLine& cl)
{
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (!strcmp(arg, "--help")) {
            PrintUsage(argv[0]);
            return false;
        }
        if (!strcmp(arg, "-v") || !strcmp(arg, "--verbose")) {
            cl.verbose = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument(string("option ") + arg + " needs a value");
        }
        const char* value = argv[++i];

        if (!strcmp(arg, "--scene"))        cl.scene_file = value;
        else if (!strcmp(arg, "--builtin")) cl.builtin = value;
        else if (!strcmp(arg, "-o"))        cl.output = value;
        else if (!strcmp(arg, "-w"))        cl.width = ParseIntArg(arg, value);
        else if (!strcmp(arg, "-h"))        cl.height = ParseIntArg(arg, value);
        else if (!strcmp(arg, "-s"))        cl.samples = ParseIntArg(arg, value);
        else if (!strcmp(arg, "-d"))        cl.depth = ParseIntArg(arg, value);
        else if (!strcmp(arg, "-t"))        cl.threads = ParseIntArg(arg, value);
        else if (!strcmp(arg, "--seed"))    cl.seed = ParseIntArg(arg, value);
        else throw std::invalid_argument(string("unknown option ") + arg);
    }
    return true;
}

static SceneDescription LoadScene(const CommandLine& cl)
{
    if (!cl.scene_file.empty()) {
        parser p;
        return p.loadFromJson(cl.scene_file);
    }

    const uint32_t seed = static_cast<uint32_t>(cl.seed.value_or(0));
    if (cl.builtin == "two-spheres") return BuildTwoSpheresScene();
    if (cl.builtin == "random")      return BuildRandomScene(11, seed);

    throw std::invalid_argument("unknown builtin scene \"" + cl.builtin + "\"");
}

// Command line values win over the scene's own settings.
static void ApplyOverrides(const CommandLine& cl, SceneDescription& desc)
{
    if (cl.width)   desc.config.image_width = *cl.width;
    if (cl.height)  desc.config.image_height = *cl.height;
    if (cl.samples) desc.config.samples_per_pixel = *cl.samples;
    if (cl.depth)   desc.config.max_depth = *cl.depth;
    if (cl.threads) desc.config.thread_count = *cl.threads;
    if (cl.seed)    desc.config.seed = static_cast<uint32_t>(*cl.seed);
    if (!cl.output.empty()) desc.image_name = cl.output;

    desc.config.Validate();
    desc.camera_settings.aspect_ratio = desc.config.aspectRatio();
}

int main(int argc, char* argv[])
{
    CommandLine cl;
    try {
        if (!ParseCommandLine(argc, argv, cl)) return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 2;
    }

    try {
        SceneDescription desc = LoadScene(cl);
        ApplyOverrides(cl, desc);
        Camera camera = MakeCamera(desc.camera_settings);

        const RenderConfig& config = desc.config;
        std::cout << "Rendering " << config.image_width << "x" << config.image_height
                  << ", " << config.samples_per_pixel << " spp, depth " << config.max_depth
                  << ", " << desc.scene.spheres.size() << " spheres" << std::endl;

        ProgressCallback progress;
        if (cl.verbose) {
            progress = [](int rows_done, int rows_total) {
                std::cerr << "\rScanlines remaining: " << (rows_total - rows_done) << ' ' << std::flush;
            };
        }

        Timer timer;
        Image image = Render(desc.scene, camera, config, progress);
        if (cl.verbose) std::cerr << "\nDone!" << std::endl;

        timer.printElapsed(std::cout, "Render time");

        WriteImage(desc.image_name, image);
        std::cout << "Wrote " << desc.image_name << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
