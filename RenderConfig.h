#ifndef RENDERCONFIG_H
#define RENDERCONFIG_H

#include <cstdint>
#include <string>

struct RenderConfig
{
    int image_width;
    int image_height;
    int samples_per_pixel;
    int max_depth;          // scatter events per sample, 0 renders black
    uint32_t seed;          // same seed, same image
    int thread_count;       // 0 uses every hardware thread

    RenderConfig()
        : image_width(400), image_height(225), samples_per_pixel(10),
          max_depth(50), seed(0), thread_count(0) {}

    float aspectRatio() const noexcept {
        return static_cast<float>(image_width) / static_cast<float>(image_height);
    }

    // Throws std::invalid_argument naming the first field out of range.
    void Validate() const;
};

// Decimal integer for one of the fields above. Throws std::invalid_argument
// naming `name` on trailing garbage or a value that does not fit in an int.
int ParseIntSetting(const std::string& name, const std::string& text);

#endif // RENDERCONFIG_H
