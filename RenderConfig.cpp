#include "RenderConfig.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

static void Require(bool condition, const char* field, int value, const char* expected)
{
    if (!condition) {
        throw std::invalid_argument(std::string("invalid render configuration: ") + field + " = "
                                    + std::to_string(value) + ", expected " + expected);
    }
}

void RenderConfig::Validate() const
{
    Require(image_width >= 1, "image_width", image_width, ">= 1");
    Require(image_height >= 1, "image_height", image_height, ">= 1");
    Require(samples_per_pixel >= 1, "samples_per_pixel", samples_per_pixel, ">= 1");
    Require(max_depth >= 0, "max_depth", max_depth, ">= 0");
    Require(thread_count >= 0, "thread_count", thread_count, ">= 0");
}

int ParseIntSetting(const std::string& name, const std::string& text)
{
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') {
        throw std::invalid_argument(name + " expects an integer, got \"" + text + "\"");
    }
    if (errno == ERANGE || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(name + " is out of integer range, got " + text);
    }
    return static_cast<int>(v);
}
