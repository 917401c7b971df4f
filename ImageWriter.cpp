#include "ImageWriter.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

static unsigned char ToByte(float c)
{
    // clampF lets NaN through
    if (std::isnan(c)) return 0;
    return static_cast<unsigned char>(256.0f * clampF(c, 0.0f, 0.999f));
}

std::vector<unsigned char> ToBytes(const Image& image)
{
    std::vector<unsigned char> bytes;
    bytes.reserve(image.pixels.size() * 3);

    for (const Color& c : image.pixels) {
        bytes.push_back(ToByte(c.x));
        bytes.push_back(ToByte(c.y));
        bytes.push_back(ToByte(c.z));
    }
    return bytes;
}

void WritePPM(std::ostream& os, const Image& image)
{
    const std::vector<unsigned char> bytes = ToBytes(image);

    os << "P3\n" << image.width << ' ' << image.height << "\n255\n";
    for (size_t idx = 0; idx < bytes.size(); idx += 3) {
        os << int(bytes[idx + 0]) << ' ' << int(bytes[idx + 1]) << ' ' << int(bytes[idx + 2]) << '\n';
    }
}

void WritePNG(const std::string& path, const Image& image)
{
    const std::vector<unsigned char> bytes = ToBytes(image);
    if (!stbi_write_png(path.c_str(), image.width, image.height, 3, bytes.data(), image.width * 3)) {
        throw std::runtime_error(path + ": failed to write PNG");
    }
}

static std::string LowercaseExtension(const std::string& path)
{
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";

    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

void WriteImage(const std::string& path, const Image& image)
{
    const std::string ext = LowercaseExtension(path);

    if (ext == "png") {
        WritePNG(path, image);
    } else if (ext == "ppm") {
        std::ofstream out(path);
        if (!out) {
            throw std::runtime_error(path + ": cannot open for writing");
        }
        WritePPM(out, image);
        out.flush();
        if (!out) {
            throw std::runtime_error(path + ": write failed");
        }
    } else {
        throw std::runtime_error(path + ": unsupported image format, use .png or .ppm");
    }
}
