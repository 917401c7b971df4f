#ifndef IMAGE_H
#define IMAGE_H

#include <cstddef>
#include <vector>
#include "Vec3f.h"

// Row-major, row 0 is the top of the picture. Channels are gamma corrected
// and in [0, 1].
struct Image
{
    int width;
    int height;
    std::vector<Color> pixels;

    Image() : width(0), height(0) {}
    Image(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h) {}

    Color& at(int row, int col) { return pixels[static_cast<size_t>(row) * width + col]; }
    const Color& at(int row, int col) const { return pixels[static_cast<size_t>(row) * width + col]; }
};

#endif // IMAGE_H
