#ifndef IMAGEWRITER_H
#define IMAGEWRITER_H

#include <ostream>
#include <string>
#include <vector>
#include "Image.h"

// 8-bit RGB, top row first: int(256 * clamp(c, 0, 0.999)) per channel.
std::vector<unsigned char> ToBytes(const Image& image);

// ASCII "P3" netpbm.
void WritePPM(std::ostream& os, const Image& image);

void WritePNG(const std::string& path, const Image& image);

// Chooses PPM or PNG from the extension of path. Throws std::runtime_error
// for other extensions and when the file cannot be written.
void WriteImage(const std::string& path, const Image& image);

#endif // IMAGEWRITER_H
