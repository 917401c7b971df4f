#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "ImageWriter.h"

static Image MakeTestImage()
{
    Image image(2, 2);
    image.at(0, 0) = Color(0.0f, 0.5f, 1.0f);
    image.at(0, 1) = Color(1.0f, 1.0f, 1.0f);
    image.at(1, 0) = Color(0.25f, 0.0f, 0.0f);
    image.at(1, 1) = Color(-1.0f, 2.0f, 0.999f);
    return image;
}

TEST(ImageWriter, ToBytesQuantizesAndClamps)
{
    std::vector<unsigned char> bytes = ToBytes(MakeTestImage());
    ASSERT_EQ(12u, bytes.size());

    EXPECT_EQ(0, bytes[0]);
    EXPECT_EQ(128, bytes[1]);
    EXPECT_EQ(255, bytes[2]);
    EXPECT_EQ(255, bytes[3]);
    EXPECT_EQ(64, bytes[6]);
    EXPECT_EQ(0, bytes[9]);
    EXPECT_EQ(255, bytes[10]);
    EXPECT_EQ(255, bytes[11]);
}

TEST(ImageWriter, NaNQuantizesToZero)
{
    Image image(1, 1);
    const float nan = std::numeric_limits<float>::quiet_NaN();
    image.at(0, 0) = Color(nan, 0.5f, nan);

    std::vector<unsigned char> bytes = ToBytes(image);
    EXPECT_EQ(0, bytes[0]);
    EXPECT_EQ(128, bytes[1]);
    EXPECT_EQ(0, bytes[2]);
}

TEST(ImageWriter, PpmLayout)
{
    std::ostringstream os;
    WritePPM(os, MakeTestImage());

    EXPECT_EQ("P3\n2 2\n255\n"
              "0 128 255\n"
              "255 255 255\n"
              "64 0 0\n"
              "0 255 255\n", os.str());
}

TEST(ImageWriter, WritesPpmByExtension)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "spheretracer_writer_test.PPM";
    WriteImage(path.string(), MakeTestImage());

    std::ifstream in(path);
    std::string magic;
    int w = 0, h = 0;
    in >> magic >> w >> h;
    EXPECT_EQ("P3", magic);
    EXPECT_EQ(2, w);
    EXPECT_EQ(2, h);

    in.close();
    std::filesystem::remove(path);
}

TEST(ImageWriter, WritesPng)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "spheretracer_writer_test.png";
    WriteImage(path.string(), MakeTestImage());

    std::ifstream in(path, std::ios::binary);
    char signature[8] = {};
    in.read(signature, 8);
    EXPECT_EQ('P', signature[1]);
    EXPECT_EQ('N', signature[2]);
    EXPECT_EQ('G', signature[3]);

    in.close();
    std::filesystem::remove(path);
}

TEST(ImageWriter, RejectsUnknownFormatAndBadPath)
{
    EXPECT_THROW(WriteImage("picture.bmp", MakeTestImage()), std::runtime_error);
    EXPECT_THROW(WriteImage("no_extension", MakeTestImage()), std::runtime_error);
    EXPECT_THROW(WriteImage("/nonexistent/dir/out.ppm", MakeTestImage()), std::runtime_error);
    EXPECT_THROW(WriteImage("/nonexistent/dir/out.png", MakeTestImage()), std::runtime_error);
}
