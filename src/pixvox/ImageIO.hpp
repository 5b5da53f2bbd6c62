#pragma once

#include "pixvox/Image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pixvox {

// Image file I/O for the command line and previews.
//
// PPM: binary P6 and ASCII P3, maxval 1..255 (rescaled to 0..255).
// PNG: 8-bit gray, gray+alpha, RGB, RGBA and palette images, non-interlaced, all five
//      scanline filters, any zlib/DEFLATE stream. Alpha and ancillary chunks are dropped.
//
// Writers always produce 8-bit RGB.

bool ReadPpm(const std::string& path, RgbImage& outImg, std::string& outError);
bool WritePpm(const std::string& path, const RgbImage& img, std::string& outError);

// Decode a PNG already in memory.
bool DecodePng(const std::vector<std::uint8_t>& bytes, RgbImage& outImg, std::string& outError);

enum class PngCompression : std::uint8_t {
  Stored = 0, // no compression
  Fixed = 1,  // fixed-Huffman DEFLATE with LZ77 matching
};

std::vector<std::uint8_t> EncodePng(const RgbImage& img, PngCompression compression = PngCompression::Fixed);

bool ReadPng(const std::string& path, RgbImage& outImg, std::string& outError);
bool WritePng(const std::string& path, const RgbImage& img, std::string& outError,
              PngCompression compression = PngCompression::Fixed);

// Dispatch on extension (.png, .ppm/.pnm), falling back to the file's magic bytes.
bool ReadImageAuto(const std::string& path, RgbImage& outImg, std::string& outError);

// .png -> PNG, anything else -> PPM.
bool WriteImageAuto(const std::string& path, const RgbImage& img, std::string& outError);

} // namespace pixvox
