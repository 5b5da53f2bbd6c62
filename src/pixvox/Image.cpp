#include "pixvox/Image.hpp"

#include <cstddef>
#include <sstream>

namespace pixvox {

RgbImage MakeSolidImage(int width, int height, Rgb8 fill)
{
  RgbImage img;
  if (width <= 0 || height <= 0) return img;

  img.width = width;
  img.height = height;
  img.rgb.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 3u);
  for (std::size_t i = 0; i < img.rgb.size(); i += 3) {
    img.rgb[i + 0] = fill.r;
    img.rgb[i + 1] = fill.g;
    img.rgb[i + 2] = fill.b;
  }
  return img;
}

bool ValidateRgbImage(const RgbImage& img, std::string& outError)
{
  outError.clear();
  if (img.width <= 0 || img.height <= 0) {
    outError = "image has zero area";
    return false;
  }
  const std::size_t expected = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height) * 3u;
  if (img.rgb.size() != expected) {
    std::ostringstream oss;
    oss << "invalid image buffer size (expected " << expected << ", got " << img.rgb.size() << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

RgbImage ScaleNearest(const RgbImage& src, int factor)
{
  if (factor <= 1 || src.width <= 0 || src.height <= 0) return src;

  RgbImage out;
  out.width = src.width * factor;
  out.height = src.height * factor;
  out.rgb.resize(static_cast<std::size_t>(out.width) * static_cast<std::size_t>(out.height) * 3u);

  for (int y = 0; y < out.height; ++y) {
    const int sy = y / factor;
    for (int x = 0; x < out.width; ++x) {
      SetPixel(out, x, y, GetPixel(src, x / factor, sy));
    }
  }
  return out;
}

} // namespace pixvox
