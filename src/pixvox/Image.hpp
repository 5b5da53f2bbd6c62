#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pixvox {

struct Rgb8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

inline bool operator==(const Rgb8& a, const Rgb8& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Rgb8& a, const Rgb8& b) { return !(a == b); }

// Plain in-memory RGB image.
//
// Coordinate system:
//  - origin at top-left
//  - x increases to the right (columns)
//  - y increases downward (rows)
struct RgbImage {
  int width = 0;
  int height = 0;
  // RGB bytes, row-major (y major), size = width * height * 3
  std::vector<std::uint8_t> rgb;
};

// Allocate a width x height image filled with `fill`.
RgbImage MakeSolidImage(int width, int height, Rgb8 fill);

// Returns false (and a message) when the image has no area or its buffer does not
// match width/height.
bool ValidateRgbImage(const RgbImage& img, std::string& outError);

inline Rgb8 GetPixel(const RgbImage& img, int x, int y)
{
  const std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(img.width) + static_cast<std::size_t>(x)) * 3u;
  return Rgb8{img.rgb[idx + 0], img.rgb[idx + 1], img.rgb[idx + 2]};
}

inline void SetPixel(RgbImage& img, int x, int y, Rgb8 c)
{
  const std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(img.width) + static_cast<std::size_t>(x)) * 3u;
  img.rgb[idx + 0] = c.r;
  img.rgb[idx + 1] = c.g;
  img.rgb[idx + 2] = c.b;
}

// Nearest-neighbor upscaling (useful for viewing tiny previews).
// factor <= 1 returns src unchanged.
RgbImage ScaleNearest(const RgbImage& src, int factor);

// Read-only pixel source consumed by the converters.
//
// Implementations decide where pixels come from (a decoded file, a camera frame, a
// test pattern). Converters only ever read through this interface and never keep a
// reference past the conversion call.
class ImageSource {
public:
  virtual ~ImageSource() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // (x, y) is guaranteed to be inside [0,width) x [0,height) by callers.
  virtual Rgb8 pixel(int x, int y) const = 0;
};

// ImageSource view over an RgbImage. The image must outlive the view.
class RgbImageSource final : public ImageSource {
public:
  explicit RgbImageSource(const RgbImage& img) : m_img(img) {}

  int width() const override { return m_img.width; }
  int height() const override { return m_img.height; }
  Rgb8 pixel(int x, int y) const override { return GetPixel(m_img, x, y); }

private:
  const RgbImage& m_img;
};

} // namespace pixvox
