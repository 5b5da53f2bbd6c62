#pragma once

#include "pixvox/Image.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace pixvox {

// Deterministic integer luma approximation (ITU-R BT.601-ish), weights sum to 256.
// Pure white maps to exactly 255 and pure black to exactly 0.
inline std::uint8_t Luma8(std::uint8_t r, std::uint8_t g, std::uint8_t b)
{
  const std::uint32_t acc = 77u * r + 150u * g + 29u * b + 128u;
  return static_cast<std::uint8_t>(acc >> 8);
}

inline std::uint8_t Luma8(Rgb8 c) { return Luma8(c.r, c.g, c.b); }

struct HsvColor {
  // Hue in degrees, [0,360). 0 for achromatic colors.
  double hue = 0.0;
  // Saturation and value on the 0..255 scale.
  std::uint8_t saturation = 0;
  std::uint8_t value = 0;
};

inline std::uint8_t UnitToU8(double v01)
{
  const long q = std::lround(std::clamp(v01, 0.0, 1.0) * 255.0);
  return static_cast<std::uint8_t>(std::clamp<long>(q, 0, 255));
}

inline HsvColor RgbToHsv(Rgb8 c)
{
  const double rd = c.r / 255.0;
  const double gd = c.g / 255.0;
  const double bd = c.b / 255.0;

  const double maxVal = std::max({rd, gd, bd});
  const double minVal = std::min({rd, gd, bd});
  const double diff = maxVal - minVal;

  HsvColor out;
  out.value = UnitToU8(maxVal);
  out.saturation = (maxVal > 0.0) ? UnitToU8(diff / maxVal) : std::uint8_t{0};

  if (diff > 0.0) {
    double hue = 0.0;
    if (c.r >= c.g && c.r >= c.b) {
      hue = 60.0 * std::fmod((gd - bd) / diff + 6.0, 6.0);
    } else if (c.g >= c.b) {
      hue = 60.0 * ((bd - rd) / diff + 2.0);
    } else {
      hue = 60.0 * ((rd - gd) / diff + 4.0);
    }
    if (hue >= 360.0) hue -= 360.0;
    if (hue < 0.0) hue = 0.0;
    out.hue = hue;
  }
  return out;
}

} // namespace pixvox
