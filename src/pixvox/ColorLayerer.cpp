#include "pixvox/ColorLayerer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace pixvox {

bool ParseAchromaticPolicy(const std::string& s, AchromaticPolicy& out)
{
  std::string t;
  t.reserve(s.size());
  for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (t == "fallback" || t == "layer" || t == "fallback_layer") {
    out = AchromaticPolicy::FallbackLayer;
    return true;
  }
  if (t == "skip" || t == "drop") {
    out = AchromaticPolicy::Skip;
    return true;
  }
  return false;
}

const char* AchromaticPolicyName(AchromaticPolicy p)
{
  switch (p) {
  case AchromaticPolicy::FallbackLayer: return "fallback";
  case AchromaticPolicy::Skip: return "skip";
  default: return "fallback";
  }
}

bool IsAchromatic(const HsvColor& hsv, const ColorLayerConfig& cfg)
{
  return static_cast<int>(hsv.saturation) <= cfg.minSaturation || static_cast<int>(hsv.value) <= cfg.minValue;
}

int HueToLayer(double hueDegrees, int layers)
{
  if (layers <= 0 || !std::isfinite(hueDegrees)) return 0;
  const double h = std::clamp(hueDegrees, 0.0, 360.0);
  const int layer = static_cast<int>(std::floor(h * static_cast<double>(layers) / 360.0));
  return std::clamp(layer, 0, layers - 1);
}

VoxelGrid BuildColorLayerVoxels(const BinnedImage& img, const ColorLayerConfig& cfg)
{
  const int n = img.resolution;
  const int layers = std::max(0, cfg.layers);
  VoxelGridBuilder builder(ConvertMethod::Color, n, n, layers, img.srcWidth, img.srcHeight);
  if (n <= 0 || layers <= 0) return builder.build();

  builder.reserve(img.cells.size());
  const int fallback = std::clamp(cfg.achromaticLayer, 0, layers - 1);

  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      const BinnedCell& cell = img.at(x, y);
      const HsvColor hsv = RgbToHsv(cell.rgb);

      int layer = 0;
      if (IsAchromatic(hsv, cfg)) {
        if (cfg.achromatic == AchromaticPolicy::Skip) continue;
        layer = fallback;
      } else {
        layer = HueToLayer(hsv.hue, layers);
      }

      builder.add(x, y, layer, cell.rgb);
    }
  }

  return builder.build();
}

} // namespace pixvox
