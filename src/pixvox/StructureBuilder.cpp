#include "pixvox/StructureBuilder.hpp"

#include "pixvox/DistanceField.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>

namespace pixvox {

namespace {

inline std::uint8_t ScaleChannel(std::uint8_t v, double k)
{
  const double s = std::floor(static_cast<double>(v) * k + 0.5);
  return static_cast<std::uint8_t>(std::clamp(s, 0.0, 255.0));
}

} // namespace

bool ParseStructureDepthMode(const std::string& s, StructureDepthMode& out)
{
  std::string t;
  t.reserve(s.size());
  for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (t == "absolute" || t == "abs") {
    out = StructureDepthMode::Absolute;
    return true;
  }
  if (t == "normalized" || t == "normalised" || t == "norm") {
    out = StructureDepthMode::Normalized;
    return true;
  }
  return false;
}

const char* StructureDepthModeName(StructureDepthMode m)
{
  switch (m) {
  case StructureDepthMode::Absolute: return "absolute";
  case StructureDepthMode::Normalized: return "normalized";
  default: return "absolute";
  }
}

StructureFields ComputeStructureFields(const BinnedImage& img, const StructureConfig& cfg)
{
  StructureFields f;
  const int n = img.resolution;
  if (n <= 0) return f;
  f.resolution = n;

  std::vector<std::uint8_t> luma(img.cells.size(), std::uint8_t{0});
  for (std::size_t i = 0; i < img.cells.size(); ++i) luma[i] = img.cells[i].luma;

  f.edges = ThresholdMask(SobelMagnitude(luma, n, n), cfg.edgeThreshold);
  f.edgeCount = static_cast<int>(std::count(f.edges.begin(), f.edges.end(), std::uint8_t{1}));

  f.distance.assign(f.edges.size(), 0.0f);
  if (f.edgeCount == 0) return f;

  std::vector<float> distSq;
  DistanceTransform2DSq(f.edges, n, n, distSq);
  for (std::size_t i = 0; i < distSq.size(); ++i) {
    const float d = std::sqrt(distSq[i]);
    f.distance[i] = d;
    f.maxDistance = std::max(f.maxDistance, d);
  }
  return f;
}

int StructureColumnTop(float d, float maxDistance, const StructureConfig& cfg)
{
  const int maxTop = std::max(0, cfg.depthLevels - 1);
  double top = 0.0;
  if (cfg.depthMode == StructureDepthMode::Normalized) {
    if (maxDistance > 0.0f) top = static_cast<double>(d) / static_cast<double>(maxDistance) * static_cast<double>(maxTop);
  } else {
    top = static_cast<double>(cfg.distanceScale) * static_cast<double>(d);
  }
  if (!std::isfinite(top)) return 0;
  const int z = static_cast<int>(std::floor(top + 0.5));
  return std::clamp(z, 0, maxTop);
}

Rgb8 ShadeByDepth(Rgb8 c, int z, int depthLevels)
{
  if (depthLevels <= 0) return c;
  const double k = 1.0 - 0.5 * static_cast<double>(z) / static_cast<double>(depthLevels);
  return Rgb8{ScaleChannel(c.r, k), ScaleChannel(c.g, k), ScaleChannel(c.b, k)};
}

VoxelGrid BuildStructureVoxels(const BinnedImage& img, const StructureConfig& cfg)
{
  const int n = img.resolution;
  const int levels = std::max(0, cfg.depthLevels);
  VoxelGridBuilder builder(ConvertMethod::Structure, n, n, levels, img.srcWidth, img.srcHeight);
  if (n <= 0 || levels <= 0) return builder.build();

  const StructureFields f = ComputeStructureFields(img, cfg);
  if (f.edgeCount == 0) return builder.build();

  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      const std::size_t i = static_cast<std::size_t>(y) * static_cast<std::size_t>(n) + static_cast<std::size_t>(x);
      if (f.edges[i] != 0u) continue;

      const BinnedCell& cell = img.at(x, y);
      const int top = StructureColumnTop(f.distance[i], f.maxDistance, cfg);
      for (int z = 0; z <= top; ++z) {
        const Rgb8 c = cfg.shadeByDepth ? ShadeByDepth(cell.rgb, z, levels) : cell.rgb;
        builder.add(x, y, z, c);
      }
    }
  }

  return builder.build();
}

} // namespace pixvox
