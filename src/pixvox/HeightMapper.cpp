#include "pixvox/HeightMapper.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>

namespace pixvox {

bool ParseHeightColumnMode(const std::string& s, HeightColumnMode& out)
{
  std::string t;
  t.reserve(s.size());
  for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (t == "solid" || t == "column" || t == "columns") {
    out = HeightColumnMode::Solid;
    return true;
  }
  if (t == "shell" || t == "top" || t == "surface") {
    out = HeightColumnMode::Shell;
    return true;
  }
  return false;
}

const char* HeightColumnModeName(HeightColumnMode m)
{
  switch (m) {
  case HeightColumnMode::Solid: return "solid";
  case HeightColumnMode::Shell: return "shell";
  default: return "solid";
  }
}

int LumaToHeight(std::uint8_t luma, int maxHeight)
{
  if (maxHeight <= 0) return 0;
  // floor(luma * maxHeight / 255 + 1/2) in integers.
  const std::int64_t num = 2 * static_cast<std::int64_t>(luma) * maxHeight + 255;
  const std::int64_t z = num / (2 * 255);
  return static_cast<int>(std::clamp<std::int64_t>(z, 0, maxHeight));
}

VoxelGrid BuildHeightVoxels(const BinnedImage& img, const HeightMapConfig& cfg)
{
  const int n = img.resolution;
  const int maxHeight = std::max(0, cfg.maxHeight);
  VoxelGridBuilder builder(ConvertMethod::Height, n, n, maxHeight + 1, img.srcWidth, img.srcHeight);
  if (n <= 0) return builder.build();

  const bool solid = (cfg.columns == HeightColumnMode::Solid);

  // Exact voxel count is cheap to know up front.
  std::size_t total = 0;
  for (const BinnedCell& c : img.cells) {
    total += solid ? static_cast<std::size_t>(LumaToHeight(c.luma, maxHeight)) + 1u : 1u;
  }
  builder.reserve(total);

  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      const BinnedCell& cell = img.at(x, y);
      const int top = LumaToHeight(cell.luma, maxHeight);

      if (!solid) {
        builder.add(x, y, top, cell.rgb);
        continue;
      }
      for (int z = 0; z <= top; ++z) {
        builder.add(x, y, z, cell.rgb);
      }
    }
  }

  return builder.build();
}

} // namespace pixvox
