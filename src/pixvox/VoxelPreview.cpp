#include "pixvox/VoxelPreview.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace pixvox {

namespace {

bool CheckGrid(const VoxelGrid& grid, std::string& outError)
{
  if (grid.sizeX() <= 0 || grid.sizeY() <= 0 || grid.sizeZ() <= 0) {
    outError = "cannot render a grid without extent";
    return false;
  }
  return true;
}

} // namespace

bool ParseSliceAxis(const std::string& s, SliceAxis& out)
{
  if (s.size() != 1) return false;
  switch (std::tolower(static_cast<unsigned char>(s[0]))) {
  case 'x': out = SliceAxis::X; return true;
  case 'y': out = SliceAxis::Y; return true;
  case 'z': out = SliceAxis::Z; return true;
  default: return false;
  }
}

const char* SliceAxisName(SliceAxis a)
{
  switch (a) {
  case SliceAxis::X: return "x";
  case SliceAxis::Y: return "y";
  case SliceAxis::Z: return "z";
  default: return "z";
  }
}

bool RenderTopDown(const VoxelGrid& grid, const PreviewOptions& opt, RgbImage& outImg, std::string& outError)
{
  outError.clear();
  if (!CheckGrid(grid, outError)) return false;

  const int w = grid.sizeX();
  const int h = grid.sizeY();
  outImg = MakeSolidImage(w, h, opt.background);

  std::vector<int> topZ(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), -1);
  std::vector<Rgb8> topColor(topZ.size());
  for (const Voxel& v : grid.voxels()) {
    const std::size_t i = static_cast<std::size_t>(v.pos.y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(v.pos.x);
    if (v.pos.z > topZ[i]) {
      topZ[i] = v.pos.z;
      topColor[i] = v.color;
    }
  }

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t i = static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
      if (topZ[i] < 0) continue;

      Rgb8 c = topColor[i];
      if (opt.darkenByDepth) {
        const double k = 0.5 + 0.5 * static_cast<double>(topZ[i] + 1) / static_cast<double>(grid.sizeZ());
        auto scale = [k](std::uint8_t v) {
          return static_cast<std::uint8_t>(std::clamp(std::floor(static_cast<double>(v) * k + 0.5), 0.0, 255.0));
        };
        c = Rgb8{scale(c.r), scale(c.g), scale(c.b)};
      }
      SetPixel(outImg, x, y, c);
    }
  }
  return true;
}

bool RenderSlice(const VoxelGrid& grid, SliceAxis axis, int index, const PreviewOptions& opt, RgbImage& outImg,
                 std::string& outError)
{
  outError.clear();
  if (!CheckGrid(grid, outError)) return false;

  const int axisSize = (axis == SliceAxis::X) ? grid.sizeX() : (axis == SliceAxis::Y) ? grid.sizeY() : grid.sizeZ();
  if (index < 0 || index >= axisSize) {
    outError = std::string("slice index out of range for axis ") + SliceAxisName(axis) + ": " + std::to_string(index) +
               " (size " + std::to_string(axisSize) + ")";
    return false;
  }

  const int sz = grid.sizeZ();
  switch (axis) {
  case SliceAxis::Z: outImg = MakeSolidImage(grid.sizeX(), grid.sizeY(), opt.background); break;
  case SliceAxis::Y: outImg = MakeSolidImage(grid.sizeX(), sz, opt.background); break;
  case SliceAxis::X: outImg = MakeSolidImage(grid.sizeY(), sz, opt.background); break;
  }

  for (const Voxel& v : grid.voxels()) {
    switch (axis) {
    case SliceAxis::Z:
      if (v.pos.z == index) SetPixel(outImg, v.pos.x, v.pos.y, v.color);
      break;
    case SliceAxis::Y:
      if (v.pos.y == index) SetPixel(outImg, v.pos.x, sz - 1 - v.pos.z, v.color);
      break;
    case SliceAxis::X:
      if (v.pos.x == index) SetPixel(outImg, v.pos.y, sz - 1 - v.pos.z, v.color);
      break;
    }
  }
  return true;
}

} // namespace pixvox
