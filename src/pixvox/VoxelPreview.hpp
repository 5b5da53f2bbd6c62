#pragma once

#include "pixvox/Image.hpp"
#include "pixvox/VoxelGrid.hpp"

#include <cstdint>
#include <string>

namespace pixvox {

// Flat 2D views of a voxel grid for quick visual checks. No lighting.

struct PreviewOptions {
  Rgb8 background{0, 0, 0};

  // Top-down view: scale the visible color by 0.5 + 0.5 * (z + 1) / sizeZ so higher
  // columns read brighter.
  bool darkenByDepth = true;
};

// sizeX x sizeY image showing the color of the highest voxel in every (x, y) column.
bool RenderTopDown(const VoxelGrid& grid, const PreviewOptions& opt, RgbImage& outImg, std::string& outError);

enum class SliceAxis : std::uint8_t { X = 0, Y = 1, Z = 2 };

bool ParseSliceAxis(const std::string& s, SliceAxis& out);
const char* SliceAxisName(SliceAxis a);

// Axis-aligned cross-section at `index` along `axis`:
//   Z: sizeX x sizeY, pixel (x, y)
//   Y: sizeX x sizeZ, pixel (x, sizeZ - 1 - z)   (z up)
//   X: sizeY x sizeZ, pixel (y, sizeZ - 1 - z)   (z up)
// Empty cells use opt.background.
bool RenderSlice(const VoxelGrid& grid, SliceAxis axis, int index, const PreviewOptions& opt, RgbImage& outImg,
                 std::string& outError);

} // namespace pixvox
