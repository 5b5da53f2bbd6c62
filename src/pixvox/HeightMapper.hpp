#pragma once

#include "pixvox/Binning.hpp"
#include "pixvox/VoxelGrid.hpp"

#include <cstdint>
#include <string>

namespace pixvox {

// -----------------------------------------------------------------------------------------------
// Brightness -> height
//
// Each binned cell becomes a column whose height is proportional to its luma:
//   z = round(luma * maxHeight / 255)
// so the z axis spans [0, maxHeight] and the grid's sizeZ is maxHeight + 1.
// A black cell still gets its z = 0 voxel (zero height, not a missing column).
// -----------------------------------------------------------------------------------------------

enum class HeightColumnMode : std::uint8_t {
  Solid = 0, // fill [0, z] (terrain look)
  Shell = 1, // only the topmost voxel at z
};

bool ParseHeightColumnMode(const std::string& s, HeightColumnMode& out);
const char* HeightColumnModeName(HeightColumnMode m);

struct HeightMapConfig {
  int maxHeight = 32;
  HeightColumnMode columns = HeightColumnMode::Solid;
};

// Quantized column height for a luma value (round half up).
int LumaToHeight(std::uint8_t luma, int maxHeight);

VoxelGrid BuildHeightVoxels(const BinnedImage& img, const HeightMapConfig& cfg);

} // namespace pixvox
