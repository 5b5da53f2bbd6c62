#pragma once

#include "pixvox/Binning.hpp"
#include "pixvox/Color.hpp"
#include "pixvox/VoxelGrid.hpp"

#include <cstdint>
#include <string>

namespace pixvox {

// -----------------------------------------------------------------------------------------------
// Hue -> depth layer
//
// Each binned cell becomes a single voxel on the layer of its hue bucket:
//   layer = floor(hue * layers / 360), clamped to [0, layers)
// Cells are never stacked, so the result is a set of thin slabs (one per hue bucket).
//
// Hue is meaningless for grays and near-black colors. A cell is treated as achromatic when
//   saturation <= minSaturation  or  value <= minValue   (0..255 scale)
// and is then handled by `achromatic`.
// -----------------------------------------------------------------------------------------------

enum class AchromaticPolicy : std::uint8_t {
  FallbackLayer = 0, // place on ColorLayerConfig::achromaticLayer
  Skip = 1,          // emit nothing for the cell
};

bool ParseAchromaticPolicy(const std::string& s, AchromaticPolicy& out);
const char* AchromaticPolicyName(AchromaticPolicy p);

struct ColorLayerConfig {
  int layers = 16;

  AchromaticPolicy achromatic = AchromaticPolicy::FallbackLayer;
  int achromaticLayer = 0;

  int minSaturation = 30;
  int minValue = 30;
};

bool IsAchromatic(const HsvColor& hsv, const ColorLayerConfig& cfg);

// Hue bucket in [0, layers). layers <= 0 yields 0.
int HueToLayer(double hueDegrees, int layers);

VoxelGrid BuildColorLayerVoxels(const BinnedImage& img, const ColorLayerConfig& cfg);

} // namespace pixvox
