#pragma once

#include "pixvox/Binning.hpp"
#include "pixvox/VoxelGrid.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pixvox {

// -----------------------------------------------------------------------------------------------
// Edges + distance transform -> structural depth
//
// 1) Edge map: 3x3 Sobel on the binned luma, cell is an edge when |grad| >= edgeThreshold.
// 2) Exact Euclidean distance from every cell to the nearest edge cell.
// 3) Each non-edge cell becomes a solid column z = 0..top where top grows with the distance
//    (see StructureDepthMode), clamped to depthLevels - 1. Edge cells stay empty.
//
// Without any edge cell there is nothing to measure from and the grid is empty.
// -----------------------------------------------------------------------------------------------

enum class StructureDepthMode : std::uint8_t {
  Absolute = 0,   // top = round(distanceScale * d)
  Normalized = 1, // top = round(d / max(d) * (depthLevels - 1))
};

bool ParseStructureDepthMode(const std::string& s, StructureDepthMode& out);
const char* StructureDepthModeName(StructureDepthMode m);

struct StructureConfig {
  int depthLevels = 24;

  // Sobel magnitude threshold. A hard 0 -> 255 step produces 1020 on both sides of the step.
  float edgeThreshold = 128.0f;

  StructureDepthMode depthMode = StructureDepthMode::Absolute;
  float distanceScale = 1.0f;

  // Darken voxels with height: color * (1 - 0.5 * z / depthLevels).
  bool shadeByDepth = false;
};

// Debug/analysis view of the intermediate fields.
struct StructureFields {
  int resolution = 0;
  std::vector<std::uint8_t> edges; // 1 = edge cell
  std::vector<float> distance;     // Euclidean distance in cells; 0 on edges
  float maxDistance = 0.0f;
  int edgeCount = 0;
};

StructureFields ComputeStructureFields(const BinnedImage& img, const StructureConfig& cfg);

// Column top for a non-edge cell at distance d (d > 0).
int StructureColumnTop(float d, float maxDistance, const StructureConfig& cfg);

Rgb8 ShadeByDepth(Rgb8 c, int z, int depthLevels);

VoxelGrid BuildStructureVoxels(const BinnedImage& img, const StructureConfig& cfg);

} // namespace pixvox
