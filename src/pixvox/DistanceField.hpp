#pragma once

#include <cstdint>
#include <vector>

namespace pixvox {

// Grid helpers used by the structure converter. All grids are row-major w*h arrays.

// 3x3 Sobel gradient magnitude of an 8-bit scalar grid. Samples outside the grid are
// clamped to the nearest border cell, so a uniform grid has zero gradient everywhere
// (including its border).
std::vector<float> SobelMagnitude(const std::vector<std::uint8_t>& values, int w, int h);

// 1 where magnitude >= threshold, 0 elsewhere.
std::vector<std::uint8_t> ThresholdMask(const std::vector<float>& magnitude, float threshold);

// Exact squared Euclidean distance from each cell to the nearest feature cell
// (features[i] != 0), using the separable Felzenszwalb-Huttenlocher transform.
//
// Feature cells get 0. When there are no feature cells at all, every output value is
// kNoFeatureDistanceSq.
constexpr float kNoFeatureDistanceSq = 1.0e20f;
void DistanceTransform2DSq(const std::vector<std::uint8_t>& features, int w, int h, std::vector<float>& outSq);

} // namespace pixvox
