#pragma once

#include "pixvox/Image.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pixvox {

// -----------------------------------------------------------------------------------------------
// Binning
//
// Every converter works on a square resolution x resolution grid of cells regardless of the
// source image size. The source is resampled once, up front, and the result is shared read-only
// by all converters.
//
// Cell (x, y) covers the source rectangle
//   [x * W / N, (x + 1) * W / N) x [y * H / N, (y + 1) * H / N)
// in continuous pixel space.
// -----------------------------------------------------------------------------------------------

enum class BinningMode : std::uint8_t {
  Area = 0,    // average every source pixel whose footprint starts inside the cell rectangle
  Nearest = 1, // sample the source pixel under the cell center
};

bool ParseBinningMode(const std::string& s, BinningMode& out);
const char* BinningModeName(BinningMode m);

struct BinnedCell {
  Rgb8 rgb;
  std::uint8_t luma = 0;
};

struct BinnedImage {
  int resolution = 0;
  int srcWidth = 0;
  int srcHeight = 0;

  // resolution * resolution cells, row-major (y major).
  std::vector<BinnedCell> cells;

  const BinnedCell& at(int x, int y) const
  {
    return cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(resolution) + static_cast<std::size_t>(x)];
  }
};

// Resample `src` to resolution x resolution cells.
//
// Callers validate inputs (resolution > 0, non-empty source); for invalid inputs an empty
// BinnedImage is returned.
BinnedImage BinImage(const ImageSource& src, int resolution, BinningMode mode);

} // namespace pixvox
