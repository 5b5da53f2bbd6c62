#include "pixvox/Binning.hpp"

#include "pixvox/Color.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace pixvox {

namespace {

inline std::string ToLower(std::string s)
{
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Integer span [begin,end) of source pixels covered by cell i out of n along an axis of
// `extent` pixels. Always at least one pixel wide so upsampling repeats pixels.
inline void CellSpan(int i, int n, int extent, int& outBegin, int& outEnd)
{
  const std::int64_t b = static_cast<std::int64_t>(i) * extent / n;
  std::int64_t e = static_cast<std::int64_t>(i + 1) * extent / n;
  if (e <= b) e = b + 1;
  outBegin = static_cast<int>(std::min<std::int64_t>(b, extent - 1));
  outEnd = static_cast<int>(std::min<std::int64_t>(e, extent));
}

inline int CenterSample(int i, int n, int extent)
{
  // floor((i + 0.5) * extent / n) without floating point.
  const std::int64_t s = (2 * static_cast<std::int64_t>(i) + 1) * extent / (2 * static_cast<std::int64_t>(n));
  return static_cast<int>(std::clamp<std::int64_t>(s, 0, extent - 1));
}

Rgb8 AverageArea(const ImageSource& src, int x0, int x1, int y0, int y1)
{
  std::uint64_t sr = 0;
  std::uint64_t sg = 0;
  std::uint64_t sb = 0;
  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      const Rgb8 p = src.pixel(x, y);
      sr += p.r;
      sg += p.g;
      sb += p.b;
    }
  }

  const std::uint64_t n = static_cast<std::uint64_t>(x1 - x0) * static_cast<std::uint64_t>(y1 - y0);
  const std::uint64_t half = n / 2u;
  return Rgb8{static_cast<std::uint8_t>((sr + half) / n), static_cast<std::uint8_t>((sg + half) / n),
              static_cast<std::uint8_t>((sb + half) / n)};
}

} // namespace

bool ParseBinningMode(const std::string& s, BinningMode& out)
{
  const std::string t = ToLower(s);
  if (t == "area" || t == "average" || t == "box") {
    out = BinningMode::Area;
    return true;
  }
  if (t == "nearest" || t == "point") {
    out = BinningMode::Nearest;
    return true;
  }
  return false;
}

const char* BinningModeName(BinningMode m)
{
  switch (m) {
  case BinningMode::Area: return "area";
  case BinningMode::Nearest: return "nearest";
  default: return "area";
  }
}

BinnedImage BinImage(const ImageSource& src, int resolution, BinningMode mode)
{
  BinnedImage out;
  const int w = src.width();
  const int h = src.height();
  if (resolution <= 0 || w <= 0 || h <= 0) return out;

  out.resolution = resolution;
  out.srcWidth = w;
  out.srcHeight = h;
  out.cells.resize(static_cast<std::size_t>(resolution) * static_cast<std::size_t>(resolution));

  for (int y = 0; y < resolution; ++y) {
    int y0 = 0;
    int y1 = 0;
    CellSpan(y, resolution, h, y0, y1);
    const int sy = CenterSample(y, resolution, h);

    for (int x = 0; x < resolution; ++x) {
      Rgb8 c;
      if (mode == BinningMode::Nearest) {
        c = src.pixel(CenterSample(x, resolution, w), sy);
      } else {
        int x0 = 0;
        int x1 = 0;
        CellSpan(x, resolution, w, x0, x1);
        c = AverageArea(src, x0, x1, y0, y1);
      }

      BinnedCell& cell = out.cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(resolution) + static_cast<std::size_t>(x)];
      cell.rgb = c;
      cell.luma = Luma8(c);
    }
  }

  return out;
}

} // namespace pixvox
