#include "pixvox/DistanceField.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace pixvox {

namespace {

inline std::size_t Idx(int x, int y, int w)
{
  return static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
}

inline float SampleClamped(const std::vector<std::uint8_t>& v, int w, int h, int x, int y)
{
  x = std::clamp(x, 0, w - 1);
  y = std::clamp(y, 0, h - 1);
  return static_cast<float>(v[Idx(x, y, w)]);
}

// 1D squared distance transform of the sampled function f (0 at features, large elsewhere).
// v and z are scratch buffers of size n and n + 1.
void DistanceTransform1DSq(const float* f, int n, float* outD, int* v, float* z)
{
  if (n <= 0) return;

  int k = 0;
  v[0] = 0;
  z[0] = -kNoFeatureDistanceSq;
  z[1] = +kNoFeatureDistanceSq;

  // Intersection of the parabolas rooted at q and v[k].
  auto intersect = [&](int q, int vk) {
    const float num = (f[q] + static_cast<float>(q) * static_cast<float>(q)) -
                      (f[vk] + static_cast<float>(vk) * static_cast<float>(vk));
    return num / (2.0f * static_cast<float>(q - vk));
  };

  for (int q = 1; q < n; ++q) {
    float s = intersect(q, v[k]);
    while (k > 0 && s <= z[k]) {
      --k;
      s = intersect(q, v[k]);
    }
    ++k;
    v[k] = q;
    z[k] = s;
    z[k + 1] = +kNoFeatureDistanceSq;
  }

  k = 0;
  for (int q = 0; q < n; ++q) {
    while (z[k + 1] < static_cast<float>(q)) ++k;
    const float dx = static_cast<float>(q - v[k]);
    outD[q] = std::min(dx * dx + f[v[k]], kNoFeatureDistanceSq);
  }
}

} // namespace

std::vector<float> SobelMagnitude(const std::vector<std::uint8_t>& values, int w, int h)
{
  std::vector<float> out;
  if (w <= 0 || h <= 0) return out;
  if (values.size() != static_cast<std::size_t>(w) * static_cast<std::size_t>(h)) return out;

  out.assign(values.size(), 0.0f);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const float tl = SampleClamped(values, w, h, x - 1, y - 1);
      const float tc = SampleClamped(values, w, h, x + 0, y - 1);
      const float tr = SampleClamped(values, w, h, x + 1, y - 1);
      const float ml = SampleClamped(values, w, h, x - 1, y + 0);
      const float mr = SampleClamped(values, w, h, x + 1, y + 0);
      const float bl = SampleClamped(values, w, h, x - 1, y + 1);
      const float bc = SampleClamped(values, w, h, x + 0, y + 1);
      const float br = SampleClamped(values, w, h, x + 1, y + 1);

      // y increases downwards here.
      const float gx = (-tl + tr) + (-2.0f * ml + 2.0f * mr) + (-bl + br);
      const float gy = (-tl - 2.0f * tc - tr) + (bl + 2.0f * bc + br);

      out[Idx(x, y, w)] = std::sqrt(gx * gx + gy * gy);
    }
  }
  return out;
}

std::vector<std::uint8_t> ThresholdMask(const std::vector<float>& magnitude, float threshold)
{
  std::vector<std::uint8_t> mask(magnitude.size(), std::uint8_t{0});
  for (std::size_t i = 0; i < magnitude.size(); ++i) {
    if (magnitude[i] >= threshold) mask[i] = 1u;
  }
  return mask;
}

void DistanceTransform2DSq(const std::vector<std::uint8_t>& features, int w, int h, std::vector<float>& outSq)
{
  const std::size_t npx = static_cast<std::size_t>(std::max(0, w)) * static_cast<std::size_t>(std::max(0, h));
  outSq.assign(npx, kNoFeatureDistanceSq);
  if (w <= 0 || h <= 0) return;
  if (features.size() != npx) return;
  if (std::none_of(features.begin(), features.end(), [](std::uint8_t b) { return b != 0u; })) return;

  std::vector<float> g(npx, kNoFeatureDistanceSq);

  const int n = std::max(w, h);
  std::vector<float> f(static_cast<std::size_t>(n), kNoFeatureDistanceSq);
  std::vector<float> d(static_cast<std::size_t>(n), kNoFeatureDistanceSq);
  std::vector<int> v(static_cast<std::size_t>(n), 0);
  std::vector<float> z(static_cast<std::size_t>(n) + 1u, 0.0f);

  // Rows.
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      f[static_cast<std::size_t>(x)] = (features[Idx(x, y, w)] != 0u) ? 0.0f : kNoFeatureDistanceSq;
    }
    DistanceTransform1DSq(f.data(), w, d.data(), v.data(), z.data());
    for (int x = 0; x < w; ++x) g[Idx(x, y, w)] = d[static_cast<std::size_t>(x)];
  }

  // Columns.
  for (int x = 0; x < w; ++x) {
    for (int y = 0; y < h; ++y) f[static_cast<std::size_t>(y)] = g[Idx(x, y, w)];
    DistanceTransform1DSq(f.data(), h, d.data(), v.data(), z.data());
    for (int y = 0; y < h; ++y) outSq[Idx(x, y, w)] = d[static_cast<std::size_t>(y)];
  }
}

} // namespace pixvox
