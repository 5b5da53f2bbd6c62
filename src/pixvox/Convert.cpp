#include "pixvox/Convert.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <new>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace pixvox {

namespace {

bool Fail(ConvertError& err, ConvertErrorCode code, const std::string& msg)
{
  err.code = code;
  err.message = msg;
  return false;
}

bool CheckRange(const char* name, int v, int lo, int hi, ConvertError& err)
{
  if (v >= lo && v <= hi) return true;
  std::ostringstream oss;
  oss << name << " must be in [" << lo << ", " << hi << "] (got " << v << ")";
  return Fail(err, ConvertErrorCode::InvalidConfiguration, oss.str());
}

bool CheckPositiveFinite(const char* name, float v, ConvertError& err)
{
  if (std::isfinite(v) && v > 0.0f) return true;
  std::ostringstream oss;
  oss << name << " must be a positive finite number (got " << v << ")";
  return Fail(err, ConvertErrorCode::InvalidConfiguration, oss.str());
}

bool ValidateSource(const ImageSource& src, ConvertError& err)
{
  if (src.width() <= 0 || src.height() <= 0) {
    std::ostringstream oss;
    oss << "image has no pixels (" << src.width() << "x" << src.height() << ")";
    return Fail(err, ConvertErrorCode::InvalidImage, oss.str());
  }
  return true;
}

bool CheckMethod(ConvertMethod method, ConvertError& err)
{
  if (IsKnownConvertMethod(method)) return true;
  std::ostringstream oss;
  oss << "unknown conversion method id " << static_cast<int>(method);
  return Fail(err, ConvertErrorCode::InvalidMethod, oss.str());
}

int ResolveThreads(int requested, int jobs)
{
  int threads = requested;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) threads = 1;
  }
  return std::min(threads, jobs);
}

constexpr std::array<ConvertMethod, 3> kConcreteMethods = {ConvertMethod::Height, ConvertMethod::Color,
                                                           ConvertMethod::Structure};

} // namespace

const char* ConvertErrorCodeName(ConvertErrorCode c)
{
  switch (c) {
  case ConvertErrorCode::None: return "none";
  case ConvertErrorCode::InvalidMethod: return "invalid_method";
  case ConvertErrorCode::InvalidImage: return "invalid_image";
  case ConvertErrorCode::InvalidConfiguration: return "invalid_configuration";
  default: return "unknown";
  }
}

std::uint64_t WorstCaseVoxelCount(const ConvertOptions& opt, ConvertMethod method)
{
  const std::uint64_t cells = static_cast<std::uint64_t>(std::max(0, opt.voxelResolution)) *
                              static_cast<std::uint64_t>(std::max(0, opt.voxelResolution));
  const std::uint64_t heightColumn =
      (opt.height.columns == HeightColumnMode::Solid) ? static_cast<std::uint64_t>(std::max(0, opt.height.maxHeight)) + 1u
                                                      : 1u;
  const std::uint64_t structureColumn = static_cast<std::uint64_t>(std::max(0, opt.structure.depthLevels));

  switch (method) {
  case ConvertMethod::Height: return cells * heightColumn;
  case ConvertMethod::Color: return cells;
  case ConvertMethod::Structure: return cells * structureColumn;
  case ConvertMethod::All: return cells * std::max<std::uint64_t>({heightColumn, 1u, structureColumn});
  default: return 0;
  }
}

bool ValidateConvertOptions(const ConvertOptions& opt, ConvertMethod method, ConvertError& outError)
{
  if (!CheckRange("voxel_resolution", opt.voxelResolution, 1, kMaxGridAxis, outError)) return false;
  if (!CheckRange("threads", opt.threads, 0, kMaxThreads, outError)) return false;

  if (!CheckRange("height.max_height", opt.height.maxHeight, 1, kMaxGridAxis, outError)) return false;

  if (!CheckRange("color.layers", opt.color.layers, 1, kMaxGridAxis, outError)) return false;
  if (!CheckRange("color.achromatic_layer", opt.color.achromaticLayer, 0, opt.color.layers - 1, outError)) return false;
  if (!CheckRange("color.min_saturation", opt.color.minSaturation, 0, 255, outError)) return false;
  if (!CheckRange("color.min_value", opt.color.minValue, 0, 255, outError)) return false;

  if (!CheckRange("structure.depth_levels", opt.structure.depthLevels, 1, kMaxGridAxis, outError)) return false;
  if (!CheckPositiveFinite("structure.edge_threshold", opt.structure.edgeThreshold, outError)) return false;
  if (!CheckPositiveFinite("structure.distance_scale", opt.structure.distanceScale, outError)) return false;

  const std::uint64_t worst = WorstCaseVoxelCount(opt, method);
  if (worst > kMaxVoxels) {
    std::ostringstream oss;
    oss << ConvertMethodName(method) << " grid could hold " << worst << " voxels, more than the limit of " << kMaxVoxels
        << " (lower voxel_resolution or the z extent)";
    return Fail(outError, ConvertErrorCode::InvalidConfiguration, oss.str());
  }

  outError = ConvertError{};
  return true;
}

VoxelGrid RunConverter(const BinnedImage& img, ConvertMethod method, const ConvertOptions& opt)
{
  switch (method) {
  case ConvertMethod::Height: return BuildHeightVoxels(img, opt.height);
  case ConvertMethod::Color: return BuildColorLayerVoxels(img, opt.color);
  case ConvertMethod::Structure: return BuildStructureVoxels(img, opt.structure);
  default: return VoxelGrid{};
  }
}

bool Convert(const ImageSource& src, ConvertMethod method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError)
{
  outResult.clear();
  outError = ConvertError{};

  if (!CheckMethod(method, outError)) return false;
  if (!ValidateSource(src, outError)) return false;
  if (!ValidateConvertOptions(opt, method, outError)) return false;

  try {
    const BinnedImage binned = BinImage(src, opt.voxelResolution, opt.binning);

    if (method != ConvertMethod::All) {
      outResult.emplace(ConvertMethodName(method), RunConverter(binned, method, opt));
      return true;
    }

    // Fixed slots so the threaded run produces exactly the sequential result.
    std::array<VoxelGrid, kConcreteMethods.size()> slots;
    const int threads = ResolveThreads(opt.threads, static_cast<int>(kConcreteMethods.size()));

    if (threads <= 1) {
      for (std::size_t i = 0; i < kConcreteMethods.size(); ++i) slots[i] = RunConverter(binned, kConcreteMethods[i], opt);
    } else {
      std::atomic<std::size_t> next{0};
      std::array<std::exception_ptr, kConcreteMethods.size()> failures;
      std::vector<std::thread> pool;
      pool.reserve(static_cast<std::size_t>(threads));

      for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&]() {
          for (;;) {
            const std::size_t i = next.fetch_add(1);
            if (i >= kConcreteMethods.size()) break;
            try {
              slots[i] = RunConverter(binned, kConcreteMethods[i], opt);
            } catch (const std::bad_alloc&) {
              failures[i] = std::current_exception();
            }
          }
        });
      }
      for (auto& th : pool) th.join();

      for (const std::exception_ptr& f : failures) {
        if (f) std::rethrow_exception(f);
      }
    }

    for (std::size_t i = 0; i < kConcreteMethods.size(); ++i) {
      outResult.emplace(ConvertMethodName(kConcreteMethods[i]), std::move(slots[i]));
    }
  } catch (const std::bad_alloc&) {
    outResult.clear();
    return Fail(outError, ConvertErrorCode::InvalidConfiguration,
                "out of memory while building voxel grids (lower voxel_resolution or the z extent)");
  }
  return true;
}

bool Convert(const ImageSource& src, const std::string& method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError)
{
  outResult.clear();
  ConvertMethod m = ConvertMethod::All;
  if (!ParseConvertMethod(method, m)) {
    return Fail(outError, ConvertErrorCode::InvalidMethod,
                "unknown conversion method '" + method + "' (expected height|color|structure|all)");
  }
  return Convert(src, m, opt, outResult, outError);
}

bool Convert(const RgbImage& img, ConvertMethod method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError)
{
  outResult.clear();
  if (!CheckMethod(method, outError)) return false;
  std::string err;
  if (!ValidateRgbImage(img, err)) return Fail(outError, ConvertErrorCode::InvalidImage, err);

  const RgbImageSource src(img);
  return Convert(src, method, opt, outResult, outError);
}

bool Convert(const RgbImage& img, const std::string& method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError)
{
  outResult.clear();
  ConvertMethod m = ConvertMethod::All;
  if (!ParseConvertMethod(method, m)) {
    return Fail(outError, ConvertErrorCode::InvalidMethod,
                "unknown conversion method '" + method + "' (expected height|color|structure|all)");
  }
  return Convert(img, m, opt, outResult, outError);
}

bool ConvertSingle(const ImageSource& src, ConvertMethod method, const ConvertOptions& opt, VoxelGrid& outGrid,
                   ConvertError& outError)
{
  outGrid = VoxelGrid{};
  if (method == ConvertMethod::All) {
    return Fail(outError, ConvertErrorCode::InvalidMethod, "ConvertSingle needs a concrete method, not 'all'");
  }

  ConversionResult res;
  if (!Convert(src, method, opt, res, outError)) return false;

  auto it = res.find(ConvertMethodName(method));
  if (it == res.end()) {
    return Fail(outError, ConvertErrorCode::InvalidMethod, std::string("no result for method ") + ConvertMethodName(method));
  }
  outGrid = std::move(it->second);
  return true;
}

} // namespace pixvox
