#include "cli/CliParse.hpp"

#include "pixvox/Convert.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

using namespace pixvox;
using namespace pixvox::cli;

static void TestScalarParsers()
{
  int i = -1;
  EXPECT_TRUE(ParseInt("128", i));
  EXPECT_EQ(i, 128);
  EXPECT_TRUE(ParseInt("+7", i));
  EXPECT_EQ(i, 7);
  EXPECT_TRUE(ParseInt("-3", i));
  EXPECT_EQ(i, -3);

  i = 42;
  EXPECT_FALSE(ParseInt("", i));
  EXPECT_FALSE(ParseInt("+", i));
  EXPECT_FALSE(ParseInt("64px", i));
  EXPECT_FALSE(ParseInt(" 64", i));
  EXPECT_FALSE(ParseInt("2147483648", i));
  EXPECT_EQ(i, 42);

  float f = 0.0f;
  EXPECT_TRUE(ParseFloat("64.5", f));
  EXPECT_EQ(f, 64.5f);
  EXPECT_TRUE(ParseFloat("-0.25", f));
  EXPECT_EQ(f, -0.25f);

  f = 9.0f;
  EXPECT_FALSE(ParseFloat("", f));
  EXPECT_FALSE(ParseFloat("nan", f));
  EXPECT_FALSE(ParseFloat("inf", f));
  EXPECT_FALSE(ParseFloat("1e40", f));
  EXPECT_FALSE(ParseFloat("1.5x", f));
  EXPECT_FALSE(ParseFloat(" 1.5", f));
  EXPECT_EQ(f, 9.0f);

  bool b = false;
  EXPECT_TRUE(ParseToggle("ON", b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseToggle("No", b));
  EXPECT_FALSE(b);
  EXPECT_TRUE(ParseToggle("1", b));
  EXPECT_TRUE(b);
  EXPECT_FALSE(ParseToggle("maybe", b));
  EXPECT_FALSE(ParseToggle("", b));
  EXPECT_TRUE(b);
}

static void TestConvertFlagTable()
{
  std::set<std::string> names;
  for (const ConvertFlag& f : ConvertFlags()) {
    const std::string name = f.name;
    EXPECT_TRUE(name.rfind("--", 0) == 0);
    EXPECT_TRUE(names.insert(name).second);
    EXPECT_TRUE(f.apply != nullptr);
    EXPECT_TRUE(FindConvertFlag(name) == &f);
  }
  EXPECT_EQ(names.size(), static_cast<std::size_t>(15));

  // Flags that are not conversion options stay with main.cpp.
  EXPECT_TRUE(FindConvertFlag("--input") == nullptr);
  EXPECT_TRUE(FindConvertFlag("--slice") == nullptr);
  EXPECT_TRUE(FindConvertFlag("--method") == nullptr);
  EXPECT_TRUE(FindConvertFlag("resolution") == nullptr);
}

static bool Apply(const char* flag, const char* value, ConvertOptions& opt, std::string& err)
{
  const ConvertFlag* f = FindConvertFlag(flag);
  if (!f) {
    err = std::string("no such flag ") + flag;
    return false;
  }
  return ApplyConvertFlag(*f, value, opt, err);
}

static void TestApplyConvertFlags()
{
  ConvertOptions opt;
  std::string err;

  EXPECT_TRUE(Apply("--resolution", "128", opt, err));
  EXPECT_TRUE(Apply("--binning", "nearest", opt, err));
  EXPECT_TRUE(Apply("--threads", "0", opt, err));
  EXPECT_TRUE(Apply("--max-height", "12", opt, err));
  EXPECT_TRUE(Apply("--columns", "shell", opt, err));
  EXPECT_TRUE(Apply("--layers", "8", opt, err));
  EXPECT_TRUE(Apply("--achromatic", "skip", opt, err));
  EXPECT_TRUE(Apply("--achromatic-layer", "5", opt, err));
  EXPECT_TRUE(Apply("--min-saturation", "40", opt, err));
  EXPECT_TRUE(Apply("--min-value", "20", opt, err));
  EXPECT_TRUE(Apply("--depth-levels", "10", opt, err));
  EXPECT_TRUE(Apply("--edge-threshold", "64.5", opt, err));
  EXPECT_TRUE(Apply("--depth-mode", "normalized", opt, err));
  EXPECT_TRUE(Apply("--distance-scale", "0.5", opt, err));
  EXPECT_TRUE(Apply("--shade-depth", "yes", opt, err));
  EXPECT_TRUE(err.empty());

  EXPECT_EQ(opt.voxelResolution, 128);
  EXPECT_EQ(opt.binning, BinningMode::Nearest);
  EXPECT_EQ(opt.threads, 0);
  EXPECT_EQ(opt.height.maxHeight, 12);
  EXPECT_EQ(opt.height.columns, HeightColumnMode::Shell);
  EXPECT_EQ(opt.color.layers, 8);
  EXPECT_EQ(opt.color.achromatic, AchromaticPolicy::Skip);
  EXPECT_EQ(opt.color.achromaticLayer, 5);
  EXPECT_EQ(opt.color.minSaturation, 40);
  EXPECT_EQ(opt.color.minValue, 20);
  EXPECT_EQ(opt.structure.depthLevels, 10);
  EXPECT_EQ(opt.structure.edgeThreshold, 64.5f);
  EXPECT_EQ(opt.structure.depthMode, StructureDepthMode::Normalized);
  EXPECT_EQ(opt.structure.distanceScale, 0.5f);
  EXPECT_TRUE(opt.structure.shadeByDepth);

  ConvertError verr;
  EXPECT_TRUE(ValidateConvertOptions(opt, verr));

  // A bad value names the flag and what it accepts, and leaves the options alone.
  EXPECT_FALSE(Apply("--columns", "hollow", opt, err));
  EXPECT_TRUE(err.find("--columns") != std::string::npos);
  EXPECT_TRUE(err.find("solid|shell") != std::string::npos);
  EXPECT_EQ(opt.height.columns, HeightColumnMode::Shell);

  EXPECT_FALSE(Apply("--resolution", "12px", opt, err));
  EXPECT_EQ(opt.voxelResolution, 128);
  EXPECT_FALSE(Apply("--depth-mode", "linear", opt, err));
  EXPECT_EQ(opt.structure.depthMode, StructureDepthMode::Normalized);
  EXPECT_FALSE(Apply("--edge-threshold", "nan", opt, err));
  EXPECT_EQ(opt.structure.edgeThreshold, 64.5f);
  EXPECT_FALSE(Apply("--shade-depth", "2", opt, err));
  EXPECT_TRUE(opt.structure.shadeByDepth);

  // Parsing accepts any integer; the range belongs to ValidateConvertOptions.
  ConvertOptions big;
  EXPECT_TRUE(Apply("--resolution", "4096", big, err));
  EXPECT_TRUE(Apply("--max-height", "4096", big, err));
  EXPECT_FALSE(ValidateConvertOptions(big, ConvertMethod::Height, verr));
  EXPECT_EQ(verr.code, ConvertErrorCode::InvalidConfiguration);
  EXPECT_TRUE(Apply("--columns", "shell", big, err));
  EXPECT_TRUE(Apply("--depth-levels", "1", big, err));
  EXPECT_TRUE(ValidateConvertOptions(big, ConvertMethod::Height, verr));

  ConvertOptions zero;
  EXPECT_TRUE(Apply("--resolution", "0", zero, err));
  EXPECT_FALSE(ValidateConvertOptions(zero, verr));
  EXPECT_TRUE(verr.message.find("voxel_resolution") != std::string::npos);
}

static void TestSliceAndFormat()
{
  SliceRequest r;
  EXPECT_TRUE(ParseSliceRequest("z:3", r));
  EXPECT_EQ(r.axis, SliceAxis::Z);
  EXPECT_EQ(r.index, 3);
  EXPECT_TRUE(ParseSliceRequest("X:0", r));
  EXPECT_EQ(r.axis, SliceAxis::X);
  EXPECT_EQ(r.index, 0);

  r = SliceRequest{SliceAxis::Y, 7};
  EXPECT_FALSE(ParseSliceRequest("z", r));
  EXPECT_FALSE(ParseSliceRequest("z:", r));
  EXPECT_FALSE(ParseSliceRequest("z:-1", r));
  EXPECT_FALSE(ParseSliceRequest("w:2", r));
  EXPECT_FALSE(ParseSliceRequest("zz:2", r));
  EXPECT_FALSE(ParseSliceRequest(":2", r));
  EXPECT_EQ(r.axis, SliceAxis::Y);
  EXPECT_EQ(r.index, 7);

  EXPECT_EQ(SliceFileName("height", r), std::string("height_slice_y7.png"));
  EXPECT_EQ(SliceFileName("structure", SliceRequest{SliceAxis::X, 12}), std::string("structure_slice_x12.png"));

  OutputFormat fmt = OutputFormat::Npz;
  EXPECT_TRUE(ParseOutputFormat("both", fmt));
  EXPECT_TRUE(WritesNpz(fmt));
  EXPECT_TRUE(WritesBin(fmt));
  EXPECT_TRUE(ParseOutputFormat("bin", fmt));
  EXPECT_FALSE(WritesNpz(fmt));
  EXPECT_TRUE(WritesBin(fmt));
  EXPECT_TRUE(ParseOutputFormat("npz", fmt));
  EXPECT_TRUE(WritesNpz(fmt));
  EXPECT_FALSE(WritesBin(fmt));
  EXPECT_FALSE(ParseOutputFormat("zip", fmt));
  EXPECT_FALSE(ParseOutputFormat("NPZ", fmt));
  EXPECT_EQ(fmt, OutputFormat::Npz);
}

static void TestOutputDirs()
{
  const fs::path base = MakeTempPath("pixvox_cli_dirs");
  std::error_code ec;
  std::string err;

  EXPECT_FALSE(EnsureOutputDir(fs::path{}, err));
  EXPECT_FALSE(err.empty());

  EXPECT_TRUE(EnsureOutputDir(base / "run" / "grids", err));
  EXPECT_TRUE(err.empty());
  EXPECT_TRUE(fs::is_directory(base / "run" / "grids"));
  EXPECT_TRUE(EnsureOutputDir(base / "run" / "grids", err));

  EXPECT_TRUE(EnsureParentDir(fs::path("report.json"), err));

  const fs::path report = base / "reports" / "convert.json";
  EXPECT_TRUE(EnsureParentDir(report, err));
  EXPECT_TRUE(fs::is_directory(base / "reports"));
  EXPECT_FALSE(fs::exists(report));

  // A regular file in the way of the output directory.
  const fs::path blocker = base / "run" / "taken";
  {
    std::ofstream f(blocker);
    f << "x";
  }
  EXPECT_FALSE(EnsureOutputDir(blocker, err));
  EXPECT_TRUE(err.find("taken") != std::string::npos);

  fs::remove_all(base, ec);
}

int main()
{
  TestScalarParsers();
  TestConvertFlagTable();
  TestApplyConvertFlags();
  TestSliceAndFormat();
  TestOutputDirs();

  if (g_failures == 0) {
    std::cout << "pixvox_cli_parse_tests: OK\n";
    return 0;
  }

  std::cerr << "pixvox_cli_parse_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
