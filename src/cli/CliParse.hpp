#pragma once

// Argument parsing for pixvox_cli.
//
// Every conversion option flag is described once in ConvertFlags(); main.cpp and the tests
// go through ApplyConvertFlag so a flag can never be parsed two different ways.

#include "pixvox/Convert.hpp"
#include "pixvox/VoxelPreview.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pixvox::cli {

// Whole-string base-10 integer. A leading '+' is accepted.
inline bool ParseInt(std::string_view s, int& out)
{
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const auto res = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (res.ec != std::errc() || res.ptr != s.data() + s.size()) return false;
  out = v;
  return true;
}

// Whole-string finite float.
inline bool ParseFloat(std::string_view s, float& out)
{
  if (s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const float v = std::strtof(tmp.c_str(), &end);
  if (errno == ERANGE || end != tmp.c_str() + tmp.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

// 0/1, on/off, true/false, yes/no in any letter case.
inline bool ParseToggle(std::string_view s, bool& out)
{
  std::string t;
  t.reserve(s.size());
  for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (t == "1" || t == "on" || t == "true" || t == "yes") {
    out = true;
    return true;
  }
  if (t == "0" || t == "off" || t == "false" || t == "no") {
    out = false;
    return true;
  }
  return false;
}

enum class OutputFormat : std::uint8_t { Npz = 0, Bin = 1, Both = 2 };

inline bool ParseOutputFormat(std::string_view s, OutputFormat& out)
{
  if (s == "npz") {
    out = OutputFormat::Npz;
  } else if (s == "bin") {
    out = OutputFormat::Bin;
  } else if (s == "both") {
    out = OutputFormat::Both;
  } else {
    return false;
  }
  return true;
}

inline bool WritesNpz(OutputFormat f) { return f == OutputFormat::Npz || f == OutputFormat::Both; }
inline bool WritesBin(OutputFormat f) { return f == OutputFormat::Bin || f == OutputFormat::Both; }

// --slice <axis>:<index>, e.g. "z:3".
struct SliceRequest {
  SliceAxis axis = SliceAxis::Z;
  int index = 0;
};

inline bool ParseSliceRequest(std::string_view s, SliceRequest& out)
{
  const std::size_t colon = s.find(':');
  if (colon == std::string_view::npos) return false;

  SliceRequest r;
  if (!ParseSliceAxis(std::string(s.substr(0, colon)), r.axis)) return false;
  if (!ParseInt(s.substr(colon + 1), r.index) || r.index < 0) return false;
  out = r;
  return true;
}

// Output file name for one grid, e.g. "height_slice_z3.png".
inline std::string SliceFileName(const std::string& method, const SliceRequest& r)
{
  return method + "_slice_" + SliceAxisName(r.axis) + std::to_string(r.index) + ".png";
}

// One conversion option reachable from the command line. `apply` returns false when the
// value does not parse; range checks are left to ValidateConvertOptions.
struct ConvertFlag {
  const char* name;
  const char* expected;
  bool (*apply)(std::string_view value, ConvertOptions& opt);
};

inline const std::vector<ConvertFlag>& ConvertFlags()
{
  static const std::vector<ConvertFlag> kFlags = {
      {"--resolution", "an integer", [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.voxelResolution); }},
      {"--binning", "area|nearest",
       [](std::string_view v, ConvertOptions& o) { return ParseBinningMode(std::string(v), o.binning); }},
      {"--threads", "an integer, 0 = auto", [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.threads); }},
      {"--max-height", "an integer",
       [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.height.maxHeight); }},
      {"--columns", "solid|shell",
       [](std::string_view v, ConvertOptions& o) { return ParseHeightColumnMode(std::string(v), o.height.columns); }},
      {"--layers", "an integer", [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.color.layers); }},
      {"--achromatic", "fallback|skip",
       [](std::string_view v, ConvertOptions& o) { return ParseAchromaticPolicy(std::string(v), o.color.achromatic); }},
      {"--achromatic-layer", "an integer",
       [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.color.achromaticLayer); }},
      {"--min-saturation", "an integer 0..255",
       [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.color.minSaturation); }},
      {"--min-value", "an integer 0..255",
       [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.color.minValue); }},
      {"--depth-levels", "an integer",
       [](std::string_view v, ConvertOptions& o) { return ParseInt(v, o.structure.depthLevels); }},
      {"--edge-threshold", "a number",
       [](std::string_view v, ConvertOptions& o) { return ParseFloat(v, o.structure.edgeThreshold); }},
      {"--depth-mode", "absolute|normalized",
       [](std::string_view v, ConvertOptions& o) {
         return ParseStructureDepthMode(std::string(v), o.structure.depthMode);
       }},
      {"--distance-scale", "a number",
       [](std::string_view v, ConvertOptions& o) { return ParseFloat(v, o.structure.distanceScale); }},
      {"--shade-depth", "0|1",
       [](std::string_view v, ConvertOptions& o) { return ParseToggle(v, o.structure.shadeByDepth); }},
  };
  return kFlags;
}

inline const ConvertFlag* FindConvertFlag(std::string_view name)
{
  for (const ConvertFlag& f : ConvertFlags()) {
    if (name == f.name) return &f;
  }
  return nullptr;
}

// Applies `value` to `opt` through `flag`. On a parse failure opt is left unchanged and
// outError names the flag and the accepted values.
inline bool ApplyConvertFlag(const ConvertFlag& flag, std::string_view value, ConvertOptions& opt,
                             std::string& outError)
{
  ConvertOptions next = opt;
  if (!flag.apply(value, next)) {
    outError = std::string("Invalid ") + flag.name + " '" + std::string(value) + "' (expected " + flag.expected + ")";
    return false;
  }
  opt = next;
  outError.clear();
  return true;
}

// Creates `dir` (and parents) if needed.
inline bool EnsureOutputDir(const std::filesystem::path& dir, std::string& outError)
{
  if (dir.empty()) {
    outError = "empty directory path";
    return false;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec || !std::filesystem::is_directory(dir, ec)) {
    outError = "cannot create directory '" + dir.string() + "'" + (ec ? ": " + ec.message() : std::string());
    return false;
  }
  outError.clear();
  return true;
}

// Creates the directory that will hold `file`. A bare file name needs nothing.
inline bool EnsureParentDir(const std::filesystem::path& file, std::string& outError)
{
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) {
    outError.clear();
    return true;
  }
  return EnsureOutputDir(parent, outError);
}

} // namespace pixvox::cli
