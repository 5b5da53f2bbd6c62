#pragma once

#include "pixvox/Binning.hpp"
#include "pixvox/ColorLayerer.hpp"
#include "pixvox/HeightMapper.hpp"
#include "pixvox/Image.hpp"
#include "pixvox/Method.hpp"
#include "pixvox/StructureBuilder.hpp"
#include "pixvox/VoxelGrid.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace pixvox {

// Upper bound shared by every integer size option (resolution, heights, layers, depth levels).
constexpr int kMaxGridAxis = 4096;
constexpr int kMaxThreads = 256;

struct ConvertOptions {
  // Side length of the square binned grid (and the x/y extent of every output grid).
  int voxelResolution = 64;
  BinningMode binning = BinningMode::Area;

  HeightMapConfig height;
  ColorLayerConfig color;
  StructureConfig structure;

  // Only used by ConvertMethod::All. 1 = sequential, 0 = hardware concurrency.
  int threads = 1;
};

enum class ConvertErrorCode : std::uint8_t {
  None = 0,
  InvalidMethod = 1,
  InvalidImage = 2,
  InvalidConfiguration = 3,
};

const char* ConvertErrorCodeName(ConvertErrorCode c);

struct ConvertError {
  ConvertErrorCode code = ConvertErrorCode::None;
  std::string message;
};

// Method name ("height", "color", "structure") -> grid. Single-method conversions
// hold exactly one entry.
using ConversionResult = std::map<std::string, VoxelGrid>;

// Largest grid `method` can produce under `opt` (the tallest grid for ConvertMethod::All).
std::uint64_t WorstCaseVoxelCount(const ConvertOptions& opt, ConvertMethod method);

// Range-checks every option, then bounds WorstCaseVoxelCount(opt, method) by kMaxVoxels.
bool ValidateConvertOptions(const ConvertOptions& opt, ConvertMethod method, ConvertError& outError);
inline bool ValidateConvertOptions(const ConvertOptions& opt, ConvertError& outError)
{
  return ValidateConvertOptions(opt, ConvertMethod::All, outError);
}

// Validate, bin once, then run the selected converter(s).
//
// All errors are detected before any converter runs; on failure outResult is left empty.
// An allocation failure while building is reported as InvalidConfiguration.
bool Convert(const ImageSource& src, ConvertMethod method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError);
bool Convert(const ImageSource& src, const std::string& method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError);

// Same as above, additionally checking that the RGB buffer matches the image size.
bool Convert(const RgbImage& img, ConvertMethod method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError);
bool Convert(const RgbImage& img, const std::string& method, const ConvertOptions& opt, ConversionResult& outResult,
             ConvertError& outError);

// Convenience for a single concrete method. ConvertMethod::All is rejected as InvalidMethod.
bool ConvertSingle(const ImageSource& src, ConvertMethod method, const ConvertOptions& opt, VoxelGrid& outGrid,
                   ConvertError& outError);

// Run one concrete converter on an already binned grid. No validation.
VoxelGrid RunConverter(const BinnedImage& img, ConvertMethod method, const ConvertOptions& opt);

} // namespace pixvox
