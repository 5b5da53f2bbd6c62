#pragma once

#include "pixvox/Convert.hpp"
#include "pixvox/Json.hpp"

#include <string>

namespace pixvox {

// JSON helpers for ConvertOptions.
//
// Layout (snake_case keys):
//   {
//     "voxel_resolution": 64, "binning": "area", "threads": 1,
//     "height":    { "max_height": 32, "columns": "solid" },
//     "color":     { "layers": 16, "achromatic": "fallback", "achromatic_layer": 0,
//                    "min_saturation": 30, "min_value": 30 },
//     "structure": { "depth_levels": 24, "edge_threshold": 128, "depth_mode": "absolute",
//                    "distance_scale": 1, "shade_by_depth": false }
//   }
//
// Apply* has merge semantics: missing keys leave the existing value unchanged, present keys
// with the wrong JSON type are errors. Unknown keys are ignored. Range checks are left to
// ValidateConvertOptions.

std::string ConvertOptionsToJson(const ConvertOptions& opt, int indentSpaces = 2);

bool ApplyConvertOptionsJson(const JsonValue& root, ConvertOptions& ioOpt, std::string& outError);

bool WriteConvertOptionsJsonFile(const std::string& path, const ConvertOptions& opt, std::string& outError,
                                 int indentSpaces = 2);
bool LoadConvertOptionsJsonFile(const std::string& path, ConvertOptions& ioOpt, std::string& outError);

} // namespace pixvox
