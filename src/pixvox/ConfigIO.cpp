#include "pixvox/ConfigIO.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace pixvox {

namespace {

std::string WrongType(const char* key, const char* expected, const JsonValue& got)
{
  return std::string("expected ") + expected + " for key '" + key + "' (got " + JsonTypeName(got.type) + ")";
}

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = WrongType(key, "boolean", *v);
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = WrongType(key, "integer", *v);
    return false;
  }
  const double r = std::round(v->numberValue);
  if (r != v->numberValue) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  if (r < static_cast<double>(std::numeric_limits<int>::min()) || r > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(r);
  return true;
}

bool ApplyF32(const JsonValue& root, const char* key, float& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = WrongType(key, "number", *v);
    return false;
  }
  const double dv = v->numberValue;
  if (dv < -static_cast<double>(std::numeric_limits<float>::max()) ||
      dv > static_cast<double>(std::numeric_limits<float>::max())) {
    err = std::string("out-of-range float for key '") + key + "'";
    return false;
  }
  io = static_cast<float>(dv);
  return true;
}

// String-valued enum member parsed with one of the Parse* helpers.
template <typename E, typename ParseFn>
bool ApplyEnum(const JsonValue& root, const char* key, E& io, ParseFn parse, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = WrongType(key, "string", *v);
    return false;
  }
  E tmp = io;
  if (!parse(v->stringValue, tmp)) {
    err = std::string("unknown ") + key + ": '" + v->stringValue + "'";
    return false;
  }
  io = tmp;
  return true;
}

bool GetSection(const JsonValue& root, const char* key, const JsonValue** out, std::string& err)
{
  *out = FindJsonMember(root, key);
  if (*out && !(*out)->isObject()) {
    err = WrongType(key, "object", **out);
    return false;
  }
  return true;
}

void Indent(std::ostringstream& oss, int n)
{
  for (int i = 0; i < n; ++i) oss << ' ';
}

std::string FloatToJson(float v)
{
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(6);
  oss << static_cast<double>(v);
  std::string s = oss.str();
  while (s.size() > 1 && s.find('.') != std::string::npos && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  if (s.empty() || s == "-0") s = "0";
  return s;
}

bool ReadFileText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

bool WriteFileText(const std::string& path, const std::string& text)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  f << text;
  return static_cast<bool>(f);
}

} // namespace

std::string ConvertOptionsToJson(const ConvertOptions& opt, int indentSpaces)
{
  const int in = std::max(0, indentSpaces);
  std::ostringstream oss;
  oss << "{\n";

  Indent(oss, in);
  oss << "\"voxel_resolution\": " << opt.voxelResolution << ",\n";
  Indent(oss, in);
  oss << "\"binning\": \"" << BinningModeName(opt.binning) << "\",\n";
  Indent(oss, in);
  oss << "\"threads\": " << opt.threads << ",\n";

  Indent(oss, in);
  oss << "\"height\": {\n";
  Indent(oss, in * 2);
  oss << "\"max_height\": " << opt.height.maxHeight << ",\n";
  Indent(oss, in * 2);
  oss << "\"columns\": \"" << HeightColumnModeName(opt.height.columns) << "\"\n";
  Indent(oss, in);
  oss << "},\n";

  Indent(oss, in);
  oss << "\"color\": {\n";
  Indent(oss, in * 2);
  oss << "\"layers\": " << opt.color.layers << ",\n";
  Indent(oss, in * 2);
  oss << "\"achromatic\": \"" << AchromaticPolicyName(opt.color.achromatic) << "\",\n";
  Indent(oss, in * 2);
  oss << "\"achromatic_layer\": " << opt.color.achromaticLayer << ",\n";
  Indent(oss, in * 2);
  oss << "\"min_saturation\": " << opt.color.minSaturation << ",\n";
  Indent(oss, in * 2);
  oss << "\"min_value\": " << opt.color.minValue << "\n";
  Indent(oss, in);
  oss << "},\n";

  Indent(oss, in);
  oss << "\"structure\": {\n";
  Indent(oss, in * 2);
  oss << "\"depth_levels\": " << opt.structure.depthLevels << ",\n";
  Indent(oss, in * 2);
  oss << "\"edge_threshold\": " << FloatToJson(opt.structure.edgeThreshold) << ",\n";
  Indent(oss, in * 2);
  oss << "\"depth_mode\": \"" << StructureDepthModeName(opt.structure.depthMode) << "\",\n";
  Indent(oss, in * 2);
  oss << "\"distance_scale\": " << FloatToJson(opt.structure.distanceScale) << ",\n";
  Indent(oss, in * 2);
  oss << "\"shade_by_depth\": " << (opt.structure.shadeByDepth ? "true" : "false") << "\n";
  Indent(oss, in);
  oss << "}\n";

  oss << "}\n";
  return oss.str();
}

bool ApplyConvertOptionsJson(const JsonValue& root, ConvertOptions& ioOpt, std::string& outError)
{
  if (!root.isObject()) {
    outError = "ConvertOptions JSON must be an object";
    return false;
  }

  // Work on a copy so a failing file leaves ioOpt untouched.
  ConvertOptions o = ioOpt;
  std::string err;

  if (!ApplyI32(root, "voxel_resolution", o.voxelResolution, err) ||
      !ApplyEnum(root, "binning", o.binning, ParseBinningMode, err) || !ApplyI32(root, "threads", o.threads, err)) {
    outError = err;
    return false;
  }

  const JsonValue* height = nullptr;
  const JsonValue* color = nullptr;
  const JsonValue* structure = nullptr;
  if (!GetSection(root, "height", &height, err) || !GetSection(root, "color", &color, err) ||
      !GetSection(root, "structure", &structure, err)) {
    outError = err;
    return false;
  }

  if (height) {
    if (!ApplyI32(*height, "max_height", o.height.maxHeight, err) ||
        !ApplyEnum(*height, "columns", o.height.columns, ParseHeightColumnMode, err)) {
      outError = "height: " + err;
      return false;
    }
  }

  if (color) {
    if (!ApplyI32(*color, "layers", o.color.layers, err) ||
        !ApplyEnum(*color, "achromatic", o.color.achromatic, ParseAchromaticPolicy, err) ||
        !ApplyI32(*color, "achromatic_layer", o.color.achromaticLayer, err) ||
        !ApplyI32(*color, "min_saturation", o.color.minSaturation, err) ||
        !ApplyI32(*color, "min_value", o.color.minValue, err)) {
      outError = "color: " + err;
      return false;
    }
  }

  if (structure) {
    if (!ApplyI32(*structure, "depth_levels", o.structure.depthLevels, err) ||
        !ApplyF32(*structure, "edge_threshold", o.structure.edgeThreshold, err) ||
        !ApplyEnum(*structure, "depth_mode", o.structure.depthMode, ParseStructureDepthMode, err) ||
        !ApplyF32(*structure, "distance_scale", o.structure.distanceScale, err) ||
        !ApplyBool(*structure, "shade_by_depth", o.structure.shadeByDepth, err)) {
      outError = "structure: " + err;
      return false;
    }
  }

  ioOpt = o;
  outError.clear();
  return true;
}

bool WriteConvertOptionsJsonFile(const std::string& path, const ConvertOptions& opt, std::string& outError,
                                 int indentSpaces)
{
  if (!WriteFileText(path, ConvertOptionsToJson(opt, indentSpaces))) {
    outError = "failed to write file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool LoadConvertOptionsJsonFile(const std::string& path, ConvertOptions& ioOpt, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text)) {
    outError = "failed to read file: " + path;
    return false;
  }

  JsonValue root;
  std::string err;
  if (!ParseJson(text, root, err)) {
    outError = path + ": " + err;
    return false;
  }
  if (!ApplyConvertOptionsJson(root, ioOpt, err)) {
    outError = path + ": " + err;
    return false;
  }

  outError.clear();
  return true;
}

} // namespace pixvox
