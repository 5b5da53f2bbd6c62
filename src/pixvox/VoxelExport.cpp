#include "pixvox/VoxelExport.hpp"

#include "pixvox/Checksum.hpp"
#include "pixvox/ConfigIO.hpp"
#include "pixvox/Hash.hpp"
#include "pixvox/Json.hpp"
#include "pixvox/ZipWriter.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace pixvox {

namespace {

constexpr char kBinMagic[4] = {'P', 'X', 'V', 'G'};
constexpr std::size_t kBinHeaderSize = 4 + 2 + 1 + 1 + 6 * 4;
constexpr std::size_t kBinVoxelSize = 3 * 2 + 3;

void PutU16(std::vector<std::uint8_t>& out, std::uint16_t v)
{
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
}

void PutU32(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
}

void PutI64(std::vector<std::uint8_t>& out, std::int64_t v)
{
  const std::uint64_t u = static_cast<std::uint64_t>(v);
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>((u >> (8 * i)) & 0xFFu));
}

std::uint16_t GetU16(const std::uint8_t* p)
{
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t GetU32(const std::uint8_t* p)
{
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return !f.bad();
}

bool WriteFileBytes(const std::string& path, const std::vector<std::uint8_t>& bytes)
{
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  if (!bytes.empty()) f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(f);
}

} // namespace

std::vector<std::uint8_t> EncodeNpy(const std::string& descr, const std::vector<std::size_t>& shape,
                                    const std::uint8_t* data, std::size_t size)
{
  std::ostringstream dict;
  dict << "{'descr': '" << descr << "', 'fortran_order': False, 'shape': (";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i) dict << ", ";
    dict << shape[i];
  }
  if (shape.size() == 1) dict << ",";
  dict << "), }";

  std::string header = dict.str();
  // magic(6) + version(2) + header_len(2) + header, terminated by '\n', total % 64 == 0.
  const std::size_t prefix = 10;
  const std::size_t unpadded = prefix + header.size() + 1;
  const std::size_t padded = (unpadded + 63u) / 64u * 64u;
  header.append(padded - unpadded, ' ');
  header.push_back('\n');

  std::vector<std::uint8_t> out;
  out.reserve(padded + size);
  const std::uint8_t magic[6] = {0x93u, 'N', 'U', 'M', 'P', 'Y'};
  out.insert(out.end(), magic, magic + 6);
  out.push_back(1u);
  out.push_back(0u);
  PutU16(out, static_cast<std::uint16_t>(header.size()));
  out.insert(out.end(), header.begin(), header.end());
  if (data && size > 0) out.insert(out.end(), data, data + size);
  return out;
}

bool WriteVoxelNpz(const std::string& path, const VoxelGrid& grid, std::string& outError)
{
  const std::size_t n = grid.size();

  std::vector<std::uint8_t> positions;
  std::vector<std::uint8_t> colors;
  positions.reserve(n * 3u * 8u);
  colors.reserve(n * 3u);
  for (const Voxel& v : grid.voxels()) {
    PutI64(positions, v.pos.x);
    PutI64(positions, v.pos.y);
    PutI64(positions, v.pos.z);
    colors.push_back(v.color.r);
    colors.push_back(v.color.g);
    colors.push_back(v.color.b);
  }

  std::vector<std::uint8_t> shape;
  PutI64(shape, grid.sizeX());
  PutI64(shape, grid.sizeY());
  PutI64(shape, grid.sizeZ());

  // NumPy unicode scalars are UTF-32LE code units.
  const std::string name = grid.methodName();
  std::vector<std::uint8_t> method;
  for (char c : name) PutU32(method, static_cast<std::uint32_t>(static_cast<unsigned char>(c)));

  ZipWriter zw;
  if (!zw.open(path, outError)) return false;

  const bool ok = zw.addFileFromBytes("positions.npy", EncodeNpy("<i8", {n, 3u}, positions.data(), positions.size()), outError) &&
                  zw.addFileFromBytes("colors.npy", EncodeNpy("|u1", {n, 3u}, colors.data(), colors.size()), outError) &&
                  zw.addFileFromBytes("grid_shape.npy", EncodeNpy("<i8", {3u}, shape.data(), shape.size()), outError) &&
                  zw.addFileFromBytes("method.npy", EncodeNpy("<U" + std::to_string(name.size()), {}, method.data(), method.size()),
                                      outError) &&
                  zw.finalize(outError);
  zw.close();
  return ok;
}

std::vector<std::uint8_t> EncodeVoxelBinary(const VoxelGrid& grid)
{
  std::vector<std::uint8_t> out;
  out.reserve(kBinHeaderSize + grid.size() * kBinVoxelSize + 4u);

  out.insert(out.end(), kBinMagic, kBinMagic + 4);
  PutU16(out, kVoxelBinaryVersion);
  out.push_back(static_cast<std::uint8_t>(grid.method()));
  out.push_back(0u);
  PutU32(out, static_cast<std::uint32_t>(grid.sizeX()));
  PutU32(out, static_cast<std::uint32_t>(grid.sizeY()));
  PutU32(out, static_cast<std::uint32_t>(grid.sizeZ()));
  PutU32(out, static_cast<std::uint32_t>(grid.sourceWidth()));
  PutU32(out, static_cast<std::uint32_t>(grid.sourceHeight()));
  PutU32(out, static_cast<std::uint32_t>(grid.size()));

  for (const Voxel& v : grid.voxels()) {
    PutU16(out, static_cast<std::uint16_t>(v.pos.x));
    PutU16(out, static_cast<std::uint16_t>(v.pos.y));
    PutU16(out, static_cast<std::uint16_t>(v.pos.z));
    out.push_back(v.color.r);
    out.push_back(v.color.g);
    out.push_back(v.color.b);
  }

  PutU32(out, Crc32(out.data(), out.size()));
  return out;
}

bool DecodeVoxelBinary(const std::vector<std::uint8_t>& bytes, VoxelGrid& outGrid, std::string& outError)
{
  outError.clear();
  if (bytes.size() < kBinHeaderSize + 4u) {
    outError = "voxel binary too short";
    return false;
  }
  const std::uint8_t* p = bytes.data();
  if (!std::equal(kBinMagic, kBinMagic + 4, p)) {
    outError = "not a voxel binary (bad magic)";
    return false;
  }
  const std::uint16_t version = GetU16(p + 4);
  if (version != kVoxelBinaryVersion) {
    outError = "unsupported voxel binary version " + std::to_string(version);
    return false;
  }

  const std::size_t body = bytes.size() - 4u;
  const std::uint32_t storedCrc = GetU32(p + body);
  if (Crc32(p, body) != storedCrc) {
    outError = "voxel binary CRC mismatch";
    return false;
  }

  const ConvertMethod method = static_cast<ConvertMethod>(p[6]);
  if (!IsKnownConvertMethod(method) || method == ConvertMethod::All) {
    outError = "voxel binary has invalid method id " + std::to_string(p[6]);
    return false;
  }

  std::uint32_t dims[5] = {};
  for (int i = 0; i < 5; ++i) dims[i] = GetU32(p + 8 + 4 * i);
  const std::uint32_t count = GetU32(p + 28);

  for (int i = 0; i < 3; ++i) {
    if (dims[i] > static_cast<std::uint32_t>(kMaxGridAxis)) {
      outError = "voxel binary grid size out of range";
      return false;
    }
  }
  for (int i = 3; i < 5; ++i) {
    if (dims[i] > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
      outError = "voxel binary source size out of range";
      return false;
    }
  }
  if (count > kMaxVoxels) {
    outError = "voxel binary holds more than " + std::to_string(kMaxVoxels) + " voxels";
    return false;
  }
  if (body != kBinHeaderSize + static_cast<std::size_t>(count) * kBinVoxelSize) {
    outError = "voxel binary size does not match voxel count";
    return false;
  }

  VoxelGridBuilder builder(method, static_cast<int>(dims[0]), static_cast<int>(dims[1]), static_cast<int>(dims[2]),
                           static_cast<int>(dims[3]), static_cast<int>(dims[4]));
  builder.reserve(count);

  const std::uint8_t* v = p + kBinHeaderSize;
  for (std::uint32_t i = 0; i < count; ++i, v += kBinVoxelSize) {
    const VoxelAddResult r = builder.add(GetU16(v), GetU16(v + 2), GetU16(v + 4), Rgb8{v[6], v[7], v[8]});
    if (r == VoxelAddResult::OutOfBounds) {
      outError = "voxel binary entry " + std::to_string(i) + " is out of bounds";
      return false;
    }
    if (r == VoxelAddResult::Duplicate) {
      outError = "voxel binary entry " + std::to_string(i) + " duplicates an earlier voxel";
      return false;
    }
    if (r != VoxelAddResult::Added) {
      outError = "voxel binary entry " + std::to_string(i) + " could not be stored";
      return false;
    }
  }

  outGrid = builder.build();
  return true;
}

bool WriteVoxelBinary(const std::string& path, const VoxelGrid& grid, std::string& outError)
{
  if (!WriteFileBytes(path, EncodeVoxelBinary(grid))) {
    outError = "failed to write file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool ReadVoxelBinary(const std::string& path, VoxelGrid& outGrid, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, bytes)) {
    outError = "failed to read file: " + path;
    return false;
  }
  if (!DecodeVoxelBinary(bytes, outGrid, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

void WriteConversionReportJson(std::ostream& os, const ConversionReportInfo& info, const ConversionResult& result,
                               const ConvertOptions& opt)
{
  os << "{\n";
  os << "  \"input\": {\"path\": \"" << JsonEscape(info.inputPath) << "\", \"w\": " << info.sourceWidth
     << ", \"h\": " << info.sourceHeight << "},\n";
  os << "  \"method\": \"" << JsonEscape(info.method) << "\",\n";
  std::string optJson = ConvertOptionsToJson(opt, 0);
  while (!optJson.empty() && optJson.back() == '\n') optJson.pop_back();
  os << "  \"options\": " << optJson << ",\n";

  os << "  \"outputs\": [";
  for (std::size_t i = 0; i < info.outputs.size(); ++i) {
    os << (i ? ", " : "") << "\"" << JsonEscape(info.outputs[i]) << "\"";
  }
  os << "],\n";

  os << "  \"grids\": {";
  bool first = true;
  for (const auto& kv : result) {
    const VoxelGrid& g = kv.second;
    const VoxelBounds b = g.occupiedBounds();

    os << (first ? "\n" : ",\n");
    first = false;
    os << "    \"" << JsonEscape(kv.first) << "\": {\n";
    os << "      \"voxels\": " << g.size() << ",\n";
    os << "      \"size\": [" << g.sizeX() << ", " << g.sizeY() << ", " << g.sizeZ() << "],\n";
    if (b.valid) {
      os << "      \"bounds\": {\"min\": [" << b.min.x << ", " << b.min.y << ", " << b.min.z << "], \"max\": [" << b.max.x
         << ", " << b.max.y << ", " << b.max.z << "]},\n";
    } else {
      os << "      \"bounds\": null,\n";
    }
    os << "      \"hash\": \"" << HashHex(HashVoxelGrid(g)) << "\"\n";
    os << "    }";
  }
  os << (first ? "}\n" : "\n  }\n");
  os << "}\n";
}

bool WriteConversionReportJsonFile(const std::string& path, const ConversionReportInfo& info,
                                   const ConversionResult& result, const ConvertOptions& opt, std::string& outError)
{
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    outError = "failed to open file: " + path;
    return false;
  }
  WriteConversionReportJson(f, info, result, opt);
  if (!f) {
    outError = "failed to write file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

} // namespace pixvox
