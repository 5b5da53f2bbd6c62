#include "pixvox/Hash.hpp"

#include "pixvox/VoxelGrid.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace pixvox {

namespace {

// 64-bit FNV-1a
constexpr std::uint64_t kFNVOffset = 1469598103934665603ull;
constexpr std::uint64_t kFNVPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFNVPrime;
}

inline void HashU32(std::uint64_t& h, std::uint32_t v)
{
  HashByte(h, static_cast<std::uint8_t>((v >> 0) & 0xFFu));
  HashByte(h, static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  HashByte(h, static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  HashByte(h, static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

inline void HashI32(std::uint64_t& h, int v)
{
  const std::int32_t sv = static_cast<std::int32_t>(v);
  std::uint32_t uv = 0;
  std::memcpy(&uv, &sv, sizeof(uv));
  HashU32(h, uv);
}

} // namespace

std::uint64_t HashVoxelGrid(const VoxelGrid& grid)
{
  std::uint64_t h = kFNVOffset;

  HashByte(h, static_cast<std::uint8_t>(grid.method()));
  HashI32(h, grid.sizeX());
  HashI32(h, grid.sizeY());
  HashI32(h, grid.sizeZ());
  HashI32(h, grid.sourceWidth());
  HashI32(h, grid.sourceHeight());
  HashU32(h, static_cast<std::uint32_t>(grid.size()));

  for (const Voxel& v : grid.voxels()) {
    HashI32(h, v.pos.x);
    HashI32(h, v.pos.y);
    HashI32(h, v.pos.z);
    HashByte(h, v.color.r);
    HashByte(h, v.color.g);
    HashByte(h, v.color.b);
  }
  return h;
}

std::string HashHex(std::uint64_t h)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << h;
  return oss.str();
}

} // namespace pixvox
