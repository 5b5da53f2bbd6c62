#pragma once

#include "pixvox/Image.hpp"
#include "pixvox/Method.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace pixvox {

// Most voxels a single grid may hold. Converter options are validated against it.
constexpr std::size_t kMaxVoxels = std::size_t{1} << 25;

// Integer voxel coordinate.
//  - x: binned image column
//  - y: binned image row
//  - z: derived axis (height, hue layer, structural depth)
struct VoxelCoord {
  int x = 0;
  int y = 0;
  int z = 0;
};

inline bool operator==(const VoxelCoord& a, const VoxelCoord& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
inline bool operator!=(const VoxelCoord& a, const VoxelCoord& b) { return !(a == b); }

// An occupied cell. Empty cells are never stored.
struct Voxel {
  VoxelCoord pos;
  Rgb8 color;
};

// Inclusive bounding box of the occupied voxels. valid == false for empty grids.
struct VoxelBounds {
  bool valid = false;
  VoxelCoord min;
  VoxelCoord max;
};

// Sparse voxel grid produced by a single converter.
//
// Storage is a flat arena in the producer's emission order plus a coordinate -> slot index
// for point lookups. Grids are immutable: the only way to fill one is VoxelGridBuilder.
class VoxelGrid {
public:
  VoxelGrid() = default;

  ConvertMethod method() const { return m_method; }
  const char* methodName() const { return ConvertMethodName(m_method); }

  int sizeX() const { return m_sizeX; }
  int sizeY() const { return m_sizeY; }
  int sizeZ() const { return m_sizeZ; }

  int sourceWidth() const { return m_srcWidth; }
  int sourceHeight() const { return m_srcHeight; }

  const std::vector<Voxel>& voxels() const { return m_voxels; }
  std::size_t size() const { return m_voxels.size(); }
  bool empty() const { return m_voxels.empty(); }

  bool inBounds(int x, int y, int z) const
  {
    return x >= 0 && y >= 0 && z >= 0 && x < m_sizeX && y < m_sizeY && z < m_sizeZ;
  }

  // Returns nullptr when (x,y,z) is empty or out of bounds.
  const Voxel* find(int x, int y, int z) const;
  bool contains(int x, int y, int z) const { return find(x, y, z) != nullptr; }

  VoxelBounds occupiedBounds() const;

private:
  friend class VoxelGridBuilder;

  std::uint64_t linearKey(int x, int y, int z) const
  {
    return (static_cast<std::uint64_t>(z) * static_cast<std::uint64_t>(m_sizeY) + static_cast<std::uint64_t>(y)) *
               static_cast<std::uint64_t>(m_sizeX) +
           static_cast<std::uint64_t>(x);
  }

  ConvertMethod m_method = ConvertMethod::Height;
  int m_sizeX = 0;
  int m_sizeY = 0;
  int m_sizeZ = 0;
  int m_srcWidth = 0;
  int m_srcHeight = 0;

  std::vector<Voxel> m_voxels;
  std::unordered_map<std::uint64_t, std::uint32_t> m_index;
};

enum class VoxelAddResult : std::uint8_t {
  Added = 0,
  OutOfBounds = 1,
  Duplicate = 2,
  Frozen = 3, // build() was already called
  Full = 4,   // kMaxVoxels reached
};

// Incrementally fills a VoxelGrid, then freezes it.
class VoxelGridBuilder {
public:
  VoxelGridBuilder(ConvertMethod method, int sizeX, int sizeY, int sizeZ, int srcWidth, int srcHeight);

  void reserve(std::size_t n);

  VoxelAddResult add(int x, int y, int z, Rgb8 color);

  std::size_t size() const { return m_grid.m_voxels.size(); }

  // Hand over the finished grid. Further add() calls return VoxelAddResult::Frozen.
  VoxelGrid build();

private:
  VoxelGrid m_grid;
  bool m_built = false;
};

// Metadata and voxel-by-voxel (ordered) equality.
bool VoxelGridsEqual(const VoxelGrid& a, const VoxelGrid& b);

} // namespace pixvox
