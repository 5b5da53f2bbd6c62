#include "pixvox/VoxelGrid.hpp"

#include <algorithm>
#include <utility>

namespace pixvox {

const Voxel* VoxelGrid::find(int x, int y, int z) const
{
  if (!inBounds(x, y, z)) return nullptr;
  const auto it = m_index.find(linearKey(x, y, z));
  if (it == m_index.end()) return nullptr;
  return &m_voxels[it->second];
}

VoxelBounds VoxelGrid::occupiedBounds() const
{
  VoxelBounds b;
  if (m_voxels.empty()) return b;

  b.valid = true;
  b.min = m_voxels.front().pos;
  b.max = m_voxels.front().pos;
  for (const Voxel& v : m_voxels) {
    b.min.x = std::min(b.min.x, v.pos.x);
    b.min.y = std::min(b.min.y, v.pos.y);
    b.min.z = std::min(b.min.z, v.pos.z);
    b.max.x = std::max(b.max.x, v.pos.x);
    b.max.y = std::max(b.max.y, v.pos.y);
    b.max.z = std::max(b.max.z, v.pos.z);
  }
  return b;
}

VoxelGridBuilder::VoxelGridBuilder(ConvertMethod method, int sizeX, int sizeY, int sizeZ, int srcWidth, int srcHeight)
{
  m_grid.m_method = method;
  m_grid.m_sizeX = std::max(0, sizeX);
  m_grid.m_sizeY = std::max(0, sizeY);
  m_grid.m_sizeZ = std::max(0, sizeZ);
  m_grid.m_srcWidth = srcWidth;
  m_grid.m_srcHeight = srcHeight;
}

void VoxelGridBuilder::reserve(std::size_t n)
{
  m_grid.m_voxels.reserve(n);
  m_grid.m_index.reserve(n);
}

VoxelAddResult VoxelGridBuilder::add(int x, int y, int z, Rgb8 color)
{
  if (m_built) return VoxelAddResult::Frozen;
  if (!m_grid.inBounds(x, y, z)) return VoxelAddResult::OutOfBounds;
  if (m_grid.m_voxels.size() >= kMaxVoxels) return VoxelAddResult::Full;

  const std::uint64_t key = m_grid.linearKey(x, y, z);
  const auto slot = static_cast<std::uint32_t>(m_grid.m_voxels.size());
  if (!m_grid.m_index.emplace(key, slot).second) return VoxelAddResult::Duplicate;

  Voxel v;
  v.pos = VoxelCoord{x, y, z};
  v.color = color;
  m_grid.m_voxels.push_back(v);
  return VoxelAddResult::Added;
}

VoxelGrid VoxelGridBuilder::build()
{
  m_built = true;
  VoxelGrid out = std::move(m_grid);
  m_grid = VoxelGrid{};
  return out;
}

bool VoxelGridsEqual(const VoxelGrid& a, const VoxelGrid& b)
{
  if (a.method() != b.method()) return false;
  if (a.sizeX() != b.sizeX() || a.sizeY() != b.sizeY() || a.sizeZ() != b.sizeZ()) return false;
  if (a.sourceWidth() != b.sourceWidth() || a.sourceHeight() != b.sourceHeight()) return false;
  if (a.size() != b.size()) return false;

  const std::vector<Voxel>& va = a.voxels();
  const std::vector<Voxel>& vb = b.voxels();
  for (std::size_t i = 0; i < va.size(); ++i) {
    if (va[i].pos != vb[i].pos || va[i].color != vb[i].color) return false;
  }
  return true;
}

} // namespace pixvox
