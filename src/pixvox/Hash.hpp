#pragma once

#include <cstdint>
#include <string>

namespace pixvox {

class VoxelGrid;

// Stable, endianness-independent 64-bit FNV-1a hash of a grid: metadata, then every voxel
// (coordinate + color) in arena order.
//
// Two grids hash equal iff they would serialize identically. Intended for regression tests,
// idempotence checks and the JSON report; values are not a file format contract.
std::uint64_t HashVoxelGrid(const VoxelGrid& grid);

// "0x" followed by 16 lowercase hex digits.
std::string HashHex(std::uint64_t h);

} // namespace pixvox
