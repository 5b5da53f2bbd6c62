#pragma once

#include "pixvox/Convert.hpp"
#include "pixvox/VoxelGrid.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace pixvox {

// -----------------------------------------------------------------------------------------------
// NumPy .npz
//
// A store-only ZIP of four .npy (format 1.0) members:
//   positions.npy   int64 (N, 3)  x, y, z per voxel in arena order
//   colors.npy      uint8 (N, 3)  r, g, b
//   grid_shape.npy  int64 (3,)    sizeX, sizeY, sizeZ
//   method.npy      <U   ()       method name
// Loadable with numpy.load(path).
// -----------------------------------------------------------------------------------------------

// Serialize one little-endian C-order array. `descr` is a NumPy dtype string ("<i8", "|u1",
// "<U6"), `shape` empty for 0-d arrays. The header is padded so the data starts at a multiple
// of 64 bytes.
std::vector<std::uint8_t> EncodeNpy(const std::string& descr, const std::vector<std::size_t>& shape,
                                    const std::uint8_t* data, std::size_t size);

bool WriteVoxelNpz(const std::string& path, const VoxelGrid& grid, std::string& outError);

// -----------------------------------------------------------------------------------------------
// Raw binary (.bin), little-endian:
//   "PXVG" | u16 version (1) | u8 method | u8 reserved (0)
//   u32 sizeX | u32 sizeY | u32 sizeZ | u32 sourceWidth | u32 sourceHeight | u32 count
//   count x (u16 x | u16 y | u16 z | u8 r | u8 g | u8 b)
//   u32 CRC32 of every preceding byte
// -----------------------------------------------------------------------------------------------

constexpr std::uint16_t kVoxelBinaryVersion = 1;

std::vector<std::uint8_t> EncodeVoxelBinary(const VoxelGrid& grid);

// Validates magic, version, sizes, coordinates and CRC, then rebuilds the grid through
// VoxelGridBuilder (so duplicates and out-of-range voxels are rejected too).
bool DecodeVoxelBinary(const std::vector<std::uint8_t>& bytes, VoxelGrid& outGrid, std::string& outError);

bool WriteVoxelBinary(const std::string& path, const VoxelGrid& grid, std::string& outError);
bool ReadVoxelBinary(const std::string& path, VoxelGrid& outGrid, std::string& outError);

// -----------------------------------------------------------------------------------------------
// JSON summary
// -----------------------------------------------------------------------------------------------

struct ConversionReportInfo {
  std::string inputPath;
  int sourceWidth = 0;
  int sourceHeight = 0;
  std::string method;

  // Files written per method (optional).
  std::vector<std::string> outputs;
};

void WriteConversionReportJson(std::ostream& os, const ConversionReportInfo& info, const ConversionResult& result,
                               const ConvertOptions& opt);

bool WriteConversionReportJsonFile(const std::string& path, const ConversionReportInfo& info,
                                   const ConversionResult& result, const ConvertOptions& opt, std::string& outError);

} // namespace pixvox
