#pragma once

#include <cstddef>
#include <cstdint>

namespace pixvox {

// Checksums used by the container formats.
//
// CRC32:
//   - IEEE 802.3 polynomial (0xEDB88320), init 0xFFFFFFFF, final XOR 0xFFFFFFFF
//   - used by ZIP entries (.npz), PNG chunks and the .bin voxel trailer
//
// Adler32:
//   - zlib/RFC1950 stream trailer (init = 1)

// Incremental CRC32 update.
//
//   std::uint32_t crc = 0xFFFFFFFFu;
//   crc = Crc32Update(crc, data, size);
//   ...
//   crc ^= 0xFFFFFFFFu;
std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  return Crc32Update(0xFFFFFFFFu, data, size) ^ 0xFFFFFFFFu;
}

std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Adler32(const std::uint8_t* data, std::size_t size) { return Adler32Update(1u, data, size); }

} // namespace pixvox
