#include "pixvox/Checksum.hpp"

#include <array>

namespace pixvox {

namespace {

std::array<std::uint32_t, 256> BuildCrc32Table()
{
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int bit = 0; bit < 8; ++bit) c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

} // namespace

std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size)
{
  // Function-local static: thread-safe init (converters and writers may run concurrently).
  static const std::array<std::uint32_t, 256> table = BuildCrc32Table();
  if (!data || size == 0) return crc;
  for (std::size_t i = 0; i < size; ++i) crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  return crc;
}

std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size)
{
  constexpr std::uint32_t kMod = 65521u;
  // Largest n such that 255 n (n + 1) / 2 + (n + 1) (kMod - 1) fits in 32 bits.
  constexpr std::size_t kNMax = 5552u;

  std::uint32_t a = adler & 0xFFFFu;
  std::uint32_t b = (adler >> 16) & 0xFFFFu;
  if (!data || size == 0) return (b << 16) | a;

  while (size > 0) {
    const std::size_t chunk = (size > kNMax) ? kNMax : size;
    size -= chunk;
    for (std::size_t i = 0; i < chunk; ++i) {
      a += data[i];
      b += a;
    }
    a %= kMod;
    b %= kMod;
    data += chunk;
  }
  return (b << 16) | a;
}

} // namespace pixvox
