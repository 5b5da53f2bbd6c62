#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pixvox {

// Self-contained zlib (RFC 1950) / DEFLATE (RFC 1951) codec for PNG I/O.
//
// Decoding supports all three block types (stored, fixed Huffman, dynamic Huffman).
// Encoding writes either stored blocks or one fixed-Huffman block with greedy LZ77 matching.
// That is enough for compact previews without pulling in a compression library.

// Guard against decompression bombs; PNG callers pass the exact expected size.
constexpr std::size_t kDefaultMaxInflateOutput = std::size_t{1} << 30;

// Raw DEFLATE stream. `outConsumed` receives the number of input bytes used (the final
// partial byte counts as used).
bool InflateRaw(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::string& outError,
                std::size_t* outConsumed = nullptr, std::size_t maxOutput = kDefaultMaxInflateOutput);

// zlib stream: header checks, DEFLATE payload, Adler32 trailer.
bool InflateZlib(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& outError,
                 std::size_t maxOutput = kDefaultMaxInflateOutput);

// zlib stream made of stored (uncompressed) blocks.
std::vector<std::uint8_t> CompressZlibStored(const std::uint8_t* data, std::size_t size);

// zlib stream made of a single fixed-Huffman block.
std::vector<std::uint8_t> CompressZlibFixed(const std::uint8_t* data, std::size_t size);

} // namespace pixvox
