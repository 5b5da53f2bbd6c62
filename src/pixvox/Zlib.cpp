#include "pixvox/Zlib.hpp"

#include "pixvox/Checksum.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <utility>

namespace pixvox {

namespace {

constexpr int kMaxBits = 15;
constexpr int kMaxLitCodes = 286;
constexpr int kMaxDistCodes = 30;
constexpr int kFixedLitCodes = 288;

constexpr std::array<std::uint16_t, 29> kLenBase = {3,  4,  5,  6,  7,  8,  9,  10, 11,  13,  15,  17,  19,  23, 27,
                                                    31, 35, 43, 51, 59, 67, 83, 99, 115, 131, 163, 195, 227, 258};
constexpr std::array<std::uint8_t, 29> kLenExtra = {0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 2, 2, 2,
                                                    2, 3, 3, 3, 3, 4, 4, 4, 4, 5, 5, 5, 5, 0};
constexpr std::array<std::uint16_t, 30> kDistBase = {1,    2,    3,    4,    5,    7,     9,     13,    17,  25,
                                                     33,   49,   65,   97,   129,  193,   257,   385,   513, 769,
                                                     1025, 1537, 2049, 3073, 4097, 6145, 8193, 12289, 16385, 24577};
constexpr std::array<std::uint8_t, 30> kDistExtra = {0, 0, 0, 0, 1, 1, 2, 2,  3,  3,  4,  4,  5,  5,  6,
                                                     6, 7, 7, 8, 8, 9, 9, 10, 10, 11, 11, 12, 12, 13, 13};

// LSB-first bit reader over a byte buffer.
struct BitReader {
  const std::uint8_t* data = nullptr;
  std::size_t size = 0;
  std::size_t pos = 0;
  std::uint32_t bitBuf = 0;
  int bitCount = 0;

  bool bits(int n, int& out)
  {
    while (bitCount < n) {
      if (pos >= size) return false;
      bitBuf |= static_cast<std::uint32_t>(data[pos++]) << bitCount;
      bitCount += 8;
    }
    out = static_cast<int>(bitBuf & ((1u << n) - 1u));
    bitBuf >>= n;
    bitCount -= n;
    return true;
  }

  void alignToByte()
  {
    bitBuf = 0;
    bitCount = 0;
  }
};

// Canonical Huffman table: code counts per length plus symbols ordered by code.
struct Huffman {
  std::array<std::int16_t, kMaxBits + 1> count{};
  std::vector<std::int16_t> symbol;
};

// Returns 0 for a complete code, > 0 for an incomplete one, < 0 when over-subscribed.
int BuildHuffman(Huffman& h, const std::int16_t* length, int n)
{
  h.count.fill(0);
  h.symbol.assign(static_cast<std::size_t>(n), 0);
  for (int s = 0; s < n; ++s) ++h.count[static_cast<std::size_t>(length[s])];
  if (h.count[0] == n) return 0;

  int left = 1;
  for (int len = 1; len <= kMaxBits; ++len) {
    left <<= 1;
    left -= h.count[static_cast<std::size_t>(len)];
    if (left < 0) return left;
  }

  std::array<std::int16_t, kMaxBits + 1> offs{};
  for (int len = 1; len < kMaxBits; ++len) offs[len + 1] = static_cast<std::int16_t>(offs[len] + h.count[len]);
  for (int s = 0; s < n; ++s) {
    if (length[s] != 0) h.symbol[static_cast<std::size_t>(offs[static_cast<std::size_t>(length[s])]++)] = static_cast<std::int16_t>(s);
  }
  return left;
}

// Decode one symbol; -1 on truncated input, -2 on an unused code.
int DecodeSymbol(BitReader& br, const Huffman& h)
{
  int code = 0;
  int first = 0;
  int index = 0;
  for (int len = 1; len <= kMaxBits; ++len) {
    int bit = 0;
    if (!br.bits(1, bit)) return -1;
    code |= bit;
    const int count = h.count[static_cast<std::size_t>(len)];
    if (code - count < first) return h.symbol[static_cast<std::size_t>(index + (code - first))];
    index += count;
    first += count;
    first <<= 1;
    code <<= 1;
  }
  return -2;
}

class Inflater {
public:
  Inflater(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::size_t maxOutput)
      : m_out(out), m_maxOutput(maxOutput)
  {
    m_br.data = data;
    m_br.size = size;
  }

  bool run(std::string& err)
  {
    int last = 0;
    do {
      int type = 0;
      if (!m_br.bits(1, last) || !m_br.bits(2, type)) return fail(err, "truncated block header");

      bool ok = false;
      switch (type) {
      case 0: ok = stored(err); break;
      case 1: ok = fixed(err); break;
      case 2: ok = dynamic(err); break;
      default: return fail(err, "invalid block type 3");
      }
      if (!ok) return false;
    } while (!last);
    return true;
  }

  std::size_t consumed() const { return m_br.pos; }

private:
  static bool fail(std::string& err, const char* msg)
  {
    err = std::string("DEFLATE: ") + msg;
    return false;
  }

  bool emit(std::uint8_t b, std::string& err)
  {
    if (m_out.size() >= m_maxOutput) return fail(err, "output exceeds limit");
    m_out.push_back(b);
    return true;
  }

  bool stored(std::string& err)
  {
    m_br.alignToByte();
    if (m_br.pos + 4 > m_br.size) return fail(err, "truncated stored block header");
    const std::uint8_t* p = m_br.data + m_br.pos;
    const unsigned len = static_cast<unsigned>(p[0] | (p[1] << 8));
    const unsigned nlen = static_cast<unsigned>(p[2] | (p[3] << 8));
    m_br.pos += 4;
    if (len != (~nlen & 0xFFFFu)) return fail(err, "stored block LEN/NLEN mismatch");
    if (m_br.pos + len > m_br.size) return fail(err, "truncated stored block payload");
    if (m_out.size() + len > m_maxOutput) return fail(err, "output exceeds limit");
    m_out.insert(m_out.end(), m_br.data + m_br.pos, m_br.data + m_br.pos + len);
    m_br.pos += len;
    return true;
  }

  bool codes(const Huffman& lencode, const Huffman& distcode, std::string& err)
  {
    for (;;) {
      int symbol = DecodeSymbol(m_br, lencode);
      if (symbol < 0) return fail(err, symbol == -1 ? "truncated data" : "invalid literal/length code");
      if (symbol < 256) {
        if (!emit(static_cast<std::uint8_t>(symbol), err)) return false;
        continue;
      }
      if (symbol == 256) return true;

      symbol -= 257;
      if (symbol >= static_cast<int>(kLenBase.size())) return fail(err, "invalid length symbol");
      int extra = 0;
      if (!m_br.bits(kLenExtra[static_cast<std::size_t>(symbol)], extra)) return fail(err, "truncated data");
      const std::size_t len = kLenBase[static_cast<std::size_t>(symbol)] + static_cast<std::size_t>(extra);

      const int dsym = DecodeSymbol(m_br, distcode);
      if (dsym < 0) return fail(err, dsym == -1 ? "truncated data" : "invalid distance code");
      if (dsym >= kMaxDistCodes) return fail(err, "invalid distance symbol");
      if (!m_br.bits(kDistExtra[static_cast<std::size_t>(dsym)], extra)) return fail(err, "truncated data");
      const std::size_t dist = kDistBase[static_cast<std::size_t>(dsym)] + static_cast<std::size_t>(extra);
      if (dist > m_out.size()) return fail(err, "distance too far back");

      if (m_out.size() + len > m_maxOutput) return fail(err, "output exceeds limit");
      // Byte-by-byte: source and destination may overlap.
      const std::size_t from = m_out.size() - dist;
      for (std::size_t i = 0; i < len; ++i) m_out.push_back(m_out[from + i]);
    }
  }

  bool fixed(std::string& err)
  {
    static const std::pair<Huffman, Huffman> tables = [] {
      std::array<std::int16_t, kFixedLitCodes> lengths{};
      int s = 0;
      for (; s < 144; ++s) lengths[static_cast<std::size_t>(s)] = 8;
      for (; s < 256; ++s) lengths[static_cast<std::size_t>(s)] = 9;
      for (; s < 280; ++s) lengths[static_cast<std::size_t>(s)] = 7;
      for (; s < kFixedLitCodes; ++s) lengths[static_cast<std::size_t>(s)] = 8;
      Huffman lit;
      BuildHuffman(lit, lengths.data(), kFixedLitCodes);

      std::array<std::int16_t, kMaxDistCodes> dl{};
      dl.fill(5);
      Huffman dist;
      BuildHuffman(dist, dl.data(), kMaxDistCodes);
      return std::make_pair(lit, dist);
    }();
    return codes(tables.first, tables.second, err);
  }

  bool dynamic(std::string& err)
  {
    static constexpr std::array<std::uint8_t, 19> kOrder = {16, 17, 18, 0, 8, 7, 9, 6, 10, 5, 11, 4, 12, 3, 13, 2, 14, 1, 15};

    int nlen = 0;
    int ndist = 0;
    int ncode = 0;
    if (!m_br.bits(5, nlen) || !m_br.bits(5, ndist) || !m_br.bits(4, ncode)) return fail(err, "truncated dynamic header");
    nlen += 257;
    ndist += 1;
    ncode += 4;
    if (nlen > kMaxLitCodes || ndist > kMaxDistCodes) return fail(err, "bad dynamic code counts");

    std::array<std::int16_t, kMaxLitCodes + kMaxDistCodes> lengths{};
    for (int i = 0; i < ncode; ++i) {
      int v = 0;
      if (!m_br.bits(3, v)) return fail(err, "truncated code lengths");
      lengths[kOrder[static_cast<std::size_t>(i)]] = static_cast<std::int16_t>(v);
    }

    Huffman lencode;
    if (BuildHuffman(lencode, lengths.data(), 19) != 0) return fail(err, "incomplete code-length code");

    int index = 0;
    while (index < nlen + ndist) {
      const int symbol = DecodeSymbol(m_br, lencode);
      if (symbol < 0) return fail(err, "invalid code-length symbol");
      if (symbol < 16) {
        lengths[static_cast<std::size_t>(index++)] = static_cast<std::int16_t>(symbol);
        continue;
      }

      std::int16_t len = 0;
      int rep = 0;
      int extra = 0;
      if (symbol == 16) {
        if (index == 0) return fail(err, "repeat with no previous length");
        len = lengths[static_cast<std::size_t>(index - 1)];
        if (!m_br.bits(2, extra)) return fail(err, "truncated code lengths");
        rep = 3 + extra;
      } else if (symbol == 17) {
        if (!m_br.bits(3, extra)) return fail(err, "truncated code lengths");
        rep = 3 + extra;
      } else {
        if (!m_br.bits(7, extra)) return fail(err, "truncated code lengths");
        rep = 11 + extra;
      }
      if (index + rep > nlen + ndist) return fail(err, "too many code lengths");
      while (rep--) lengths[static_cast<std::size_t>(index++)] = len;
    }

    if (lengths[256] == 0) return fail(err, "missing end-of-block code");

    Huffman litcode;
    int rc = BuildHuffman(litcode, lengths.data(), nlen);
    if (rc < 0 || (rc > 0 && nlen - litcode.count[0] != 1)) return fail(err, "bad literal/length code");

    Huffman distcode;
    rc = BuildHuffman(distcode, lengths.data() + nlen, ndist);
    if (rc < 0 || (rc > 0 && ndist - distcode.count[0] != 1)) return fail(err, "bad distance code");

    return codes(litcode, distcode, err);
  }

  BitReader m_br;
  std::vector<std::uint8_t>& m_out;
  std::size_t m_maxOutput = 0;
};

// LSB-first bit writer.
class BitWriter {
public:
  explicit BitWriter(std::vector<std::uint8_t>& out) : m_out(out) {}

  void put(std::uint32_t value, int n)
  {
    m_buf |= static_cast<std::uint64_t>(value) << m_count;
    m_count += n;
    while (m_count >= 8) {
      m_out.push_back(static_cast<std::uint8_t>(m_buf & 0xFFu));
      m_buf >>= 8;
      m_count -= 8;
    }
  }

  // Huffman codes are packed starting from their most significant bit.
  void putCode(std::uint32_t code, int n)
  {
    std::uint32_t rev = 0;
    for (int i = 0; i < n; ++i) rev |= ((code >> i) & 1u) << (n - 1 - i);
    put(rev, n);
  }

  void flush()
  {
    if (m_count > 0) m_out.push_back(static_cast<std::uint8_t>(m_buf & 0xFFu));
    m_buf = 0;
    m_count = 0;
  }

private:
  std::vector<std::uint8_t>& m_out;
  std::uint64_t m_buf = 0;
  int m_count = 0;
};

void PutFixedLiteral(BitWriter& bw, int sym)
{
  if (sym < 144) {
    bw.putCode(static_cast<std::uint32_t>(0x30 + sym), 8);
  } else if (sym < 256) {
    bw.putCode(static_cast<std::uint32_t>(0x190 + (sym - 144)), 9);
  } else if (sym < 280) {
    bw.putCode(static_cast<std::uint32_t>(sym - 256), 7);
  } else {
    bw.putCode(static_cast<std::uint32_t>(0xC0 + (sym - 280)), 8);
  }
}

void PutMatch(BitWriter& bw, std::size_t len, std::size_t dist)
{
  std::size_t li = kLenBase.size() - 1;
  while (kLenBase[li] > len) --li;
  PutFixedLiteral(bw, 257 + static_cast<int>(li));
  if (kLenExtra[li]) bw.put(static_cast<std::uint32_t>(len - kLenBase[li]), kLenExtra[li]);

  std::size_t di = kDistBase.size() - 1;
  while (kDistBase[di] > dist) --di;
  bw.putCode(static_cast<std::uint32_t>(di), 5);
  if (kDistExtra[di]) bw.put(static_cast<std::uint32_t>(dist - kDistBase[di]), kDistExtra[di]);
}

void PutAdler32(std::vector<std::uint8_t>& out, const std::uint8_t* data, std::size_t size)
{
  const std::uint32_t adler = Adler32(data, size);
  // Big-endian trailer.
  out.push_back(static_cast<std::uint8_t>((adler >> 24) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((adler >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((adler >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(adler & 0xFFu));
}

} // namespace

bool InflateRaw(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::string& outError,
                std::size_t* outConsumed, std::size_t maxOutput)
{
  outError.clear();
  out.clear();
  if (!data && size > 0) {
    outError = "DEFLATE: null input";
    return false;
  }

  Inflater inf(data, size, out, maxOutput);
  if (!inf.run(outError)) return false;
  if (outConsumed) *outConsumed = inf.consumed();
  return true;
}

bool InflateZlib(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& outError,
                 std::size_t maxOutput)
{
  outError.clear();
  out.clear();

  if (in.size() < 2 + 4) {
    outError = "zlib stream too small";
    return false;
  }

  const std::uint8_t cmf = in[0];
  const std::uint8_t flg = in[1];
  const unsigned cmfFlg = static_cast<unsigned>(cmf) * 256u + static_cast<unsigned>(flg);
  if ((cmfFlg % 31u) != 0u) {
    outError = "invalid zlib header (FCHECK)";
    return false;
  }
  if ((cmf & 0x0Fu) != 8u || (cmf >> 4) > 7u) {
    outError = "unsupported zlib compression method (expected DEFLATE)";
    return false;
  }
  if ((flg & 0x20u) != 0u) {
    outError = "unsupported zlib preset dictionary";
    return false;
  }

  std::size_t used = 0;
  if (!InflateRaw(in.data() + 2, in.size() - 2, out, outError, &used, maxOutput)) return false;

  const std::size_t pos = 2 + used;
  if (pos + 4 > in.size()) {
    outError = "missing Adler32";
    return false;
  }
  const std::uint32_t expected = (static_cast<std::uint32_t>(in[pos + 0]) << 24) | (static_cast<std::uint32_t>(in[pos + 1]) << 16) |
                                 (static_cast<std::uint32_t>(in[pos + 2]) << 8) | static_cast<std::uint32_t>(in[pos + 3]);
  const std::uint32_t got = Adler32(out.data(), out.size());
  if (got != expected) {
    std::ostringstream oss;
    oss << "Adler32 mismatch (expected 0x" << std::hex << expected << ", got 0x" << got << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

std::vector<std::uint8_t> CompressZlibStored(const std::uint8_t* data, std::size_t size)
{
  // CMF=0x78 (deflate, 32k window), FLG=0x01 (no preset dict, check bits).
  std::vector<std::uint8_t> out;
  out.reserve(size + size / 65535u * 5u + 16u);
  out.push_back(0x78u);
  out.push_back(0x01u);

  const std::uint8_t* p = data;
  std::size_t remaining = size;
  do {
    const std::uint16_t chunk = static_cast<std::uint16_t>(std::min<std::size_t>(remaining, 65535u));
    const bool final = (remaining == chunk);

    out.push_back(final ? 0x01u : 0x00u);
    out.push_back(static_cast<std::uint8_t>(chunk & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((chunk >> 8) & 0xFFu));
    const std::uint16_t nlen = static_cast<std::uint16_t>(chunk ^ 0xFFFFu);
    out.push_back(static_cast<std::uint8_t>(nlen & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((nlen >> 8) & 0xFFu));

    if (chunk > 0) out.insert(out.end(), p, p + chunk);
    p += chunk;
    remaining -= chunk;
  } while (remaining > 0);

  PutAdler32(out, data, size);
  return out;
}

std::vector<std::uint8_t> CompressZlibFixed(const std::uint8_t* data, std::size_t size)
{
  constexpr std::size_t kWindow = 32768;
  constexpr std::size_t kMinMatch = 3;
  constexpr std::size_t kMaxMatch = 258;
  constexpr int kMaxChain = 32;
  constexpr std::size_t kHashBits = 15;
  constexpr std::size_t kNoPos = static_cast<std::size_t>(-1);

  std::vector<std::uint8_t> out;
  out.reserve(size / 2 + 16u);
  out.push_back(0x78u);
  out.push_back(0x01u);

  BitWriter bw(out);
  bw.put(1u, 1); // BFINAL
  bw.put(1u, 2); // BTYPE = fixed Huffman

  std::vector<std::size_t> head(std::size_t{1} << kHashBits, kNoPos);
  std::vector<std::size_t> prev(size, kNoPos);
  auto hashAt = [&](std::size_t i) {
    const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) | (static_cast<std::uint32_t>(data[i + 1]) << 8) | data[i + 2];
    return static_cast<std::size_t>((v * 2654435761u) >> (32 - kHashBits));
  };
  auto insert = [&](std::size_t i) {
    if (i + kMinMatch > size) return;
    const std::size_t h = hashAt(i);
    prev[i] = head[h];
    head[h] = i;
  };

  std::size_t i = 0;
  while (i < size) {
    std::size_t bestLen = 0;
    std::size_t bestDist = 0;

    if (i + kMinMatch <= size) {
      std::size_t cand = head[hashAt(i)];
      const std::size_t maxLen = std::min(kMaxMatch, size - i);
      for (int chain = 0; cand != kNoPos && chain < kMaxChain; ++chain, cand = prev[cand]) {
        if (i - cand > kWindow) break;
        std::size_t len = 0;
        while (len < maxLen && data[cand + len] == data[i + len]) ++len;
        if (len > bestLen) {
          bestLen = len;
          bestDist = i - cand;
          if (len == maxLen) break;
        }
      }
    }

    if (bestLen >= kMinMatch) {
      PutMatch(bw, bestLen, bestDist);
      for (std::size_t k = 0; k < bestLen; ++k) insert(i + k);
      i += bestLen;
    } else {
      PutFixedLiteral(bw, data[i]);
      insert(i);
      ++i;
    }
  }

  PutFixedLiteral(bw, 256);
  bw.flush();

  PutAdler32(out, data, size);
  return out;
}

} // namespace pixvox
