#include "pixvox/ImageIO.hpp"

#include "pixvox/Checksum.hpp"
#include "pixvox/Zlib.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace pixvox {

namespace {

constexpr std::uint8_t kPngSig[8] = {0x89u, 'P', 'N', 'G', 0x0Du, 0x0Au, 0x1Au, 0x0Au};

// Decoded images are capped well below what would overflow size_t arithmetic.
constexpr std::uint64_t kMaxPixels = std::uint64_t{1} << 28;

inline std::string LowerExt(const std::string& path)
{
  const std::size_t slash = path.find_last_of("/\\");
  const std::size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) return {};
  if (slash != std::string::npos && dot < slash) return {};
  std::string ext = path.substr(dot);
  for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

inline std::uint32_t GetU32BE(const std::uint8_t* p)
{
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

inline void PutU32BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

inline std::uint32_t CrcPngChunk(const std::uint8_t* typeAndData, std::size_t size)
{
  return Crc32(typeAndData, size);
}

void PutPngChunk(std::vector<std::uint8_t>& out, const char type[4], const std::uint8_t* data, std::size_t size)
{
  PutU32BE(out, static_cast<std::uint32_t>(size));
  const std::size_t start = out.size();
  out.insert(out.end(), type, type + 4);
  if (data && size > 0) out.insert(out.end(), data, data + size);
  PutU32BE(out, CrcPngChunk(out.data() + start, size + 4u));
}

bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return !f.bad();
}

inline int Paeth(int a, int b, int c)
{
  const int p = a + b - c;
  const int pa = std::abs(p - a);
  const int pb = std::abs(p - b);
  const int pc = std::abs(p - c);
  if (pa <= pb && pa <= pc) return a;
  if (pb <= pc) return b;
  return c;
}

// Reverse the per-scanline filters in place. `raw` holds h rows of (1 + stride) bytes;
// the unfiltered pixel bytes are written to `out` (h * stride).
bool Unfilter(const std::vector<std::uint8_t>& raw, int h, std::size_t stride, int bpp, std::vector<std::uint8_t>& out,
              std::string& outError)
{
  out.assign(stride * static_cast<std::size_t>(h), 0u);
  const std::size_t b = static_cast<std::size_t>(bpp);

  for (int y = 0; y < h; ++y) {
    const std::uint8_t filter = raw[static_cast<std::size_t>(y) * (stride + 1u)];
    const std::uint8_t* src = raw.data() + static_cast<std::size_t>(y) * (stride + 1u) + 1u;
    std::uint8_t* cur = out.data() + static_cast<std::size_t>(y) * stride;
    const std::uint8_t* up = (y > 0) ? cur - stride : nullptr;

    for (std::size_t i = 0; i < stride; ++i) {
      const int a = (i >= b) ? cur[i - b] : 0;
      const int u = up ? up[i] : 0;
      const int c = (up && i >= b) ? up[i - b] : 0;

      int pred = 0;
      switch (filter) {
      case 0: pred = 0; break;
      case 1: pred = a; break;
      case 2: pred = u; break;
      case 3: pred = (a + u) / 2; break;
      case 4: pred = Paeth(a, u, c); break;
      default: {
        std::ostringstream oss;
        oss << "invalid PNG filter type " << static_cast<int>(filter) << " on row " << y;
        outError = oss.str();
        return false;
      }
      }
      cur[i] = static_cast<std::uint8_t>((src[i] + pred) & 0xFF);
    }
  }
  return true;
}

bool ReadPpmToken(std::istream& in, std::string& out)
{
  out.clear();
  int c = 0;
  // Skip whitespace and '#' comments.
  while ((c = in.get()) != EOF) {
    if (c == '#') {
      while ((c = in.get()) != EOF && c != '\n') {
      }
      continue;
    }
    if (!std::isspace(c)) break;
  }
  if (c == EOF) return false;
  out.push_back(static_cast<char>(c));
  while ((c = in.peek()) != EOF && !std::isspace(c) && c != '#') out.push_back(static_cast<char>(in.get()));
  // Exactly one whitespace byte separates the header from P6 pixel data.
  if (c != EOF && std::isspace(c)) in.get();
  return true;
}

bool ParseIntToken(const std::string& s, int& out)
{
  if (s.empty() || s.size() > 9) return false;
  int v = 0;
  for (char ch : s) {
    if (ch < '0' || ch > '9') return false;
    v = v * 10 + (ch - '0');
  }
  out = v;
  return true;
}

} // namespace

bool ReadPpm(const std::string& path, RgbImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RgbImage{};

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }

  std::string magic;
  if (!ReadPpmToken(f, magic) || (magic != "P6" && magic != "P3")) {
    outError = "invalid PPM magic (expected P6 or P3)";
    return false;
  }

  std::string tok;
  int w = 0, h = 0, maxv = 0;
  if (!ReadPpmToken(f, tok) || !ParseIntToken(tok, w) || w <= 0) {
    outError = "invalid PPM width";
    return false;
  }
  if (!ReadPpmToken(f, tok) || !ParseIntToken(tok, h) || h <= 0) {
    outError = "invalid PPM height";
    return false;
  }
  if (!ReadPpmToken(f, tok) || !ParseIntToken(tok, maxv) || maxv <= 0 || maxv > 255) {
    outError = "invalid or unsupported PPM maxval (expected 1..255)";
    return false;
  }
  if (static_cast<std::uint64_t>(w) * static_cast<std::uint64_t>(h) > kMaxPixels) {
    outError = "PPM image too large";
    return false;
  }

  const std::size_t expected = static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3u;
  std::vector<std::uint8_t> buf(expected);

  if (magic == "P6") {
    f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (static_cast<std::size_t>(f.gcount()) != expected) {
      outError = "truncated PPM pixel data";
      return false;
    }
  } else {
    for (std::size_t i = 0; i < expected; ++i) {
      int v = 0;
      if (!ReadPpmToken(f, tok) || !ParseIntToken(tok, v) || v > maxv) {
        outError = "invalid P3 sample #" + std::to_string(i);
        return false;
      }
      buf[i] = static_cast<std::uint8_t>(v);
    }
  }

  if (maxv != 255) {
    for (std::uint8_t& c : buf) {
      const int scaled = (static_cast<int>(c) * 255 + maxv / 2) / maxv;
      c = static_cast<std::uint8_t>(std::clamp(scaled, 0, 255));
    }
  }

  outImg.width = w;
  outImg.height = h;
  outImg.rgb = std::move(buf);
  return true;
}

bool WritePpm(const std::string& path, const RgbImage& img, std::string& outError)
{
  if (!ValidateRgbImage(img, outError)) return false;

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }

  f << "P6\n" << img.width << " " << img.height << "\n255\n";
  f.write(reinterpret_cast<const char*>(img.rgb.data()), static_cast<std::streamsize>(img.rgb.size()));
  if (!f) {
    outError = "failed while writing file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool DecodePng(const std::vector<std::uint8_t>& bytes, RgbImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RgbImage{};

  if (bytes.size() < 8 || !std::equal(kPngSig, kPngSig + 8, bytes.begin())) {
    outError = "invalid PNG signature";
    return false;
  }

  int w = 0;
  int h = 0;
  int colorType = -1;
  bool haveIHDR = false;
  std::vector<std::uint8_t> palette;
  std::vector<std::uint8_t> idat;

  std::size_t pos = 8;
  for (;;) {
    if (pos + 8 > bytes.size()) {
      outError = "truncated PNG (chunk header)";
      return false;
    }
    const std::uint32_t len = GetU32BE(bytes.data() + pos);
    if (len > bytes.size() - pos - 8 || bytes.size() - pos - 8 - len < 4) {
      outError = "truncated PNG (chunk data)";
      return false;
    }
    const std::uint8_t* typeAndData = bytes.data() + pos + 4;
    const std::string type(reinterpret_cast<const char*>(typeAndData), 4);
    const std::uint8_t* data = typeAndData + 4;

    if (GetU32BE(data + len) != CrcPngChunk(typeAndData, len + 4u)) {
      outError = "PNG CRC mismatch for chunk '" + type + "'";
      return false;
    }
    pos += 12u + len;

    if (!haveIHDR && type != "IHDR") {
      outError = "PNG does not start with IHDR";
      return false;
    }

    if (type == "IHDR") {
      if (len != 13u || haveIHDR) {
        outError = "invalid IHDR";
        return false;
      }
      const std::uint32_t wb = GetU32BE(data);
      const std::uint32_t hb = GetU32BE(data + 4);
      if (wb == 0 || hb == 0 || wb > static_cast<std::uint32_t>(std::numeric_limits<int>::max()) ||
          hb > static_cast<std::uint32_t>(std::numeric_limits<int>::max()) ||
          static_cast<std::uint64_t>(wb) * static_cast<std::uint64_t>(hb) > kMaxPixels) {
        outError = "invalid or too large IHDR dimensions";
        return false;
      }
      w = static_cast<int>(wb);
      h = static_cast<int>(hb);

      const std::uint8_t bitDepth = data[8];
      colorType = data[9];
      if (bitDepth != 8u) {
        outError = "unsupported PNG bit depth " + std::to_string(bitDepth) + " (expected 8)";
        return false;
      }
      if (colorType != 0 && colorType != 2 && colorType != 3 && colorType != 4 && colorType != 6) {
        outError = "invalid PNG color type " + std::to_string(colorType);
        return false;
      }
      if (data[10] != 0u || data[11] != 0u) {
        outError = "unsupported PNG compression/filter method";
        return false;
      }
      if (data[12] != 0u) {
        outError = "interlaced PNG is not supported";
        return false;
      }
      haveIHDR = true;
    } else if (type == "PLTE") {
      if (len == 0 || len % 3u != 0 || len > 256u * 3u) {
        outError = "invalid PLTE chunk";
        return false;
      }
      palette.assign(data, data + len);
    } else if (type == "IDAT") {
      idat.insert(idat.end(), data, data + len);
    } else if (type == "IEND") {
      break;
    }
  }

  if (idat.empty()) {
    outError = "missing IDAT";
    return false;
  }
  if (colorType == 3 && palette.empty()) {
    outError = "palette PNG without PLTE";
    return false;
  }

  const int channels = (colorType == 0 || colorType == 3) ? 1 : (colorType == 4) ? 2 : (colorType == 2) ? 3 : 4;
  const std::size_t stride = static_cast<std::size_t>(w) * static_cast<std::size_t>(channels);
  const std::size_t expectedRaw = (stride + 1u) * static_cast<std::size_t>(h);

  std::vector<std::uint8_t> raw;
  std::string zerr;
  if (!InflateZlib(idat, raw, zerr, expectedRaw)) {
    outError = "failed to decompress IDAT: " + zerr;
    return false;
  }
  if (raw.size() != expectedRaw) {
    std::ostringstream oss;
    oss << "unexpected decompressed size (expected " << expectedRaw << ", got " << raw.size() << ")";
    outError = oss.str();
    return false;
  }

  std::vector<std::uint8_t> px;
  if (!Unfilter(raw, h, stride, channels, px, outError)) return false;

  RgbImage img;
  img.width = w;
  img.height = h;
  img.rgb.resize(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3u);

  const std::size_t n = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
  for (std::size_t i = 0; i < n; ++i) {
    const std::uint8_t* s = px.data() + i * static_cast<std::size_t>(channels);
    std::uint8_t* d = img.rgb.data() + i * 3u;
    switch (colorType) {
    case 0:
    case 4: d[0] = d[1] = d[2] = s[0]; break;
    case 3: {
      const std::size_t idx = static_cast<std::size_t>(s[0]) * 3u;
      if (idx + 2 >= palette.size()) {
        outError = "palette index out of range";
        return false;
      }
      d[0] = palette[idx + 0];
      d[1] = palette[idx + 1];
      d[2] = palette[idx + 2];
      break;
    }
    default:
      d[0] = s[0];
      d[1] = s[1];
      d[2] = s[2];
      break;
    }
  }

  outImg = std::move(img);
  return true;
}

std::vector<std::uint8_t> EncodePng(const RgbImage& img, PngCompression compression)
{
  // Filter byte 0 + RGB data per row.
  const std::size_t rowBytes = 1u + static_cast<std::size_t>(img.width) * 3u;
  std::vector<std::uint8_t> raw(rowBytes * static_cast<std::size_t>(img.height), 0u);
  for (int y = 0; y < img.height; ++y) {
    const std::size_t srcRow = static_cast<std::size_t>(y) * static_cast<std::size_t>(img.width) * 3u;
    std::copy(img.rgb.begin() + static_cast<std::ptrdiff_t>(srcRow),
              img.rgb.begin() + static_cast<std::ptrdiff_t>(srcRow + rowBytes - 1u),
              raw.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(y) * rowBytes + 1u));
  }

  const std::vector<std::uint8_t> z = (compression == PngCompression::Stored) ? CompressZlibStored(raw.data(), raw.size())
                                                                                : CompressZlibFixed(raw.data(), raw.size());

  std::vector<std::uint8_t> out(kPngSig, kPngSig + 8);

  std::vector<std::uint8_t> ihdr;
  PutU32BE(ihdr, static_cast<std::uint32_t>(img.width));
  PutU32BE(ihdr, static_cast<std::uint32_t>(img.height));
  ihdr.push_back(8u); // bit depth
  ihdr.push_back(2u); // truecolor
  ihdr.push_back(0u); // compression
  ihdr.push_back(0u); // filter
  ihdr.push_back(0u); // interlace

  PutPngChunk(out, "IHDR", ihdr.data(), ihdr.size());
  PutPngChunk(out, "IDAT", z.data(), z.size());
  PutPngChunk(out, "IEND", nullptr, 0);
  return out;
}

bool ReadPng(const std::string& path, RgbImage& outImg, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, bytes)) {
    outError = "failed to open file for reading: " + path;
    return false;
  }
  return DecodePng(bytes, outImg, outError);
}

bool WritePng(const std::string& path, const RgbImage& img, std::string& outError, PngCompression compression)
{
  if (!ValidateRgbImage(img, outError)) return false;

  const std::vector<std::uint8_t> bytes = EncodePng(img, compression);
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!f) {
    outError = "failed while writing file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool ReadImageAuto(const std::string& path, RgbImage& outImg, std::string& outError)
{
  const std::string ext = LowerExt(path);
  if (ext == ".png") return ReadPng(path, outImg, outError);
  if (ext == ".ppm" || ext == ".pnm") return ReadPpm(path, outImg, outError);

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }
  std::uint8_t head[8] = {};
  f.read(reinterpret_cast<char*>(head), static_cast<std::streamsize>(sizeof(head)));
  const std::size_t got = static_cast<std::size_t>(f.gcount());

  if (got >= 8 && std::equal(kPngSig, kPngSig + 8, head)) return ReadPng(path, outImg, outError);
  if (got >= 2 && head[0] == 'P' && (head[1] == '6' || head[1] == '3')) return ReadPpm(path, outImg, outError);

  outError = "unknown image format (expected .png or .ppm): " + path;
  return false;
}

bool WriteImageAuto(const std::string& path, const RgbImage& img, std::string& outError)
{
  if (LowerExt(path) == ".png") return WritePng(path, img, outError);
  return WritePpm(path, img, outError);
}

} // namespace pixvox
