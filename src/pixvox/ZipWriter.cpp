#include "pixvox/ZipWriter.hpp"

#include "pixvox/Checksum.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace pixvox {

namespace {

constexpr std::uint32_t kSigLocalHeader = 0x04034b50u;
constexpr std::uint32_t kSigCentralHeader = 0x02014b50u;
constexpr std::uint32_t kSigEndOfCentral = 0x06054b50u;

constexpr std::uint16_t kVersionMadeBy = 20; // 2.0
constexpr std::uint16_t kVersionNeeded = 20; // 2.0
constexpr std::uint16_t kMethodStore = 0;

void WriteLe16(std::ostream& os, std::uint16_t v)
{
  const unsigned char b[2] = {static_cast<unsigned char>(v & 0xFFu), static_cast<unsigned char>((v >> 8) & 0xFFu)};
  os.write(reinterpret_cast<const char*>(b), 2);
}

void WriteLe32(std::ostream& os, std::uint32_t v)
{
  const unsigned char b[4] = {static_cast<unsigned char>(v & 0xFFu), static_cast<unsigned char>((v >> 8) & 0xFFu),
                              static_cast<unsigned char>((v >> 16) & 0xFFu), static_cast<unsigned char>((v >> 24) & 0xFFu)};
  os.write(reinterpret_cast<const char*>(b), 4);
}

bool TellpU32(std::ostream& os, std::uint32_t& out)
{
  const std::streampos p = os.tellp();
  if (p < 0) return false;
  const std::uint64_t u = static_cast<std::uint64_t>(p);
  if (u > std::numeric_limits<std::uint32_t>::max()) return false;
  out = static_cast<std::uint32_t>(u);
  return true;
}

} // namespace

ZipWriter::ZipWriter() = default;

ZipWriter::~ZipWriter()
{
  close();
}

bool ZipWriter::open(const std::filesystem::path& path, std::string& outError, const ZipWriterOptions& opt)
{
  outError.clear();
  close();

  if (path.empty()) {
    outError = "ZipWriter path is empty";
    return false;
  }

  std::error_code ec;
  if (!opt.overwrite && std::filesystem::exists(path, ec) && !ec) {
    outError = "ZipWriter target already exists: " + path.string();
    return false;
  }

  const std::filesystem::path parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "ZipWriter unable to create directory: " + parent.string() + " (" + ec.message() + ")";
      return false;
    }
  }

  auto ofs = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
  if (!(*ofs)) {
    outError = "ZipWriter unable to open file: " + path.string();
    return false;
  }

  DosTimeDateFromTimeT(opt.fixedTime != 0 ? opt.fixedTime : std::time(nullptr), m_dosTime, m_dosDate);
  m_path = path;
  m_ofs = std::move(ofs);
  m_open = true;
  m_finalized = false;
  m_entries.clear();
  return true;
}

void ZipWriter::close()
{
  if (m_ofs) {
    m_ofs->close();
    m_ofs.reset();
  }
  m_open = false;
  m_finalized = false;
  m_entries.clear();
  m_path.clear();
}

void ZipWriter::DosTimeDateFromTimeT(std::time_t t, std::uint16_t& outTime, std::uint16_t& outDate)
{
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  const int year = std::clamp(tm.tm_year + 1900, 1980, 2107); // DOS epoch, 7 bits
  const int month = std::clamp(tm.tm_mon + 1, 1, 12);
  const int day = std::clamp(tm.tm_mday, 1, 31);
  const int hour = std::clamp(tm.tm_hour, 0, 23);
  const int minute = std::clamp(tm.tm_min, 0, 59);
  const int sec2 = std::clamp(tm.tm_sec / 2, 0, 29);

  outDate = static_cast<std::uint16_t>(((year - 1980) << 9) | (month << 5) | day);
  outTime = static_cast<std::uint16_t>((hour << 11) | (minute << 5) | sec2);
}

bool ZipWriter::SanitizeZipPath(const std::string& in, std::string& out, std::string& outError)
{
  outError.clear();
  out.clear();
  if (in.empty()) {
    outError = "zip path is empty";
    return false;
  }

  std::vector<std::string> parts;
  std::string cur;
  auto flush = [&]() {
    if (!cur.empty() && cur != ".") parts.push_back(cur);
    cur.clear();
  };
  for (char c : in) {
    if (c == '/' || c == '\\') {
      flush();
    } else {
      cur.push_back(c);
    }
  }
  flush();

  for (const std::string& p : parts) {
    if (p == "..") {
      outError = "zip path contains '..' segment (blocked): " + in;
      return false;
    }
  }
  if (parts.empty()) {
    outError = "zip path is empty after normalization: " + in;
    return false;
  }

  std::ostringstream oss;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) oss << '/';
    oss << parts[i];
  }
  out = oss.str();
  if (out.size() > std::numeric_limits<std::uint16_t>::max()) {
    outError = "zip path too long";
    return false;
  }
  return true;
}

bool ZipWriter::addFileFromBytes(const std::string& zipPath, const std::uint8_t* data, std::size_t size, std::string& outError)
{
  outError.clear();
  if (!m_open || !m_ofs) {
    outError = "ZipWriter is not open";
    return false;
  }
  if (m_finalized) {
    outError = "ZipWriter already finalized";
    return false;
  }
  if (!data && size > 0) {
    outError = "ZipWriter addFileFromBytes called with null data";
    return false;
  }

  Entry e;
  if (!SanitizeZipPath(zipPath, e.name, outError)) return false;

  for (const Entry& other : m_entries) {
    if (other.name == e.name) {
      outError = "ZipWriter duplicate entry name: " + e.name;
      return false;
    }
  }
  if (size > std::numeric_limits<std::uint32_t>::max()) {
    outError = "ZipWriter entry too large (ZIP64 not supported): " + e.name;
    return false;
  }

  std::ofstream& ofs = *m_ofs;
  if (!TellpU32(ofs, e.localHeaderOffset)) {
    outError = "ZipWriter archive too large (ZIP64 not supported)";
    return false;
  }
  e.size = static_cast<std::uint32_t>(size);
  e.crc32 = Crc32(data, size);

  WriteLe32(ofs, kSigLocalHeader);
  WriteLe16(ofs, kVersionNeeded);
  WriteLe16(ofs, 0); // flags
  WriteLe16(ofs, kMethodStore);
  WriteLe16(ofs, m_dosTime);
  WriteLe16(ofs, m_dosDate);
  WriteLe32(ofs, e.crc32);
  WriteLe32(ofs, e.size); // compressed
  WriteLe32(ofs, e.size); // uncompressed
  WriteLe16(ofs, static_cast<std::uint16_t>(e.name.size()));
  WriteLe16(ofs, 0); // extra len
  ofs.write(e.name.data(), static_cast<std::streamsize>(e.name.size()));
  if (size > 0) ofs.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!ofs.good()) {
    outError = "ZipWriter write failed: " + e.name;
    return false;
  }

  m_entries.push_back(std::move(e));
  return true;
}

bool ZipWriter::writeCentralDirectory(std::string& outError)
{
  if (m_entries.size() > std::numeric_limits<std::uint16_t>::max()) {
    outError = "ZipWriter too many entries (ZIP64 not supported)";
    return false;
  }

  std::ofstream& ofs = *m_ofs;
  std::uint32_t cdOffset = 0;
  if (!TellpU32(ofs, cdOffset)) {
    outError = "ZipWriter archive too large (ZIP64 not supported)";
    return false;
  }

  for (const Entry& e : m_entries) {
    WriteLe32(ofs, kSigCentralHeader);
    WriteLe16(ofs, kVersionMadeBy);
    WriteLe16(ofs, kVersionNeeded);
    WriteLe16(ofs, 0); // flags
    WriteLe16(ofs, kMethodStore);
    WriteLe16(ofs, m_dosTime);
    WriteLe16(ofs, m_dosDate);
    WriteLe32(ofs, e.crc32);
    WriteLe32(ofs, e.size);
    WriteLe32(ofs, e.size);
    WriteLe16(ofs, static_cast<std::uint16_t>(e.name.size()));
    WriteLe16(ofs, 0); // extra
    WriteLe16(ofs, 0); // comment
    WriteLe16(ofs, 0); // disk
    WriteLe16(ofs, 0); // int attrs
    WriteLe32(ofs, 0); // ext attrs
    WriteLe32(ofs, e.localHeaderOffset);
    ofs.write(e.name.data(), static_cast<std::streamsize>(e.name.size()));
  }

  std::uint32_t cdEnd = 0;
  if (!ofs.good() || !TellpU32(ofs, cdEnd)) {
    outError = "ZipWriter write failed (central directory)";
    return false;
  }

  WriteLe32(ofs, kSigEndOfCentral);
  WriteLe16(ofs, 0); // disk
  WriteLe16(ofs, 0); // start disk
  WriteLe16(ofs, static_cast<std::uint16_t>(m_entries.size()));
  WriteLe16(ofs, static_cast<std::uint16_t>(m_entries.size()));
  WriteLe32(ofs, cdEnd - cdOffset);
  WriteLe32(ofs, cdOffset);
  WriteLe16(ofs, 0); // comment

  ofs.flush();
  if (!ofs.good()) {
    outError = "ZipWriter write failed (end of central directory)";
    return false;
  }
  return true;
}

bool ZipWriter::finalize(std::string& outError)
{
  outError.clear();
  if (!m_open || !m_ofs) {
    outError = "ZipWriter is not open";
    return false;
  }
  if (m_finalized) return true;
  if (!writeCentralDirectory(outError)) return false;
  m_finalized = true;
  return true;
}

} // namespace pixvox
