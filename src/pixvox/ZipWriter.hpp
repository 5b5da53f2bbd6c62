#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace pixvox {

// Minimal ZIP archive writer ("store" / no compression), used to produce NumPy .npz files.
//
// - Only the store method (compression = 0) is written. numpy.load reads it natively.
// - Entries are in-memory buffers, so CRC and sizes go straight into the local header
//   (no data descriptors).
// - ZIP64 is not supported (entries and archives must stay below 4 GiB).
// - Entry names are normalized ('\\' -> '/', leading '/' stripped) and "zip slip" names with
//   ".." segments are blocked. Duplicate names (after normalization) are rejected.

struct ZipWriterOptions {
  // If true, overwrite any existing file at `path`.
  bool overwrite = true;

  // Modification time stamped on every entry. 0 = current time. Set a fixed value for
  // byte-reproducible archives.
  std::time_t fixedTime = 0;
};

class ZipWriter {
public:
  ZipWriter();
  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  ~ZipWriter();

  bool open(const std::filesystem::path& path, std::string& outError, const ZipWriterOptions& opt = ZipWriterOptions{});

  // `zipPath` is the path inside the archive.
  bool addFileFromBytes(const std::string& zipPath, const std::uint8_t* data, std::size_t size, std::string& outError);

  bool addFileFromBytes(const std::string& zipPath, const std::vector<std::uint8_t>& bytes, std::string& outError)
  {
    return addFileFromBytes(zipPath, bytes.data(), bytes.size(), outError);
  }

  bool addFileFromString(const std::string& zipPath, const std::string& text, std::string& outError)
  {
    return addFileFromBytes(zipPath, reinterpret_cast<const std::uint8_t*>(text.data()), text.size(), outError);
  }

  // Finish the archive (central directory + end-of-central-directory record).
  bool finalize(std::string& outError);

  // Abort writing and close the file. An unfinalized archive is left truncated.
  void close();

  bool active() const { return m_open; }
  std::size_t entryCount() const { return m_entries.size(); }
  const std::filesystem::path& path() const { return m_path; }

  static bool SanitizeZipPath(const std::string& in, std::string& out, std::string& outError);

private:
  struct Entry {
    std::string name;
    std::uint32_t crc32 = 0;
    std::uint32_t size = 0;
    std::uint32_t localHeaderOffset = 0;
  };

  bool writeCentralDirectory(std::string& outError);

  static void DosTimeDateFromTimeT(std::time_t t, std::uint16_t& outTime, std::uint16_t& outDate);

  bool m_open = false;
  bool m_finalized = false;
  std::uint16_t m_dosTime = 0;
  std::uint16_t m_dosDate = 0;
  std::filesystem::path m_path;
  std::unique_ptr<std::ofstream> m_ofs;
  std::vector<Entry> m_entries;
};

} // namespace pixvox
