#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace pixvox {

// RAII helper that duplicates std::cout/std::cerr output to a log file.
//
//  - A custom std::streambuf forwards writes to both the console streambuf and the file.
//  - Simple rotation: <log> -> <log>.1 -> <log>.2 ... up to keepFiles.
//  - File lines get a UTC timestamp and a stream tag; the console output is unchanged:
//      2026-01-27T16:40:12.345Z [OUT] wrote output/height_voxels.npz

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 disables rotation (the existing file is truncated).
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging. If already active, it is stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original std::cout/std::cerr streambufs and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace pixvox
