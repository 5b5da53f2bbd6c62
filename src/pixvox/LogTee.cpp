#include "pixvox/LogTee.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>

namespace pixvox {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += ".";
  p += std::to_string(idx);
  return p;
}

std::string TimestampUtcNow()
{
  using clock = std::chrono::system_clock;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch());
  const auto sec = std::chrono::duration_cast<std::chrono::seconds>(ms);
  const auto msRemainder = ms - sec;

  const std::time_t tt = static_cast<std::time_t>(sec.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(msRemainder.count()));
  return std::string(buf);
}

// Shared by the stdout and stderr buffers so their lines never interleave mid-line in the file.
struct TeeShared {
  std::mutex mutex;
  bool fileAtLineStart = true;
};

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, std::streambuf* file, TeeShared* shared, const char* tag, bool prefixLines)
      : m_console(console), m_file(file), m_shared(shared), m_tag(tag), m_prefixLines(prefixLines)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return (xsputn(&c, 1) == 1) ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::scoped_lock<std::mutex> lock(m_shared->mutex);

    const std::streamsize rc = m_console->sputn(s, n);
    const std::streamsize rf = m_prefixLines ? writeFilePrefixed(s, n) : m_file->sputn(s, n);
    return std::min(rc, rf);
  }

  int sync() override
  {
    std::scoped_lock<std::mutex> lock(m_shared->mutex);
    const int rc = m_console->pubsync();
    const int rf = m_file->pubsync();
    return (rc == 0 && rf == 0) ? 0 : -1;
  }

private:
  std::streamsize writeFilePrefixed(const char* s, std::streamsize n)
  {
    const char* p = s;
    const char* end = s + n;
    std::streamsize written = 0;

    while (p < end) {
      if (m_shared->fileAtLineStart) {
        const std::string prefix = TimestampUtcNow() + " [" + m_tag + "] ";
        if (m_file->sputn(prefix.data(), static_cast<std::streamsize>(prefix.size())) !=
            static_cast<std::streamsize>(prefix.size())) {
          return written;
        }
        m_shared->fileAtLineStart = false;
      }

      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(end - p)));
      const std::streamsize chunk = nl ? static_cast<std::streamsize>((nl - p) + 1) : static_cast<std::streamsize>(end - p);
      const std::streamsize wr = m_file->sputn(p, chunk);
      if (wr <= 0) return written;
      written += std::min(wr, chunk);
      if (wr < chunk) return written;

      if (nl) {
        m_shared->fileAtLineStart = true;
        // Flush per line so the log survives a crash right after a message.
        m_file->pubsync();
      }
      p += chunk;
    }
    return written;
  }

  std::streambuf* m_console = nullptr;
  std::streambuf* m_file = nullptr;
  TeeShared* m_shared = nullptr;
  std::string m_tag;
  bool m_prefixLines = true;
};

} // namespace

struct LogTee::Impl {
  std::ofstream file;
  std::filesystem::path path;
  TeeShared shared;

  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

const std::filesystem::path& LogTee::path() const
{
  static const std::filesystem::path kEmpty;
  return m_impl ? m_impl->path : kEmpty;
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path dst = RotatedPath(basePath, i);
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      std::ostringstream oss;
      oss << "failed to rotate log '" << src.string() << "' -> '" << dst.string() << "': " << ec.message();
      outError = oss.str();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  std::error_code ec;
  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }
  std::streambuf* fileBuf = impl->file.rdbuf();

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, fileBuf, &impl->shared, "OUT", opt.prefixLines);
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, fileBuf, &impl->shared, "ERR", opt.prefixLines);
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore first so logging during teardown never hits a closed file.
  if (m_impl->origCout && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->origCerr && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->file.flush();
  m_impl.reset();
}

} // namespace pixvox
