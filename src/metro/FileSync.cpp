#include "metro/FileSync.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace metro {

namespace {

namespace fs = std::filesystem;

// Owns a POSIX descriptor for the duration of one flush.
class ScopedFd {
public:
  explicit ScopedFd(int fd) : m_fd(fd) {}
  ~ScopedFd()
  {
    if (m_fd >= 0) ::close(m_fd);
  }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  bool valid() const { return m_fd >= 0; }
  int get() const { return m_fd; }

private:
  int m_fd = -1;
};

// Durability is opportunistic: some filesystems refuse to fsync a directory,
// and the rename has already made the new blob visible by then.
void FlushToDisk(const fs::path& p, bool isDirectory)
{
  int flags = O_RDONLY;
#ifdef O_DIRECTORY
  if (isDirectory) flags |= O_DIRECTORY;
#endif
  ScopedFd fd(::open(p.c_str(), flags));
  if (!fd.valid()) return;
  (void)::fsync(fd.get());
}

bool WriteWhole(const fs::path& p, const std::string& contents, std::string& outError)
{
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) {
    outError = "cannot create " + p.string();
    return false;
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  out.flush();
  if (!out) {
    outError = "short write to " + p.string();
    return false;
  }
  return true;
}

} // namespace

bool WriteFileAtomic(const fs::path& path, const std::string& contents, std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "empty path";
    return false;
  }

  const fs::path parent = path.has_parent_path() ? path.parent_path() : fs::path(".");
  fs::path staging = path;
  staging += ".tmp";

  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    outError = "cannot create directory " + parent.string() + ": " + ec.message();
    return false;
  }

  if (!WriteWhole(staging, contents, outError)) {
    fs::remove(staging, ec);
    return false;
  }
  FlushToDisk(staging, false);

  fs::rename(staging, path, ec);
  if (ec) {
    outError = "cannot replace " + path.string() + ": " + ec.message();
    std::error_code ignored;
    fs::remove(staging, ignored);
    return false;
  }

  FlushToDisk(parent, true);
  return true;
}

bool ReadFileText(const fs::path& path, std::string& outText, std::string& outError)
{
  outError.clear();
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    outError = "cannot open " + path.string();
    return false;
  }

  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    outError = "read error on " + path.string();
    return false;
  }
  outText = std::move(text);
  return true;
}

} // namespace metro
