#include <regionmerge/errors.hpp>
#include <regionmerge/io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace regionmerge {
namespace io {

static IoError io_error(std::string_view what, const fs::path& p, int err) {
  return IoError(fmt::format("{} {}: {}", what, p.string(), std::strerror(err)));
}

std::string read_file(const fs::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) throw io_error("open", path, errno);

  std::string out;
  struct stat st {};
  if (::fstat(fd, &st) == 0 && st.st_size > 0)
    out.reserve(static_cast<std::size_t>(st.st_size));

  char buf[64 * 1024];
  for (;;) {
    ssize_t r = ::read(fd, buf, sizeof(buf));
    if (r < 0) {
      if (errno == EINTR) continue;
      const int e = errno;
      ::close(fd);
      throw io_error("read", path, e);
    }
    if (r == 0) break;
    out.append(buf, static_cast<std::size_t>(r));
  }
  ::close(fd);
  return out;
}

static inline void fsync_dir_path(const fs::path& dir) {
  int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd >= 0) { (void)::fsync(dfd); ::close(dfd); }
}

void write_file_atomic(const fs::path& path, std::string_view bytes) {
  fs::path tmp = path;
  tmp += ".tmp";

  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) throw io_error("open", tmp, errno);

  // a replaced file keeps its permission bits
  struct stat st {};
  if (::stat(path.c_str(), &st) == 0 && ::fchmod(fd, st.st_mode & 07777) != 0) {
    const int e = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    throw io_error("fchmod", tmp, e);
  }

  const char* ptr = bytes.data();
  std::size_t left = bytes.size();
  while (left > 0) {
    ssize_t w = ::write(fd, ptr, left);
    if (w < 0) {
      if (errno == EINTR) continue;
      const int e = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      throw io_error("write", tmp, e);
    }
    ptr  += w;
    left -= static_cast<std::size_t>(w);
  }

  if (::fsync(fd) != 0) {
    const int e = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    throw io_error("fsync", tmp, e);
  }
  ::close(fd);

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    const int e = errno;
    ::unlink(tmp.c_str());
    throw io_error("rename", path, e);
  }
  fsync_dir_path(path.parent_path());
}

uint64_t xxh64(std::string_view bytes) {
  XXH64_state_t* st = XXH64_createState();
  if (!st) throw IoError("XXH64_createState failed");
  XXH64_reset(st, 0);
  if (!bytes.empty()) XXH64_update(st, bytes.data(), bytes.size());
  const uint64_t h = static_cast<uint64_t>(XXH64_digest(st));
  XXH64_freeState(st);
  return h;
}

void copy_file_verified(const fs::path& from, const fs::path& to) {
  const std::string src = read_file(from);
  const uint64_t want = xxh64(src);
  write_file_atomic(to, src);

  const uint64_t got = xxh64(read_file(to));
  if (got != want) {
    throw IoError(fmt::format("copy verification failed for {}: xxh64 {:016x} != {:016x}",
                              to.string(), got, want));
  }
  spdlog::debug("copied {} -> {} ({} bytes, xxh64 {:016x})", from.string(),
                to.string(), src.size(), want);
}

} // namespace io
} // namespace regionmerge
