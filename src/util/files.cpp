#include "util/files.hpp"
#include <cerrno>
#include <fcntl.h>
#include <functional>
#include <thread>
#include <unistd.h>

namespace lorasim {
namespace util {

namespace {

std::error_code LastError() { return {errno, std::generic_category()}; }

// Owns a file descriptor for the duration of one write
class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() { reset(); }

  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // Close now and report the result; close errors on a written file matter
  std::error_code reset() {
    std::error_code ec;
    if (fd_ >= 0 && ::close(fd_) != 0) {
      ec = LastError();
    }
    fd_ = -1;
    return ec;
  }

private:
  int fd_;
};

std::error_code WriteAll(int fd, const std::string &data) {
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::write(fd, data.data() + total, data.size() - total);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return LastError();
    }
    total += static_cast<size_t>(n);
  }
  return {};
}

std::error_code SyncDirectory(const std::filesystem::path &dir) {
  ScopedFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (!fd.valid()) {
    return LastError();
  }
  if (::fsync(fd.get()) != 0) {
    return LastError();
  }
  return fd.reset();
}

} // namespace

std::error_code CreateOutputDirectory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec && ec != std::errc::file_exists) {
    return ec;
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    return ec ? ec : std::make_error_code(std::errc::not_a_directory);
  }
  return {};
}

std::error_code WriteFileAtomic(const std::filesystem::path &path,
                                const std::string &data) {
  std::filesystem::path parent = path.parent_path();
  if (parent.empty()) {
    parent = ".";
  } else if (auto ec = CreateOutputDirectory(parent)) {
    return ec;
  }

  // Unique per process and thread so concurrent writers never collide
  std::filesystem::path temp = path;
  temp += ".tmp." + std::to_string(::getpid()) + "." +
          std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);

  std::error_code ec;
  {
    ScopedFd fd(::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
      return LastError();
    }
    ec = WriteAll(fd.get(), data);
    if (!ec && ::fsync(fd.get()) != 0) {
      ec = LastError();
    }
    if (auto close_ec = fd.reset(); !ec) {
      ec = close_ec;
    }
  }

  if (!ec) {
    std::filesystem::rename(temp, path, ec);
  }
  if (!ec) {
    return SyncDirectory(parent);
  }

  std::error_code ignored;
  std::filesystem::remove(temp, ignored);
  return ec;
}

} // namespace util
} // namespace lorasim
