#include "file_handle.hpp"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace haul {

namespace {

Status io_failure(const char *what, const std::string &path, int err) {
  return Status::failure(ErrorKind::Io, std::string(what) + " " + path + ": " +
                                            std::strerror(err));
}

timespec to_timespec(double ms) {
  timespec ts{};
  double secs = std::floor(ms / 1000.0);
  ts.tv_sec = (time_t)secs;
  ts.tv_nsec = (long)((ms - secs * 1000.0) * 1000000.0);
  if (ts.tv_nsec < 0)
    ts.tv_nsec = 0;
  if (ts.tv_nsec > 999999999)
    ts.tv_nsec = 999999999;
  return ts;
}

} // namespace

FileHandle &FileHandle::operator=(FileHandle &&other) noexcept {
  if (this != &other) {
    if (fd_ >= 0)
      ::close(fd_);
    path_ = std::move(other.path_);
    fd_ = other.release();
  }
  return *this;
}

FileHandle::~FileHandle() {
  if (fd_ >= 0)
    ::close(fd_);
}

Status FileHandle::open(const std::string &path, int flags, uint32_t mode,
                        FileHandle &out) {
  int fd;
  do {
    fd = ::open(path.c_str(), flags | O_CLOEXEC, (mode_t)mode);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0)
    return io_failure("unable to open", path, errno);
  out = FileHandle(fd);
  out.path_ = path;
  return Status::success();
}

Status FileHandle::write_all(const uint8_t *data, size_t len) {
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::write(fd_, data + done, len - done);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return io_failure("write failed on", path_, errno);
    }
    done += (size_t)n;
  }
  return Status::success();
}

Status FileHandle::write_at(const uint8_t *data, size_t len, uint64_t offset) {
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::pwrite(fd_, data + done, len - done, (off_t)(offset + done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return io_failure("write failed on", path_, errno);
    }
    done += (size_t)n;
  }
  return Status::success();
}

Status FileHandle::set_times(double atime_ms, double mtime_ms) {
  timespec times[2] = {to_timespec(atime_ms), to_timespec(mtime_ms)};
  if (::futimens(fd_, times) != 0)
    return io_failure("unable to set times on", path_, errno);
  return Status::success();
}

Status FileHandle::close() {
  if (fd_ < 0)
    return Status::success();
  int fd = release();
  if (::close(fd) != 0 && errno != EINTR)
    return io_failure("close failed on", path_, errno);
  return Status::success();
}

} // namespace haul
