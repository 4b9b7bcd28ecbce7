#include "depgraph/storage/store_lock.hpp"

#include "depgraph/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace depgraph {

auto StoreLock::acquire(const std::string& tasks_path) -> Result<StoreLock> {
  auto lock_path = tasks_path + ".lock";
  int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    log::error("Failed to open lock file {}: {}", lock_path,
               std::strerror(errno));
    return fail(Error::LockFailed);
  }

  int rc;
  do {
    rc = ::flock(fd, LOCK_EX);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) {
    log::error("Failed to lock {}: {}", lock_path, std::strerror(errno));
    ::close(fd);
    return fail(Error::LockFailed);
  }

  log::debug("Acquired store lock {}", lock_path);
  return StoreLock{fd, std::move(lock_path)};
}

StoreLock::StoreLock(StoreLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

auto StoreLock::operator=(StoreLock&& other) noexcept -> StoreLock& {
  if (this != &other) {
    release();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

StoreLock::~StoreLock() { release(); }

auto StoreLock::release() noexcept -> void {
  if (fd_ < 0) {
    return;
  }
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

}  // namespace depgraph
