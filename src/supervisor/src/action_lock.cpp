#include "../include/action_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include "../include/polling.hpp"

namespace fs = std::filesystem;

ActionLock::ActionLock(fs::path lockPath, std::chrono::milliseconds timeout,
                       std::chrono::milliseconds interval)
    : path_(std::move(lockPath)) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::system_error(ec, "ActionLock: create_directories(): " +
                                      path_.parent_path().string());
    }
  }

  fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    throw std::system_error(errno, std::generic_category(),
                            "ActionLock: open(): " + path_.string());
  }

  int lock_errno = 0;
  const bool acquired = pollUntil(
      [this, &lock_errno] {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) return true;
        if (errno != EWOULDBLOCK && errno != EINTR) {
          lock_errno = errno;
          return true;
        }
        return false;
      },
      timeout, interval);

  if (!acquired || lock_errno != 0) {
    ::close(fd_);
    fd_ = -1;
    if (lock_errno != 0) {
      throw std::system_error(lock_errno, std::generic_category(),
                              "ActionLock: flock(): " + path_.string());
    }
    throw std::runtime_error("ActionLock: Timed out waiting for " +
                             path_.string() + " (another webctl is running)");
  }
}

ActionLock::~ActionLock() {
  if (fd_ != -1) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}
