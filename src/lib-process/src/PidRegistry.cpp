#include "webctl/PidRegistry.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

namespace webctl {

PidRegistry::PidRegistry(std::filesystem::path pidPath, IProcessHost& host)
    : mPidPath(std::move(pidPath)), mHost(host) {}

void PidRegistry::write(pid_t pid) {
  if (mPidPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(mPidPath.parent_path(), ec);
    if (ec) {
      throw std::system_error(
          ec, "PidRegistry: write(): Failed to create directory " +
                  mPidPath.parent_path().string());
    }
  }

  std::ofstream file(mPidPath, std::ios::trunc);
  if (!file) {
    throw std::system_error(
        errno, std::system_category(),
        "PidRegistry: write(): Failed to open PID file: " + mPidPath.string());
  }
  file << pid << '\n';
  file.flush();
  if (!file) {
    throw std::system_error(
        errno, std::system_category(),
        "PidRegistry: write(): Failed to write PID file: " + mPidPath.string());
  }

  if (chmod(mPidPath.c_str(), 0644) < 0) {
    throw std::system_error(
        errno, std::system_category(),
        "PidRegistry: write(): Failed to set PID file permissions");
  }
}

std::optional<pid_t> PidRegistry::read() const {
  std::ifstream file(mPidPath);
  if (!file) return std::nullopt;

  pid_t pid;
  if (!(file >> pid)) return std::nullopt;
  return pid;
}

bool PidRegistry::isAlive(std::optional<pid_t> pid) const {
  if (!pid || *pid <= 0) return false;
  return mHost.isAlive(*pid);
}

void PidRegistry::clear() noexcept {
  std::error_code ec;
  std::filesystem::remove(mPidPath, ec);
}

bool PidRegistry::exists() const {
  std::error_code ec;
  return std::filesystem::exists(mPidPath, ec);
}

}  // namespace webctl
