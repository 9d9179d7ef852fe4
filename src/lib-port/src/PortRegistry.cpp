#include "webctl/PortRegistry.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

namespace webctl {

PortRegistry::PortRegistry(std::filesystem::path path, PortRange range)
    : path_(std::move(path)), range_(range) {}

void PortRegistry::write(int port) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::system_error(ec, "PortRegistry: write(): Failed to create "
                                  "directory " +
                                      path_.parent_path().string());
    }
  }

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    throw std::system_error(errno, std::system_category(),
                            "PortRegistry: write(): Failed to open port file: " +
                                path_.string());
  }
  out << port << '\n';
  out.flush();
  if (!out) {
    throw std::system_error(errno, std::system_category(),
                            "PortRegistry: write(): Failed to write port file: " +
                                path_.string());
  }
}

std::optional<int> PortRegistry::read() const {
  std::ifstream in(path_);
  if (!in) return std::nullopt;

  long port = 0;
  if (!(in >> port)) return std::nullopt;
  if (port < range_.start || port > range_.end) return std::nullopt;
  return static_cast<int>(port);
}

}  // namespace webctl
