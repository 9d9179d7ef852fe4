#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace webctl {

/**
 * @struct PortRange
 * @brief Замкнутый интервал TCP-портов [start, end], доступных для выделения
 */
struct PortRange {
  int start = 4000;
  int end = 4099;

  PortRange() = default;

  /**
   * @throw std::invalid_argument Если границы вне 1..65535 или start > end
   */
  PortRange(int first, int last) : start(first), end(last) {
    if (first < 1 || last > 65535 || first > last) {
      throw std::invalid_argument("PortRange: Invalid port range [" +
                                  std::to_string(first) + ", " +
                                  std::to_string(last) + "]");
    }
  }

  std::size_t size() const { return static_cast<std::size_t>(end - start + 1); }

  bool contains(int port) const { return port >= start && port <= end; }

  std::string toString() const {
    return "[" + std::to_string(start) + ", " + std::to_string(end) + "]";
  }
};

}  // namespace webctl
