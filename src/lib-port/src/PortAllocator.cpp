#include "webctl/PortAllocator.hpp"

namespace webctl {

PortAllocator::PortAllocator(PortRange range, const IPortProber& prober)
    : range_(range), prober_(prober) {}

int PortAllocator::allocate() const {
  int port = range_.start;

  for (std::size_t attempts = 0; attempts < range_.size(); ++attempts) {
    if (prober_.isAvailable(port)) {
      return port;
    }
    port = port == range_.end ? range_.start : port + 1;
  }

  throw ExhaustedRangeError(range_);
}

}  // namespace webctl
