#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace mc {
namespace network {

struct IpEndpoint {
  std::string address;
  uint16_t port{0};

  std::string ltsToString() const {
    return address + ":" + std::to_string(port);
  }

  bool operator==(const IpEndpoint &other) const {
    return port == other.port && address == other.address;
  }
  bool operator!=(const IpEndpoint &other) const { return !(*this == other); }
};

inline std::ostream &operator<<(std::ostream &os, const IpEndpoint &endpoint) {
  return os << endpoint.address << ":" << endpoint.port;
}

} // namespace network
} // namespace mc
