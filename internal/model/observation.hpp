#pragma once

#include <cstdint>
#include <string>

namespace hostreg::model {

using Pid = std::int32_t;

// One row of the service manager's unit listing.
struct ObservedUnit {
  std::string name;
  std::string run_state;
  std::string description;
};

// One listening TCP socket and the process that owns it.
struct PortBinding {
  std::uint16_t port      = 0;
  Pid           owner_pid = 0;
};

inline bool operator==(const ObservedUnit& a, const ObservedUnit& b) {
  return a.name == b.name && a.run_state == b.run_state && a.description == b.description;
}

inline bool operator==(const PortBinding& a, const PortBinding& b) {
  return a.port == b.port && a.owner_pid == b.owner_pid;
}

} // namespace hostreg::model
