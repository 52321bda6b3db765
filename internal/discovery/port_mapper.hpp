#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/observation.hpp"

namespace hostreg::discovery {

/*
  Parses `ss -tlnp`.

    State  Recv-Q Send-Q Local Address:Port Peer Address:Port Process
    LISTEN 0      511          0.0.0.0:80        0.0.0.0:*    users:(("nginx",pid=1234,fd=6))
    LISTEN 0      4096            [::]:8080         [::]:*    users:(("app",pid=99,fd=3))

  The first host:port token gives the port, the first pid=<digits> the owner.
  Rows missing either (headers, sockets without process info) are skipped,
  as are ports outside 1..65535.
*/
std::vector<hostreg::model::PortBinding> ParseListeningSockets(std::string_view text);

// 80, 443, 3000-3999, 4000-4999, 5000-5999, 8000-8999.
constexpr bool IsWebPort(std::int64_t port) {
  if (port == 80 || port == 443) {
    return true;
  }
  return (port >= 3000 && port <= 5999) || (port >= 8000 && port <= 8999);
}

// Bindings owned by pid, in input order.
std::vector<hostreg::model::PortBinding> PortsForPid(const std::vector<hostreg::model::PortBinding>& bindings, hostreg::model::Pid pid);

/*
  pid -> ports index over one socket listing.

  Built once per scan and passed by reference into classification, so the
  listing is fetched once no matter how many units are examined.
*/
class PortMap {
 public:
  PortMap() = default;
  explicit PortMap(const std::vector<hostreg::model::PortBinding>& bindings);

  // Ports of pid in listing order; empty if the pid owns no listener.
  const std::vector<std::uint16_t>& PortsFor(hostreg::model::Pid pid) const;

  std::size_t size() const {
    return binding_count_;
  }

 private:
  std::unordered_map<hostreg::model::Pid, std::vector<std::uint16_t>> by_pid_;
  std::size_t                                                         binding_count_ = 0;
};

} // namespace hostreg::discovery
