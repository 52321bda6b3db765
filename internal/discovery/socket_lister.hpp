#pragma once

#include <vector>

#include "internal/model/observation.hpp"

namespace hostreg::discovery {

/*
  Listening TCP sockets with their owning process.

  Throws util::ExternalToolError when the listing cannot be produced.
*/
class SocketLister {
 public:
  virtual ~SocketLister() = default;

  virtual std::vector<hostreg::model::PortBinding> ListListeningPorts() = 0;
};

} // namespace hostreg::discovery
