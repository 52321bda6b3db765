#pragma once

#include <memory>
#include <string>

#include "internal/discovery/socket_lister.hpp"
#include "internal/util/process.hpp"

namespace hostreg::discovery {

// SocketLister backed by `ss -tlnp`.
class SsSocketLister final : public SocketLister {
 public:
  SsSocketLister(std::shared_ptr<hostreg::util::CommandRunner> runner, std::string ss_path = "ss");

  std::vector<hostreg::model::PortBinding> ListListeningPorts() override;

 private:
  std::shared_ptr<hostreg::util::CommandRunner> runner_;
  std::string                                   ss_path_;
};

} // namespace hostreg::discovery
