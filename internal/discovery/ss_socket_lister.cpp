#include "ss_socket_lister.hpp"

#include "internal/discovery/port_mapper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hostreg::discovery {

using hostreg::observability::IntField;
using hostreg::observability::StringField;

SsSocketLister::SsSocketLister(std::shared_ptr<hostreg::util::CommandRunner> runner, std::string ss_path)
    : runner_(std::move(runner)), ss_path_(std::move(ss_path)) {
}

std::vector<hostreg::model::PortBinding> SsSocketLister::ListListeningPorts() {
  const std::vector<std::string> argv = {ss_path_, "-tlnp"};

  const auto result = runner_->Run(argv);
  if (result.exit_code != 0) {
    HOSTREG_LOG_WARN("ss failed", {StringField("command", hostreg::util::JoinArgv(argv)), IntField("exit_code", result.exit_code)});
    throw hostreg::util::ExternalToolError(hostreg::util::JoinArgv(argv) + " exited with status " + std::to_string(result.exit_code));
  }

  auto bindings = ParseListeningSockets(result.stdout_text);
  HOSTREG_LOG_DEBUG("Listed listening sockets", {IntField("count", static_cast<std::int64_t>(bindings.size()))});
  return bindings;
}

} // namespace hostreg::discovery
