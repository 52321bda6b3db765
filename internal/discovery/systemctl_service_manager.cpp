#include "systemctl_service_manager.hpp"

#include "internal/discovery/unit_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hostreg::discovery {

using hostreg::observability::IntField;
using hostreg::observability::StringField;

SystemctlServiceManager::SystemctlServiceManager(std::shared_ptr<hostreg::util::CommandRunner> runner, std::string systemctl_path)
    : runner_(std::move(runner)), systemctl_path_(std::move(systemctl_path)) {
}

std::string SystemctlServiceManager::RunChecked(const std::vector<std::string>& argv) {
  auto result = runner_->Run(argv);
  if (result.exit_code != 0) {
    HOSTREG_LOG_WARN("systemctl failed", {StringField("command", hostreg::util::JoinArgv(argv)), IntField("exit_code", result.exit_code)});
    throw hostreg::util::ExternalToolError(hostreg::util::JoinArgv(argv) + " exited with status " + std::to_string(result.exit_code));
  }
  return std::move(result.stdout_text);
}

std::vector<hostreg::model::ObservedUnit> SystemctlServiceManager::ListUnits() {
  const auto output = RunChecked({systemctl_path_, "list-units", "--type=service", "--all", "--no-pager", "--plain"});
  auto       units  = ParseUnitList(output);
  HOSTREG_LOG_DEBUG("Listed service units", {IntField("count", static_cast<std::int64_t>(units.size()))});
  return units;
}

std::optional<hostreg::model::Pid> SystemctlServiceManager::ResolveMainPid(const std::string& unit_name) {
  const auto output = RunChecked({systemctl_path_, "show", unit_name, "--property=MainPID"});
  return ParseMainPid(output);
}

} // namespace hostreg::discovery
