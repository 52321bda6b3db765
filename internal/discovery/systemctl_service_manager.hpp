#pragma once

#include <memory>
#include <string>

#include "internal/discovery/service_manager.hpp"
#include "internal/util/process.hpp"

namespace hostreg::discovery {

/*
  ServiceManager backed by the systemctl CLI.

    list:  systemctl list-units --type=service --all --no-pager --plain
    pid:   systemctl show <unit> --property=MainPID
*/
class SystemctlServiceManager final : public ServiceManager {
 public:
  SystemctlServiceManager(std::shared_ptr<hostreg::util::CommandRunner> runner, std::string systemctl_path = "systemctl");

  std::vector<hostreg::model::ObservedUnit> ListUnits() override;

  std::optional<hostreg::model::Pid> ResolveMainPid(const std::string& unit_name) override;

 private:
  std::string RunChecked(const std::vector<std::string>& argv);

  std::shared_ptr<hostreg::util::CommandRunner> runner_;
  std::string                                   systemctl_path_;
};

} // namespace hostreg::discovery
