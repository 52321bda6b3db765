#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/observation.hpp"

namespace hostreg::discovery {

/*
  Host service manager, as the reconciler sees it.

  ListUnits()       -> every service unit with its run state, in the
                       manager's own order
  ResolveMainPid()  -> main process of one unit; nullopt when the unit
                       has no running process

  Both throw util::ExternalToolError when the manager cannot be queried.
*/
class ServiceManager {
 public:
  virtual ~ServiceManager() = default;

  virtual std::vector<hostreg::model::ObservedUnit> ListUnits() = 0;

  virtual std::optional<hostreg::model::Pid> ResolveMainPid(const std::string& unit_name) = 0;
};

} // namespace hostreg::discovery
