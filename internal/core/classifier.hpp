#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include "internal/discovery/port_mapper.hpp"
#include "internal/model/lifecycle.hpp"
#include "internal/model/observation.hpp"

namespace hostreg::core {

// Not a web service (or not running).
struct Raw {};

// Running and listening on a web-like port.
struct Discovered {
  std::uint16_t port = 0;
};

using Classification = std::variant<Raw, Discovered>;

/*
  First-sight classification of a unit.

  - no pid                              -> Raw
  - pid owns at least one web-like port -> Discovered{first such port in listing order}
  - otherwise                           -> Raw

  Never yields configured; that stage is reached by user action only.
*/
Classification Classify(std::optional<hostreg::model::Pid> pid, const hostreg::discovery::PortMap& ports);

hostreg::model::LifecycleStage StageOf(const Classification& classification);

} // namespace hostreg::core
