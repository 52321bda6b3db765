#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/lifecycle.hpp"

namespace hostreg::db::model {

/*
  Persistent registry row, keyed by unit name.

  Ownership of fields:
  - scan-owned:  run_state, last_scanned_at_ms
  - user-owned:  description, port, health_endpoint, base_url
  - set once:    name, created_at_ms
  A scan writes the user-owned fields only when it creates the row.

  Timestamps are epoch milliseconds (UTC).
*/

struct ServiceRecord {
  std::string name;

  std::optional<std::string>   description;
  std::optional<std::uint16_t> port;
  std::optional<std::string>   health_endpoint;
  std::optional<std::string>   base_url;

  hostreg::model::LifecycleStage stage = hostreg::model::LifecycleStage::kRaw;

  // host-reported state token, verbatim (active, inactive, failed, ...)
  std::string run_state;

  std::optional<std::uint64_t> last_scanned_at_ms;
  std::uint64_t                created_at_ms = 0;
  std::uint64_t                updated_at_ms = 0;

  bool operator==(const ServiceRecord&) const = default;
};

} // namespace hostreg::db::model
