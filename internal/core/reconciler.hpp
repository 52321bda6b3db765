#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/core/classifier.hpp"
#include "internal/db/model/service_record.hpp"
#include "internal/model/observation.hpp"
#include "internal/util/time.hpp"

namespace hostreg::db {
class Repository;
}
namespace hostreg::discovery {
class ServiceManager;
class SocketLister;
}

namespace hostreg::core {

struct ScanSummary {
  std::uint32_t total_scanned  = 0;
  std::uint32_t new_discovered = 0;
  std::uint32_t new_raw        = 0;
  std::uint32_t updated        = 0;
};

// Known record seen again: refresh run_state and scan/update times, nothing else.
db::model::ServiceRecord ApplyObservation(db::model::ServiceRecord existing, const hostreg::model::ObservedUnit& unit, std::uint64_t now_ms);

// First sight of a unit. description is kept only for discovered units.
db::model::ServiceRecord BuildRecord(const hostreg::model::ObservedUnit& unit, const Classification& classification, std::uint64_t now_ms);

/*
  Reconciles the host's service units into the registry.

  One Scan():
    1. lists units and listening sockets, once each, before any write
    2. in one transaction, per unit in listing order:
         known name   -> ApplyObservation
         unknown name -> resolve pid, Classify, BuildRecord, insert
    3. commits once

  Failures:
    - unit or socket listing fails  -> util::ExternalToolError, nothing written
    - pid lookup fails              -> logged, unit classified Raw
    - repository rejects a write    -> util::StoreError, transaction rolled back
    - another Scan() is running     -> util::ScanInProgress
*/
class Reconciler {
 public:
  using Clock = std::function<hostreg::util::TimePoint()>;

  Reconciler(std::shared_ptr<hostreg::discovery::ServiceManager> service_manager, std::shared_ptr<hostreg::discovery::SocketLister> socket_lister,
             std::shared_ptr<hostreg::db::Repository> repository, Clock clock = hostreg::util::Now);

  ScanSummary Scan();

 private:
  std::optional<hostreg::model::Pid> ResolvePidOrNone(const std::string& unit_name);

  std::shared_ptr<hostreg::discovery::ServiceManager> service_manager_;
  std::shared_ptr<hostreg::discovery::SocketLister>   socket_lister_;
  std::shared_ptr<hostreg::db::Repository>            repository_;
  Clock                                               clock_;

  // Held for the whole scan; a second caller is rejected, not queued.
  std::mutex scan_mutex_;
};

} // namespace hostreg::core
