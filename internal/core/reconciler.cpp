#include "reconciler.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/discovery/port_mapper.hpp"
#include "internal/discovery/service_manager.hpp"
#include "internal/discovery/socket_lister.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hostreg::core {

using hostreg::observability::IntField;
using hostreg::observability::StringField;

namespace {

void ThrowIfStoreError(const hostreg::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  const auto message = context + ": " + std::string(hostreg::db::ToString(result.code)) + (result.message.empty() ? "" : " (" + result.message + ")");
  HOSTREG_LOG_ERROR("Scan aborted by store error", {StringField("error", message)});
  throw hostreg::util::StoreError(message);
}

} // namespace

db::model::ServiceRecord ApplyObservation(db::model::ServiceRecord existing, const hostreg::model::ObservedUnit& unit, std::uint64_t now_ms) {
  existing.run_state          = unit.run_state;
  existing.last_scanned_at_ms = now_ms;
  existing.updated_at_ms      = now_ms;
  return existing;
}

db::model::ServiceRecord BuildRecord(const hostreg::model::ObservedUnit& unit, const Classification& classification, std::uint64_t now_ms) {
  db::model::ServiceRecord record;
  record.name               = unit.name;
  record.stage              = StageOf(classification);
  record.run_state          = unit.run_state;
  record.last_scanned_at_ms = now_ms;
  record.created_at_ms      = now_ms;
  record.updated_at_ms      = now_ms;

  if (const auto* discovered = std::get_if<Discovered>(&classification)) {
    record.port = discovered->port;
    if (!unit.description.empty()) {
      record.description = unit.description;
    }
  }
  return record;
}

Reconciler::Reconciler(std::shared_ptr<hostreg::discovery::ServiceManager> service_manager,
                       std::shared_ptr<hostreg::discovery::SocketLister> socket_lister, std::shared_ptr<hostreg::db::Repository> repository, Clock clock)
    : service_manager_(std::move(service_manager)),
      socket_lister_(std::move(socket_lister)),
      repository_(std::move(repository)),
      clock_(std::move(clock)) {
}

std::optional<hostreg::model::Pid> Reconciler::ResolvePidOrNone(const std::string& unit_name) {
  try {
    return service_manager_->ResolveMainPid(unit_name);
  } catch (const hostreg::util::ExternalToolError& e) {
    HOSTREG_LOG_WARN("PID lookup failed, classifying as raw", {StringField("unit", unit_name), StringField("error", e.what())});
    return std::nullopt;
  }
}

ScanSummary Reconciler::Scan() {
  std::unique_lock<std::mutex> guard(scan_mutex_, std::try_to_lock);
  if (!guard.owns_lock()) {
    throw hostreg::util::ScanInProgress("a scan is already in progress");
  }

  HOSTREG_LOG_INFO("Scan started");

  // Both listings happen before the transaction opens; a failure here writes nothing.
  const auto                        units = service_manager_->ListUnits();
  const hostreg::discovery::PortMap ports(socket_lister_->ListListeningPorts());

  const auto now_ms = hostreg::util::ToUnixMillis(clock_());

  ScanSummary summary;
  summary.total_scanned = static_cast<std::uint32_t>(units.size());

  auto tx = repository_->Begin();

  for (const auto& unit : units) {
    if (auto existing = repository_->GetService(*tx, unit.name)) {
      ThrowIfStoreError(repository_->UpdateService(*tx, ApplyObservation(std::move(*existing), unit, now_ms)), "update " + unit.name);
      ++summary.updated;
      continue;
    }

    const auto pid            = ResolvePidOrNone(unit.name);
    const auto classification = Classify(pid, ports);
    const auto record         = BuildRecord(unit, classification, now_ms);

    ThrowIfStoreError(repository_->InsertService(*tx, record), "insert " + unit.name);

    if (record.stage == hostreg::model::LifecycleStage::kDiscovered) {
      ++summary.new_discovered;
      HOSTREG_LOG_INFO("Discovered web service", {StringField("unit", unit.name), IntField("port", *record.port)});
    } else {
      ++summary.new_raw;
      HOSTREG_LOG_DEBUG("Recorded raw unit", {StringField("unit", unit.name), StringField("run_state", unit.run_state)});
    }
  }

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    HOSTREG_LOG_ERROR("Scan commit failed", {StringField("error", e.what())});
    throw hostreg::util::StoreError(std::string("commit scan: ") + e.what());
  }

  HOSTREG_LOG_INFO("Scan finished", {IntField("total_scanned", summary.total_scanned), IntField("new_discovered", summary.new_discovered),
                                     IntField("new_raw", summary.new_raw), IntField("updated", summary.updated)});
  return summary;
}

} // namespace hostreg::core
