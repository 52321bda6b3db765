#include "registry_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/core/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace hostreg::service {

using namespace hostreg::v1;

using hostreg::observability::IntField;
using hostreg::observability::StringField;

namespace {

hostreg::model::LifecycleStage FromProto(LifecycleStage stage) {
  switch (stage) {
    case LIFECYCLE_STAGE_RAW:
      return hostreg::model::LifecycleStage::kRaw;
    case LIFECYCLE_STAGE_DISCOVERED:
      return hostreg::model::LifecycleStage::kDiscovered;
    case LIFECYCLE_STAGE_CONFIGURED:
      return hostreg::model::LifecycleStage::kConfigured;
    default:
      throw hostreg::util::InvalidArgument("unknown lifecycle stage " + std::to_string(static_cast<int>(stage)));
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      HOSTREG_LOG_DEBUG("RPC ok", {StringField("route", route), IntField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      HOSTREG_LOG_DEBUG("RPC ok", {StringField("route", route), IntField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    HOSTREG_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

hostreg::v1::LifecycleStage ToProto(hostreg::model::LifecycleStage stage) {
  switch (stage) {
    case hostreg::model::LifecycleStage::kRaw:
      return LIFECYCLE_STAGE_RAW;
    case hostreg::model::LifecycleStage::kDiscovered:
      return LIFECYCLE_STAGE_DISCOVERED;
    case hostreg::model::LifecycleStage::kConfigured:
      return LIFECYCLE_STAGE_CONFIGURED;
  }
  return LIFECYCLE_STAGE_UNSPECIFIED;
}

hostreg::v1::ServiceRecord ToProto(const db::model::ServiceRecord& record) {
  hostreg::v1::ServiceRecord out;
  out.set_name(record.name);
  if (record.description) out.set_description(*record.description);
  if (record.port) out.set_port(*record.port);
  if (record.health_endpoint) out.set_health_endpoint(*record.health_endpoint);
  if (record.base_url) out.set_base_url(*record.base_url);
  out.set_lifecycle_stage(ToProto(record.stage));
  out.set_run_state(record.run_state);
  if (record.last_scanned_at_ms) {
    *out.mutable_last_scanned_at() = hostreg::util::UnixMillisToProto(*record.last_scanned_at_ms);
  }
  *out.mutable_created_at() = hostreg::util::UnixMillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = hostreg::util::UnixMillisToProto(record.updated_at_ms);
  return out;
}

hostreg::v1::ScanSummary ToProto(const hostreg::core::ScanSummary& summary) {
  hostreg::v1::ScanSummary out;
  out.set_total_scanned(summary.total_scanned);
  out.set_new_discovered(summary.new_discovered);
  out.set_new_raw(summary.new_raw);
  out.set_updated(summary.updated);
  return out;
}

hostreg::v1::HealthStatus ToProto(const hostreg::health::HealthStatus& status) {
  hostreg::v1::HealthStatus out;
  out.set_healthy(status.healthy);
  if (status.status_code) out.set_status_code(*status.status_code);
  if (status.error) out.set_error(*status.error);
  *out.mutable_checked_at() = hostreg::util::ToProto(status.checked_at);
  out.set_url(status.url);
  return out;
}

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ScanResponse RegistryService::Scan(const ScanRequest&) {
  return ObserveRpc("RegistryService.Scan", [&] {
    ScanResponse resp;
    *resp.mutable_summary() = ToProto(ctx_.reconciler->Scan());
    return resp;
  });
}

ListServicesResponse RegistryService::ListServices(const ListServicesRequest& req) {
  return ObserveRpc("RegistryService.ListServices", [&] {
    const auto records =
        req.stage() == LIFECYCLE_STAGE_UNSPECIFIED ? ctx_.registry->ListAll() : ctx_.registry->ListByStage(FromProto(req.stage()));

    ListServicesResponse resp;
    for (const auto& record : records) {
      *resp.add_services() = ToProto(record);
    }
    return resp;
  });
}

hostreg::v1::ServiceRecord RegistryService::GetService(const GetServiceRequest& req) {
  return ObserveRpc("RegistryService.GetService", [&] { return ToProto(ctx_.registry->Get(req.name())); });
}

hostreg::v1::ServiceRecord RegistryService::CreateService(const CreateServiceRequest& req) {
  return ObserveRpc("RegistryService.CreateService", [&] {
    hostreg::core::NewService request;
    request.name        = req.name();
    request.description = req.description();
    request.base_url    = req.base_url();
    if (req.has_port()) request.port = req.port();
    if (req.has_health_endpoint()) request.health_endpoint = req.health_endpoint();
    return ToProto(ctx_.registry->Create(request));
  });
}

hostreg::v1::ServiceRecord RegistryService::ConfigureService(const ConfigureServiceRequest& req) {
  return ObserveRpc("RegistryService.ConfigureService", [&] {
    hostreg::core::ServiceUpdate update;
    if (req.has_description()) update.description = req.description();
    if (req.has_port()) update.port = req.port();
    if (req.has_health_endpoint()) update.health_endpoint = req.health_endpoint();
    if (req.has_base_url()) update.base_url = req.base_url();
    return ToProto(ctx_.registry->Configure(req.name(), update));
  });
}

void RegistryService::DeleteService(const DeleteServiceRequest& req) {
  ObserveRpc("RegistryService.DeleteService", [&] { ctx_.registry->Delete(req.name()); });
}

hostreg::v1::HealthStatus RegistryService::CheckHealth(const CheckHealthRequest& req) {
  return ObserveRpc("RegistryService.CheckHealth", [&] { return ToProto(ctx_.registry->CheckService(req.name(), !req.bypass_cache())); });
}

} // namespace hostreg::service
