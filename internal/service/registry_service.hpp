#pragma once

#include "hostreg/v1.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/db/model/service_record.hpp"
#include "internal/health/health_checker.hpp"
#include "service_context.hpp"

namespace hostreg::service {

/*
  Protobuf facade over Reconciler and Registry.

  Transport adapters (gRPC) call this; it owns the domain <-> hostreg.v1
  conversions and lets util exceptions propagate for status mapping.
*/
class RegistryService {
 public:
  explicit RegistryService(ServiceContext ctx);

  hostreg::v1::ScanResponse Scan(const hostreg::v1::ScanRequest& req);

  hostreg::v1::ListServicesResponse ListServices(const hostreg::v1::ListServicesRequest& req);

  hostreg::v1::ServiceRecord GetService(const hostreg::v1::GetServiceRequest& req);

  hostreg::v1::ServiceRecord CreateService(const hostreg::v1::CreateServiceRequest& req);

  hostreg::v1::ServiceRecord ConfigureService(const hostreg::v1::ConfigureServiceRequest& req);

  void DeleteService(const hostreg::v1::DeleteServiceRequest& req);

  hostreg::v1::HealthStatus CheckHealth(const hostreg::v1::CheckHealthRequest& req);

 private:
  ServiceContext ctx_;
};

hostreg::v1::ServiceRecord ToProto(const db::model::ServiceRecord& record);
hostreg::v1::ScanSummary   ToProto(const hostreg::core::ScanSummary& summary);
hostreg::v1::HealthStatus  ToProto(const hostreg::health::HealthStatus& status);

hostreg::v1::LifecycleStage ToProto(hostreg::model::LifecycleStage stage);

} // namespace hostreg::service
