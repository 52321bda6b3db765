#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "hostreg/v1/registry_service.grpc.pb.h"
#include "internal/service/registry_service.hpp"

namespace hostreg::grpc {

class RegistryServer final : public hostreg::v1::RegistryService::Service {
 public:
  explicit RegistryServer(std::shared_ptr<hostreg::service::RegistryService> svc);

  ::grpc::Status Scan(::grpc::ServerContext*, const hostreg::v1::ScanRequest*, hostreg::v1::ScanResponse*) override;

  ::grpc::Status ListServices(::grpc::ServerContext*, const hostreg::v1::ListServicesRequest*, hostreg::v1::ListServicesResponse*) override;

  ::grpc::Status GetService(::grpc::ServerContext*, const hostreg::v1::GetServiceRequest*, hostreg::v1::ServiceRecord*) override;

  ::grpc::Status CreateService(::grpc::ServerContext*, const hostreg::v1::CreateServiceRequest*, hostreg::v1::ServiceRecord*) override;

  ::grpc::Status ConfigureService(::grpc::ServerContext*, const hostreg::v1::ConfigureServiceRequest*, hostreg::v1::ServiceRecord*) override;

  ::grpc::Status DeleteService(::grpc::ServerContext*, const hostreg::v1::DeleteServiceRequest*, google::protobuf::Empty*) override;

  ::grpc::Status CheckHealth(::grpc::ServerContext*, const hostreg::v1::CheckHealthRequest*, hostreg::v1::HealthStatus*) override;

 private:
  std::shared_ptr<hostreg::service::RegistryService> service_;
};

} // namespace hostreg::grpc
