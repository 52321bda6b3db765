#include "registry_server.hpp"

#include "grpc_error.hpp"

namespace hostreg::grpc {

using namespace hostreg::v1;

RegistryServer::RegistryServer(std::shared_ptr<hostreg::service::RegistryService> svc) : service_(std::move(svc)) {
}

::grpc::Status RegistryServer::Scan(::grpc::ServerContext*, const ScanRequest* req, ScanResponse* resp) {
  try {
    *resp = service_->Scan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListServices(::grpc::ServerContext*, const ListServicesRequest* req, ListServicesResponse* resp) {
  try {
    *resp = service_->ListServices(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetService(::grpc::ServerContext*, const GetServiceRequest* req, ServiceRecord* resp) {
  try {
    *resp = service_->GetService(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::CreateService(::grpc::ServerContext*, const CreateServiceRequest* req, ServiceRecord* resp) {
  try {
    *resp = service_->CreateService(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ConfigureService(::grpc::ServerContext*, const ConfigureServiceRequest* req, ServiceRecord* resp) {
  try {
    *resp = service_->ConfigureService(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::DeleteService(::grpc::ServerContext*, const DeleteServiceRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteService(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::CheckHealth(::grpc::ServerContext*, const CheckHealthRequest* req, HealthStatus* resp) {
  try {
    *resp = service_->CheckHealth(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace hostreg::grpc
