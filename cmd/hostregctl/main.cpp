#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "hostreg/v1.hpp"
#include "hostreg/v1/registry_service.grpc.pb.h"

using namespace hostreg::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  hostregctl <addr> scan\n"
            << "  hostregctl <addr> list [raw|discovered|configured]\n"
            << "  hostregctl <addr> get <name>\n"
            << "  hostregctl <addr> create <name> <description> <base_url> [port=N] [health=/path]\n"
            << "  hostregctl <addr> configure <name> [description=..] [port=N] [health=/path] [base_url=..]\n"
            << "  hostregctl <addr> delete <name>\n"
            << "  hostregctl <addr> health <name> [--fresh]\n";
}

static std::optional<LifecycleStage> ParseStage(const std::string& value) {
  if (value == "raw") {
    return LIFECYCLE_STAGE_RAW;
  }
  if (value == "discovered") {
    return LIFECYCLE_STAGE_DISCOVERED;
  }
  if (value == "configured") {
    return LIFECYCLE_STAGE_CONFIGURED;
  }
  return std::nullopt;
}

// Splits "key=value"; returns false when there is no '='.
static bool SplitOption(const std::string& arg, std::string* key, std::string* value) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos) {
    return false;
  }
  *key   = arg.substr(0, eq);
  *value = arg.substr(eq + 1);
  return true;
}

static std::optional<uint32_t> ParsePort(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const auto  port     = std::stoul(value, &consumed);
    if (consumed != value.size() || port > UINT32_MAX) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(port);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static int PrintJson(const google::protobuf::Message& message) {
  std::string                           json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RegistryService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "scan") {
    ScanRequest  req;
    ScanResponse resp;

    auto status = stub->Scan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp.summary());
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListServicesRequest req;
    if (argc >= 4) {
      auto stage = ParseStage(argv[3]);
      if (!stage) {
        std::cerr << "unsupported stage: " << argv[3] << "\n";
        return 1;
      }
      req.set_stage(*stage);
    }

    ListServicesResponse resp;

    auto status = stub->ListServices(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetServiceRequest req;
    req.set_name(argv[3]);

    ServiceRecord resp;

    auto status = stub->GetService(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    CreateServiceRequest req;
    req.set_name(argv[3]);
    req.set_description(argv[4]);
    req.set_base_url(argv[5]);

    for (int i = 6; i < argc; ++i) {
      std::string key, value;
      if (!SplitOption(argv[i], &key, &value)) {
        std::cerr << "expected key=value, got: " << argv[i] << "\n";
        return 1;
      }
      if (key == "port") {
        auto port = ParsePort(value);
        if (!port) {
          std::cerr << "invalid port: " << value << "\n";
          return 1;
        }
        req.set_port(*port);
      } else if (key == "health") {
        req.set_health_endpoint(value);
      } else {
        std::cerr << "unknown option: " << key << "\n";
        return 1;
      }
    }

    ServiceRecord resp;

    auto status = stub->CreateService(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "configure") {
    if (argc < 4) return 1;

    ConfigureServiceRequest req;
    req.set_name(argv[3]);

    for (int i = 4; i < argc; ++i) {
      std::string key, value;
      if (!SplitOption(argv[i], &key, &value)) {
        std::cerr << "expected key=value, got: " << argv[i] << "\n";
        return 1;
      }
      if (key == "description") {
        req.set_description(value);
      } else if (key == "port") {
        auto port = ParsePort(value);
        if (!port) {
          std::cerr << "invalid port: " << value << "\n";
          return 1;
        }
        req.set_port(*port);
      } else if (key == "health") {
        req.set_health_endpoint(value);
      } else if (key == "base_url") {
        req.set_base_url(value);
      } else {
        std::cerr << "unknown option: " << key << "\n";
        return 1;
      }
    }

    ServiceRecord resp;

    auto status = stub->ConfigureService(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteServiceRequest req;
    req.set_name(argv[3]);

    google::protobuf::Empty resp;

    auto status = stub->DeleteService(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    if (argc < 4) return 1;

    CheckHealthRequest req;
    req.set_name(argv[3]);
    req.set_bypass_cache(argc >= 5 && std::string(argv[4]) == "--fresh");

    HealthStatus resp;

    auto status = stub->CheckHealth(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp);
  }

  Usage();
  return 1;
}
