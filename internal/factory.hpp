#pragma once

#include <memory>

#include "hostreg/config/v1/config.pb.h"

namespace hostreg::db {
class Repository;
}
namespace hostreg::core {
class Reconciler;
class Registry;
}
namespace hostreg::service {
class RegistryService;
}

namespace hostreg::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<core::Reconciler> reconciler;
  std::shared_ptr<core::Registry>   registry;

  std::shared_ptr<service::RegistryService> registry_service;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, tool and HTTP types.
*/
Application Build(const hostreg::config::v1::RuntimeConfig& config);

// sqlite (migrated) when configured, memory otherwise.
std::shared_ptr<db::Repository> BuildRepository(const hostreg::config::v1::RuntimeConfig& config);

} // namespace hostreg::factory
