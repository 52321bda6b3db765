#pragma once

#include <memory>

namespace hostreg::core {
class Reconciler;
class Registry;
}

namespace hostreg::service {

/*
  Dependency container shared by the RPC-facing services.
*/
struct ServiceContext {
  std::shared_ptr<hostreg::core::Reconciler> reconciler;
  std::shared_ptr<hostreg::core::Registry>   registry;
};

} // namespace hostreg::service
