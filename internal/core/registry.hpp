#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/service_record.hpp"
#include "internal/health/health_checker.hpp"
#include "internal/model/lifecycle.hpp"
#include "internal/util/time.hpp"

namespace hostreg::db {
class Repository;
}

namespace hostreg::core {

// Manual registration of a service discovery never saw.
struct NewService {
  std::string                  name;
  std::string                  description;
  std::string                  base_url;
  std::optional<std::int64_t>  port;
  std::optional<std::string>   health_endpoint;
};

// Partial update of the user-owned fields; unset members are left alone.
struct ServiceUpdate {
  std::optional<std::string>  description;
  std::optional<std::int64_t> port;
  std::optional<std::string>  health_endpoint;
  std::optional<std::string>  base_url;
};

/*
  Curation side of the registry.

  Everything here is a user action: scans never call into Registry and
  Registry never probes the host. Each operation is one transaction.

  Errors are thrown as util exceptions (NotFound, AlreadyExists,
  InvalidArgument, FailedPrecondition); repository failures surface as
  util::StoreError.
*/
class Registry {
 public:
  using Clock = std::function<hostreg::util::TimePoint()>;

  Registry(std::shared_ptr<hostreg::db::Repository> repository, std::shared_ptr<hostreg::health::HealthChecker> health,
           Clock clock = hostreg::util::Now);

  std::vector<db::model::ServiceRecord> ListAll();
  std::vector<db::model::ServiceRecord> ListByStage(hostreg::model::LifecycleStage stage);

  db::model::ServiceRecord Get(const std::string& name);

  db::model::ServiceRecord Create(const NewService& request);
  db::model::ServiceRecord Configure(const std::string& name, const ServiceUpdate& update);
  void                     Delete(const std::string& name);

  // Requires base_url and health_endpoint on the record.
  hostreg::health::HealthStatus CheckService(const std::string& name, bool use_cache = true);

 private:
  std::shared_ptr<hostreg::db::Repository>      repository_;
  std::shared_ptr<hostreg::health::HealthChecker> health_;
  Clock                                         clock_;
};

// Validation helpers, throw util::InvalidArgument.
void     ValidateName(const std::string& name);
uint16_t ValidatePort(std::int64_t port);
void     ValidateBaseUrl(const std::string& base_url);
void     ValidateHealthEndpoint(const std::string& endpoint);

} // namespace hostreg::core
