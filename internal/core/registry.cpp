#include "registry.hpp"

#include <algorithm>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hostreg::core {

using hostreg::model::LifecycleStage;
using hostreg::observability::StringField;

namespace {

constexpr std::size_t kMaxNameLength = 255;

void ThrowIfDbError(const hostreg::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  switch (result.code) {
    case hostreg::db::ErrorCode::NotFound:
      throw hostreg::util::NotFound(context + ": " + result.message);
    case hostreg::db::ErrorCode::AlreadyExists:
      throw hostreg::util::AlreadyExists(context + ": " + result.message);
    default:
      throw hostreg::util::StoreError(context + ": " + std::string(hostreg::db::ToString(result.code)) + " " + result.message);
  }
}

void CommitOrThrow(hostreg::db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const std::exception& e) {
    throw hostreg::util::StoreError(context + ": " + e.what());
  }
}

} // namespace

void ValidateName(const std::string& name) {
  if (name.empty() || name.size() > kMaxNameLength) {
    throw hostreg::util::InvalidArgument("name must be 1-255 characters");
  }
}

uint16_t ValidatePort(std::int64_t port) {
  if (port < 1 || port > 65535) {
    throw hostreg::util::InvalidArgument("port must be in 1-65535, got " + std::to_string(port));
  }
  return static_cast<uint16_t>(port);
}

void ValidateBaseUrl(const std::string& base_url) {
  std::string_view rest;
  if (base_url.starts_with("http://")) {
    rest = std::string_view(base_url).substr(7);
  } else if (base_url.starts_with("https://")) {
    rest = std::string_view(base_url).substr(8);
  } else {
    throw hostreg::util::InvalidArgument("base_url must start with http:// or https://");
  }
  if (rest.empty() || rest.front() == '/') {
    throw hostreg::util::InvalidArgument("base_url has no host");
  }
}

void ValidateHealthEndpoint(const std::string& endpoint) {
  if (!endpoint.starts_with('/')) {
    throw hostreg::util::InvalidArgument("health_endpoint must start with /");
  }
}

Registry::Registry(std::shared_ptr<hostreg::db::Repository> repository, std::shared_ptr<hostreg::health::HealthChecker> health, Clock clock)
    : repository_(std::move(repository)), health_(std::move(health)), clock_(std::move(clock)) {
}

std::vector<db::model::ServiceRecord> Registry::ListAll() {
  auto tx = repository_->Begin();
  return repository_->ListServices(*tx);
}

std::vector<db::model::ServiceRecord> Registry::ListByStage(LifecycleStage stage) {
  auto records = ListAll();
  records.erase(std::remove_if(records.begin(), records.end(), [stage](const auto& r) { return r.stage != stage; }), records.end());
  return records;
}

db::model::ServiceRecord Registry::Get(const std::string& name) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetService(*tx, name);
  if (!record) {
    throw hostreg::util::NotFound("service '" + name + "' not found");
  }
  return *record;
}

db::model::ServiceRecord Registry::Create(const NewService& request) {
  ValidateName(request.name);
  if (request.description.empty()) {
    throw hostreg::util::InvalidArgument("description is required");
  }
  ValidateBaseUrl(request.base_url);

  db::model::ServiceRecord record;
  record.name        = request.name;
  record.description = request.description;
  record.base_url    = request.base_url;
  if (request.port) {
    record.port = ValidatePort(*request.port);
  }
  if (request.health_endpoint) {
    ValidateHealthEndpoint(*request.health_endpoint);
    record.health_endpoint = request.health_endpoint;
  }
  record.stage     = LifecycleStage::kConfigured;
  record.run_state = "unknown";

  const auto now_ms    = hostreg::util::ToUnixMillis(clock_());
  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;

  auto tx = repository_->Begin();
  if (repository_->GetService(*tx, record.name)) {
    throw hostreg::util::AlreadyExists("service '" + record.name + "' already exists");
  }
  ThrowIfDbError(repository_->InsertService(*tx, record), "create service");
  CommitOrThrow(*tx, "create service");

  HOSTREG_LOG_INFO("Service registered manually", {StringField("name", record.name), StringField("base_url", request.base_url)});
  return record;
}

db::model::ServiceRecord Registry::Configure(const std::string& name, const ServiceUpdate& update) {
  if (update.port) {
    ValidatePort(*update.port);
  }
  if (update.base_url) {
    ValidateBaseUrl(*update.base_url);
  }
  if (update.health_endpoint) {
    ValidateHealthEndpoint(*update.health_endpoint);
  }

  auto tx       = repository_->Begin();
  auto existing = repository_->GetService(*tx, name);
  if (!existing) {
    throw hostreg::util::NotFound("service '" + name + "' not found");
  }

  auto record = std::move(*existing);
  if (update.description) {
    record.description = update.description;
  }
  if (update.port) {
    record.port = static_cast<uint16_t>(*update.port);
  }
  if (update.health_endpoint) {
    record.health_endpoint = update.health_endpoint;
  }
  if (update.base_url) {
    record.base_url = update.base_url;
  }

  if (!hostreg::model::CanTransition(record.stage, LifecycleStage::kConfigured)) {
    throw hostreg::util::FailedPrecondition("service '" + name + "' cannot be configured from stage " + std::string(ToString(record.stage)));
  }
  record.stage         = LifecycleStage::kConfigured;
  record.updated_at_ms = hostreg::util::ToUnixMillis(clock_());

  ThrowIfDbError(repository_->UpdateService(*tx, record), "configure service");
  CommitOrThrow(*tx, "configure service");

  HOSTREG_LOG_INFO("Service configured", {StringField("name", name)});
  return record;
}

void Registry::Delete(const std::string& name) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteService(*tx, name), "delete service");
  CommitOrThrow(*tx, "delete service");

  HOSTREG_LOG_INFO("Service deleted", {StringField("name", name)});
}

hostreg::health::HealthStatus Registry::CheckService(const std::string& name, bool use_cache) {
  const auto record = Get(name);
  if (!record.base_url) {
    throw hostreg::util::FailedPrecondition("service '" + name + "' has no base_url");
  }

  const auto url = hostreg::health::BuildHealthUrl(*record.base_url, record.health_endpoint);
  if (!url) {
    throw hostreg::util::FailedPrecondition("service '" + name + "' has no health_endpoint");
  }
  return health_->Check(*url, use_cache);
}

} // namespace hostreg::core
