#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/core/reconciler.hpp"
#include "internal/core/registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/discovery/ss_socket_lister.hpp"
#include "internal/discovery/systemctl_service_manager.hpp"
#include "internal/health/curl_http_probe.hpp"
#include "internal/health/health_checker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/process.hpp"

namespace hostreg::factory {

using hostreg::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const hostreg::config::v1::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::RegistryMigrations());
    HOSTREG_LOG_INFO("Using sqlite registry", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  HOSTREG_LOG_INFO("Using in-memory registry");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const hostreg::config::v1::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Host tools
  // ------------------------------------------------------------------
  const auto& tools  = config.discovery();
  auto        runner = std::make_shared<util::ProcessCommandRunner>(std::chrono::milliseconds(tools.command_timeout_ms()));

  auto service_manager = std::make_shared<discovery::SystemctlServiceManager>(runner, tools.systemctl_path());
  auto socket_lister   = std::make_shared<discovery::SsSocketLister>(runner, tools.ss_path());

  // ------------------------------------------------------------------
  // Health
  // ------------------------------------------------------------------
  auto probe   = std::make_shared<health::CurlHttpProbe>(std::chrono::milliseconds(config.health().request_timeout_ms()));
  auto checker = std::make_shared<health::HealthChecker>(std::move(probe), std::chrono::seconds(config.health().cache_ttl_sec()));

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.reconciler = std::make_shared<core::Reconciler>(std::move(service_manager), std::move(socket_lister), app.repository);
  app.registry   = std::make_shared<core::Registry>(app.repository, std::move(checker));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.reconciler = app.reconciler;
  ctx.registry   = app.registry;

  app.registry_service = std::make_shared<service::RegistryService>(ctx);

  return app;
}

} // namespace hostreg::factory
