#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace hostreg::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.ExecuteSQL(
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  const auto applied = executor.AppliedVersion();
  for (std::size_t i = applied; i < ordered_sql.size(); ++i) {
    const auto version = static_cast<uint32_t>(i + 1);
    executor.ExecuteSQL(ordered_sql[i]);
    executor.ExecuteSQL("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(version) + ", " +
                        std::to_string(hostreg::util::ToUnixMillis(hostreg::util::Now())) + ");");
    HOSTREG_LOG_INFO("Applied schema migration", {hostreg::observability::IntField("version", version)});
  }
}

const std::vector<std::string>& RegistryMigrations() {
  static const std::vector<std::string> kMigrations = {
      "CREATE TABLE IF NOT EXISTS services ("
      " name TEXT PRIMARY KEY,"
      " description TEXT,"
      " port INTEGER CHECK (port BETWEEN 1 AND 65535),"
      " health_endpoint TEXT,"
      " base_url TEXT,"
      " lifecycle_stage TEXT NOT NULL CHECK (lifecycle_stage IN ('raw','discovered','configured')),"
      " run_state TEXT NOT NULL,"
      " last_scanned_at_ms INTEGER,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS services_lifecycle_stage_idx ON services(lifecycle_stage);"};
  return kMigrations;
}

} // namespace hostreg::db::sql
