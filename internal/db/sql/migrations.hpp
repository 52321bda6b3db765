#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hostreg::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and reports the highest migration
  version it has recorded (0 for a fresh database).
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual uint32_t AppliedVersion() = 0;
};

/*
  Runs migrations in order. Migration i (0-based) has version i + 1; only
  versions above AppliedVersion() are executed, each followed by a row in
  schema_migrations.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Registry schema, oldest first.
const std::vector<std::string>& RegistryMigrations();

} // namespace hostreg::db::sql
