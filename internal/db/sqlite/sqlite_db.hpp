#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace hostreg::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Also the migration executor for the sqlite backend.
*/
class SqliteDB final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // One open transaction per connection; held by SqliteTransaction.
  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  void     ExecuteSQL(const std::string& sql) override;
  uint32_t AppliedVersion() override;

 private:
  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace hostreg::db::sqlite
