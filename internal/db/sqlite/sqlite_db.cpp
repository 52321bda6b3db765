#include "sqlite_db.hpp"

#include <stdexcept>

namespace hostreg::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  // primary key violations are reported as SQLITE_CONSTRAINT_PRIMARYKEY
  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::ExecuteSQL(const std::string& sql) {
  Exec(sql);
}

uint32_t SqliteDB::AppliedVersion() {
  sqlite3_stmt* stmt = Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
  uint32_t      version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = static_cast<uint32_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers proceed while a scan holds the write lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace hostreg::db::sqlite
