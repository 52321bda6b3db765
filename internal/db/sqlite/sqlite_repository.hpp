#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace hostreg::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertService(Transaction&, const model::ServiceRecord&) override;
  std::optional<model::ServiceRecord> GetService(Transaction&, const std::string&) override;
  std::vector<model::ServiceRecord> ListServices(Transaction&) override;
  Result UpdateService(Transaction&, const model::ServiceRecord&) override;
  Result DeleteService(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
