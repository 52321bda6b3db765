#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/service_record.hpp"

namespace hostreg::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - name is unique: InsertService on a taken name returns AlreadyExists
    (or ConstraintViolation, depending on the backend)
  - Nothing is visible to other transactions before Commit()

  The DB is the source of truth for the registry; the reconciler and the
  curation operations both write through here.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Services
  // ---------------------------------------------------------------------

  virtual Result InsertService(Transaction&, const model::ServiceRecord&) = 0;

  virtual std::optional<model::ServiceRecord> GetService(Transaction&, const std::string& name) = 0;

  // Ordered by name.
  virtual std::vector<model::ServiceRecord> ListServices(Transaction&) = 0;

  virtual Result UpdateService(Transaction&, const model::ServiceRecord&) = 0;

  // NotFound if no row has this name.
  virtual Result DeleteService(Transaction&, const std::string& name) = 0;
};

} // namespace hostreg::db
