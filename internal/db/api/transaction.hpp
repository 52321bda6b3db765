#pragma once

namespace hostreg::db {

/*
  Unit of work over the registry.

  A scan runs entirely inside one transaction; curation calls each use their
  own. Every backend provides:

  - writes stay private until Commit()
  - Rollback(), or destruction without Commit(), leaves the store as it was
    when the transaction began
  - one open transaction per store at a time; Commit()/Rollback() release it

  sqlite: BEGIN IMMEDIATE on the shared connection
  memory: private copy swapped in on Commit()
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // no-op once finished
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace hostreg::db
