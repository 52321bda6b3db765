#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace hostreg::db::memory {

/*
  Working copy of the registry, published on Commit().

  Transactions are serialized like the sqlite backend: the repository's
  tx_mutex_ is held from construction until Commit()/Rollback(), so a scan
  and a concurrent configure never race on the same copy.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace hostreg::db::memory
