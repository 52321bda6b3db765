#include "memory_tx.hpp"

#include <stdexcept>

namespace hostreg::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo_.tx_mutex_), working_(repo_.committed_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error(committed_ ? "transaction already committed" : "transaction already rolled back");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  working_  = {};
  finished_ = true;
  lock_.unlock();
}

} // namespace hostreg::db::memory
