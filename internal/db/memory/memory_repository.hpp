#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace hostreg::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertService(Transaction&, const model::ServiceRecord&) override;
  std::optional<model::ServiceRecord> GetService(Transaction&, const std::string&) override;
  std::vector<model::ServiceRecord> ListServices(Transaction&) override;
  Result UpdateService(Transaction&, const model::ServiceRecord&) override;
  Result DeleteService(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered so ListServices comes out sorted by name
    std::map<std::string, model::ServiceRecord> services;
  };

  // held by the open MemoryTransaction, if any
  std::mutex tx_mutex_;
  State committed_;
};

}
