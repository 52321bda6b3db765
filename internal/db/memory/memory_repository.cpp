#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace hostreg::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertService(Transaction& t, const model::ServiceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.services.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "service '" + r.name + "' already exists");
  s.services[r.name] = r;
  return Result::Ok();
}

std::optional<model::ServiceRecord> MemoryRepository::GetService(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.services.find(name);
  if (it == s.services.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ServiceRecord> MemoryRepository::ListServices(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::ServiceRecord> records;
  records.reserve(s.services.size());
  for (const auto& [_, record] : s.services) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateService(Transaction& t, const model::ServiceRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.services.find(r.name);
  if (it == s.services.end()) return Result::Err(ErrorCode::NotFound, "service '" + r.name + "' not found");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteService(Transaction& t, const std::string& name) {
  auto& s = TX(t).Mutable();
  if (s.services.erase(name) == 0) return Result::Err(ErrorCode::NotFound, "service '" + name + "' not found");
  return Result::Ok();
}

} // namespace hostreg::db::memory
