#include "internal/core/reconciler.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/discovery/service_manager.hpp"
#include "internal/discovery/socket_lister.hpp"
#include "internal/util/errors.hpp"

namespace {

using hostreg::core::ApplyObservation;
using hostreg::core::Reconciler;
using hostreg::db::ErrorCode;
using hostreg::db::Repository;
using hostreg::db::Result;
using hostreg::db::Transaction;
using hostreg::db::memory::MemoryRepository;
using hostreg::db::model::ServiceRecord;
using hostreg::model::LifecycleStage;
using hostreg::model::ObservedUnit;
using hostreg::model::Pid;
using hostreg::model::PortBinding;

class FakeServiceManager final : public hostreg::discovery::ServiceManager {
 public:
  std::vector<ObservedUnit> ListUnits() override {
    if (fail_listing) {
      throw hostreg::util::ExternalToolError("systemctl exited with status 1");
    }
    return units;
  }

  std::optional<Pid> ResolveMainPid(const std::string& unit_name) override {
    ++pid_lookups;
    if (failing_pids.contains(unit_name)) {
      throw hostreg::util::ExternalToolError("systemctl show " + unit_name + " exited with status 1");
    }
    const auto it = pids.find(unit_name);
    if (it == pids.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<ObservedUnit>  units;
  std::map<std::string, Pid> pids;
  std::set<std::string>      failing_pids;
  bool                       fail_listing = false;
  int                        pid_lookups  = 0;
};

class FakeSocketLister final : public hostreg::discovery::SocketLister {
 public:
  std::vector<PortBinding> ListListeningPorts() override {
    ++calls;
    if (fail) {
      throw hostreg::util::ExternalToolError("ss exited with status 1");
    }
    return bindings;
  }

  std::vector<PortBinding> bindings;
  bool                     fail  = false;
  int                      calls = 0;
};

// Delegates to a MemoryRepository and rejects the Nth insert like a unique index would.
class FaultInjectingRepository final : public Repository {
 public:
  FaultInjectingRepository(std::shared_ptr<MemoryRepository> inner, int fail_on_insert) : inner_(std::move(inner)), fail_on_insert_(fail_on_insert) {
  }

  std::unique_ptr<Transaction> Begin() override {
    return inner_->Begin();
  }

  Result InsertService(Transaction& tx, const ServiceRecord& record) override {
    if (++inserts_ == fail_on_insert_) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: services.name");
    }
    return inner_->InsertService(tx, record);
  }

  std::optional<ServiceRecord> GetService(Transaction& tx, const std::string& name) override {
    return inner_->GetService(tx, name);
  }

  std::vector<ServiceRecord> ListServices(Transaction& tx) override {
    return inner_->ListServices(tx);
  }

  Result UpdateService(Transaction& tx, const ServiceRecord& record) override {
    return inner_->UpdateService(tx, record);
  }

  Result DeleteService(Transaction& tx, const std::string& name) override {
    return inner_->DeleteService(tx, name);
  }

 private:
  std::shared_ptr<MemoryRepository> inner_;
  int                               fail_on_insert_;
  int                               inserts_ = 0;
};

// Blocks inside ListUnits until released, so a second Scan() can race the first.
class BlockingServiceManager final : public hostreg::discovery::ServiceManager {
 public:
  std::vector<ObservedUnit> ListUnits() override {
    entered.set_value();
    release.wait();
    return {{"slow.service", "active", "Slow"}};
  }

  std::optional<Pid> ResolveMainPid(const std::string&) override {
    return std::nullopt;
  }

  std::promise<void>       entered;
  std::shared_future<void> release;
};

struct Harness {
  std::shared_ptr<FakeServiceManager> manager    = std::make_shared<FakeServiceManager>();
  std::shared_ptr<FakeSocketLister>   sockets    = std::make_shared<FakeSocketLister>();
  std::shared_ptr<MemoryRepository>   repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<std::uint64_t>      now_ms     = std::make_shared<std::uint64_t>(1'000);

  Reconciler::Clock MakeClock() const {
    auto now = now_ms;
    return [now] { return hostreg::util::FromUnixMillis(*now); };
  }

  Reconciler MakeReconciler() const {
    return Reconciler(manager, sockets, repository, MakeClock());
  }

  Reconciler MakeReconciler(std::shared_ptr<Repository> repo) const {
    return Reconciler(manager, sockets, std::move(repo), MakeClock());
  }

  std::vector<ServiceRecord> Snapshot() const {
    auto tx = repository->Begin();
    return repository->ListServices(*tx);
  }

  std::optional<ServiceRecord> Find(const std::string& name) const {
    auto tx = repository->Begin();
    return repository->GetService(*tx, name);
  }
};

void SeedTypicalHost(Harness& h) {
  h.manager->units = {
      {"nginx.service", "active", "A high performance web server"},
      {"ssh.service", "active", "OpenBSD Secure Shell server"},
      {"backup.service", "inactive", "Nightly backup"},
  };
  h.manager->pids     = {{"nginx.service", 1234}, {"ssh.service", 5678}};
  h.sockets->bindings = {{80, 1234}, {22, 5678}};
}

void TestFirstScanClassifiesUnits() {
  Harness h;
  SeedTypicalHost(h);
  auto reconciler = h.MakeReconciler();

  const auto summary = reconciler.Scan();
  assert(summary.total_scanned == 3);
  assert(summary.new_discovered == 1);
  assert(summary.new_raw == 2);
  assert(summary.updated == 0);

  const auto nginx = h.Find("nginx.service");
  assert(nginx.has_value());
  assert(nginx->stage == LifecycleStage::kDiscovered);
  assert(nginx->port == 80);
  assert(nginx->description == "A high performance web server");
  assert(nginx->run_state == "active");
  assert(nginx->last_scanned_at_ms == 1'000);
  assert(nginx->created_at_ms == 1'000);

  const auto ssh = h.Find("ssh.service");
  assert(ssh.has_value());
  assert(ssh->stage == LifecycleStage::kRaw);
  assert(!ssh->port.has_value());
  assert(!ssh->description.has_value());

  const auto backup = h.Find("backup.service");
  assert(backup.has_value());
  assert(backup->stage == LifecycleStage::kRaw);
  assert(backup->run_state == "inactive");

  assert(h.sockets->calls == 1);
}

void TestRescanOnlyRefreshesKnownRecords() {
  Harness h;
  SeedTypicalHost(h);
  auto reconciler = h.MakeReconciler();

  (void)reconciler.Scan();
  const auto first = h.Snapshot();
  const auto lookups_after_first = h.manager->pid_lookups;

  *h.now_ms = 2'000;
  const auto summary = reconciler.Scan();
  assert(summary.total_scanned == 3);
  assert(summary.updated == 3);
  assert(summary.new_discovered == 0);
  assert(summary.new_raw == 0);

  // known units are not re-classified
  assert(h.manager->pid_lookups == lookups_after_first);

  const auto second = h.Snapshot();
  assert(second.size() == first.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    auto expected               = first[i];
    expected.last_scanned_at_ms = 2'000;
    expected.updated_at_ms      = 2'000;
    assert(second[i] == expected);
  }
}

void TestConfiguredServiceSurvivesRescan() {
  Harness h;
  h.manager->units    = {{"nginx.service", "active", "A high performance web server"}};
  h.manager->pids     = {{"nginx.service", 1234}};
  h.sockets->bindings = {{80, 1234}};
  auto reconciler     = h.MakeReconciler();

  (void)reconciler.Scan();

  hostreg::core::Registry registry(h.repository, nullptr, h.MakeClock());
  hostreg::core::ServiceUpdate update;
  update.base_url = "http://host:80";
  (void)registry.Configure("nginx.service", update);

  // restarted under a new pid on a different port, now failing
  *h.now_ms           = 5'000;
  h.manager->units    = {{"nginx.service", "failed", "Something else entirely"}};
  h.manager->pids     = {{"nginx.service", 4321}};
  h.sockets->bindings = {{9090, 4321}};

  const auto summary = reconciler.Scan();
  assert(summary.updated == 1);

  const auto nginx = h.Find("nginx.service");
  assert(nginx.has_value());
  assert(nginx->stage == LifecycleStage::kConfigured);
  assert(nginx->port == 80);
  assert(nginx->base_url == "http://host:80");
  assert(nginx->description == "A high performance web server");
  assert(nginx->run_state == "failed");
  assert(nginx->last_scanned_at_ms == 5'000);
}

void TestInsertFailureRollsBackWholeScan() {
  Harness h;
  h.manager->units = {{"existing.service", "active", "Already known"}};
  auto reconciler  = h.MakeReconciler();
  (void)reconciler.Scan();

  const auto before = h.Snapshot();

  *h.now_ms        = 9'000;
  h.manager->units = {
      {"existing.service", "failed", "Already known"},
      {"a.service", "active", "A"},
      {"b.service", "active", "B"},
      {"c.service", "active", "C"},
  };

  auto faulty          = std::make_shared<FaultInjectingRepository>(h.repository, 2);
  auto failing_scanner = h.MakeReconciler(faulty);

  bool threw = false;
  try {
    (void)failing_scanner.Scan();
  } catch (const hostreg::util::StoreError&) {
    threw = true;
  }
  assert(threw && "Scan must surface a store failure.");

  // neither the update of existing.service nor the first insert survived
  assert(h.Snapshot() == before);
}

void TestToolFailureWritesNothing() {
  {
    Harness h;
    SeedTypicalHost(h);
    h.manager->fail_listing = true;
    auto reconciler         = h.MakeReconciler();

    bool threw = false;
    try {
      (void)reconciler.Scan();
    } catch (const hostreg::util::ExternalToolError&) {
      threw = true;
    }
    assert(threw);
    assert(h.Snapshot().empty());
  }
  {
    Harness h;
    SeedTypicalHost(h);
    h.sockets->fail = true;
    auto reconciler = h.MakeReconciler();

    bool threw = false;
    try {
      (void)reconciler.Scan();
    } catch (const hostreg::util::ExternalToolError&) {
      threw = true;
    }
    assert(threw);
    assert(h.Snapshot().empty());
    assert(h.manager->pid_lookups == 0);
  }
}

void TestPidLookupFailureClassifiesRaw() {
  Harness h;
  SeedTypicalHost(h);
  h.manager->failing_pids = {"nginx.service"};
  auto reconciler         = h.MakeReconciler();

  const auto summary = reconciler.Scan();
  assert(summary.new_discovered == 0);
  assert(summary.new_raw == 3);

  const auto nginx = h.Find("nginx.service");
  assert(nginx.has_value());
  assert(nginx->stage == LifecycleStage::kRaw);
  assert(!nginx->port.has_value());
}

void TestDuplicateNamesInOneListingMerge() {
  Harness h;
  h.manager->units = {
      {"dup.service", "active", "First"},
      {"dup.service", "failed", "Second"},
  };
  auto reconciler = h.MakeReconciler();

  const auto summary = reconciler.Scan();
  assert(summary.total_scanned == 2);
  assert(summary.new_raw == 1);
  assert(summary.updated == 1);

  const auto all = h.Snapshot();
  assert(all.size() == 1);
  assert(all[0].run_state == "failed");
}

void TestConcurrentScanIsRejected() {
  auto blocking = std::make_shared<BlockingServiceManager>();
  auto sockets  = std::make_shared<FakeSocketLister>();
  auto repo     = std::make_shared<MemoryRepository>();

  std::promise<void> release;
  blocking->release = release.get_future().share();
  auto entered      = blocking->entered.get_future();

  Reconciler reconciler(blocking, sockets, repo);

  auto first = std::async(std::launch::async, [&] { return reconciler.Scan(); });
  entered.wait();

  bool rejected = false;
  try {
    (void)reconciler.Scan();
  } catch (const hostreg::util::ScanInProgress&) {
    rejected = true;
  }
  assert(rejected && "A second scan must not run while one is in progress.");

  release.set_value();
  const auto summary = first.get();
  assert(summary.total_scanned == 1);
  assert(summary.new_raw == 1);
}

void TestApplyObservationTouchesOnlyScanFields() {
  ServiceRecord existing;
  existing.name            = "api.service";
  existing.description     = "Curated";
  existing.port            = 8080;
  existing.health_endpoint = "/healthz";
  existing.base_url        = "http://api:8080";
  existing.stage           = LifecycleStage::kConfigured;
  existing.run_state       = "active";
  existing.created_at_ms   = 10;
  existing.updated_at_ms   = 10;

  const auto merged = ApplyObservation(existing, {"api.service", "inactive", "Upstream text"}, 99);
  assert(merged.run_state == "inactive");
  assert(merged.last_scanned_at_ms == 99);
  assert(merged.updated_at_ms == 99);
  assert(merged.created_at_ms == 10);
  assert(merged.description == "Curated");
  assert(merged.port == 8080);
  assert(merged.health_endpoint == "/healthz");
  assert(merged.base_url == "http://api:8080");
  assert(merged.stage == LifecycleStage::kConfigured);
}

} // namespace

int main() {
  TestFirstScanClassifiesUnits();
  TestRescanOnlyRefreshesKnownRecords();
  TestConfiguredServiceSurvivesRescan();
  TestInsertFailureRollsBackWholeScan();
  TestToolFailureWritesNothing();
  TestPidLookupFailureClassifiesRaw();
  TestDuplicateNamesInOneListingMerge();
  TestConcurrentScanIsRejected();
  TestApplyObservationTouchesOnlyScanFields();

  std::cout << "hostreg_unit_reconciler: pass\n";
  return 0;
}
