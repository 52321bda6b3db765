#include "internal/core/registry.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/health/http_probe.hpp"
#include "internal/util/errors.hpp"

namespace {

using hostreg::core::NewService;
using hostreg::core::Registry;
using hostreg::core::ServiceUpdate;
using hostreg::db::memory::MemoryRepository;
using hostreg::db::model::ServiceRecord;
using hostreg::model::LifecycleStage;

class FakeProbe final : public hostreg::health::HttpProbe {
 public:
  hostreg::health::ProbeResult Get(const std::string& url) override {
    last_url = url;
    ++calls;
    hostreg::health::ProbeResult result;
    result.status_code = status_code;
    return result;
  }

  std::string last_url;
  int         status_code = 200;
  int         calls       = 0;
};

template <typename Exception>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

struct Harness {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeProbe>        probe      = std::make_shared<FakeProbe>();
  Registry                          registry{repository, std::make_shared<hostreg::health::HealthChecker>(probe, std::chrono::seconds(60)),
                    [] { return hostreg::util::FromUnixMillis(42'000); }};

  void Seed(const std::string& name, LifecycleStage stage) {
    ServiceRecord record;
    record.name      = name;
    record.stage     = stage;
    record.run_state = "active";
    auto tx          = repository->Begin();
    assert(repository->InsertService(*tx, record));
    tx->Commit();
  }
};

NewService ValidRequest(const std::string& name) {
  NewService request;
  request.name        = name;
  request.description = "Grafana dashboards";
  request.base_url    = "http://grafana.local:3000";
  return request;
}

void TestCreateRegistersConfiguredService() {
  Harness h;

  auto request            = ValidRequest("grafana");
  request.port            = 3000;
  request.health_endpoint = "/api/health";

  const auto created = h.registry.Create(request);
  assert(created.stage == LifecycleStage::kConfigured);
  assert(created.run_state == "unknown");
  assert(created.port == 3000);
  assert(created.created_at_ms == 42'000);
  assert(!created.last_scanned_at_ms.has_value());

  const auto fetched = h.registry.Get("grafana");
  assert(fetched == created);
}

void TestCreateRejectsDuplicates() {
  Harness h;
  (void)h.registry.Create(ValidRequest("grafana"));

  assert(Throws<hostreg::util::AlreadyExists>([&] { (void)h.registry.Create(ValidRequest("grafana")); }));
}

void TestCreateValidatesFields() {
  Harness h;

  auto no_name = ValidRequest("");
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(no_name); }));

  auto long_name = ValidRequest(std::string(256, 'x'));
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(long_name); }));

  auto no_description        = ValidRequest("a");
  no_description.description = "";
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(no_description); }));

  auto ftp     = ValidRequest("a");
  ftp.base_url = "ftp://files.local";
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(ftp); }));

  auto hostless     = ValidRequest("a");
  hostless.base_url = "https://";
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(hostless); }));

  auto port_zero = ValidRequest("a");
  port_zero.port = 0;
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(port_zero); }));

  auto port_high = ValidRequest("a");
  port_high.port = 65536;
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(port_high); }));

  auto bad_endpoint            = ValidRequest("a");
  bad_endpoint.health_endpoint = "health";
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Create(bad_endpoint); }));

  assert(h.registry.ListAll().empty());

  auto max_name = ValidRequest(std::string(255, 'x'));
  (void)h.registry.Create(max_name);
  assert(h.registry.ListAll().size() == 1);
}

void TestConfigurePromotesAndMergesPartially() {
  Harness h;
  h.Seed("nginx.service", LifecycleStage::kDiscovered);

  ServiceUpdate first;
  first.base_url = "http://host:80";
  first.port     = 80;
  const auto configured = h.registry.Configure("nginx.service", first);
  assert(configured.stage == LifecycleStage::kConfigured);
  assert(configured.base_url == "http://host:80");
  assert(configured.updated_at_ms == 42'000);

  ServiceUpdate second;
  second.health_endpoint = "/status";
  const auto updated     = h.registry.Configure("nginx.service", second);
  assert(updated.base_url == "http://host:80");
  assert(updated.port == 80);
  assert(updated.health_endpoint == "/status");
  assert(updated.run_state == "active");

  // raw units can be configured directly
  h.Seed("custom.service", LifecycleStage::kRaw);
  assert(h.registry.Configure("custom.service", ServiceUpdate{}).stage == LifecycleStage::kConfigured);
}

void TestConfigureErrors() {
  Harness h;
  assert(Throws<hostreg::util::NotFound>([&] { (void)h.registry.Configure("ghost.service", ServiceUpdate{}); }));

  h.Seed("nginx.service", LifecycleStage::kDiscovered);
  ServiceUpdate bad;
  bad.port = 70000;
  assert(Throws<hostreg::util::InvalidArgument>([&] { (void)h.registry.Configure("nginx.service", bad); }));

  // a rejected update leaves the record alone
  assert(h.registry.Get("nginx.service").stage == LifecycleStage::kDiscovered);
}

void TestListByStageAndOrdering() {
  Harness h;
  h.Seed("zeta.service", LifecycleStage::kDiscovered);
  h.Seed("alpha.service", LifecycleStage::kDiscovered);
  h.Seed("sshd.service", LifecycleStage::kRaw);
  (void)h.registry.Create(ValidRequest("manual"));

  const auto all = h.registry.ListAll();
  assert(all.size() == 4);
  assert(all[0].name == "alpha.service");
  assert(all[3].name == "zeta.service");

  const auto inbox = h.registry.ListByStage(LifecycleStage::kDiscovered);
  assert(inbox.size() == 2);
  assert(inbox[0].name == "alpha.service");
  assert(inbox[1].name == "zeta.service");

  const auto dashboard = h.registry.ListByStage(LifecycleStage::kConfigured);
  assert(dashboard.size() == 1);
  assert(dashboard[0].name == "manual");
}

void TestDelete() {
  Harness h;
  (void)h.registry.Create(ValidRequest("grafana"));
  h.registry.Delete("grafana");

  assert(Throws<hostreg::util::NotFound>([&] { (void)h.registry.Get("grafana"); }));
  assert(Throws<hostreg::util::NotFound>([&] { h.registry.Delete("grafana"); }));
}

void TestCheckServiceBuildsUrlFromRecord() {
  Harness h;
  auto request            = ValidRequest("grafana");
  request.base_url        = "http://grafana.local:3000/";
  request.health_endpoint = "/api/health";
  (void)h.registry.Create(request);

  const auto status = h.registry.CheckService("grafana");
  assert(status.healthy);
  assert(status.status_code == 200);
  assert(h.probe->last_url == "http://grafana.local:3000/api/health");
}

void TestCheckServiceNeedsHealthUrl() {
  Harness h;
  (void)h.registry.Create(ValidRequest("grafana"));
  assert(Throws<hostreg::util::FailedPrecondition>([&] { (void)h.registry.CheckService("grafana"); }));

  h.Seed("raw.service", LifecycleStage::kRaw);
  assert(Throws<hostreg::util::FailedPrecondition>([&] { (void)h.registry.CheckService("raw.service"); }));

  assert(Throws<hostreg::util::NotFound>([&] { (void)h.registry.CheckService("ghost"); }));
  assert(h.probe->calls == 0);
}

} // namespace

int main() {
  TestCreateRegistersConfiguredService();
  TestCreateRejectsDuplicates();
  TestCreateValidatesFields();
  TestConfigurePromotesAndMergesPartially();
  TestConfigureErrors();
  TestListByStageAndOrdering();
  TestDelete();
  TestCheckServiceBuildsUrlFromRecord();
  TestCheckServiceNeedsHealthUrl();

  std::cout << "hostreg_unit_registry: pass\n";
  return 0;
}
