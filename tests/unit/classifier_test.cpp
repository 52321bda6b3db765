#include "internal/core/classifier.hpp"

#include <cassert>
#include <iostream>
#include <variant>

namespace {

using hostreg::core::Classification;
using hostreg::core::Classify;
using hostreg::core::Discovered;
using hostreg::core::Raw;
using hostreg::core::StageOf;
using hostreg::discovery::PortMap;
using hostreg::model::LifecycleStage;

void TestWebPortOwnerIsDiscovered() {
  const PortMap ports({{80, 1234}});

  const auto result = Classify(1234, ports);
  assert(std::holds_alternative<Discovered>(result));
  assert(std::get<Discovered>(result).port == 80);
  assert(StageOf(result) == LifecycleStage::kDiscovered);
}

void TestNonWebPortOwnerIsRaw() {
  const PortMap ports({{22, 5678}});

  const auto result = Classify(5678, ports);
  assert(std::holds_alternative<Raw>(result));
  assert(StageOf(result) == LifecycleStage::kRaw);
}

void TestNoPidIsRawRegardlessOfPorts() {
  const PortMap ports({{80, 1234}, {443, 1234}, {8080, 1}});

  assert(std::holds_alternative<Raw>(Classify(std::nullopt, ports)));
}

void TestPidWithoutListenersIsRaw() {
  const PortMap ports({{80, 1234}});

  assert(std::holds_alternative<Raw>(Classify(4321, ports)));
}

void TestFirstWebPortInListingOrderWins() {
  const PortMap ports({{22, 7}, {9090, 7}, {8443, 7}, {3000, 7}});

  const auto result = Classify(7, ports);
  assert(std::holds_alternative<Discovered>(result));
  assert(std::get<Discovered>(result).port == 8443);
}

} // namespace

int main() {
  TestWebPortOwnerIsDiscovered();
  TestNonWebPortOwnerIsRaw();
  TestNoPidIsRawRegardlessOfPorts();
  TestPidWithoutListenersIsRaw();
  TestFirstWebPortInListingOrderWins();

  std::cout << "hostreg_unit_classifier: pass\n";
  return 0;
}
