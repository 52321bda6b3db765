#include "classifier.hpp"

namespace hostreg::core {

Classification Classify(std::optional<hostreg::model::Pid> pid, const hostreg::discovery::PortMap& ports) {
  if (!pid) {
    return Raw{};
  }

  for (const auto port : ports.PortsFor(*pid)) {
    if (hostreg::discovery::IsWebPort(port)) {
      return Discovered{port};
    }
  }
  return Raw{};
}

hostreg::model::LifecycleStage StageOf(const Classification& classification) {
  return std::holds_alternative<Discovered>(classification) ? hostreg::model::LifecycleStage::kDiscovered
                                                            : hostreg::model::LifecycleStage::kRaw;
}

} // namespace hostreg::core
