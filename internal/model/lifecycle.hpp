#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace hostreg::model {

/*
  Lifecycle of a registry entry.

    raw ──► discovered ──► configured
     └────────────────────────▲

  Scans only ever produce raw or discovered. configured is reached by an
  explicit user action and is never left automatically.
*/
enum class LifecycleStage : std::uint8_t {
  kRaw        = 1,
  kDiscovered = 2,
  kConfigured = 3,
};

constexpr bool CanTransition(LifecycleStage from, LifecycleStage to) {
  if (from == to) {
    return true;
  }
  if (from == LifecycleStage::kConfigured) {
    return false;
  }
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(LifecycleStage stage) {
  switch (stage) {
    case LifecycleStage::kRaw:
      return "raw";
    case LifecycleStage::kDiscovered:
      return "discovered";
    case LifecycleStage::kConfigured:
      return "configured";
  }
  return "raw";
}

constexpr std::optional<LifecycleStage> ParseLifecycleStage(std::string_view text) {
  if (text == "raw") return LifecycleStage::kRaw;
  if (text == "discovered") return LifecycleStage::kDiscovered;
  if (text == "configured") return LifecycleStage::kConfigured;
  return std::nullopt;
}

} // namespace hostreg::model
