#pragma once

#include <optional>
#include <string>

namespace hostreg::health {

// Outcome of one GET. Exactly one of status_code / error is set.
struct ProbeResult {
  std::optional<int>         status_code;
  std::optional<std::string> error;
  bool                       timed_out = false;
};

class HttpProbe {
 public:
  virtual ~HttpProbe() = default;

  // Transport failures are reported in the result, never thrown.
  virtual ProbeResult Get(const std::string& url) = 0;
};

} // namespace hostreg::health
