#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace hostreg::health {

class HttpProbe;

struct HealthStatus {
  bool                       healthy = false;
  std::optional<int>         status_code;
  std::optional<std::string> error;
  hostreg::util::TimePoint   checked_at;
  std::string                url;
};

// base_url without trailing '/' followed by endpoint; nullopt without an endpoint.
std::optional<std::string> BuildHealthUrl(std::string_view base_url, const std::optional<std::string>& endpoint);

/*
  Probes health URLs and caches results per URL.

  healthy iff the probe got HTTP 200. A cached result younger than the TTL
  is returned as is unless the caller bypasses the cache. The probe runs
  without the cache lock held.
*/
class HealthChecker {
 public:
  using Clock = std::function<hostreg::util::TimePoint()>;

  HealthChecker(std::shared_ptr<HttpProbe> probe, std::chrono::seconds cache_ttl, Clock clock = hostreg::util::Now);

  HealthStatus Check(const std::string& url, bool use_cache = true);

  void ClearCache();

 private:
  std::shared_ptr<HttpProbe> probe_;
  std::chrono::seconds       cache_ttl_;
  Clock                      clock_;

  std::mutex                                    mutex_;
  std::unordered_map<std::string, HealthStatus> cache_;
};

} // namespace hostreg::health
