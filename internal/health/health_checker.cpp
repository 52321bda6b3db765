#include "health_checker.hpp"

#include "http_probe.hpp"
#include "internal/observability/logging.hpp"

namespace hostreg::health {

using hostreg::observability::BoolField;
using hostreg::observability::IntField;
using hostreg::observability::StringField;

std::optional<std::string> BuildHealthUrl(std::string_view base_url, const std::optional<std::string>& endpoint) {
  if (!endpoint) {
    return std::nullopt;
  }

  while (!base_url.empty() && base_url.back() == '/') {
    base_url.remove_suffix(1);
  }

  std::string url(base_url);
  if (endpoint->empty() || endpoint->front() != '/') {
    url += '/';
  }
  url += *endpoint;
  return url;
}

HealthChecker::HealthChecker(std::shared_ptr<HttpProbe> probe, std::chrono::seconds cache_ttl, Clock clock)
    : probe_(std::move(probe)), cache_ttl_(cache_ttl), clock_(std::move(clock)) {
}

HealthStatus HealthChecker::Check(const std::string& url, bool use_cache) {
  if (use_cache) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = cache_.find(url);
    if (it != cache_.end() && clock_() - it->second.checked_at < cache_ttl_) {
      return it->second;
    }
  }

  const auto probe = probe_->Get(url);

  HealthStatus status;
  status.url         = url;
  status.checked_at  = clock_();
  status.status_code = probe.status_code;
  status.error       = probe.error;
  status.healthy     = !probe.error && probe.status_code == 200;

  if (!status.healthy) {
    HOSTREG_LOG_WARN("Health check failed", {StringField("url", url), IntField("status_code", probe.status_code.value_or(0)),
                                             StringField("error", probe.error.value_or(""))});
  } else {
    HOSTREG_LOG_DEBUG("Health check ok", {StringField("url", url), BoolField("cache_bypassed", !use_cache)});
  }

  std::lock_guard<std::mutex> lock(mutex_);
  cache_[url] = status;
  return status;
}

void HealthChecker::ClearCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

} // namespace hostreg::health
