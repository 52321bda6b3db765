#include "curl_http_probe.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

namespace hostreg::health {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

size_t DiscardBody(char*, size_t size, size_t nmemb, void*) {
  return size * nmemb;
}

} // namespace

CurlHttpProbe::CurlHttpProbe(std::chrono::milliseconds timeout) : timeout_(timeout) {
  EnsureCurlGlobalInit();
}

ProbeResult CurlHttpProbe::Get(const std::string& url) {
  ProbeResult result;

  CurlHandle curl(curl_easy_init());
  if (!curl) {
    result.error = "curl_easy_init failed";
    return result;
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &DiscardBody);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "hostreg-health/1");

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc == CURLE_OPERATION_TIMEDOUT) {
    result.timed_out = true;
    result.error     = "Timeout";
    return result;
  }
  if (rc != CURLE_OK) {
    result.error = curl_easy_strerror(rc);
    return result;
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  result.status_code = static_cast<int>(status);
  return result;
}

} // namespace hostreg::health
