#pragma once

#include <chrono>

#include "http_probe.hpp"

namespace hostreg::health {

/*
  HttpProbe on the libcurl easy API.

  One easy handle per request; the body is discarded. Redirects are
  followed and the whole transfer is bounded by the request timeout.
*/
class CurlHttpProbe final : public HttpProbe {
 public:
  explicit CurlHttpProbe(std::chrono::milliseconds timeout);

  ProbeResult Get(const std::string& url) override;

 private:
  std::chrono::milliseconds timeout_;
};

} // namespace hostreg::health
