#pragma once

#include <cstdint>
#include <string>

#include "hostreg/config/v1/config.pb.h"

namespace hostreg::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset (zero/empty) values are filled from the defaults below.
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultBindAddress     = "127.0.0.1:50061";
  static constexpr const char* kDefaultSystemctl       = "systemctl";
  static constexpr const char* kDefaultSs              = "ss";
  static constexpr uint32_t    kDefaultCommandTimeout  = 10000;
  static constexpr uint32_t    kDefaultRequestTimeout  = 2000;
  static constexpr uint32_t    kDefaultHealthCacheTtl  = 60;

  static hostreg::config::v1::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(hostreg::config::v1::RuntimeConfig* config);
};

} // namespace hostreg::config
