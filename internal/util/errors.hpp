#pragma once

#include <stdexcept>
#include <string>

namespace hostreg::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FailedPrecondition : public std::runtime_error {
 public:
  explicit FailedPrecondition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A host tool (systemctl, ss) could not be run, timed out, or exited non-zero.
class ExternalToolError : public std::runtime_error {
 public:
  explicit ExternalToolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The repository rejected a write during a scan. Fatal for that scan.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ScanInProgress : public std::runtime_error {
 public:
  explicit ScanInProgress(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace hostreg::util
