#pragma once

#include <stdexcept>
#include <string>

namespace mediaflow::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Transfer failures are not exceptions: the upload controller reports them
  through UploadResult.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A collaborator (document store, blob store) refused or failed a call.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mediaflow::util
