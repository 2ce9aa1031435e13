#pragma once

#include <stdexcept>
#include <string>

namespace relations::util {

/*
  Central error types.

  Each carries a stable Matrix-style errcode. Both get translated to a
  gRPC status at the transport edge (see grpc::ToStatus).
*/

class Error : public std::runtime_error {
 public:
  Error(std::string errcode, const std::string& msg) : std::runtime_error(msg), errcode_(std::move(errcode)) {
  }

  const std::string& errcode() const noexcept {
    return errcode_;
  }

 private:
  std::string errcode_;
};

// Target event, parent event or room does not exist (or is not visible).
class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error("M_NOT_FOUND", msg) {
  }
};

// Relation request violates an ingest or query rule.
class InvalidRelation : public Error {
 public:
  explicit InvalidRelation(const std::string& msg) : Error("M_INVALID_PARAM", msg) {
  }
};

// Pagination token is malformed, from another version, or bound to a
// different query.
class InvalidCursor : public Error {
 public:
  explicit InvalidCursor(const std::string& msg) : Error("M_INVALID_CURSOR", msg) {
  }
};

// Malformed request outside the relation rules (missing type, bad room).
class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& msg) : Error("M_INVALID_PARAM", msg) {
  }
};

class PermissionDenied : public Error {
 public:
  explicit PermissionDenied(const std::string& msg) : Error("M_FORBIDDEN", msg) {
  }
};

} // namespace relations::util
