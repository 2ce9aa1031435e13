#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace relations::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace relations::util;

  if (const auto* err = dynamic_cast<const Error*>(&e)) {
    if (dynamic_cast<const NotFound*>(&e)) {
      return {::grpc::StatusCode::NOT_FOUND, e.what(), err->errcode()};
    }
    if (dynamic_cast<const InvalidRelation*>(&e) || dynamic_cast<const InvalidCursor*>(&e) ||
        dynamic_cast<const InvalidArgument*>(&e)) {
      return {::grpc::StatusCode::INVALID_ARGUMENT, e.what(), err->errcode()};
    }
    if (dynamic_cast<const PermissionDenied*>(&e)) {
      return {::grpc::StatusCode::PERMISSION_DENIED, e.what(), err->errcode()};
    }
  }

  return {::grpc::StatusCode::INTERNAL, e.what(), "M_UNKNOWN"};
}

} // namespace relations::grpc
