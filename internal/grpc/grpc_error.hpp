#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace relations::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The Matrix-style errcode travels in the status error details
  (M_NOT_FOUND, M_INVALID_PARAM, M_INVALID_CURSOR, M_FORBIDDEN,
  M_UNKNOWN).
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace relations::grpc
