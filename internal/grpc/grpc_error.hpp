#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace satp::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  TransactError is mapped by its cause kind so clients can tell a bad
  request from a busy session or a rolled back transfer.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace satp::grpc
