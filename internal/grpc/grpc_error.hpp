#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace workgraph::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs a service call and maps any exception it throws.
template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace workgraph::grpc
