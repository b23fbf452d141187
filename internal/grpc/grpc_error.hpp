#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace swarm::grpc {

/*
  Converts engine exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace swarm::grpc
