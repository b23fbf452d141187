#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace swarm::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace swarm::util;

  if (dynamic_cast<const InvalidConfig*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const SessionNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const TopologyTransitionError*>(&e) || dynamic_cast<const NoLeaderAvailable*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ProposalAlreadyDecided*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const AgentUnreachable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace swarm::grpc
