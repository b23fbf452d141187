#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "swarm/engine/v1/coordinator_service.grpc.pb.h"

namespace swarm::core {
class SwarmCoordinator;
}

namespace swarm::grpc {

/*
  Thin transport adapter: unpacks the request, calls the coordinator,
  maps exceptions with ToStatus.
*/
class CoordinatorServer final : public swarm::engine::v1::SwarmCoordinatorService::Service {
 public:
  explicit CoordinatorServer(std::shared_ptr<swarm::core::SwarmCoordinator> coordinator);

  ::grpc::Status InitSession(::grpc::ServerContext*, const swarm::engine::v1::InitSessionRequest*,
                             swarm::engine::v1::InitSessionResponse*) override;
  ::grpc::Status GetStatus(::grpc::ServerContext*, const swarm::engine::v1::GetStatusRequest*,
                           swarm::engine::v1::GetStatusResponse*) override;
  ::grpc::Status SwitchTopology(::grpc::ServerContext*, const swarm::engine::v1::SwitchTopologyRequest*,
                                swarm::engine::v1::SwitchTopologyResponse*) override;
  ::grpc::Status RequestConsensus(::grpc::ServerContext*, const swarm::engine::v1::RequestConsensusRequest*,
                                  swarm::engine::v1::RequestConsensusResponse*) override;
  ::grpc::Status CloseSession(::grpc::ServerContext*, const swarm::engine::v1::CloseSessionRequest*,
                              swarm::engine::v1::CloseSessionResponse*) override;

  ::grpc::Status OnTaskStart(::grpc::ServerContext*, const swarm::engine::v1::OnTaskStartRequest*,
                             swarm::engine::v1::OnTaskStartResponse*) override;
  ::grpc::Status OnTaskEnd(::grpc::ServerContext*, const swarm::engine::v1::OnTaskEndRequest*,
                           swarm::engine::v1::OnTaskEndResponse*) override;

  ::grpc::Status RegisterAgent(::grpc::ServerContext*, const swarm::engine::v1::RegisterAgentRequest*,
                               swarm::engine::v1::RegisterAgentResponse*) override;
  ::grpc::Status DeregisterAgent(::grpc::ServerContext*, const swarm::engine::v1::DeregisterAgentRequest*,
                                 swarm::engine::v1::DeregisterAgentResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const swarm::engine::v1::HeartbeatRequest*,
                           swarm::engine::v1::HeartbeatResponse*) override;
  ::grpc::Status SubmitVote(::grpc::ServerContext*, const swarm::engine::v1::SubmitVoteRequest*,
                            swarm::engine::v1::SubmitVoteResponse*) override;

 private:
  std::shared_ptr<swarm::core::SwarmCoordinator> coordinator_;
};

} // namespace swarm::grpc
