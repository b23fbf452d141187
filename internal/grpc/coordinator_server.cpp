#include "coordinator_server.hpp"

#include <chrono>
#include <vector>

#include "grpc_error.hpp"
#include "internal/core/swarm_coordinator.hpp"

namespace swarm::grpc {

namespace v1 = swarm::engine::v1;

CoordinatorServer::CoordinatorServer(std::shared_ptr<swarm::core::SwarmCoordinator> coordinator) : coordinator_(std::move(coordinator)) {
}

::grpc::Status CoordinatorServer::InitSession(::grpc::ServerContext*, const v1::InitSessionRequest* req, v1::InitSessionResponse* resp) {
  try {
    const std::vector<v1::AgentSpec> agents(req->agents().begin(), req->agents().end());
    resp->set_session_id(coordinator_->InitSession(req->topology(), req->consensus_algorithm(), agents, req->pinned_leader_id()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::GetStatus(::grpc::ServerContext*, const v1::GetStatusRequest* req, v1::GetStatusResponse* resp) {
  try {
    *resp->mutable_status() = coordinator_->GetStatus(req->session_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::SwitchTopology(::grpc::ServerContext*, const v1::SwitchTopologyRequest* req,
                                                 v1::SwitchTopologyResponse* resp) {
  try {
    *resp->mutable_topology() = coordinator_->SwitchTopology(req->session_id(), req->topology());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::RequestConsensus(::grpc::ServerContext*, const v1::RequestConsensusRequest* req,
                                                   v1::RequestConsensusResponse* resp) {
  try {
    *resp->mutable_proposal() =
        coordinator_->RequestConsensus(req->session_id(), req->proposal_text(), std::chrono::milliseconds(req->timeout_ms()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::CloseSession(::grpc::ServerContext*, const v1::CloseSessionRequest* req, v1::CloseSessionResponse*) {
  try {
    coordinator_->CloseSession(req->session_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::OnTaskStart(::grpc::ServerContext*, const v1::OnTaskStartRequest* req, v1::OnTaskStartResponse*) {
  try {
    coordinator_->OnTaskStart(req->session_id(), req->agent_id(), req->task_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::OnTaskEnd(::grpc::ServerContext*, const v1::OnTaskEndRequest* req, v1::OnTaskEndResponse*) {
  try {
    coordinator_->OnTaskEnd(req->session_id(), req->agent_id(), req->task_id(), req->duration_ms(), req->result());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::RegisterAgent(::grpc::ServerContext*, const v1::RegisterAgentRequest* req,
                                                v1::RegisterAgentResponse* resp) {
  try {
    *resp->mutable_topology() = coordinator_->RegisterAgent(req->session_id(), req->agent());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::DeregisterAgent(::grpc::ServerContext*, const v1::DeregisterAgentRequest* req,
                                                  v1::DeregisterAgentResponse* resp) {
  try {
    *resp->mutable_topology() = coordinator_->DeregisterAgent(req->session_id(), req->agent_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::Heartbeat(::grpc::ServerContext*, const v1::HeartbeatRequest* req, v1::HeartbeatResponse* resp) {
  try {
    for (auto& ballot : coordinator_->Heartbeat(req->session_id(), req->agent_id(), req->latency_ms())) {
      *resp->add_pending_ballots() = std::move(ballot);
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::SubmitVote(::grpc::ServerContext*, const v1::SubmitVoteRequest* req, v1::SubmitVoteResponse* resp) {
  try {
    resp->set_accepted(coordinator_->SubmitVote(req->session_id(), req->agent_id(), req->proposal_id(), req->round(), req->vote()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace swarm::grpc
