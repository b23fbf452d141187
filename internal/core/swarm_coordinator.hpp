#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/consensus/consensus_engine.hpp"
#include "internal/session/session_worker.hpp"
#include "swarm/engine/v1/types.pb.h"

namespace swarm::state {
class StateStore;
}

namespace swarm::agent {
class AgentDirectory;
}

namespace swarm::metrics {
class MetricsCollector;
}

namespace swarm::core {

struct CoordinatorOptions {
  swarm::engine::v1::TopologyKind       default_topology  = swarm::engine::v1::TOPOLOGY_KIND_MESH;
  swarm::engine::v1::ConsensusAlgorithm default_algorithm = swarm::engine::v1::CONSENSUS_ALGORITHM_QUORUM;

  uint32_t max_agents   = 100;
  uint32_t max_sessions = 0; // 0 = unlimited

  // task metrics are written to the store only when set
  bool metrics_enabled = true;

  session::SessionOptions     session;
  consensus::ConsensusOptions consensus;

  // 0 keeps records forever
  std::chrono::seconds task_metrics_max_age{0};
  std::chrono::seconds health_snapshots_max_age{0};
};

/*
  SwarmCoordinator

  Owns session lifecycle and the public engine surface. Each live
  session has one SessionWorker; the coordinator only routes calls to
  it and runs consensus on the caller's thread.

  Errors are the typed exceptions from util/errors.hpp. A session whose
  background loop failed stays visible to GetStatus (degraded) until it
  is closed.
*/
class SwarmCoordinator {
 public:
  SwarmCoordinator(CoordinatorOptions options, std::shared_ptr<state::StateStore> store,
                   std::shared_ptr<agent::AgentDirectory> directory);
  ~SwarmCoordinator();

  SwarmCoordinator(const SwarmCoordinator&)            = delete;
  SwarmCoordinator& operator=(const SwarmCoordinator&) = delete;

  // UNSPECIFIED kind/algorithm select the configured defaults.
  std::string InitSession(swarm::engine::v1::TopologyKind topology, swarm::engine::v1::ConsensusAlgorithm algorithm,
                          const std::vector<swarm::engine::v1::AgentSpec>& agents, const std::string& pinned_leader_id = {});

  swarm::engine::v1::SessionStatus GetStatus(const std::string& session_id) const;

  swarm::engine::v1::TopologyGraph SwitchTopology(const std::string& session_id, swarm::engine::v1::TopologyKind topology);

  // timeout 0 uses the configured default. TIMEOUT is an outcome, not an error.
  swarm::engine::v1::ConsensusProposal RequestConsensus(const std::string& session_id, const std::string& proposal_text,
                                                        std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

  // Idempotent for sessions closed here; unknown ids throw SessionNotFound.
  void CloseSession(const std::string& session_id);

  // ---- host hooks ----

  void OnTaskStart(const std::string& session_id, const std::string& agent_id, const std::string& task_id);
  void OnTaskEnd(const std::string& session_id, const std::string& agent_id, const std::string& task_id, uint64_t duration_ms,
                 swarm::engine::v1::TaskResult result);

  void SetTaskReassigner(session::TaskReassigner reassigner);

  // ---- agent churn ----

  swarm::engine::v1::TopologyGraph RegisterAgent(const std::string& session_id, const swarm::engine::v1::AgentSpec& agent);
  swarm::engine::v1::TopologyGraph DeregisterAgent(const std::string& session_id, const std::string& agent_id);

  // ---- remote agents ----

  std::vector<swarm::engine::v1::Ballot> Heartbeat(const std::string& session_id, const std::string& agent_id, uint64_t latency_ms);

  bool SubmitVote(const std::string& session_id, const std::string& agent_id, const std::string& proposal_id, uint32_t round,
                  swarm::engine::v1::Vote vote);

  // ---- queries ----

  std::vector<swarm::engine::v1::ConsensusProposal> GetConsensusHistory(const std::string& session_id, std::size_t limit);
  std::vector<swarm::engine::v1::HealingAction>     GetHealingHistory(const std::string& session_id, std::size_t limit);
  std::vector<std::string>                          ListSessions() const;

  // ---- maintenance ----

  void SyncNow(const std::string& session_id);
  void RunRetention(uint64_t now_ms);
  void CloseAll();

 private:
  std::shared_ptr<session::SessionWorker> Find(const std::string& session_id) const;
  std::shared_ptr<session::SessionWorker> FindLive(const std::string& session_id) const;

  void RequireKnown(const std::string& session_id) const;

  // Metrics counters and timestamp floors of a closed session.
  void ForgetSession(const std::string& session_id);

  session::AgentEntry MakeEntry(const std::string& session_id, const swarm::engine::v1::AgentSpec& spec, bool explicit_eligibility);

  template <typename Fn>
  auto Persist(session::SessionWorker& worker, Fn&& fn);

  const CoordinatorOptions                   options_;
  std::shared_ptr<state::StateStore>         store_;
  std::shared_ptr<agent::AgentDirectory>     directory_;
  std::shared_ptr<metrics::MetricsCollector> metrics_;
  consensus::ConsensusEngine                 engine_;

  mutable std::shared_mutex                                                 sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<session::SessionWorker>> sessions_;
  std::unordered_set<std::string>                                           closed_ids_;
  session::TaskReassigner                                                   reassigner_;
};

} // namespace swarm::core
