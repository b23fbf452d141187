#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace swarm::state {

/*
  StateStore

  Durable record of sessions, agents, topology, task metrics, health
  snapshots, proposals and healing actions.

  - Every call is one repository transaction; a failure rolls it back
    and surfaces as util::StoreError.
  - Calls are serialized: the backends share one connection.
  - Task metric and health snapshot timestamps are strictly increasing
    per (session, agent); an older or equal timestamp is bumped to
    last + 1 before it is written.
*/
class StateStore {
 public:
  explicit StateStore(std::shared_ptr<db::Repository> repository);

  // Session row, its agents and the first graph in one transaction.
  void CreateSession(const db::model::SessionRecord& session, const std::vector<db::model::AgentRecord>& agents,
                     const swarm::engine::v1::TopologyGraph& graph);

  void                                    SaveSession(const db::model::SessionRecord& session);
  std::optional<db::model::SessionRecord> LoadSession(const std::string& session_id);
  std::vector<db::model::SessionRecord>   ListSessions();

  void                                SaveAgent(const db::model::AgentRecord& agent);
  void                                RemoveAgent(const std::string& session_id, const std::string& agent_id);
  std::vector<db::model::AgentRecord> LoadAgents(const std::string& session_id);

  void                                            SaveTopology(const std::string& session_id, const swarm::engine::v1::TopologyGraph& graph);
  std::optional<swarm::engine::v1::TopologyGraph> LoadTopology(const std::string& session_id);

  // Return the record as written (timestamp possibly adjusted).
  swarm::engine::v1::TaskMetric     AppendMetric(swarm::engine::v1::TaskMetric metric);
  swarm::engine::v1::HealthSnapshot AppendHealth(swarm::engine::v1::HealthSnapshot snapshot);

  void AppendHealingAction(const swarm::engine::v1::HealingAction& action);

  void                                                SaveProposal(const swarm::engine::v1::ConsensusProposal& proposal);
  std::optional<swarm::engine::v1::ConsensusProposal> LoadProposal(const std::string& proposal_id);

  // Newest first.
  std::vector<swarm::engine::v1::TaskMetric>        QueryRecentMetrics(const std::string& session_id, std::size_t limit);
  std::vector<swarm::engine::v1::HealthSnapshot>    QueryRecentHealth(const std::string& session_id, const std::string& agent_id,
                                                                      std::size_t limit);
  std::vector<swarm::engine::v1::HealingAction>     QueryRecentHealingActions(const std::string& session_id, std::size_t limit);
  std::vector<swarm::engine::v1::ConsensusProposal> QueryRecentProposals(const std::string& session_id, std::size_t limit,
                                                                         bool decided_only = false);

  // Retention: the only deletes of metrics/snapshots. 0 keeps everything.
  void PruneBefore(uint64_t task_metrics_cutoff_ms, uint64_t health_snapshots_cutoff_ms);

  // Drops the per-agent timestamp floors of a closed session.
  void ForgetSession(const std::string& session_id);

 private:
  template <typename Fn>
  auto WithTransaction(const char* what, Fn&& fn);

  uint64_t NextTimestamp(const std::string& session_id, const std::string& agent_id, uint64_t requested);

  std::shared_ptr<db::Repository> repository_;

  std::mutex                                mutex_;
  std::unordered_map<std::string, uint64_t> last_timestamp_;
};

} // namespace swarm::state
