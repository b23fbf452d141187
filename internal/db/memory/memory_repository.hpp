#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace swarm::db::memory {

class MemoryTransaction;

/*
  In-process backend. Used for tests and for deployments that do not
  need the swarm state to outlive the process.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertSession(Transaction&, const model::SessionRecord&) override;
  Result                               UpdateSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord>  GetSession(Transaction&, const std::string& session_id) override;
  std::vector<model::SessionRecord>    ListSessions(Transaction&) override;

  Result                          UpsertAgent(Transaction&, const model::AgentRecord&) override;
  Result                          DeleteAgent(Transaction&, const std::string& session_id, const std::string& agent_id) override;
  std::vector<model::AgentRecord> ListAgents(Transaction&, const std::string& session_id) override;

  Result                               SaveTopology(Transaction&, const model::TopologyRecord&) override;
  std::optional<model::TopologyRecord> GetTopology(Transaction&, const std::string& session_id) override;

  Result AppendTaskMetric(Transaction&, const swarm::engine::v1::TaskMetric&) override;
  std::vector<swarm::engine::v1::TaskMetric> ListRecentTaskMetrics(Transaction&, const std::string& session_id, std::size_t limit) override;
  Result AppendHealthSnapshot(Transaction&, const swarm::engine::v1::HealthSnapshot&) override;
  std::vector<swarm::engine::v1::HealthSnapshot> ListRecentHealthSnapshots(Transaction&, const std::string& session_id,
                                                                          const std::string& agent_id, std::size_t limit) override;
  Result DeleteTaskMetricsBefore(Transaction&, uint64_t cutoff_ms) override;
  Result DeleteHealthSnapshotsBefore(Transaction&, uint64_t cutoff_ms) override;

  Result AppendHealingAction(Transaction&, const swarm::engine::v1::HealingAction&) override;
  std::vector<swarm::engine::v1::HealingAction> ListRecentHealingActions(Transaction&, const std::string& session_id,
                                                                         std::size_t limit) override;

  Result UpsertProposal(Transaction&, const swarm::engine::v1::ConsensusProposal&) override;
  std::optional<swarm::engine::v1::ConsensusProposal> GetProposal(Transaction&, const std::string& proposal_id) override;
  std::vector<swarm::engine::v1::ConsensusProposal> ListRecentProposals(Transaction&, const std::string& session_id,
                                                                        std::size_t limit, bool decided_only) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::SessionRecord> sessions;

    // session_id -> agent_id -> record
    std::unordered_map<std::string, std::map<std::string, model::AgentRecord>> agents;

    std::unordered_map<std::string, model::TopologyRecord> topologies;

    // append order == insertion order
    std::vector<swarm::engine::v1::TaskMetric>     task_metrics;
    std::vector<swarm::engine::v1::HealthSnapshot> health_snapshots;
    std::vector<swarm::engine::v1::HealingAction>  healing_actions;

    std::unordered_map<std::string, swarm::engine::v1::ConsensusProposal> proposals;
    std::vector<std::string>                                              proposal_order;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace swarm::db::memory
