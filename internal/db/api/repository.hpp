#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/topology_record.hpp"
#include "swarm/engine/v1/types.pb.h"

namespace swarm::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Task metrics, health snapshots and healing actions are append-only;
    the only deletes are the retention Delete*Before calls
  - "Recent" listings return newest first

  The DB is the source of truth for:
    session lifecycle
    per-agent state
    the current topology graph
    consensus and healing audit trails
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::SessionRecord> ListSessions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Agents
  // ---------------------------------------------------------------------

  virtual Result UpsertAgent(Transaction&, const model::AgentRecord&) = 0;

  virtual Result DeleteAgent(Transaction&, const std::string& session_id, const std::string& agent_id) = 0;

  virtual std::vector<model::AgentRecord> ListAgents(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Topology (current graph only; replaced on every transition)
  // ---------------------------------------------------------------------

  virtual Result SaveTopology(Transaction&, const model::TopologyRecord&) = 0;

  virtual std::optional<model::TopologyRecord> GetTopology(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Task metrics / health snapshots
  // ---------------------------------------------------------------------

  virtual Result AppendTaskMetric(Transaction&, const swarm::engine::v1::TaskMetric&) = 0;

  virtual std::vector<swarm::engine::v1::TaskMetric> ListRecentTaskMetrics(Transaction&, const std::string& session_id, std::size_t limit) = 0;

  virtual Result AppendHealthSnapshot(Transaction&, const swarm::engine::v1::HealthSnapshot&) = 0;

  virtual std::vector<swarm::engine::v1::HealthSnapshot> ListRecentHealthSnapshots(Transaction&, const std::string& session_id,
                                                                                  const std::string& agent_id, std::size_t limit) = 0;

  virtual Result DeleteTaskMetricsBefore(Transaction&, uint64_t cutoff_ms) = 0;

  virtual Result DeleteHealthSnapshotsBefore(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Healing audit
  // ---------------------------------------------------------------------

  virtual Result AppendHealingAction(Transaction&, const swarm::engine::v1::HealingAction&) = 0;

  virtual std::vector<swarm::engine::v1::HealingAction> ListRecentHealingActions(Transaction&, const std::string& session_id,
                                                                                 std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Consensus proposals
  // ---------------------------------------------------------------------

  virtual Result UpsertProposal(Transaction&, const swarm::engine::v1::ConsensusProposal&) = 0;

  virtual std::optional<swarm::engine::v1::ConsensusProposal> GetProposal(Transaction&, const std::string& proposal_id) = 0;

  // Newest first; decided_only skips PENDING proposals before the limit applies.
  virtual std::vector<swarm::engine::v1::ConsensusProposal> ListRecentProposals(Transaction&, const std::string& session_id,
                                                                                std::size_t limit, bool decided_only) = 0;
};

} // namespace swarm::db
