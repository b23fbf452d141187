#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace swarm::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                              InsertSession(Transaction&, const model::SessionRecord&) override;
  Result                              UpdateSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& session_id) override;
  std::vector<model::SessionRecord>   ListSessions(Transaction&) override;

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace swarm::db::sqlite
