#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace swarm::db::memory {

namespace v1 = swarm::engine::v1;

namespace {

// Newest-first copy of the last `limit` elements matching `pred`.
template <typename T, typename Pred>
std::vector<T> TailNewestFirst(const std::vector<T>& items, std::size_t limit, Pred pred) {
  std::vector<T> out;
  for (auto it = items.rbegin(); it != items.rend() && out.size() < limit; ++it) {
    if (pred(*it)) out.push_back(*it);
  }
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists, r.session_id);
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::NotFound, r.session_id);
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(session_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  records.reserve(s.sessions.size());
  for (const auto& [_, record] : s.sessions) {
    records.push_back(record);
  }
  return records;
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown session " + r.session_id);
  s.agents[r.session_id][r.agent_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteAgent(Transaction& t, const std::string& session_id, const std::string& agent_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.agents.find(session_id);
  if (it == s.agents.end() || it->second.erase(agent_id) == 0) return Result::Err(ErrorCode::NotFound, agent_id);
  return Result::Ok();
}

std::vector<model::AgentRecord> MemoryRepository::ListAgents(Transaction& t, const std::string& session_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::AgentRecord> out;
  auto                            it = s.agents.find(session_id);
  if (it == s.agents.end()) return out;
  for (const auto& [_, record] : it->second) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Topology
// ------------------------------------------------------------------

Result MemoryRepository::SaveTopology(Transaction& t, const model::TopologyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown session " + r.session_id);
  s.topologies[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::TopologyRecord> MemoryRepository::GetTopology(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.topologies.find(session_id);
  if (it == s.topologies.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Task metrics / health snapshots
// ------------------------------------------------------------------

Result MemoryRepository::AppendTaskMetric(Transaction& t, const v1::TaskMetric& m) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(m.session_id())) return Result::Err(ErrorCode::ConstraintViolation, "unknown session " + m.session_id());
  s.task_metrics.push_back(m);
  return Result::Ok();
}

std::vector<v1::TaskMetric> MemoryRepository::ListRecentTaskMetrics(Transaction& t, const std::string& session_id, std::size_t limit) {
  return TailNewestFirst(TX(t).View().task_metrics, limit, [&](const v1::TaskMetric& m) { return m.session_id() == session_id; });
}

Result MemoryRepository::AppendHealthSnapshot(Transaction& t, const v1::HealthSnapshot& h) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(h.session_id())) return Result::Err(ErrorCode::ConstraintViolation, "unknown session " + h.session_id());
  s.health_snapshots.push_back(h);
  return Result::Ok();
}

std::vector<v1::HealthSnapshot> MemoryRepository::ListRecentHealthSnapshots(Transaction& t, const std::string& session_id,
                                                                           const std::string& agent_id, std::size_t limit) {
  return TailNewestFirst(TX(t).View().health_snapshots, limit, [&](const v1::HealthSnapshot& h) {
    return h.session_id() == session_id && (agent_id.empty() || h.agent_id() == agent_id);
  });
}

Result MemoryRepository::DeleteTaskMetricsBefore(Transaction& t, uint64_t cutoff_ms) {
  auto& v = TX(t).Mutable().task_metrics;
  std::erase_if(v, [&](const v1::TaskMetric& m) { return m.timestamp_ms() < cutoff_ms; });
  return Result::Ok();
}

Result MemoryRepository::DeleteHealthSnapshotsBefore(Transaction& t, uint64_t cutoff_ms) {
  auto& v = TX(t).Mutable().health_snapshots;
  std::erase_if(v, [&](const v1::HealthSnapshot& h) { return h.timestamp_ms() < cutoff_ms; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Healing audit
// ------------------------------------------------------------------

Result MemoryRepository::AppendHealingAction(Transaction& t, const v1::HealingAction& a) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(a.session_id())) return Result::Err(ErrorCode::ConstraintViolation, "unknown session " + a.session_id());
  s.healing_actions.push_back(a);
  return Result::Ok();
}

std::vector<v1::HealingAction> MemoryRepository::ListRecentHealingActions(Transaction& t, const std::string& session_id, std::size_t limit) {
  return TailNewestFirst(TX(t).View().healing_actions, limit, [&](const v1::HealingAction& a) { return a.session_id() == session_id; });
}

// ------------------------------------------------------------------
// Consensus proposals
// ------------------------------------------------------------------

Result MemoryRepository::UpsertProposal(Transaction& t, const v1::ConsensusProposal& p) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(p.session_id())) return Result::Err(ErrorCode::ConstraintViolation, "unknown session " + p.session_id());
  auto [it, inserted] = s.proposals.insert_or_assign(p.proposal_id(), p);
  if (inserted) s.proposal_order.push_back(p.proposal_id());
  return Result::Ok();
}

std::optional<v1::ConsensusProposal> MemoryRepository::GetProposal(Transaction& t, const std::string& proposal_id) {
  const auto& s  = TX(t).View();
  auto        it = s.proposals.find(proposal_id);
  if (it == s.proposals.end()) return std::nullopt;
  return it->second;
}

std::vector<v1::ConsensusProposal> MemoryRepository::ListRecentProposals(Transaction& t, const std::string& session_id, std::size_t limit,
                                                                         bool decided_only) {
  const auto&                        s = TX(t).View();
  std::vector<v1::ConsensusProposal> out;
  for (auto it = s.proposal_order.rbegin(); it != s.proposal_order.rend() && out.size() < limit; ++it) {
    const auto& p = s.proposals.at(*it);
    if (p.session_id() != session_id) continue;
    if (decided_only && p.outcome() == v1::OUTCOME_PENDING) continue;
    out.push_back(p);
  }
  return out;
}

} // namespace swarm::db::memory
