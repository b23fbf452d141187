#include "state_store.hpp"

#include <type_traits>

#include "internal/util/errors.hpp"

namespace swarm::state {

namespace v1 = swarm::engine::v1;

namespace {

void Check(const db::Result& r, const char* what) {
  if (!r) throw util::StoreError(std::string(what) + ": " + r.message + " (code " + std::to_string(static_cast<int>(r.code)) + ")");
}

} // namespace

StateStore::StateStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

template <typename Fn>
auto StateStore::WithTransaction(const char* what, Fn&& fn) {
  // caller holds mutex_
  try {
    auto tx = repository_->Begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto out = fn(*tx);
      tx->Commit();
      return out;
    }
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StoreError(std::string(what) + ": " + e.what());
  }
}

void StateStore::ForgetSession(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  const std::string prefix = session_id + '\n';
  std::erase_if(last_timestamp_, [&](const auto& kv) { return kv.first.starts_with(prefix); });
}

uint64_t StateStore::NextTimestamp(const std::string& session_id, const std::string& agent_id, uint64_t requested) {
  auto& last = last_timestamp_[session_id + '\n' + agent_id];
  last       = requested > last ? requested : last + 1;
  return last;
}

void StateStore::CreateSession(const db::model::SessionRecord& session, const std::vector<db::model::AgentRecord>& agents,
                               const v1::TopologyGraph& graph) {
  std::lock_guard lock(mutex_);
  WithTransaction("create session", [&](db::Transaction& tx) {
    Check(repository_->InsertSession(tx, session), "insert session");
    for (const auto& agent : agents) {
      Check(repository_->UpsertAgent(tx, agent), "insert agent");
    }
    Check(repository_->SaveTopology(tx, db::model::TopologyRecord{session.session_id, graph}), "save topology");
  });
}

void StateStore::SaveSession(const db::model::SessionRecord& session) {
  std::lock_guard lock(mutex_);
  WithTransaction("save session", [&](db::Transaction& tx) {
    auto r = repository_->UpdateSession(tx, session);
    if (r.code == db::ErrorCode::NotFound) r = repository_->InsertSession(tx, session);
    Check(r, "save session");
  });
}

std::optional<db::model::SessionRecord> StateStore::LoadSession(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  return WithTransaction("load session", [&](db::Transaction& tx) { return repository_->GetSession(tx, session_id); });
}

std::vector<db::model::SessionRecord> StateStore::ListSessions() {
  std::lock_guard lock(mutex_);
  return WithTransaction("list sessions", [&](db::Transaction& tx) { return repository_->ListSessions(tx); });
}

void StateStore::SaveAgent(const db::model::AgentRecord& agent) {
  std::lock_guard lock(mutex_);
  WithTransaction("save agent", [&](db::Transaction& tx) { Check(repository_->UpsertAgent(tx, agent), "save agent"); });
}

void StateStore::RemoveAgent(const std::string& session_id, const std::string& agent_id) {
  std::lock_guard lock(mutex_);
  WithTransaction("remove agent", [&](db::Transaction& tx) {
    auto r = repository_->DeleteAgent(tx, session_id, agent_id);
    if (r.code != db::ErrorCode::NotFound) Check(r, "remove agent");
  });
}

std::vector<db::model::AgentRecord> StateStore::LoadAgents(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  return WithTransaction("load agents", [&](db::Transaction& tx) { return repository_->ListAgents(tx, session_id); });
}

void StateStore::SaveTopology(const std::string& session_id, const v1::TopologyGraph& graph) {
  std::lock_guard lock(mutex_);
  WithTransaction("save topology", [&](db::Transaction& tx) {
    Check(repository_->SaveTopology(tx, db::model::TopologyRecord{session_id, graph}), "save topology");
  });
}

std::optional<v1::TopologyGraph> StateStore::LoadTopology(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto rec = WithTransaction("load topology", [&](db::Transaction& tx) { return repository_->GetTopology(tx, session_id); });
  if (!rec) return std::nullopt;
  return rec->graph;
}

v1::TaskMetric StateStore::AppendMetric(v1::TaskMetric metric) {
  std::lock_guard   lock(mutex_);
  const std::string key          = metric.session_id() + '\n' + metric.agent_id();
  const uint64_t    prior_key_ts = last_timestamp_[key];
  metric.set_timestamp_ms(NextTimestamp(metric.session_id(), metric.agent_id(), metric.timestamp_ms()));
  try {
    WithTransaction("append task metric", [&](db::Transaction& tx) { Check(repository_->AppendTaskMetric(tx, metric), "append task metric"); });
  } catch (...) {
    last_timestamp_[key] = prior_key_ts;
    throw;
  }
  return metric;
}

v1::HealthSnapshot StateStore::AppendHealth(v1::HealthSnapshot snapshot) {
  std::lock_guard lock(mutex_);
  // health snapshots share the per-agent clock with task metrics
  const std::string key          = snapshot.session_id() + '\n' + snapshot.agent_id();
  const uint64_t    prior_key_ts = last_timestamp_[key];
  snapshot.set_timestamp_ms(NextTimestamp(snapshot.session_id(), snapshot.agent_id(), snapshot.timestamp_ms()));
  try {
    WithTransaction("append health snapshot",
                    [&](db::Transaction& tx) { Check(repository_->AppendHealthSnapshot(tx, snapshot), "append health snapshot"); });
  } catch (...) {
    last_timestamp_[key] = prior_key_ts;
    throw;
  }
  return snapshot;
}

void StateStore::AppendHealingAction(const v1::HealingAction& action) {
  std::lock_guard lock(mutex_);
  WithTransaction("append healing action",
                  [&](db::Transaction& tx) { Check(repository_->AppendHealingAction(tx, action), "append healing action"); });
}

void StateStore::SaveProposal(const v1::ConsensusProposal& proposal) {
  std::lock_guard lock(mutex_);
  WithTransaction("save proposal", [&](db::Transaction& tx) { Check(repository_->UpsertProposal(tx, proposal), "save proposal"); });
}

std::optional<v1::ConsensusProposal> StateStore::LoadProposal(const std::string& proposal_id) {
  std::lock_guard lock(mutex_);
  return WithTransaction("load proposal", [&](db::Transaction& tx) { return repository_->GetProposal(tx, proposal_id); });
}

std::vector<v1::TaskMetric> StateStore::QueryRecentMetrics(const std::string& session_id, std::size_t limit) {
  std::lock_guard lock(mutex_);
  return WithTransaction("query metrics", [&](db::Transaction& tx) { return repository_->ListRecentTaskMetrics(tx, session_id, limit); });
}

std::vector<v1::HealthSnapshot> StateStore::QueryRecentHealth(const std::string& session_id, const std::string& agent_id, std::size_t limit) {
  std::lock_guard lock(mutex_);
  return WithTransaction("query health",
                         [&](db::Transaction& tx) { return repository_->ListRecentHealthSnapshots(tx, session_id, agent_id, limit); });
}

std::vector<v1::HealingAction> StateStore::QueryRecentHealingActions(const std::string& session_id, std::size_t limit) {
  std::lock_guard lock(mutex_);
  return WithTransaction("query healing actions",
                         [&](db::Transaction& tx) { return repository_->ListRecentHealingActions(tx, session_id, limit); });
}

std::vector<v1::ConsensusProposal> StateStore::QueryRecentProposals(const std::string& session_id, std::size_t limit, bool decided_only) {
  std::lock_guard lock(mutex_);
  return WithTransaction("query proposals",
                         [&](db::Transaction& tx) { return repository_->ListRecentProposals(tx, session_id, limit, decided_only); });
}

void StateStore::PruneBefore(uint64_t task_metrics_cutoff_ms, uint64_t health_snapshots_cutoff_ms) {
  std::lock_guard lock(mutex_);
  WithTransaction("retention", [&](db::Transaction& tx) {
    if (task_metrics_cutoff_ms) Check(repository_->DeleteTaskMetricsBefore(tx, task_metrics_cutoff_ms), "prune task metrics");
    if (health_snapshots_cutoff_ms) Check(repository_->DeleteHealthSnapshotsBefore(tx, health_snapshots_cutoff_ms), "prune health snapshots");
  });
}

} // namespace swarm::state
