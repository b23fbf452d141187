#include "swarm_coordinator.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <set>

#include "internal/agent/agent_handle.hpp"
#include "internal/agent/remote_agent.hpp"
#include "internal/metrics/metrics_collector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/state_store.hpp"
#include "internal/topology/topology_graph.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace swarm::core {

namespace v1 = swarm::engine::v1;

using observability::IntField;
using observability::StringField;

namespace {

bool IsSupportedAlgorithm(v1::ConsensusAlgorithm algorithm) {
  return algorithm >= v1::CONSENSUS_ALGORITHM_QUORUM && algorithm <= v1::CONSENSUS_ALGORITHM_CRDT;
}

bool IsDecided(const v1::ConsensusProposal& proposal) {
  return proposal.outcome() != v1::OUTCOME_PENDING && proposal.outcome() != v1::OUTCOME_UNSPECIFIED;
}

} // namespace

SwarmCoordinator::SwarmCoordinator(CoordinatorOptions options, std::shared_ptr<state::StateStore> store,
                                   std::shared_ptr<agent::AgentDirectory> directory)
    : options_(std::move(options)),
      store_(std::move(store)),
      directory_(std::move(directory)),
      metrics_(std::make_shared<metrics::MetricsCollector>(store_, options_.metrics_enabled)),
      engine_(options_.consensus, [store = store_](const std::string& proposal_id) -> std::optional<v1::Outcome> {
        if (!store) return std::nullopt;
        auto stored = store->LoadProposal(proposal_id);
        if (!stored || !IsDecided(*stored)) return std::nullopt;
        return stored->outcome();
      }) {
  if (!store_) throw util::InvalidConfig("coordinator requires a state store");
  if (!directory_) throw util::InvalidConfig("coordinator requires an agent directory");
}

SwarmCoordinator::~SwarmCoordinator() = default;

template <typename Fn>
auto SwarmCoordinator::Persist(session::SessionWorker& worker, Fn&& fn) {
  try {
    return fn();
  } catch (const util::StoreError& e) {
    worker.ReportStoreFailure(e.what());
    throw;
  }
}

// ------------------------------------------------------------------
// lookup
// ------------------------------------------------------------------

std::shared_ptr<session::SessionWorker> SwarmCoordinator::Find(const std::string& session_id) const {
  std::shared_lock lock(sessions_mutex_);
  auto             it = sessions_.find(session_id);
  if (it != sessions_.end()) return it->second;
  if (closed_ids_.contains(session_id)) throw util::SessionNotFound("session " + session_id + " is closed");
  throw util::SessionNotFound("unknown session " + session_id);
}

std::shared_ptr<session::SessionWorker> SwarmCoordinator::FindLive(const std::string& session_id) const {
  auto worker = Find(session_id);
  if (worker->failed()) throw util::SessionNotFound("session " + session_id + " has failed");
  return worker;
}

void SwarmCoordinator::RequireKnown(const std::string& session_id) const {
  std::shared_lock lock(sessions_mutex_);
  if (sessions_.contains(session_id) || closed_ids_.contains(session_id)) return;
  throw util::SessionNotFound("unknown session " + session_id);
}

session::AgentEntry SwarmCoordinator::MakeEntry(const std::string& session_id, const v1::AgentSpec& spec, bool explicit_eligibility) {
  if (spec.agent_id().empty()) throw util::InvalidConfig("agent_id must not be empty");
  if (spec.weight() < 0.0) throw util::InvalidConfig("agent " + spec.agent_id() + " has a negative weight");

  session::AgentEntry entry;
  entry.record.session_id      = session_id;
  entry.record.agent_id        = spec.agent_id();
  entry.record.capability_tags = {spec.capability_tags().begin(), spec.capability_tags().end()};
  entry.record.weight          = spec.weight() == 0.0 ? 1.0 : spec.weight();
  entry.record.leader_eligible = spec.has_leader_eligible() ? spec.leader_eligible() : !explicit_eligibility;
  entry.record.state           = v1::AGENT_STATE_HEALTHY;

  entry.handle = directory_->Resolve(session_id, spec);
  if (!entry.handle) throw util::InvalidConfig("no handle for agent " + spec.agent_id());
  return entry;
}

// ------------------------------------------------------------------
// session lifecycle
// ------------------------------------------------------------------

std::string SwarmCoordinator::InitSession(v1::TopologyKind topology, v1::ConsensusAlgorithm algorithm,
                                          const std::vector<v1::AgentSpec>& agents, const std::string& pinned_leader_id) {
  if (topology == v1::TOPOLOGY_KIND_UNSPECIFIED) topology = options_.default_topology;
  if (algorithm == v1::CONSENSUS_ALGORITHM_UNSPECIFIED) algorithm = options_.default_algorithm;

  if (agents.empty()) throw util::InvalidConfig("a session needs at least one agent");
  if (agents.size() > options_.max_agents) {
    throw util::InvalidConfig(std::to_string(agents.size()) + " agents exceed max_agents=" + std::to_string(options_.max_agents));
  }
  if (!topology::IsSupportedKind(topology)) {
    throw util::InvalidConfig("unsupported topology " + std::to_string(static_cast<int>(topology)));
  }
  if (!IsSupportedAlgorithm(algorithm)) {
    throw util::InvalidConfig("unsupported consensus algorithm " + std::to_string(static_cast<int>(algorithm)));
  }

  std::set<std::string> ids;
  bool                  explicit_eligibility = false;
  for (const auto& spec : agents) {
    if (!ids.insert(spec.agent_id()).second) throw util::InvalidConfig("duplicate agent " + spec.agent_id());
    explicit_eligibility = explicit_eligibility || spec.has_leader_eligible();
  }
  if (!pinned_leader_id.empty() && !ids.contains(pinned_leader_id)) {
    throw util::InvalidConfig("pinned leader " + pinned_leader_id + " is not one of the session's agents");
  }

  {
    std::shared_lock lock(sessions_mutex_);
    if (options_.max_sessions > 0 && sessions_.size() >= options_.max_sessions) {
      throw util::InvalidConfig("max_sessions=" + std::to_string(options_.max_sessions) + " reached");
    }
  }

  db::model::SessionRecord record;
  record.session_id          = util::GenerateId("swarm-");
  record.topology            = topology;
  record.consensus_algorithm = algorithm;
  record.created_at_ms       = util::NowMillis();
  record.status              = v1::SESSION_STATE_ACTIVE;
  record.pinned_leader_id    = pinned_leader_id;

  std::vector<session::AgentEntry> entries;
  entries.reserve(agents.size());
  for (const auto& spec : agents) entries.push_back(MakeEntry(record.session_id, spec, explicit_eligibility));

  auto session_options       = options_.session;
  session_options.max_agents = options_.max_agents;

  session::TaskReassigner reassigner;
  {
    std::shared_lock lock(sessions_mutex_);
    reassigner = reassigner_;
  }

  const std::string session_id = record.session_id;
  auto worker = std::make_shared<session::SessionWorker>(std::move(record), session_options, store_, metrics_, std::move(reassigner));

  metrics_->TrackSession(session_id);
  try {
    worker->Start(std::move(entries));
  } catch (const util::TopologyTransitionError& e) {
    ForgetSession(session_id);
    throw util::InvalidConfig(std::string("initial topology: ") + e.what());
  } catch (...) {
    ForgetSession(session_id);
    throw;
  }

  {
    std::unique_lock lock(sessions_mutex_);
    sessions_.emplace(session_id, std::move(worker));
  }
  return session_id;
}

v1::SessionStatus SwarmCoordinator::GetStatus(const std::string& session_id) const {
  return Find(session_id)->Status();
}

void SwarmCoordinator::CloseSession(const std::string& session_id) {
  std::shared_ptr<session::SessionWorker> worker;
  {
    std::unique_lock lock(sessions_mutex_);
    auto             it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      if (closed_ids_.contains(session_id)) return;
      throw util::SessionNotFound("unknown session " + session_id);
    }
    worker = std::move(it->second);
    sessions_.erase(it);
    closed_ids_.insert(session_id);
  }

  // per-session state is dropped only once the worker thread has stopped
  try {
    worker->Close();
  } catch (...) {
    ForgetSession(session_id);
    throw;
  }
  ForgetSession(session_id);
}

void SwarmCoordinator::ForgetSession(const std::string& session_id) {
  metrics_->ForgetSession(session_id);
  store_->ForgetSession(session_id);
}

void SwarmCoordinator::CloseAll() {
  std::vector<std::string> ids = ListSessions();
  for (const auto& id : ids) {
    try {
      CloseSession(id);
    } catch (const util::StoreError& e) {
      SWARM_LOG_ERROR("session close failed", {StringField("session_id", id), StringField("error", e.what())});
    }
  }
}

std::vector<std::string> SwarmCoordinator::ListSessions() const {
  std::vector<std::string> ids;
  {
    std::shared_lock lock(sessions_mutex_);
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

// ------------------------------------------------------------------
// topology
// ------------------------------------------------------------------

v1::TopologyGraph SwarmCoordinator::SwitchTopology(const std::string& session_id, v1::TopologyKind topology) {
  if (!topology::IsSupportedKind(topology)) {
    throw util::InvalidConfig("unsupported topology " + std::to_string(static_cast<int>(topology)));
  }
  return *Find(session_id)->SwitchTopology(topology);
}

v1::TopologyGraph SwarmCoordinator::RegisterAgent(const std::string& session_id, const v1::AgentSpec& agent) {
  auto worker = FindLive(session_id);
  if (worker->HasAgent(agent.agent_id())) {
    throw util::InvalidConfig("agent " + agent.agent_id() + " is already part of session " + session_id);
  }
  return *worker->RegisterAgent(MakeEntry(session_id, agent, false));
}

v1::TopologyGraph SwarmCoordinator::DeregisterAgent(const std::string& session_id, const std::string& agent_id) {
  return *Find(session_id)->DeregisterAgent(agent_id);
}

// ------------------------------------------------------------------
// consensus
// ------------------------------------------------------------------

v1::ConsensusProposal SwarmCoordinator::RequestConsensus(const std::string& session_id, const std::string& proposal_text,
                                                         std::chrono::milliseconds timeout) {
  auto worker = FindLive(session_id);

  const auto algorithm = worker->consensus_algorithm();
  const auto graph     = worker->CurrentGraph();

  if (consensus::ConsensusEngine::RequiresLeader(algorithm) && graph->leader_id().empty()) {
    throw util::NoLeaderAvailable(util::ConsensusAlgorithmName(algorithm) + " needs a leader; topology " +
                                  util::TopologyKindName(graph->effective_kind()) + " has none");
  }

  if (timeout.count() <= 0) timeout = options_.consensus.default_timeout;

  auto participants = worker->Participants();

  v1::ConsensusProposal proposal;
  proposal.set_proposal_id(util::GenerateId("prop-"));
  proposal.set_session_id(session_id);
  proposal.set_text(proposal_text);
  proposal.set_algorithm(algorithm);
  proposal.set_created_at_ms(util::NowMillis());
  proposal.set_deadline_ms(proposal.created_at_ms() + static_cast<uint64_t>(timeout.count()));
  proposal.set_outcome(v1::OUTCOME_PENDING);
  for (const auto& p : participants) proposal.add_participants(p.agent_id);

  Persist(*worker, [&] { store_->SaveProposal(proposal); });

  auto cancel = consensus::MakeCancelToken();
  worker->OpenProposal(proposal, cancel);

  v1::ConsensusProposal decided;
  try {
    decided = engine_.Decide(proposal, std::move(participants), graph->leader_id(), cancel);
  } catch (...) {
    worker->CloseProposal(proposal.proposal_id());
    throw;
  }
  worker->CloseProposal(proposal.proposal_id());

  Persist(*worker, [&] { store_->SaveProposal(decided); });
  return decided;
}

std::vector<v1::ConsensusProposal> SwarmCoordinator::GetConsensusHistory(const std::string& session_id, std::size_t limit) {
  RequireKnown(session_id);
  return store_->QueryRecentProposals(session_id, limit, true);
}

std::vector<v1::HealingAction> SwarmCoordinator::GetHealingHistory(const std::string& session_id, std::size_t limit) {
  RequireKnown(session_id);
  return store_->QueryRecentHealingActions(session_id, limit);
}

// ------------------------------------------------------------------
// host hooks
// ------------------------------------------------------------------

void SwarmCoordinator::OnTaskStart(const std::string& session_id, const std::string& agent_id, const std::string& task_id) {
  auto worker = FindLive(session_id);
  if (!worker->HasAgent(agent_id)) {
    throw util::InvalidConfig("agent " + agent_id + " is not part of session " + session_id);
  }
  metrics_->OnTaskStart(session_id, agent_id, task_id);
}

void SwarmCoordinator::OnTaskEnd(const std::string& session_id, const std::string& agent_id, const std::string& task_id,
                                 uint64_t duration_ms, v1::TaskResult result) {
  auto worker = FindLive(session_id);
  if (!worker->HasAgent(agent_id)) {
    throw util::InvalidConfig("agent " + agent_id + " is not part of session " + session_id);
  }
  if (result != v1::TASK_RESULT_SUCCESS && result != v1::TASK_RESULT_FAILURE) {
    throw util::InvalidConfig("task " + task_id + " ended without a result");
  }
  Persist(*worker, [&] { return metrics_->OnTaskEnd(session_id, agent_id, task_id, duration_ms, result); });
}

void SwarmCoordinator::SetTaskReassigner(session::TaskReassigner reassigner) {
  std::unique_lock lock(sessions_mutex_);
  reassigner_ = std::move(reassigner);
}

// ------------------------------------------------------------------
// remote agents
// ------------------------------------------------------------------

std::vector<v1::Ballot> SwarmCoordinator::Heartbeat(const std::string& session_id, const std::string& agent_id, uint64_t latency_ms) {
  auto worker = FindLive(session_id);
  if (!worker->TouchHeartbeat(agent_id)) {
    throw util::InvalidConfig("agent " + agent_id + " is not part of session " + session_id);
  }

  auto remote = std::dynamic_pointer_cast<agent::RemoteAgentHandle>(worker->Handle(agent_id));
  if (!remote) return {};

  remote->RecordHeartbeat(latency_ms);
  return remote->PendingBallots();
}

bool SwarmCoordinator::SubmitVote(const std::string& session_id, const std::string& agent_id, const std::string& proposal_id,
                                  uint32_t round, v1::Vote vote) {
  if (vote != v1::VOTE_YES && vote != v1::VOTE_NO && vote != v1::VOTE_ABSTAIN) {
    throw util::InvalidConfig("vote must be YES, NO or ABSTAIN");
  }

  auto worker = FindLive(session_id);
  auto handle = worker->Handle(agent_id);
  if (!handle) throw util::InvalidConfig("agent " + agent_id + " is not part of session " + session_id);

  auto remote = std::dynamic_pointer_cast<agent::RemoteAgentHandle>(handle);
  if (!remote) return false;

  const bool accepted = remote->SubmitVote(proposal_id, round, vote);
  if (!accepted) {
    SWARM_LOG_DEBUG("late vote discarded", {StringField("session_id", session_id), StringField("agent_id", agent_id),
                                            StringField("proposal_id", proposal_id), IntField("round", round)});
  }
  return accepted;
}

// ------------------------------------------------------------------
// maintenance
// ------------------------------------------------------------------

void SwarmCoordinator::SyncNow(const std::string& session_id) {
  Find(session_id)->SyncNow();
}

void SwarmCoordinator::RunRetention(uint64_t now_ms) {
  auto cutoff = [now_ms](std::chrono::seconds age) -> uint64_t {
    if (age.count() <= 0) return 0;
    const auto age_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(age).count());
    return now_ms > age_ms ? now_ms - age_ms : 0;
  };

  const uint64_t task_cutoff   = cutoff(options_.task_metrics_max_age);
  const uint64_t health_cutoff = cutoff(options_.health_snapshots_max_age);
  if (task_cutoff == 0 && health_cutoff == 0) return;

  store_->PruneBefore(task_cutoff, health_cutoff);

  SWARM_LOG_INFO("retention applied", {IntField("task_metrics_cutoff_ms", static_cast<int64_t>(task_cutoff)),
                                       IntField("health_snapshots_cutoff_ms", static_cast<int64_t>(health_cutoff))});
}

} // namespace swarm::core
