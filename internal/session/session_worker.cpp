#include "session_worker.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <type_traits>

#include "internal/metrics/metrics_collector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/state/snapshot_writer.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"

namespace swarm::session {

namespace v1 = swarm::engine::v1;

using observability::IntField;
using observability::StringField;

SessionWorker::SessionWorker(db::model::SessionRecord session, SessionOptions options, std::shared_ptr<state::StateStore> store,
                             std::shared_ptr<metrics::MetricsCollector> metrics, TaskReassigner reassigner)
    : session_id_(session.session_id),
      options_(std::move(options)),
      store_(std::move(store)),
      metrics_(std::move(metrics)),
      reassigner_(std::move(reassigner)),
      topology_(session_id_, options_.topology, store_),
      healer_(session_id_, options_.healer),
      session_(std::move(session)) {
}

SessionWorker::~SessionWorker() {
  CancelOpenProposals();
  queue_.Shutdown();
  try {
    if (thread_.joinable()) thread_.join();
  } catch (const std::system_error& e) {
    SWARM_LOG_ERROR("session worker join failed", {StringField("session_id", session_id_), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// lifecycle
// ------------------------------------------------------------------

void SessionWorker::Start(std::vector<AgentEntry> agents) {
  std::vector<topology::AgentNode>    nodes;
  std::vector<db::model::AgentRecord> records;
  nodes.reserve(agents.size());
  records.reserve(agents.size());
  for (const auto& agent : agents) {
    nodes.push_back(topology::AgentNode{agent.record.agent_id, agent.record.leader_eligible});
    records.push_back(agent.record);
  }

  auto graph = topology_.Initialize(session_.topology, std::move(nodes), session_.pinned_leader_id);
  store_->CreateSession(session_, records, *graph);

  {
    std::lock_guard lock(state_mutex_);
    for (auto& agent : agents) {
      healer_.Track(agent.record.agent_id, agent.record.state);
      const std::string id = agent.record.agent_id;
      agents_.emplace(id, std::move(agent));
    }
  }

  try {
    WriteSnapshot();
  } catch (const util::StoreError& e) {
    Fail(std::string("initial session file: ") + e.what());
    throw;
  }

  observability::Metrics::Instance().SetActiveAgents(session_id_, static_cast<int64_t>(records.size()));

  thread_ = std::thread(&SessionWorker::Run, this);

  SWARM_LOG_INFO("session started", {StringField("session_id", session_id_),
                                     StringField("topology", util::TopologyKindName(session_.topology)),
                                     StringField("effective_topology", util::TopologyKindName(graph->effective_kind())),
                                     StringField("consensus_algorithm", util::ConsensusAlgorithmName(session_.consensus_algorithm)),
                                     IntField("agents", static_cast<int64_t>(records.size()))});
}

void SessionWorker::Close() {
  if (closed_.exchange(true)) return;

  CancelOpenProposals();
  queue_.Shutdown();
  if (thread_.joinable()) thread_.join();

  // a failed session was already persisted CLOSED with its reason
  if (failed_) return;

  db::model::SessionRecord record;
  {
    std::lock_guard lock(state_mutex_);
    session_.status       = v1::SESSION_STATE_CLOSED;
    session_.closed_at_ms = util::NowMillis();
    record                = session_;
  }

  store_->SaveSession(record);
  WriteSnapshot();

  SWARM_LOG_INFO("session closed", {StringField("session_id", session_id_)});
}

void SessionWorker::Fail(const std::string& reason) {
  if (failed_.exchange(true)) return;

  CancelOpenProposals();

  db::model::SessionRecord record;
  {
    std::lock_guard lock(state_mutex_);
    session_.status         = v1::SESSION_STATE_CLOSED;
    session_.closed_at_ms   = util::NowMillis();
    session_.failure_reason = reason;
    record                  = session_;
  }

  SWARM_LOG_ERROR("session failed", {StringField("session_id", session_id_), StringField("reason", reason)});

  try {
    store_->SaveSession(record);
  } catch (const util::StoreError& e) {
    SWARM_LOG_ERROR("failed session could not be persisted", {StringField("session_id", session_id_), StringField("error", e.what())});
  }

  try {
    WriteSnapshot();
  } catch (const util::StoreError& e) {
    SWARM_LOG_WARN("failed session file not written", {StringField("session_id", session_id_), StringField("error", e.what())});
  }
}

void SessionWorker::ReportStoreFailure(const std::string& what) {
  Fail(what);
}

void SessionWorker::CancelOpenProposals() {
  std::lock_guard lock(proposals_mutex_);
  for (auto& [_, entry] : open_proposals_) {
    if (entry.cancel) entry.cancel->store(true);
  }
}

// ------------------------------------------------------------------
// worker thread
// ------------------------------------------------------------------

void SessionWorker::Run() {
  using SteadyClock = std::chrono::steady_clock;

  const bool periodic  = options_.sync_interval.count() > 0;
  auto       next_tick = SteadyClock::now() + options_.sync_interval;

  while (true) {
    if (periodic && SteadyClock::now() >= next_tick) {
      next_tick = SteadyClock::now() + options_.sync_interval;
      if (!failed_) Iterate();
    }

    auto command = periodic ? queue_.DequeueUntil(next_tick) : queue_.Dequeue();
    if (command) {
      (*command)();
      continue;
    }
    if (queue_.IsShutdown()) break;
  }
}

void SessionWorker::Iterate() {
  try {
    IterateOnce();
  } catch (const std::exception& e) {
    Fail(std::string("background iteration failed: ") + e.what());
  }
}

void SessionWorker::IterateOnce() {
  const std::size_t agent_count = AgentCount();
  const std::size_t window      = static_cast<std::size_t>(options_.healer.window_size) * std::max<std::size_t>(agent_count, 1);

  auto           recent    = metrics_->RecentTasks(session_id_, std::max(window, options_.status_metrics_limit));
  const uint64_t completed = metrics_->TakeCompletedCount(session_id_);

  healer_.RunIteration(*this, recent, completed);

  {
    std::lock_guard lock(state_mutex_);
    if (recent.size() > options_.status_metrics_limit) recent.resize(options_.status_metrics_limit);
    last_metrics_ = std::move(recent);
  }

  WriteSnapshot();
  observability::Metrics::Instance().SetActiveAgents(session_id_, static_cast<int64_t>(AgentCount()));
}

template <typename Fn>
auto SessionWorker::Submit(const char* what, Fn&& fn) {
  using Result = std::invoke_result_t<Fn&>;

  auto promise = std::make_shared<std::promise<Result>>();
  auto future  = promise->get_future();

  Command command = [this, what, promise, fn = std::forward<Fn>(fn)]() mutable {
    try {
      if (failed_) {
        throw util::SessionNotFound("session " + session_id_ + " has failed");
      }
      if constexpr (std::is_void_v<Result>) {
        fn();
        promise->set_value();
      } else {
        promise->set_value(fn());
      }
    } catch (const util::StoreError& e) {
      Fail(std::string(what) + ": " + e.what());
      promise->set_exception(std::current_exception());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  };

  if (!queue_.Enqueue(std::move(command))) {
    throw util::SessionNotFound("session " + session_id_ + " is closed");
  }
  return future.get();
}

// ------------------------------------------------------------------
// commands
// ------------------------------------------------------------------

SessionWorker::GraphPtr SessionWorker::SwitchTopology(v1::TopologyKind kind) {
  return Submit("switch topology", [this, kind] {
    auto graph = topology_.TransitionTo(kind);

    db::model::SessionRecord record;
    {
      std::lock_guard lock(state_mutex_);
      session_.topology = kind;
      record            = session_;
    }
    store_->SaveSession(record);
    return graph;
  });
}

SessionWorker::GraphPtr SessionWorker::RegisterAgent(AgentEntry agent) {
  return Submit("register agent", [this, agent] {
    const std::string& agent_id = agent.record.agent_id;
    if (HasAgent(agent_id)) {
      throw util::InvalidConfig("agent " + agent_id + " is already part of session " + session_id_);
    }
    if (options_.max_agents > 0 && AgentCount() >= options_.max_agents) {
      throw util::InvalidConfig("session " + session_id_ + " already has max_agents=" + std::to_string(options_.max_agents) + " agents");
    }

    auto graph = topology_.AddAgent(topology::AgentNode{agent_id, agent.record.leader_eligible});
    store_->SaveAgent(agent.record);

    {
      std::lock_guard lock(state_mutex_);
      agents_[agent_id] = agent;
    }
    healer_.Track(agent_id, agent.record.state);
    observability::Metrics::Instance().SetActiveAgents(session_id_, static_cast<int64_t>(AgentCount()));

    SWARM_LOG_INFO("agent registered", {StringField("session_id", session_id_), StringField("agent_id", agent_id)});
    return graph;
  });
}

SessionWorker::GraphPtr SessionWorker::DeregisterAgent(const std::string& agent_id) {
  return Submit("deregister agent", [this, agent_id] {
    if (!HasAgent(agent_id)) {
      throw util::InvalidConfig("agent " + agent_id + " is not part of session " + session_id_);
    }

    auto graph = topology_.RemoveAgent(agent_id, /*strict=*/true);
    store_->RemoveAgent(session_id_, agent_id);

    {
      std::lock_guard lock(state_mutex_);
      agents_.erase(agent_id);
    }
    healer_.Forget(agent_id);
    observability::Metrics::Instance().SetActiveAgents(session_id_, static_cast<int64_t>(AgentCount()));

    SWARM_LOG_INFO("agent deregistered", {StringField("session_id", session_id_), StringField("agent_id", agent_id)});
    return graph;
  });
}

void SessionWorker::SyncNow() {
  Submit("sync", [this] {
    Iterate();
    if (failed_) {
      std::lock_guard lock(state_mutex_);
      throw util::StoreError("session " + session_id_ + " failed: " + session_.failure_reason);
    }
  });
}

// ------------------------------------------------------------------
// readers
// ------------------------------------------------------------------

SessionWorker::GraphPtr SessionWorker::CurrentGraph() const {
  return topology_.Current();
}

v1::ConsensusAlgorithm SessionWorker::consensus_algorithm() const {
  std::lock_guard lock(state_mutex_);
  return session_.consensus_algorithm;
}

std::size_t SessionWorker::AgentCount() const {
  std::lock_guard lock(state_mutex_);
  return agents_.size();
}

bool SessionWorker::HasAgent(const std::string& agent_id) const {
  std::lock_guard lock(state_mutex_);
  return agents_.contains(agent_id);
}

std::shared_ptr<agent::AgentHandle> SessionWorker::Handle(const std::string& agent_id) const {
  std::lock_guard lock(state_mutex_);
  auto            it = agents_.find(agent_id);
  return it == agents_.end() ? nullptr : it->second.handle;
}

std::vector<consensus::Participant> SessionWorker::Participants() const {
  std::lock_guard                     lock(state_mutex_);
  std::vector<consensus::Participant> out;
  out.reserve(agents_.size());
  for (const auto& [agent_id, entry] : agents_) {
    if (entry.record.state == v1::AGENT_STATE_REMOVED) continue;
    out.push_back(consensus::Participant{agent_id, entry.record.weight, entry.handle});
  }
  return out;
}

bool SessionWorker::TouchHeartbeat(const std::string& agent_id) {
  std::lock_guard lock(state_mutex_);
  auto            it = agents_.find(agent_id);
  if (it == agents_.end()) return false;
  it->second.record.last_heartbeat_at_ms = util::NowMillis();
  return true;
}

void SessionWorker::OpenProposal(const v1::ConsensusProposal& proposal, consensus::CancelToken cancel) {
  std::lock_guard lock(proposals_mutex_);
  // closed or failed after the caller looked the session up
  if ((closed_ || failed_) && cancel) cancel->store(true);
  open_proposals_[proposal.proposal_id()] = OpenEntry{proposal, std::move(cancel)};
}

void SessionWorker::CloseProposal(const std::string& proposal_id) {
  std::lock_guard lock(proposals_mutex_);
  open_proposals_.erase(proposal_id);
}

v1::SessionStatus SessionWorker::Status() const {
  v1::SessionStatus status;

  if (auto graph = CurrentGraph()) *status.mutable_topology() = *graph;

  {
    std::lock_guard lock(state_mutex_);
    status.set_session_id(session_id_);
    status.set_consensus_algorithm(session_.consensus_algorithm);
    status.set_state(session_.status);
    status.set_failure_reason(session_.failure_reason);
    status.set_created_at_ms(session_.created_at_ms);

    for (const auto& [agent_id, entry] : agents_) {
      auto* agent = status.add_agents();
      agent->set_agent_id(agent_id);
      agent->set_state(entry.record.state);
      agent->set_last_heartbeat_at_ms(entry.record.last_heartbeat_at_ms);
      agent->set_weight(entry.record.weight);
      agent->set_leader_eligible(entry.record.leader_eligible);
      for (const auto& tag : entry.record.capability_tags) agent->add_capability_tags(tag);
    }
  }

  status.set_degraded(failed_);

  std::vector<v1::TaskMetric> recent;
  bool                        live = false;
  if (!failed_) {
    try {
      recent = store_->QueryRecentMetrics(session_id_, options_.status_metrics_limit);
      live   = true;
    } catch (const util::StoreError& e) {
      SWARM_LOG_WARN("status served from cached metrics", {StringField("session_id", session_id_), StringField("error", e.what())});
    }
  }
  if (!live) {
    std::lock_guard lock(state_mutex_);
    recent = last_metrics_;
  }
  for (auto& metric : recent) *status.add_recent_metrics() = std::move(metric);

  {
    std::lock_guard lock(proposals_mutex_);
    for (const auto& [_, entry] : open_proposals_) *status.add_open_proposals() = entry.proposal;
  }

  return status;
}

// ------------------------------------------------------------------
// HealingTarget
// ------------------------------------------------------------------

agent::ProbeResult SessionWorker::ProbeAgent(const std::string& agent_id) {
  agent::ProbeResult probe;

  if (auto handle = Handle(agent_id)) {
    try {
      probe = handle->Probe(options_.healer.probe_timeout);
    } catch (const util::AgentUnreachable& e) {
      probe.reachable = false;
      SWARM_LOG_DEBUG("probe failed", {StringField("session_id", session_id_), StringField("agent_id", agent_id),
                                       StringField("error", e.what())});
    }
  }

  metrics_->RecordProbe(session_id_, agent_id, probe);
  if (probe.reachable) TouchHeartbeat(agent_id);
  return probe;
}

bool SessionWorker::RestartAgent(const std::string& agent_id) {
  auto handle = Handle(agent_id);
  if (!handle) throw util::AgentUnreachable("agent " + agent_id + " has no handle");
  return handle->Restart();
}

void SessionWorker::SetAgentState(const std::string& agent_id, v1::AgentState state, const std::string& reason) {
  db::model::AgentRecord record;
  v1::AgentState         prior = v1::AGENT_STATE_UNSPECIFIED;
  {
    std::lock_guard lock(state_mutex_);
    auto            it = agents_.find(agent_id);
    if (it == agents_.end()) return;
    prior                   = it->second.record.state;
    it->second.record.state = state;
    record                  = it->second.record;
  }

  store_->SaveAgent(record);

  const bool worse = state == v1::AGENT_STATE_UNREACHABLE || state == v1::AGENT_STATE_REMOVED;
  observability::Log(worse ? spdlog::level::warn : spdlog::level::info, "agent state transition",
                     {StringField("session_id", session_id_), StringField("agent_id", agent_id),
                      StringField("from", util::AgentStateName(prior)), StringField("to", util::AgentStateName(state)),
                      StringField("reason", reason)});
}

void SessionWorker::RemoveAgent(const std::string& agent_id) {
  topology_.RemoveAgent(agent_id, /*strict=*/false);
  store_->RemoveAgent(session_id_, agent_id);

  {
    std::lock_guard lock(state_mutex_);
    agents_.erase(agent_id);
  }
  observability::Metrics::Instance().SetActiveAgents(session_id_, static_cast<int64_t>(AgentCount()));
}

bool SessionWorker::ReassignTasks(const std::string& agent_id) {
  if (!reassigner_) {
    SWARM_LOG_INFO("no task reassigner installed", {StringField("session_id", session_id_), StringField("agent_id", agent_id)});
    return false;
  }

  const auto tasks = metrics_->InFlightTasks(session_id_, agent_id);
  try {
    return reassigner_(session_id_, agent_id, tasks);
  } catch (const std::exception& e) {
    SWARM_LOG_WARN("task reassignment failed", {StringField("session_id", session_id_), StringField("agent_id", agent_id),
                                                StringField("error", e.what())});
    return false;
  }
}

std::optional<v1::TopologyKind> SessionWorker::SwitchTopologyForBottleneck() {
  auto graph = topology_.SwitchForBottleneck();
  if (!graph) return std::nullopt;

  const v1::TopologyKind kind = (*graph)->kind();

  std::optional<db::model::SessionRecord> changed;
  {
    std::lock_guard lock(state_mutex_);
    if (session_.topology != kind) {
      session_.topology = kind;
      changed           = session_;
    }
  }
  if (changed) store_->SaveSession(*changed);

  return (*graph)->effective_kind();
}

v1::TopologyKind SessionWorker::CurrentTopology() const {
  auto graph = CurrentGraph();
  return graph ? graph->effective_kind() : v1::TOPOLOGY_KIND_UNSPECIFIED;
}

void SessionWorker::RecordHealingAction(const v1::HealingAction& action) {
  store_->AppendHealingAction(action);
}

// ------------------------------------------------------------------
// session file
// ------------------------------------------------------------------

v1::SessionSnapshot SessionWorker::BuildSnapshot() const {
  v1::SessionSnapshot snapshot;

  std::lock_guard lock(state_mutex_);
  snapshot.set_session_id(session_id_);
  snapshot.set_topology(util::TopologyKindName(session_.topology));
  snapshot.set_consensus_algorithm(util::ConsensusAlgorithmName(session_.consensus_algorithm));
  snapshot.set_status(util::SessionStateName(session_.status));
  for (const auto& [agent_id, entry] : agents_) {
    auto* agent = snapshot.add_agents();
    agent->set_id(agent_id);
    agent->set_state(util::AgentStateName(entry.record.state));
  }
  return snapshot;
}

void SessionWorker::WriteSnapshot() const {
  if (options_.state_dir.empty()) return;
  const auto      snapshot = BuildSnapshot();
  std::lock_guard lock(snapshot_mutex_);
  state::WriteSessionSnapshot(options_.state_dir, snapshot);
}

} // namespace swarm::session
