#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "event_queue.hpp"
#include "internal/consensus/types.hpp"
#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/healing/auto_healer.hpp"
#include "internal/topology/topology_manager.hpp"
#include "swarm/engine/v1/types.pb.h"

namespace swarm::state {
class StateStore;
}

namespace swarm::metrics {
class MetricsCollector;
}

namespace swarm::session {

// Host hook for predictive healing: move `task_ids` off `agent_id`.
// Returns false when the host could not take the work.
using TaskReassigner =
    std::function<bool(const std::string& session_id, const std::string& agent_id, const std::vector<std::string>& task_ids)>;

struct SessionOptions {
  std::chrono::milliseconds sync_interval{1000};

  // per session; 0 means unlimited
  uint32_t max_agents = 0;

  // session JSON file directory; empty disables the file
  std::filesystem::path state_dir;

  std::size_t status_metrics_limit = 50;

  topology::TopologyOptions topology;
  healing::HealerOptions    healer;
};

struct AgentEntry {
  db::model::AgentRecord              record;
  std::shared_ptr<agent::AgentHandle> handle;
};

/*
  SessionWorker

  The single writer of one session. Owns the TopologyManager, the
  AutoHealer and the session/agent records; every mutation of them runs
  on the worker thread, either as a queued command or as the periodic
  health/metrics/healing iteration (every `sync_interval`; 0 means only
  SyncNow drives iterations).

  Readers on other threads get copies: Status(), Participants(),
  CurrentGraph().

  Any exception escaping a command or an iteration with a persistence
  failure, or escaping an iteration at all, fails the session: it is
  marked degraded, persisted CLOSED with the failure reason, its open
  proposals are cancelled and later commands throw SessionNotFound.
  Status() keeps serving the last known snapshot.
*/
class SessionWorker final : public healing::HealingTarget {
 public:
  using GraphPtr = topology::TopologyManager::GraphPtr;

  SessionWorker(db::model::SessionRecord session, SessionOptions options, std::shared_ptr<state::StateStore> store,
                std::shared_ptr<metrics::MetricsCollector> metrics, TaskReassigner reassigner);
  ~SessionWorker() override;

  SessionWorker(const SessionWorker&)            = delete;
  SessionWorker& operator=(const SessionWorker&) = delete;

  // Builds the first graph, persists session, agents and graph in one
  // transaction, then starts the worker thread.
  void Start(std::vector<AgentEntry> agents);

  // Cancels open proposals, drains queued commands, joins the thread,
  // then persists the session CLOSED.
  void Close();

  const std::string& session_id() const {
    return session_id_;
  }

  bool failed() const {
    return failed_.load();
  }

  swarm::engine::v1::ConsensusAlgorithm consensus_algorithm() const;

  // Persistence failure observed off the worker thread (consensus and
  // task hooks write from the caller's thread).
  void ReportStoreFailure(const std::string& what);

  // ---- commands (run on the worker thread, block the caller) ----

  GraphPtr SwitchTopology(swarm::engine::v1::TopologyKind kind);
  GraphPtr RegisterAgent(AgentEntry agent);
  GraphPtr DeregisterAgent(const std::string& agent_id);
  void     SyncNow();

  // ---- any thread ----

  swarm::engine::v1::SessionStatus    Status() const;
  GraphPtr                            CurrentGraph() const;
  std::vector<consensus::Participant> Participants() const;
  std::shared_ptr<agent::AgentHandle> Handle(const std::string& agent_id) const;
  bool                                HasAgent(const std::string& agent_id) const;
  std::size_t                         AgentCount() const;

  // false for an unknown agent
  bool TouchHeartbeat(const std::string& agent_id);

  // A proposal opened after the session closed or failed is cancelled at once.
  void OpenProposal(const swarm::engine::v1::ConsensusProposal& proposal, consensus::CancelToken cancel);
  void CloseProposal(const std::string& proposal_id);

  // ---- HealingTarget (worker thread) ----

  agent::ProbeResult                             ProbeAgent(const std::string& agent_id) override;
  bool                                           RestartAgent(const std::string& agent_id) override;
  void                                           SetAgentState(const std::string& agent_id, swarm::engine::v1::AgentState state,
                                                               const std::string& reason) override;
  void                                           RemoveAgent(const std::string& agent_id) override;
  std::optional<swarm::engine::v1::TopologyKind> SwitchTopologyForBottleneck() override;
  swarm::engine::v1::TopologyKind                CurrentTopology() const override;
  bool                                           ReassignTasks(const std::string& agent_id) override;
  void                                           RecordHealingAction(const swarm::engine::v1::HealingAction& action) override;

 private:
  using Command = std::function<void()>;

  struct OpenEntry {
    swarm::engine::v1::ConsensusProposal proposal;
    consensus::CancelToken               cancel;
  };

  void Run();

  // health/metrics/healing pass; Iterate() fails the session on error
  void Iterate();
  void IterateOnce();

  template <typename Fn>
  auto Submit(const char* what, Fn&& fn);

  void Fail(const std::string& reason);
  void CancelOpenProposals();

  swarm::engine::v1::SessionSnapshot BuildSnapshot() const;
  void                               WriteSnapshot() const;

  const std::string    session_id_;
  const SessionOptions options_;

  std::shared_ptr<state::StateStore>         store_;
  std::shared_ptr<metrics::MetricsCollector> metrics_;
  TaskReassigner                             reassigner_;

  topology::TopologyManager topology_;
  healing::AutoHealer       healer_;

  // session row and agents; written on the worker thread only
  mutable std::mutex                         state_mutex_;
  db::model::SessionRecord                   session_;
  std::map<std::string, AgentEntry>          agents_;
  std::vector<swarm::engine::v1::TaskMetric> last_metrics_;

  mutable std::mutex                         proposals_mutex_;
  std::unordered_map<std::string, OpenEntry> open_proposals_;

  mutable std::mutex snapshot_mutex_;

  EventQueue<Command> queue_;
  std::thread         thread_;
  std::atomic<bool>   failed_{false};
  std::atomic<bool>   closed_{false};
};

} // namespace swarm::session
