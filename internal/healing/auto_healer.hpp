#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/agent/agent_handle.hpp"
#include "swarm/engine/v1/types.pb.h"

namespace swarm::healing {

struct HealerOptions {
  bool health_checks_enabled        = true;
  bool self_healing_enabled         = true;
  bool predictive_healing_enabled   = true;
  bool bottleneck_detection_enabled = true;

  uint32_t window_size             = 20;
  double   degraded_latency_factor = 2.0;
  uint32_t min_samples             = 5;
  uint32_t missed_probes_threshold = 3;
  uint32_t max_restart_attempts    = 3;
  uint32_t predictive_windows      = 5;

  double   bottleneck_throughput_ratio = 0.7;
  uint32_t bottleneck_intervals        = 3;
  uint32_t baseline_intervals          = 10;

  std::chrono::milliseconds probe_timeout{500};
};

/*
  What the healer acts on. Implemented by the session worker; every
  call runs on the session's writer thread.
*/
class HealingTarget {
 public:
  virtual ~HealingTarget() = default;

  virtual agent::ProbeResult ProbeAgent(const std::string& agent_id) = 0;
  virtual bool               RestartAgent(const std::string& agent_id) = 0;

  virtual void SetAgentState(const std::string& agent_id, swarm::engine::v1::AgentState state, const std::string& reason) = 0;

  // remove-agent transition; the agent is already REMOVED
  virtual void RemoveAgent(const std::string& agent_id) = 0;

  // false when no host hook took the work
  virtual bool ReassignTasks(const std::string& agent_id) = 0;

  // Bottleneck switch. Returns the new effective kind, or nullopt when
  // the topology has no better shape. Throws TopologyTransitionError.
  virtual std::optional<swarm::engine::v1::TopologyKind> SwitchTopologyForBottleneck() = 0;

  virtual swarm::engine::v1::TopologyKind CurrentTopology() const = 0;

  virtual void RecordHealingAction(const swarm::engine::v1::HealingAction& action) = 0;
};

/*
  AutoHealer

  Per-agent state machine driven once per sync interval:

    HEALTHY     -> DEGRADED     missed probe, or rolling p95 latency over
                                the last `window_size` tasks above
                                `degraded_latency_factor` x the swarm median p95
    DEGRADED    -> HEALTHY      probe answered and latency back in range
    DEGRADED    -> UNREACHABLE  `missed_probes_threshold` consecutive misses
    UNREACHABLE -> RECOVERED -> HEALTHY   restart succeeded (next iteration)
    UNREACHABLE -> REMOVED      `max_restart_attempts` restarts failed

  Predictive healing: an agent DEGRADED for `predictive_windows`
  consecutive iterations gets REASSIGN_TASK once per degraded episode.

  Bottleneck detection watches aggregate throughput (tasks completed per
  iteration). `bottleneck_intervals` consecutive samples below
  `bottleneck_throughput_ratio` x the rolling baseline while no agent is
  DEGRADED/UNREACHABLE classify the topology as the bottleneck.
*/
class AutoHealer {
 public:
  AutoHealer(std::string session_id, HealerOptions options);

  void Track(const std::string& agent_id, swarm::engine::v1::AgentState state = swarm::engine::v1::AGENT_STATE_HEALTHY);
  void Forget(const std::string& agent_id);

  /*
    One iteration.
      recent_tasks      newest first, session-wide
      completed_tasks   tasks finished since the previous iteration
  */
  void RunIteration(HealingTarget& target, const std::vector<swarm::engine::v1::TaskMetric>& recent_tasks, uint64_t completed_tasks);

  std::optional<swarm::engine::v1::AgentState> StateOf(const std::string& agent_id) const;

  // nearest-rank p95; nullopt below min_samples
  static std::optional<double> P95(const std::vector<uint64_t>& durations_ms, std::size_t min_samples);

  // agents whose p95 exceeds factor x median p95, with their p95
  std::map<std::string, double> SlowAgents(const std::vector<swarm::engine::v1::TaskMetric>& recent_tasks, double* median_p95) const;

 private:
  struct AgentTrack {
    swarm::engine::v1::AgentState state = swarm::engine::v1::AGENT_STATE_HEALTHY;

    uint32_t missed_probes    = 0;
    uint32_t restart_attempts = 0;
    uint32_t degraded_windows = 0;
    bool     reassigned       = false;
  };

  void Transition(HealingTarget& target, const std::string& agent_id, AgentTrack& track, swarm::engine::v1::AgentState next,
                  const std::string& reason);

  void HandleUnreachable(HealingTarget& target, const std::string& agent_id, AgentTrack& track);
  void HandlePredictive(HealingTarget& target, const std::string& agent_id, AgentTrack& track);
  void DetectBottleneck(HealingTarget& target, uint64_t completed_tasks);

  std::string LatencyReason(double p95, double median_p95) const;

  void Record(HealingTarget& target, const std::string& agent_id, swarm::engine::v1::HealingActionKind kind, const std::string& trigger,
              bool success);

  const std::string   session_id_;
  const HealerOptions options_;

  std::map<std::string, AgentTrack> agents_;

  std::deque<uint64_t> baseline_samples_;
  uint32_t             low_throughput_intervals_ = 0;
};

} // namespace swarm::healing
