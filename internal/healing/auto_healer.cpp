#include "auto_healer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/model/agent_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace swarm::healing {

namespace v1 = swarm::engine::v1;

using observability::StringField;

namespace {

double Median(std::vector<double> values) {
  std::sort(values.begin(), values.end());
  const std::size_t n = values.size();
  return n % 2 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

} // namespace

std::string AutoHealer::LatencyReason(double p95, double median_p95) const {
  std::ostringstream out;
  out.precision(1);
  out << std::fixed << "p95 latency " << p95 << "ms > " << options_.degraded_latency_factor << "x swarm median " << median_p95 << "ms";
  return out.str();
}

AutoHealer::AutoHealer(std::string session_id, HealerOptions options) : session_id_(std::move(session_id)), options_(options) {
}

void AutoHealer::Track(const std::string& agent_id, v1::AgentState state) {
  AgentTrack track;
  track.state       = state;
  agents_[agent_id] = track;
}

void AutoHealer::Forget(const std::string& agent_id) {
  agents_.erase(agent_id);
}

std::optional<v1::AgentState> AutoHealer::StateOf(const std::string& agent_id) const {
  auto it = agents_.find(agent_id);
  if (it == agents_.end()) return std::nullopt;
  return it->second.state;
}

std::optional<double> AutoHealer::P95(const std::vector<uint64_t>& durations_ms, std::size_t min_samples) {
  if (durations_ms.empty() || durations_ms.size() < min_samples) return std::nullopt;
  auto sorted = durations_ms;
  std::sort(sorted.begin(), sorted.end());
  const auto rank = static_cast<std::size_t>(std::ceil(0.95 * static_cast<double>(sorted.size())));
  return static_cast<double>(sorted[std::max<std::size_t>(rank, 1) - 1]);
}

std::map<std::string, double> AutoHealer::SlowAgents(const std::vector<v1::TaskMetric>& recent_tasks, double* median_p95) const {
  std::map<std::string, std::vector<uint64_t>> windows;
  for (const auto& task : recent_tasks) {
    if (!agents_.contains(task.agent_id())) continue;
    auto& window = windows[task.agent_id()];
    if (window.size() < options_.window_size) window.push_back(task.duration_ms());
  }

  std::map<std::string, double> p95s;
  for (const auto& [agent_id, window] : windows) {
    if (auto p = P95(window, options_.min_samples)) p95s[agent_id] = *p;
  }

  std::map<std::string, double> slow;
  if (p95s.size() < 2) return slow;

  std::vector<double> values;
  for (const auto& [_, p] : p95s) values.push_back(p);
  const double median = Median(std::move(values));
  if (median_p95) *median_p95 = median;

  for (const auto& [agent_id, p] : p95s) {
    if (p > options_.degraded_latency_factor * median) slow[agent_id] = p;
  }
  return slow;
}

void AutoHealer::Transition(HealingTarget& target, const std::string& agent_id, AgentTrack& track, v1::AgentState next,
                            const std::string& reason) {
  if (!model::CanTransition(track.state, next)) {
    throw std::logic_error("invalid agent transition " + util::AgentStateName(track.state) + " -> " + util::AgentStateName(next) +
                           " for " + agent_id);
  }
  target.SetAgentState(agent_id, next, reason);
  track.state = next;
}

void AutoHealer::Record(HealingTarget& target, const std::string& agent_id, v1::HealingActionKind kind, const std::string& trigger,
                        bool success) {
  v1::HealingAction action;
  action.set_action_id(util::GenerateId("heal-"));
  action.set_session_id(session_id_);
  action.set_agent_id(agent_id);
  action.set_trigger(trigger);
  action.set_kind(kind);
  action.set_applied_at_ms(util::NowMillis());
  action.set_success(success);

  target.RecordHealingAction(action);
  observability::Metrics::Instance().RecordHealingAction(util::HealingActionKindName(kind), success);

  SWARM_LOG_INFO("healing action", {StringField("session_id", session_id_), StringField("agent_id", agent_id),
                                    StringField("kind", util::HealingActionKindName(kind)), StringField("trigger", trigger),
                                    observability::BoolField("success", success)});
}

void AutoHealer::HandleUnreachable(HealingTarget& target, const std::string& agent_id, AgentTrack& track) {
  if (!options_.self_healing_enabled) return;

  track.restart_attempts++;

  bool restarted = false;
  try {
    restarted = target.RestartAgent(agent_id);
  } catch (const util::AgentUnreachable& e) {
    SWARM_LOG_WARN("agent restart failed", {StringField("session_id", session_id_), StringField("agent_id", agent_id),
                                            StringField("error", e.what())});
  }

  Record(target, agent_id, v1::HEALING_ACTION_KIND_RESTART_AGENT,
         "unreachable after " + std::to_string(options_.missed_probes_threshold) + " missed health probes (attempt " +
             std::to_string(track.restart_attempts) + "/" + std::to_string(options_.max_restart_attempts) + ")",
         restarted);

  if (restarted) {
    Transition(target, agent_id, track, v1::AGENT_STATE_RECOVERED, "restart succeeded");
    Transition(target, agent_id, track, v1::AGENT_STATE_HEALTHY, "restart succeeded");
    track = AgentTrack{};
    return;
  }

  if (track.restart_attempts >= options_.max_restart_attempts) {
    Transition(target, agent_id, track, v1::AGENT_STATE_REMOVED,
               std::to_string(track.restart_attempts) + " restart attempts failed");
    target.RemoveAgent(agent_id);
  }
}

void AutoHealer::HandlePredictive(HealingTarget& target, const std::string& agent_id, AgentTrack& track) {
  if (!options_.predictive_healing_enabled || track.reassigned) return;
  if (track.degraded_windows < options_.predictive_windows) return;

  track.reassigned = true;
  const bool ok    = target.ReassignTasks(agent_id);
  Record(target, agent_id, v1::HEALING_ACTION_KIND_REASSIGN_TASK,
         "degraded for " + std::to_string(track.degraded_windows) + " consecutive windows", ok);
}

void AutoHealer::RunIteration(HealingTarget& target, const std::vector<v1::TaskMetric>& recent_tasks, uint64_t completed_tasks) {
  double     median_p95 = 0.0;
  const auto slow       = SlowAgents(recent_tasks, &median_p95);

  std::vector<std::string> removed;

  for (auto& [agent_id, track] : agents_) {
    switch (track.state) {
      case v1::AGENT_STATE_REMOVED:
        removed.push_back(agent_id);
        continue;
      case v1::AGENT_STATE_UNREACHABLE:
        HandleUnreachable(target, agent_id, track);
        if (track.state == v1::AGENT_STATE_REMOVED) removed.push_back(agent_id);
        continue;
      case v1::AGENT_STATE_RECOVERED:
        Transition(target, agent_id, track, v1::AGENT_STATE_HEALTHY, "recovered");
        break;
      default:
        break;
    }

    bool reachable = true;
    if (options_.health_checks_enabled) reachable = target.ProbeAgent(agent_id).reachable;

    auto       slow_it = slow.find(agent_id);
    const bool is_slow = slow_it != slow.end();

    if (track.state == v1::AGENT_STATE_HEALTHY) {
      if (!reachable) {
        track.missed_probes = 1;
        track.degraded_windows = 1;
        Transition(target, agent_id, track, v1::AGENT_STATE_DEGRADED, "missed health probe");
      } else if (is_slow) {
        track.degraded_windows = 1;
        Transition(target, agent_id, track, v1::AGENT_STATE_DEGRADED, LatencyReason(slow_it->second, median_p95));
      }
      continue;
    }

    // DEGRADED
    if (!reachable) {
      track.missed_probes++;
      if (track.missed_probes >= options_.missed_probes_threshold) {
        Transition(target, agent_id, track, v1::AGENT_STATE_UNREACHABLE,
                   std::to_string(track.missed_probes) + " consecutive missed health probes");
        continue;
      }
    } else {
      track.missed_probes = 0;
      if (!is_slow) {
        Transition(target, agent_id, track, v1::AGENT_STATE_HEALTHY, "probe answered and latency within range");
        track.degraded_windows = 0;
        track.reassigned       = false;
        continue;
      }
    }

    track.degraded_windows++;
    HandlePredictive(target, agent_id, track);
  }

  for (const auto& agent_id : removed) agents_.erase(agent_id);

  DetectBottleneck(target, completed_tasks);
}

void AutoHealer::DetectBottleneck(HealingTarget& target, uint64_t completed_tasks) {
  if (!options_.bottleneck_detection_enabled) return;

  const bool agent_trouble = std::any_of(agents_.begin(), agents_.end(), [](const auto& kv) {
    return kv.second.state == v1::AGENT_STATE_DEGRADED || kv.second.state == v1::AGENT_STATE_UNREACHABLE;
  });

  auto push_sample = [&] {
    baseline_samples_.push_back(completed_tasks);
    while (baseline_samples_.size() > options_.baseline_intervals) baseline_samples_.pop_front();
  };

  if (baseline_samples_.size() < options_.baseline_intervals) {
    if (!agent_trouble) push_sample();
    low_throughput_intervals_ = 0;
    return;
  }

  const double baseline =
      static_cast<double>(std::accumulate(baseline_samples_.begin(), baseline_samples_.end(), uint64_t{0})) / baseline_samples_.size();
  const bool low = baseline > 0.0 && static_cast<double>(completed_tasks) < options_.bottleneck_throughput_ratio * baseline;

  if (!low) {
    low_throughput_intervals_ = 0;
    if (!agent_trouble) push_sample();
    return;
  }
  if (agent_trouble) {
    // attributable to an agent, not the topology
    low_throughput_intervals_ = 0;
    return;
  }
  if (++low_throughput_intervals_ < options_.bottleneck_intervals) return;
  low_throughput_intervals_ = 0;

  std::ostringstream trigger;
  trigger.precision(2);
  trigger << std::fixed << "throughput " << completed_tasks << "/interval below " << options_.bottleneck_throughput_ratio
          << "x baseline " << baseline << " for " << options_.bottleneck_intervals << " intervals on "
          << util::TopologyKindName(target.CurrentTopology());

  if (!options_.self_healing_enabled) {
    Record(target, "", v1::HEALING_ACTION_KIND_SWITCH_TOPOLOGY, trigger.str() + "; self-healing disabled", false);
    return;
  }

  try {
    auto applied = target.SwitchTopologyForBottleneck();
    if (!applied) {
      Record(target, "", v1::HEALING_ACTION_KIND_SWITCH_TOPOLOGY, trigger.str() + "; no better topology", false);
      return;
    }
    Record(target, "", v1::HEALING_ACTION_KIND_SWITCH_TOPOLOGY, trigger.str() + "; switched to " + util::TopologyKindName(*applied), true);
    baseline_samples_.clear();
  } catch (const util::TopologyTransitionError& e) {
    Record(target, "", v1::HEALING_ACTION_KIND_SWITCH_TOPOLOGY, trigger.str() + "; " + e.what(), false);
  }
}

} // namespace swarm::healing
