#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/agent/agent_handle.hpp"
#include "internal/util/time.hpp"
#include "swarm/engine/v1/types.pb.h"

namespace swarm::state {
class StateStore;
}

namespace swarm::metrics {

/*
  MetricsCollector

  Task lifecycle and probe results, written through the StateStore.
  Also keeps the cheap in-memory counters the healer needs per
  interval (completed tasks, tasks in flight per agent).

  Thread-safe; host hooks call it from arbitrary threads.
*/
class MetricsCollector {
 public:
  MetricsCollector(std::shared_ptr<state::StateStore> store, bool task_metrics_enabled);

  // Counters exist only between TrackSession and ForgetSession; hooks
  // for an untracked session still write metrics but keep no counters.
  void TrackSession(const std::string& session_id);

  void OnTaskStart(const std::string& session_id, const std::string& agent_id, const std::string& task_id);

  // Appends the TaskMetric; returns it as stored.
  swarm::engine::v1::TaskMetric OnTaskEnd(const std::string& session_id, const std::string& agent_id, const std::string& task_id,
                                          uint64_t duration_ms, swarm::engine::v1::TaskResult result);

  swarm::engine::v1::HealthSnapshot RecordProbe(const std::string& session_id, const std::string& agent_id,
                                                const agent::ProbeResult& probe);

  // Tasks finished since the previous call for this session.
  uint64_t TakeCompletedCount(const std::string& session_id);

  std::vector<std::string> InFlightTasks(const std::string& session_id, const std::string& agent_id) const;

  // Newest first.
  std::vector<swarm::engine::v1::TaskMetric> RecentTasks(const std::string& session_id, std::size_t limit) const;

  void ForgetSession(const std::string& session_id);

  bool task_metrics_enabled() const {
    return task_metrics_enabled_;
  }

 private:
  struct SessionCounters {
    uint64_t completed = 0;
    // agent_id -> task_id -> start
    std::unordered_map<std::string, std::unordered_map<std::string, util::TimePoint>> in_flight;
  };

  std::shared_ptr<state::StateStore> store_;
  const bool                         task_metrics_enabled_;

  mutable std::mutex                               mutex_;
  std::unordered_map<std::string, SessionCounters> sessions_;
};

} // namespace swarm::metrics
