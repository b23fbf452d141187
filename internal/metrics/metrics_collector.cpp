#include "metrics_collector.hpp"

#include "internal/observability/metrics.hpp"
#include "internal/state/state_store.hpp"

namespace swarm::metrics {

namespace v1 = swarm::engine::v1;

MetricsCollector::MetricsCollector(std::shared_ptr<state::StateStore> store, bool task_metrics_enabled)
    : store_(std::move(store)), task_metrics_enabled_(task_metrics_enabled) {
}

void MetricsCollector::TrackSession(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  sessions_.try_emplace(session_id);
}

void MetricsCollector::OnTaskStart(const std::string& session_id, const std::string& agent_id, const std::string& task_id) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it == sessions_.end()) return;
  it->second.in_flight[agent_id][task_id] = util::Now();
}

v1::TaskMetric MetricsCollector::OnTaskEnd(const std::string& session_id, const std::string& agent_id, const std::string& task_id,
                                           uint64_t duration_ms, v1::TaskResult result) {
  {
    std::lock_guard lock(mutex_);
    auto            session_it = sessions_.find(session_id);
    if (session_it != sessions_.end()) {
      auto& counters = session_it->second;
      counters.completed++;
      auto agent_it = counters.in_flight.find(agent_id);
      if (agent_it != counters.in_flight.end()) {
        auto task_it = agent_it->second.find(task_id);
        if (task_it != agent_it->second.end()) {
          // host omitted the duration; measure from OnTaskStart
          if (duration_ms == 0) {
            duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - task_it->second).count());
          }
          agent_it->second.erase(task_it);
        }
      }
    }
  }

  v1::TaskMetric metric;
  metric.set_task_id(task_id);
  metric.set_session_id(session_id);
  metric.set_agent_id(agent_id);
  metric.set_duration_ms(duration_ms);
  metric.set_result(result);
  metric.set_timestamp_ms(util::NowMillis());

  observability::Metrics::Instance().ObserveTaskDurationMs(result == v1::TASK_RESULT_SUCCESS ? "success" : "failure",
                                                           static_cast<double>(duration_ms));

  if (!task_metrics_enabled_) return metric;
  return store_->AppendMetric(std::move(metric));
}

v1::HealthSnapshot MetricsCollector::RecordProbe(const std::string& session_id, const std::string& agent_id, const agent::ProbeResult& probe) {
  v1::HealthSnapshot snapshot;
  snapshot.set_agent_id(agent_id);
  snapshot.set_session_id(session_id);
  snapshot.set_timestamp_ms(util::NowMillis());
  snapshot.set_reachable(probe.reachable);
  snapshot.set_latency_ms(probe.latency_ms);
  return store_->AppendHealth(std::move(snapshot));
}

uint64_t MetricsCollector::TakeCompletedCount(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it == sessions_.end()) return 0;
  const uint64_t n     = it->second.completed;
  it->second.completed = 0;
  return n;
}

std::vector<std::string> MetricsCollector::InFlightTasks(const std::string& session_id, const std::string& agent_id) const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  auto                     it = sessions_.find(session_id);
  if (it == sessions_.end()) return out;
  auto agent_it = it->second.in_flight.find(agent_id);
  if (agent_it == it->second.in_flight.end()) return out;
  for (const auto& [task_id, _] : agent_it->second) out.push_back(task_id);
  return out;
}

std::vector<v1::TaskMetric> MetricsCollector::RecentTasks(const std::string& session_id, std::size_t limit) const {
  return store_->QueryRecentMetrics(session_id, limit);
}

void MetricsCollector::ForgetSession(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  sessions_.erase(session_id);
}

} // namespace swarm::metrics
