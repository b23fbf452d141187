#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace swarm::runtime::config {
class RuntimeConfig;
}

namespace swarm::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"swarm-engine"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint64_t export_interval_ms{1000};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const swarm::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide OTLP instruments. Without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordConsensusDecision(std::string_view algorithm, std::string_view outcome);
  void ObserveTaskDurationMs(std::string_view result, double duration_ms);
  void RecordHealingAction(std::string_view kind, bool success);
  void SetActiveAgents(std::string_view session_id, std::int64_t agents);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const swarm::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordConsensusDecision(std::string_view, std::string_view) {
}

inline void Metrics::ObserveTaskDurationMs(std::string_view, double) {
}

inline void Metrics::RecordHealingAction(std::string_view, bool) {
}

inline void Metrics::SetActiveAgents(std::string_view, std::int64_t) {
}
#endif

} // namespace swarm::observability
