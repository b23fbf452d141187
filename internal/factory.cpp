#include "factory.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

#include "internal/agent/remote_agent.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace swarm::factory {

using namespace std::chrono_literals;

namespace {

// remote agents must heartbeat at least once per this many sync intervals
constexpr int kHeartbeatIntervals = 3;

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const swarm::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(sqlite_db);
    SWARM_LOG_INFO("sqlite state store opened", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  SWARM_LOG_WARN("using in-memory state store; nothing survives a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::CoordinatorOptions BuildCoordinatorOptions(const swarm::runtime::config::RuntimeConfig& config) {
  const auto& swarm     = config.swarm();
  const auto& topology  = config.topology();
  const auto& consensus = config.consensus();
  const auto& healing   = config.healing();
  const auto& retention = config.retention();

  core::CoordinatorOptions options;

  auto kind = util::ParseTopologyKind(swarm.default_topology());
  if (!kind) throw util::InvalidConfig("unknown swarm.default_topology '" + swarm.default_topology() + "'");
  auto algorithm = util::ParseConsensusAlgorithm(swarm.consensus_algorithm());
  if (!algorithm) throw util::InvalidConfig("unknown swarm.consensus_algorithm '" + swarm.consensus_algorithm() + "'");

  options.default_topology  = *kind;
  options.default_algorithm = *algorithm;
  options.max_agents        = swarm.max_agents();
  options.max_sessions      = swarm.max_sessions();
  options.metrics_enabled   = swarm.metrics_enabled();

  auto& session         = options.session;
  session.sync_interval = std::chrono::milliseconds(swarm.state_sync_interval_ms());
  session.state_dir     = swarm.state_dir();
  session.max_agents    = swarm.max_agents();

  session.topology.hierarchical_branching_factor = topology.hierarchical_branching_factor();
  session.topology.adaptive_mesh_max_agents      = topology.adaptive_mesh_max_agents();
  session.topology.adaptive_star_max_agents      = topology.adaptive_star_max_agents();

  auto& healer                        = session.healer;
  healer.health_checks_enabled        = swarm.health_checks_enabled();
  healer.self_healing_enabled         = swarm.self_healing_enabled();
  healer.predictive_healing_enabled   = swarm.predictive_healing_enabled();
  healer.bottleneck_detection_enabled = swarm.bottleneck_detection_enabled();
  healer.window_size                  = healing.window_size();
  healer.degraded_latency_factor      = healing.degraded_latency_factor();
  healer.min_samples                  = healing.min_samples();
  healer.missed_probes_threshold      = healing.missed_probes_threshold();
  healer.max_restart_attempts         = healing.max_restart_attempts();
  healer.predictive_windows           = healing.predictive_windows();
  healer.bottleneck_throughput_ratio  = healing.bottleneck_throughput_ratio();
  healer.bottleneck_intervals         = healing.bottleneck_intervals();
  healer.baseline_intervals           = healing.baseline_intervals();
  healer.probe_timeout                = std::chrono::milliseconds(healing.probe_timeout_ms());

  options.consensus.default_timeout              = std::chrono::milliseconds(consensus.default_timeout_ms());
  options.consensus.gossip.fanout                = consensus.gossip().fanout();
  options.consensus.gossip.max_rounds            = consensus.gossip().max_rounds();
  options.consensus.gossip.convergence_threshold = consensus.gossip().convergence_threshold();
  options.consensus.gossip.round_delay           = std::chrono::milliseconds(consensus.gossip().round_delay_ms());
  options.consensus.gossip.seed                  = consensus.gossip().seed();

  options.task_metrics_max_age     = std::chrono::seconds(retention.task_metrics_max_age_sec());
  options.health_snapshots_max_age = std::chrono::seconds(retention.health_snapshots_max_age_sec());

  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const swarm::runtime::config::RuntimeConfig& config, std::shared_ptr<agent::AgentDirectory> directory) {
  Application app;

  auto options = BuildCoordinatorOptions(config);

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<state::StateStore>(app.repository);

  // ------------------------------------------------------------------
  // Agents
  // ------------------------------------------------------------------
  if (!directory) {
    const auto ttl = std::max<std::chrono::milliseconds>(options.session.sync_interval * kHeartbeatIntervals, 1000ms);
    directory      = std::make_shared<agent::RemoteAgentDirectory>(ttl);
  }
  app.directory = directory;

  // ------------------------------------------------------------------
  // Coordinator
  // ------------------------------------------------------------------
  app.coordinator = std::make_shared<core::SwarmCoordinator>(std::move(options), app.store, app.directory);

  return app;
}

} // namespace swarm::factory
