#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/agent/remote_agent.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/fake_agent.hpp"

namespace {

namespace v1 = swarm::engine::v1;

using namespace std::chrono_literals;

using swarm::config::ConfigLoader;

void TestOptionsFollowConfig() {
  auto config = ConfigLoader::LoadFromYamlString(R"(swarm:
  default_topology: ring
  consensus_algorithm: gossip
  max_agents: 9
  state_sync_interval_ms: 250
  predictive_healing_enabled: false
healing:
  missed_probes_threshold: 5
  probe_timeout_ms: 200
consensus:
  default_timeout_ms: 4000
  gossip:
    seed: 7
retention:
  health_snapshots_max_age_sec: 60
)");

  auto options = swarm::factory::BuildCoordinatorOptions(config);
  assert(options.default_topology == v1::TOPOLOGY_KIND_RING);
  assert(options.default_algorithm == v1::CONSENSUS_ALGORITHM_GOSSIP);
  assert(options.max_agents == 9);
  assert(options.max_sessions == 128);
  assert(options.session.sync_interval == 250ms);
  assert(options.session.topology.hierarchical_branching_factor == 4);
  assert(!options.session.healer.predictive_healing_enabled);
  assert(options.session.healer.self_healing_enabled);
  assert(options.session.healer.missed_probes_threshold == 5);
  assert(options.session.healer.probe_timeout == 200ms);
  assert(options.consensus.default_timeout == 4000ms);
  assert(options.consensus.gossip.seed == 7);
  assert(options.consensus.gossip.fanout == 3);
  assert(options.task_metrics_max_age.count() == 0);
  assert(options.health_snapshots_max_age == 60s);
}

void TestMemoryBackendByDefault() {
  auto config = ConfigLoader::LoadFromYamlString("");
  auto repo   = swarm::factory::BuildRepository(config);
  assert(std::dynamic_pointer_cast<swarm::db::memory::MemoryRepository>(repo) != nullptr);
}

void TestSqliteBackendSurvivesReopen() {
  const auto path = std::filesystem::temp_directory_path() / (swarm::util::GenerateId("swarm_factory_") + ".db");

  auto config = ConfigLoader::LoadFromYamlString("database:\n  sqlite:\n    path: \"" + path.string() + "\"\n    wal_mode: false\n");
  config.mutable_swarm()->set_state_sync_interval_ms(60000);

  std::string session_id;
  {
    auto directory = std::make_shared<swarm::testing::FakeDirectory>();
    auto app       = swarm::factory::Build(config, directory);
    assert(std::dynamic_pointer_cast<swarm::db::sqlite::SqliteRepository>(app.repository) != nullptr);

    session_id = app.coordinator->InitSession(v1::TOPOLOGY_KIND_UNSPECIFIED, v1::CONSENSUS_ALGORITHM_UNSPECIFIED,
                                              {swarm::testing::Spec("a1"), swarm::testing::Spec("a2")});
    app.coordinator->CloseSession(session_id);
  }

  auto reopened = swarm::factory::Build(config);
  auto session  = reopened.store->LoadSession(session_id);
  assert(session.has_value());
  assert(session->status == v1::SESSION_STATE_CLOSED);
  assert(session->topology == v1::TOPOLOGY_KIND_MESH);
  assert(reopened.store->LoadAgents(session_id).size() == 2);

  // no directory selects remote agents
  assert(std::dynamic_pointer_cast<swarm::agent::RemoteAgentDirectory>(reopened.directory) != nullptr);

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

int main() {
  TestOptionsFollowConfig();
  TestMemoryBackendByDefault();
  TestSqliteBackendSurvivesReopen();

  std::cout << "swarm_engine_unit_factory: pass\n";
  return 0;
}
