#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/swarm_coordinator.hpp"
#include "internal/db/api/repository.hpp"

namespace swarm::agent {
class AgentDirectory;
}

namespace swarm::state {
class StateStore;
}

namespace swarm::factory {

/*
  Application

  Owns all long-lived objects used by the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<state::StateStore>      store;
  std::shared_ptr<agent::AgentDirectory>  directory;
  std::shared_ptr<core::SwarmCoordinator> coordinator;
};

/*
  Composition root. The only place that knows concrete repository
  types; `config` must already have defaults applied.
*/
std::shared_ptr<db::Repository> BuildRepository(const swarm::runtime::config::RuntimeConfig& config);

core::CoordinatorOptions BuildCoordinatorOptions(const swarm::runtime::config::RuntimeConfig& config);

// A null directory selects remote agents (heartbeats over gRPC).
Application Build(const swarm::runtime::config::RuntimeConfig& config, std::shared_ptr<agent::AgentDirectory> directory = nullptr);

} // namespace swarm::factory
