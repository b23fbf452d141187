#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::db::model {

struct AgentRecord {
  std::string session_id;
  std::string agent_id;

  std::vector<std::string> capability_tags;

  double weight          = 1.0;
  bool   leader_eligible = true;

  swarm::engine::v1::AgentState state = swarm::engine::v1::AGENT_STATE_HEALTHY;

  uint64_t last_heartbeat_at_ms = 0;
};

} // namespace swarm::db::model
