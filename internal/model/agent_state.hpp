#pragma once

#include "swarm/engine/v1/types.pb.h"

namespace swarm::model {

using AgentState = swarm::engine::v1::AgentState;

constexpr bool IsTerminal(AgentState state) {
  return state == swarm::engine::v1::AGENT_STATE_REMOVED;
}

/*
  Healing state machine:

    HEALTHY -> DEGRADED -> UNREACHABLE -> RECOVERED -> HEALTHY
                  |             |
                  v             v
               HEALTHY       REMOVED

  No edge skips a state; HEALTHY never reaches UNREACHABLE directly.
*/
constexpr bool CanTransition(AgentState from, AgentState to) {
  using namespace swarm::engine::v1;

  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case AGENT_STATE_HEALTHY:
      return to == AGENT_STATE_DEGRADED;
    case AGENT_STATE_DEGRADED:
      return to == AGENT_STATE_HEALTHY || to == AGENT_STATE_UNREACHABLE;
    case AGENT_STATE_UNREACHABLE:
      return to == AGENT_STATE_RECOVERED || to == AGENT_STATE_REMOVED;
    case AGENT_STATE_RECOVERED:
      return to == AGENT_STATE_HEALTHY;
    default:
      return false;
  }
}

} // namespace swarm::model
