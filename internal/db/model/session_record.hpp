#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::db::model {

/*
  Persistent session row (sessions table).

  Status only ever moves ACTIVE -> CLOSED. A non-empty failure_reason
  means the session was closed by its background loop, not by a caller.
*/

struct SessionRecord {
  std::string session_id;

  swarm::engine::v1::TopologyKind topology = swarm::engine::v1::TOPOLOGY_KIND_UNSPECIFIED;

  swarm::engine::v1::ConsensusAlgorithm consensus_algorithm = swarm::engine::v1::CONSENSUS_ALGORITHM_UNSPECIFIED;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> closed_at_ms;

  swarm::engine::v1::SessionState status = swarm::engine::v1::SESSION_STATE_UNSPECIFIED;

  std::string failure_reason;
  std::string pinned_leader_id;
};

} // namespace swarm::db::model
