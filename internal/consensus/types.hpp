#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "internal/agent/agent_handle.hpp"
#include "swarm/engine/v1/types.pb.h"

namespace swarm::consensus {

using VoteMap = std::map<std::string, swarm::engine::v1::Vote>;

// Set by the owner of a decision (CloseSession) to abandon it.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken MakeCancelToken() {
  return std::make_shared<std::atomic<bool>>(false);
}

struct Participant {
  std::string                         agent_id;
  double                              weight = 1.0;
  std::shared_ptr<agent::AgentHandle> handle;
};

struct GossipOptions {
  uint32_t                  fanout                = 3;
  uint32_t                  max_rounds            = 10;
  double                    convergence_threshold = 0.9;
  std::chrono::milliseconds round_delay{50};
  // 0 seeds from std::random_device
  uint64_t seed = 0;
};

struct ConsensusOptions {
  std::chrono::milliseconds default_timeout{30000};
  GossipOptions             gossip;
};

} // namespace swarm::consensus
