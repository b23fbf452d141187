#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "internal/consensus/consensus_algorithm.hpp"

namespace swarm::consensus {

/*
  Epidemic convergence.

  Initial values come from one broadcast round (abstentions drop out).
  Each gossip round every agent samples `fanout` random peers and
  adopts the strict majority of its own value plus theirs; a tie keeps
  the current value. Updates are synchronous per round.

  Converged when at least `convergence_threshold` of the agents hold
  one value; that value decides. No convergence after `max_rounds` is
  REJECTED; running out of time first is TIMEOUT.
*/
class GossipAlgorithm final : public ConsensusAlgorithm {
 public:
  swarm::engine::v1::ConsensusAlgorithm Kind() const override {
    return swarm::engine::v1::CONSENSUS_ALGORITHM_GOSSIP;
  }

  Decision Decide(DecisionContext& ctx) override;

  static std::optional<swarm::engine::v1::Vote> ConvergedValue(const VoteMap& values, double threshold);

  static VoteMap Step(const VoteMap& values, uint32_t fanout, std::mt19937_64& rng);
};

} // namespace swarm::consensus
