#pragma once

#include <cstddef>

#include "internal/consensus/consensus_algorithm.hpp"

namespace swarm::consensus {

/*
  Two-round Byzantine agreement.

    round 1  every agent votes
    round 2  every agent votes again, seeing the round-1 map

  Agents whose two votes differ (or who skip a round) are treated as
  faulty and dropped. With f = floor((n-1)/3), APPROVED iff at least
  2f+1 consistent agents voted YES. n <= 3 tolerates no fault and falls
  back to the quorum rule on round 1.
*/
class ByzantineAlgorithm final : public ConsensusAlgorithm {
 public:
  swarm::engine::v1::ConsensusAlgorithm Kind() const override {
    return swarm::engine::v1::CONSENSUS_ALGORITHM_BYZANTINE;
  }

  Decision Decide(DecisionContext& ctx) override;

  static swarm::engine::v1::Outcome Tally(const VoteMap& round1, const VoteMap& round2, std::size_t participant_count);

  static std::size_t FaultTolerance(std::size_t participant_count) {
    return participant_count == 0 ? 0 : (participant_count - 1) / 3;
  }
};

} // namespace swarm::consensus
