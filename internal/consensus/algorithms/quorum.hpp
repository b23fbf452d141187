#pragma once

#include <cstddef>

#include "internal/consensus/consensus_algorithm.hpp"

namespace swarm::consensus {

/*
  Simple majority over every participant: APPROVED iff YES > n/2.
  Abstentions and silent agents count against approval.
*/
class QuorumAlgorithm final : public ConsensusAlgorithm {
 public:
  swarm::engine::v1::ConsensusAlgorithm Kind() const override {
    return swarm::engine::v1::CONSENSUS_ALGORITHM_QUORUM;
  }

  Decision Decide(DecisionContext& ctx) override;

  static swarm::engine::v1::Outcome Tally(const VoteMap& votes, std::size_t participant_count);
};

} // namespace swarm::consensus
