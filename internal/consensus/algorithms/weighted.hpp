#pragma once

#include <map>
#include <string>

#include "internal/consensus/consensus_algorithm.hpp"

namespace swarm::consensus {

/*
  APPROVED iff the weight behind YES exceeds half of the total weight
  of all participants. Silent agents keep their weight in the total.
*/
class WeightedAlgorithm final : public ConsensusAlgorithm {
 public:
  swarm::engine::v1::ConsensusAlgorithm Kind() const override {
    return swarm::engine::v1::CONSENSUS_ALGORITHM_WEIGHTED;
  }

  Decision Decide(DecisionContext& ctx) override;

  static swarm::engine::v1::Outcome Tally(const VoteMap& votes, const std::map<std::string, double>& weights);
};

} // namespace swarm::consensus
