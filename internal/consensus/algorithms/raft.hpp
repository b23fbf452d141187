#pragma once

#include <string>

#include "internal/consensus/consensus_algorithm.hpp"

namespace swarm::consensus {

/*
  Leader-collected majority. The topology leader gathers acks from the
  followers; its own vote counts. APPROVED iff YES > (YES+NO)/2,
  abstentions excluded.
  Without an answer from the leader the round cannot complete and the
  outcome is TIMEOUT.
*/
class RaftAlgorithm final : public ConsensusAlgorithm {
 public:
  swarm::engine::v1::ConsensusAlgorithm Kind() const override {
    return swarm::engine::v1::CONSENSUS_ALGORITHM_RAFT;
  }

  Decision Decide(DecisionContext& ctx) override;

  static swarm::engine::v1::Outcome Tally(const VoteMap& responders, const std::string& leader_id);
};

} // namespace swarm::consensus
