#pragma once

#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/consensus/consensus_algorithm.hpp"

namespace swarm::consensus {

/*
  Grow-only vote sets. Every responder contributes a replica holding
  its own (agent, vote) element; replicas merge by set union, so the
  merge order never matters and nothing is rolled back.

  APPROVED iff merged YES >= floor(active/2)+1 with active = YES + NO.
*/
class CrdtAlgorithm final : public ConsensusAlgorithm {
 public:
  using GSet = std::set<std::pair<std::string, swarm::engine::v1::Vote>>;

  swarm::engine::v1::ConsensusAlgorithm Kind() const override {
    return swarm::engine::v1::CONSENSUS_ALGORITHM_CRDT;
  }

  Decision Decide(DecisionContext& ctx) override;

  static GSet Merge(const GSet& a, const GSet& b);

  static swarm::engine::v1::Outcome Tally(const GSet& merged);
};

} // namespace swarm::consensus
