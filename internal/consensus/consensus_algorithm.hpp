#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "ballot_box.hpp"
#include "internal/util/time.hpp"
#include "types.hpp"

namespace swarm::consensus {

struct Decision {
  swarm::engine::v1::Outcome outcome = swarm::engine::v1::OUTCOME_PENDING;

  // Recorded on the proposal. Every participant appears; agents that
  // never answered are ABSTAIN.
  VoteMap votes;

  uint32_t    rounds = 0;
  std::string detail;
};

/*
  Everything an algorithm may touch while deciding one proposal.
*/
class DecisionContext {
 public:
  DecisionContext(const swarm::engine::v1::ConsensusProposal& proposal, std::vector<Participant> participants, std::string leader_id,
                  util::TimePoint deadline, CancelToken cancel, BallotDispatcher& dispatcher, const ConsensusOptions& options,
                  uint64_t seed);

  /*
    Broadcasts one ballot round and waits until everyone answered, the
    round deadline passed or the decision was cancelled. Only
    responders appear in the result.
  */
  VoteMap CollectRound(uint32_t round, util::TimePoint round_deadline, const VoteMap& observed = {});

  VoteMap CollectRound(uint32_t round) {
    return CollectRound(round, deadline_);
  }

  bool Cancelled() const {
    return cancel_ && cancel_->load();
  }

  bool Expired() const {
    return util::Now() >= deadline_;
  }

  const std::vector<Participant>& participants() const {
    return participants_;
  }

  const std::string& leader_id() const {
    return leader_id_;
  }

  util::TimePoint deadline() const {
    return deadline_;
  }

  const ConsensusOptions& options() const {
    return options_;
  }

  std::mt19937_64& rng() {
    return rng_;
  }

  // responders plus ABSTAIN for everyone else
  VoteMap WithAbstentions(const VoteMap& responders) const;

 private:
  const swarm::engine::v1::ConsensusProposal& proposal_;
  std::vector<Participant>                    participants_;
  std::string                                 leader_id_;
  util::TimePoint                             deadline_;
  CancelToken                                 cancel_;
  BallotDispatcher&                           dispatcher_;
  const ConsensusOptions&                     options_;
  std::mt19937_64                             rng_;
};

/*
  ConsensusAlgorithm

  Vote collection + tally for one proposal. Every algorithm returns
  TIMEOUT when nobody answered or the decision was cancelled.
*/
class ConsensusAlgorithm {
 public:
  virtual ~ConsensusAlgorithm() = default;

  virtual swarm::engine::v1::ConsensusAlgorithm Kind() const = 0;

  virtual Decision Decide(DecisionContext& ctx) = 0;
};

// Shared helper for the single-broadcast algorithms. Returns false
// (with `out` filled as TIMEOUT) when the tally must not run.
bool CollectSingleRound(DecisionContext& ctx, VoteMap* responders, Decision* out);

int CountVotes(const VoteMap& votes, swarm::engine::v1::Vote value);

} // namespace swarm::consensus
