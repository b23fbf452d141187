#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ballot_box.hpp"
#include "consensus_algorithm.hpp"
#include "types.hpp"

namespace swarm::consensus {

/*
  ConsensusEngine

  Decide() runs on the caller's thread and blocks until the proposal is
  decided, its deadline passes or it is cancelled. No engine lock is
  held while votes are collected.

  A proposal id is decided at most once; deciding it again throws
  ProposalAlreadyDecided carrying the original outcome. Recent ids are
  cached; older ones are resolved through the DecidedLookup.
*/
class ConsensusEngine {
 public:
  // Terminal outcome of a persisted proposal, nullopt when undecided or unknown.
  using DecidedLookup = std::function<std::optional<swarm::engine::v1::Outcome>(const std::string& proposal_id)>;

  explicit ConsensusEngine(ConsensusOptions options, DecidedLookup lookup = nullptr);

  /*
    `proposal` must be PENDING with deadline_ms set. When its
    participant list is non-empty, only those agents vote (agents
    that joined later are ignored).

    Throws NoLeaderAvailable for Raft without a leader among the
    participants.
  */
  swarm::engine::v1::ConsensusProposal Decide(swarm::engine::v1::ConsensusProposal proposal, std::vector<Participant> participants,
                                              const std::string& leader_id, CancelToken cancel = nullptr);

  static bool RequiresLeader(swarm::engine::v1::ConsensusAlgorithm algorithm);

  static std::unique_ptr<ConsensusAlgorithm> MakeAlgorithm(swarm::engine::v1::ConsensusAlgorithm algorithm);

  const ConsensusOptions& options() const {
    return options_;
  }

 private:
  void     MarkDecided(const std::string& proposal_id, swarm::engine::v1::Outcome outcome);
  uint64_t NextSeed();

  const ConsensusOptions options_;
  const DecidedLookup    lookup_;
  BallotDispatcher       dispatcher_;

  std::mutex                                                   mutex_;
  std::unordered_set<std::string>                              in_flight_;
  std::unordered_map<std::string, swarm::engine::v1::Outcome>  decided_;
  std::deque<std::string>                                      decided_order_;

  std::atomic<uint64_t> seed_sequence_{0};
};

} // namespace swarm::consensus
