#include "consensus_algorithm.hpp"

#include <algorithm>

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

DecisionContext::DecisionContext(const v1::ConsensusProposal& proposal, std::vector<Participant> participants, std::string leader_id,
                                 util::TimePoint deadline, CancelToken cancel, BallotDispatcher& dispatcher,
                                 const ConsensusOptions& options, uint64_t seed)
    : proposal_(proposal),
      participants_(std::move(participants)),
      leader_id_(std::move(leader_id)),
      deadline_(deadline),
      cancel_(std::move(cancel)),
      dispatcher_(dispatcher),
      options_(options),
      rng_(seed) {
}

VoteMap DecisionContext::CollectRound(uint32_t round, util::TimePoint round_deadline, const VoteMap& observed) {
  round_deadline = std::min(round_deadline, deadline_);

  v1::Ballot ballot;
  ballot.set_proposal_id(proposal_.proposal_id());
  ballot.set_text(proposal_.text());
  ballot.set_round(round);
  ballot.set_deadline_ms(util::ToUnixMillis(round_deadline));
  for (const auto& [agent_id, vote] : observed) {
    (*ballot.mutable_observed_votes())[agent_id] = vote;
  }

  auto box   = dispatcher_.Dispatch(participants_, ballot);
  auto votes = box->AwaitAndClose(round_deadline, cancel_);

  // release agents still holding the ballot of a cancelled decision
  if (Cancelled()) {
    for (const auto& p : participants_) {
      if (p.handle && !votes.contains(p.agent_id)) p.handle->WithdrawBallot(ballot);
    }
  }
  return votes;
}

VoteMap DecisionContext::WithAbstentions(const VoteMap& responders) const {
  VoteMap out;
  for (const auto& p : participants_) {
    auto it         = responders.find(p.agent_id);
    out[p.agent_id] = it == responders.end() ? v1::VOTE_ABSTAIN : it->second;
  }
  return out;
}

bool CollectSingleRound(DecisionContext& ctx, VoteMap* responders, Decision* out) {
  *responders = ctx.CollectRound(1);
  out->rounds = 1;
  out->votes  = ctx.WithAbstentions(*responders);

  if (ctx.Cancelled()) {
    out->outcome = v1::OUTCOME_TIMEOUT;
    out->detail  = "cancelled";
    return false;
  }
  if (responders->empty()) {
    out->outcome = v1::OUTCOME_TIMEOUT;
    out->detail  = "no participant answered";
    return false;
  }
  return true;
}

int CountVotes(const VoteMap& votes, v1::Vote value) {
  return static_cast<int>(std::count_if(votes.begin(), votes.end(), [&](const auto& kv) { return kv.second == value; }));
}

} // namespace swarm::consensus
