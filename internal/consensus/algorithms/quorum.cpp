#include "quorum.hpp"

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

v1::Outcome QuorumAlgorithm::Tally(const VoteMap& votes, std::size_t participant_count) {
  const auto yes = static_cast<std::size_t>(CountVotes(votes, v1::VOTE_YES));
  return yes * 2 > participant_count ? v1::OUTCOME_APPROVED : v1::OUTCOME_REJECTED;
}

Decision QuorumAlgorithm::Decide(DecisionContext& ctx) {
  Decision decision;
  VoteMap  responders;
  if (!CollectSingleRound(ctx, &responders, &decision)) return decision;

  decision.outcome = Tally(responders, ctx.participants().size());
  return decision;
}

} // namespace swarm::consensus
