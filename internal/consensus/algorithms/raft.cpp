#include "raft.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

v1::Outcome RaftAlgorithm::Tally(const VoteMap& responders, const std::string& leader_id) {
  if (!responders.contains(leader_id)) return v1::OUTCOME_TIMEOUT;
  const auto yes = static_cast<std::size_t>(CountVotes(responders, v1::VOTE_YES));
  // abstaining responders do not count toward the majority
  const auto active = yes + static_cast<std::size_t>(CountVotes(responders, v1::VOTE_NO));
  return yes * 2 > active ? v1::OUTCOME_APPROVED : v1::OUTCOME_REJECTED;
}

Decision RaftAlgorithm::Decide(DecisionContext& ctx) {
  const auto& participants = ctx.participants();
  const bool  has_leader   = std::any_of(participants.begin(), participants.end(),
                                         [&](const Participant& p) { return p.agent_id == ctx.leader_id(); });
  if (ctx.leader_id().empty() || !has_leader) {
    throw util::NoLeaderAvailable("raft requires a topology leader among the participants");
  }

  Decision decision;
  VoteMap  responders;
  if (!CollectSingleRound(ctx, &responders, &decision)) return decision;

  decision.outcome = Tally(responders, ctx.leader_id());
  if (decision.outcome == v1::OUTCOME_TIMEOUT) decision.detail = "leader " + ctx.leader_id() + " did not answer";
  return decision;
}

} // namespace swarm::consensus
