#include "byzantine.hpp"

#include "quorum.hpp"

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

namespace {

constexpr std::size_t kMinByzantineAgents = 4;

} // namespace

v1::Outcome ByzantineAlgorithm::Tally(const VoteMap& round1, const VoteMap& round2, std::size_t participant_count) {
  if (participant_count < kMinByzantineAgents) return QuorumAlgorithm::Tally(round1, participant_count);

  const std::size_t f   = FaultTolerance(participant_count);
  std::size_t       yes = 0;
  for (const auto& [agent_id, first] : round1) {
    auto it = round2.find(agent_id);
    if (it == round2.end() || it->second != first) continue;
    if (first == v1::VOTE_YES) ++yes;
  }
  return yes >= 2 * f + 1 ? v1::OUTCOME_APPROVED : v1::OUTCOME_REJECTED;
}

Decision ByzantineAlgorithm::Decide(DecisionContext& ctx) {
  const std::size_t n = ctx.participants().size();
  if (n < kMinByzantineAgents) {
    Decision decision;
    VoteMap  responders;
    if (!CollectSingleRound(ctx, &responders, &decision)) return decision;
    decision.outcome = QuorumAlgorithm::Tally(responders, n);
    decision.detail  = "quorum fallback";
    return decision;
  }

  // round 1 may use half the remaining time; it ends early once everyone answered
  const auto now      = util::Now();
  const auto midpoint = now + (ctx.deadline() - now) / 2;

  Decision decision;
  VoteMap  round1 = ctx.CollectRound(1, midpoint);
  decision.rounds = 1;
  decision.votes  = ctx.WithAbstentions(round1);

  if (ctx.Cancelled() || round1.empty()) {
    decision.outcome = v1::OUTCOME_TIMEOUT;
    decision.detail  = ctx.Cancelled() ? "cancelled" : "no participant answered";
    return decision;
  }

  VoteMap round2  = ctx.CollectRound(2, ctx.deadline(), round1);
  decision.rounds = 2;
  if (ctx.Cancelled()) {
    decision.outcome = v1::OUTCOME_TIMEOUT;
    decision.detail  = "cancelled";
    return decision;
  }

  std::string inconsistent;
  for (const auto& [agent_id, first] : round1) {
    auto it = round2.find(agent_id);
    if (it != round2.end() && it->second == first) continue;
    if (!inconsistent.empty()) inconsistent += ",";
    inconsistent += agent_id;
  }
  if (!inconsistent.empty()) decision.detail = "inconsistent: " + inconsistent;

  decision.outcome = Tally(round1, round2, n);
  return decision;
}

} // namespace swarm::consensus
