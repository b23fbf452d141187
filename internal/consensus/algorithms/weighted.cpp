#include "weighted.hpp"

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

v1::Outcome WeightedAlgorithm::Tally(const VoteMap& votes, const std::map<std::string, double>& weights) {
  double total = 0.0;
  double yes   = 0.0;
  for (const auto& [agent_id, weight] : weights) {
    total += weight;
    auto it = votes.find(agent_id);
    if (it != votes.end() && it->second == v1::VOTE_YES) yes += weight;
  }
  return yes > total / 2.0 ? v1::OUTCOME_APPROVED : v1::OUTCOME_REJECTED;
}

Decision WeightedAlgorithm::Decide(DecisionContext& ctx) {
  Decision decision;
  VoteMap  responders;
  if (!CollectSingleRound(ctx, &responders, &decision)) return decision;

  std::map<std::string, double> weights;
  for (const auto& p : ctx.participants()) weights[p.agent_id] = p.weight;

  decision.outcome = Tally(responders, weights);
  return decision;
}

} // namespace swarm::consensus
