#include "crdt.hpp"

#include <algorithm>

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

CrdtAlgorithm::GSet CrdtAlgorithm::Merge(const GSet& a, const GSet& b) {
  GSet out = a;
  out.insert(b.begin(), b.end());
  return out;
}

v1::Outcome CrdtAlgorithm::Tally(const GSet& merged) {
  int yes = 0;
  int no  = 0;
  for (const auto& [_, vote] : merged) {
    if (vote == v1::VOTE_YES) ++yes;
    if (vote == v1::VOTE_NO) ++no;
  }
  const int active = yes + no;
  if (active == 0) return v1::OUTCOME_REJECTED;
  return yes >= active / 2 + 1 ? v1::OUTCOME_APPROVED : v1::OUTCOME_REJECTED;
}

Decision CrdtAlgorithm::Decide(DecisionContext& ctx) {
  Decision decision;
  VoteMap  responders;
  if (!CollectSingleRound(ctx, &responders, &decision)) return decision;

  std::vector<GSet> replicas;
  replicas.reserve(responders.size());
  for (const auto& element : responders) replicas.push_back(GSet{element});

  // replicas arrive in no particular order
  std::shuffle(replicas.begin(), replicas.end(), ctx.rng());

  GSet merged;
  for (const auto& replica : replicas) merged = Merge(merged, replica);

  decision.outcome = Tally(merged);
  return decision;
}

} // namespace swarm::consensus
