#include "gossip.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(20);

// false when the decision was cancelled or ran out of time while waiting
bool WaitRoundDelay(DecisionContext& ctx) {
  const auto until = std::min(util::Now() + ctx.options().gossip.round_delay, ctx.deadline());
  while (util::Now() < until) {
    if (ctx.Cancelled()) return false;
    std::this_thread::sleep_for(std::min<util::Clock::duration>(kSleepSlice, until - util::Now()));
  }
  return !ctx.Cancelled() && !ctx.Expired();
}

} // namespace

std::optional<v1::Vote> GossipAlgorithm::ConvergedValue(const VoteMap& values, double threshold) {
  const int yes   = CountVotes(values, v1::VOTE_YES);
  const int no    = CountVotes(values, v1::VOTE_NO);
  const int total = yes + no;
  if (total == 0) return std::nullopt;
  if (static_cast<double>(yes) / total >= threshold) return v1::VOTE_YES;
  if (static_cast<double>(no) / total >= threshold) return v1::VOTE_NO;
  return std::nullopt;
}

VoteMap GossipAlgorithm::Step(const VoteMap& values, uint32_t fanout, std::mt19937_64& rng) {
  std::vector<std::string> ids;
  ids.reserve(values.size());
  for (const auto& [id, _] : values) ids.push_back(id);

  VoteMap next;
  for (const auto& [id, own] : values) {
    std::vector<std::string> peers;
    peers.reserve(ids.size());
    for (const auto& other : ids) {
      if (other != id) peers.push_back(other);
    }
    std::shuffle(peers.begin(), peers.end(), rng);
    if (peers.size() > fanout) peers.resize(fanout);

    int yes = own == v1::VOTE_YES ? 1 : 0;
    int no  = own == v1::VOTE_NO ? 1 : 0;
    for (const auto& p : peers) {
      const auto v = values.at(p);
      if (v == v1::VOTE_YES) ++yes;
      if (v == v1::VOTE_NO) ++no;
    }

    if (yes > no) {
      next[id] = v1::VOTE_YES;
    } else if (no > yes) {
      next[id] = v1::VOTE_NO;
    } else {
      next[id] = own;
    }
  }
  return next;
}

Decision GossipAlgorithm::Decide(DecisionContext& ctx) {
  Decision decision;
  VoteMap  responders;
  if (!CollectSingleRound(ctx, &responders, &decision)) return decision;

  VoteMap values;
  for (const auto& [id, vote] : responders) {
    if (vote == v1::VOTE_YES || vote == v1::VOTE_NO) values[id] = vote;
  }
  if (values.empty()) {
    decision.outcome = v1::OUTCOME_REJECTED;
    decision.detail  = "every responder abstained";
    return decision;
  }

  const auto& options = ctx.options().gossip;
  for (uint32_t round = 0;; ++round) {
    decision.rounds = round + 1;
    if (auto value = ConvergedValue(values, options.convergence_threshold)) {
      decision.outcome = *value == v1::VOTE_YES ? v1::OUTCOME_APPROVED : v1::OUTCOME_REJECTED;
      decision.detail  = "converged after " + std::to_string(round) + " gossip rounds";
      return decision;
    }
    if (round == options.max_rounds) break;

    if (!WaitRoundDelay(ctx)) {
      decision.outcome = v1::OUTCOME_TIMEOUT;
      decision.detail  = ctx.Cancelled() ? "cancelled" : "deadline before convergence";
      return decision;
    }
    values = Step(values, options.fanout, ctx.rng());
  }

  decision.outcome = v1::OUTCOME_REJECTED;
  decision.detail  = "no convergence within " + std::to_string(options.max_rounds) + " rounds";
  return decision;
}

} // namespace swarm::consensus
