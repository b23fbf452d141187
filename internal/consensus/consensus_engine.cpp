#include "consensus_engine.hpp"

#include <algorithm>
#include <random>
#include <set>

#include "algorithms/byzantine.hpp"
#include "algorithms/crdt.hpp"
#include "algorithms/gossip.hpp"
#include "algorithms/quorum.hpp"
#include "algorithms/raft.hpp"
#include "algorithms/weighted.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

namespace {

// decided ids remembered for duplicate detection
constexpr std::size_t kDecidedCacheSize = 4096;

bool IsTerminal(v1::Outcome outcome) {
  return outcome == v1::OUTCOME_APPROVED || outcome == v1::OUTCOME_REJECTED || outcome == v1::OUTCOME_TIMEOUT;
}

} // namespace

ConsensusEngine::ConsensusEngine(ConsensusOptions options, DecidedLookup lookup)
    : options_(std::move(options)), lookup_(std::move(lookup)) {
}

bool ConsensusEngine::RequiresLeader(v1::ConsensusAlgorithm algorithm) {
  return algorithm == v1::CONSENSUS_ALGORITHM_RAFT;
}

std::unique_ptr<ConsensusAlgorithm> ConsensusEngine::MakeAlgorithm(v1::ConsensusAlgorithm algorithm) {
  switch (algorithm) {
    case v1::CONSENSUS_ALGORITHM_QUORUM:
      return std::make_unique<QuorumAlgorithm>();
    case v1::CONSENSUS_ALGORITHM_WEIGHTED:
      return std::make_unique<WeightedAlgorithm>();
    case v1::CONSENSUS_ALGORITHM_BYZANTINE:
      return std::make_unique<ByzantineAlgorithm>();
    case v1::CONSENSUS_ALGORITHM_RAFT:
      return std::make_unique<RaftAlgorithm>();
    case v1::CONSENSUS_ALGORITHM_GOSSIP:
      return std::make_unique<GossipAlgorithm>();
    case v1::CONSENSUS_ALGORITHM_CRDT:
      return std::make_unique<CrdtAlgorithm>();
    default:
      throw util::InvalidConfig("unsupported consensus algorithm " + std::to_string(static_cast<int>(algorithm)));
  }
}

uint64_t ConsensusEngine::NextSeed() {
  if (options_.gossip.seed != 0) return options_.gossip.seed + seed_sequence_.fetch_add(1);
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

void ConsensusEngine::MarkDecided(const std::string& proposal_id, v1::Outcome outcome) {
  std::lock_guard lock(mutex_);
  in_flight_.erase(proposal_id);
  decided_[proposal_id] = outcome;
  decided_order_.push_back(proposal_id);
  while (decided_order_.size() > kDecidedCacheSize) {
    decided_.erase(decided_order_.front());
    decided_order_.pop_front();
  }
}

v1::ConsensusProposal ConsensusEngine::Decide(v1::ConsensusProposal proposal, std::vector<Participant> participants,
                                              const std::string& leader_id, CancelToken cancel) {
  const std::string id = proposal.proposal_id();

  if (IsTerminal(proposal.outcome())) {
    throw util::ProposalAlreadyDecided("proposal " + id + " already decided", proposal.outcome());
  }

  auto algorithm = MakeAlgorithm(proposal.algorithm());

  // freeze the participant set
  if (proposal.participants_size() > 0) {
    const std::set<std::string> frozen(proposal.participants().begin(), proposal.participants().end());
    std::erase_if(participants, [&](const Participant& p) { return !frozen.contains(p.agent_id); });
  } else {
    for (const auto& p : participants) proposal.add_participants(p.agent_id);
  }
  for (auto& p : participants) {
    if (p.weight <= 0.0) p.weight = 1.0;
  }

  if (RequiresLeader(proposal.algorithm()) &&
      (leader_id.empty() ||
       std::none_of(participants.begin(), participants.end(), [&](const Participant& p) { return p.agent_id == leader_id; }))) {
    throw util::NoLeaderAvailable("proposal " + id + ": " + util::ConsensusAlgorithmName(proposal.algorithm()) +
                                  " requires a topology leader");
  }

  bool cached = false;
  {
    std::lock_guard lock(mutex_);
    if (auto it = decided_.find(id); it != decided_.end()) {
      throw util::ProposalAlreadyDecided("proposal " + id + " already decided", it->second);
    }
    cached = in_flight_.contains(id);
  }
  if (cached) {
    throw util::ProposalAlreadyDecided("proposal " + id + " is being decided", v1::OUTCOME_PENDING);
  }

  // evicted from the cache or decided before a restart
  if (lookup_) {
    if (auto stored = lookup_(id); stored && IsTerminal(*stored)) {
      throw util::ProposalAlreadyDecided("proposal " + id + " already decided", *stored);
    }
  }

  {
    std::lock_guard lock(mutex_);
    if (auto it = decided_.find(id); it != decided_.end()) {
      throw util::ProposalAlreadyDecided("proposal " + id + " already decided", it->second);
    }
    if (!in_flight_.insert(id).second) {
      throw util::ProposalAlreadyDecided("proposal " + id + " is being decided", v1::OUTCOME_PENDING);
    }
  }

  if (proposal.deadline_ms() == 0) {
    proposal.set_deadline_ms(util::NowMillis() + static_cast<uint64_t>(options_.default_timeout.count()));
  }

  Decision decision;
  try {
    DecisionContext ctx(proposal, std::move(participants), leader_id, util::FromUnixMillis(proposal.deadline_ms()), cancel, dispatcher_,
                        options_, NextSeed());
    decision = algorithm->Decide(ctx);
  } catch (...) {
    std::lock_guard lock(mutex_);
    in_flight_.erase(id);
    throw;
  }

  proposal.mutable_votes()->clear();
  for (const auto& [agent_id, vote] : decision.votes) {
    (*proposal.mutable_votes())[agent_id] = vote;
  }
  proposal.set_outcome(decision.outcome);
  proposal.set_decided_at_ms(util::NowMillis());

  MarkDecided(id, decision.outcome);

  observability::Metrics::Instance().RecordConsensusDecision(util::ConsensusAlgorithmName(proposal.algorithm()),
                                                              util::OutcomeName(decision.outcome));
  SWARM_LOG_INFO("proposal decided", {observability::StringField("session_id", proposal.session_id()),
                                      observability::StringField("proposal_id", id),
                                      observability::StringField("algorithm", util::ConsensusAlgorithmName(proposal.algorithm())),
                                      observability::StringField("outcome", util::OutcomeName(decision.outcome)),
                                      observability::IntField("rounds", decision.rounds),
                                      observability::StringField("detail", decision.detail)});
  return proposal;
}

} // namespace swarm::consensus
