#include "ballot_box.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace swarm::consensus {

namespace v1 = swarm::engine::v1;

namespace {

// granularity at which a waiting round notices cancellation
constexpr auto kCancelPoll = std::chrono::milliseconds(20);

} // namespace

BallotBox::BallotBox(std::set<std::string> expected) : expected_(std::move(expected)) {
}

bool BallotBox::Submit(const std::string& agent_id, v1::Vote vote) {
  if (vote != v1::VOTE_YES && vote != v1::VOTE_NO) vote = v1::VOTE_ABSTAIN;
  {
    std::lock_guard lock(mutex_);
    if (closed_ || !expected_.contains(agent_id) || votes_.contains(agent_id)) return false;
    votes_.emplace(agent_id, vote);
  }
  cv_.notify_all();
  return true;
}

VoteMap BallotBox::AwaitAndClose(util::TimePoint deadline, const CancelToken& cancel) {
  std::unique_lock lock(mutex_);
  while (votes_.size() < expected_.size()) {
    if (cancel && cancel->load()) break;
    const auto now = util::Now();
    if (now >= deadline) break;
    cv_.wait_until(lock, std::min(deadline, now + kCancelPoll));
  }
  closed_ = true;
  return votes_;
}

BallotDispatcher::~BallotDispatcher() {
  std::lock_guard lock(mutex_);
  for (auto& voter : voters_) {
    if (voter.thread.joinable()) voter.thread.join();
  }
}

void BallotDispatcher::ReapFinishedLocked() {
  for (auto it = voters_.begin(); it != voters_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) it->thread.join();
      it = voters_.erase(it);
    } else {
      ++it;
    }
  }
}

std::shared_ptr<BallotBox> BallotDispatcher::Dispatch(const std::vector<Participant>& participants, const v1::Ballot& ballot) {
  std::set<std::string> expected;
  for (const auto& p : participants) expected.insert(p.agent_id);
  auto box = std::make_shared<BallotBox>(std::move(expected));

  std::lock_guard lock(mutex_);
  ReapFinishedLocked();

  for (const auto& p : participants) {
    Voter voter;
    voter.done   = std::make_shared<std::atomic<bool>>(false);
    voter.thread = std::thread([box, ballot, agent_id = p.agent_id, handle = p.handle, done = voter.done] {
      try {
        if (handle) {
          if (auto vote = handle->CastVote(ballot)) box->Submit(agent_id, *vote);
        }
      } catch (const std::exception& e) {
        // an agent that fails to vote simply does not answer
        SWARM_LOG_DEBUG("ballot not answered", {observability::StringField("agent_id", agent_id),
                                                observability::StringField("proposal_id", ballot.proposal_id()),
                                                observability::StringField("error", e.what())});
      }
      done->store(true);
    });
    voters_.push_back(std::move(voter));
  }
  return box;
}

} // namespace swarm::consensus
