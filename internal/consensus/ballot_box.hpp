#pragma once

#include <atomic>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/time.hpp"
#include "types.hpp"

namespace swarm::consensus {

/*
  Collects the votes of one ballot round.

  Votes are accepted until the box closes. Closing happens when every
  expected agent answered, at the deadline, or on cancellation;
  anything submitted afterwards is discarded.
*/
class BallotBox {
 public:
  explicit BallotBox(std::set<std::string> expected);

  // false when closed, unexpected or a duplicate
  bool Submit(const std::string& agent_id, swarm::engine::v1::Vote vote);

  VoteMap AwaitAndClose(util::TimePoint deadline, const CancelToken& cancel);

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::set<std::string>   expected_;
  VoteMap                 votes_;
  bool                    closed_ = false;
};

/*
  Fans a ballot out to agents, one voter thread per agent.

  Voter threads outlive the round they vote in (a slow agent keeps its
  thread until CastVote returns). Finished threads are joined lazily;
  the destructor joins the rest.
*/
class BallotDispatcher {
 public:
  BallotDispatcher() = default;
  ~BallotDispatcher();

  BallotDispatcher(const BallotDispatcher&)            = delete;
  BallotDispatcher& operator=(const BallotDispatcher&) = delete;

  std::shared_ptr<BallotBox> Dispatch(const std::vector<Participant>& participants, const swarm::engine::v1::Ballot& ballot);

 private:
  struct Voter {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void ReapFinishedLocked();

  std::mutex       mutex_;
  std::list<Voter> voters_;
};

} // namespace swarm::consensus
