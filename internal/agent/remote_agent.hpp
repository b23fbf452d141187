#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "agent_handle.hpp"
#include "internal/util/time.hpp"

namespace swarm::agent {

/*
  RemoteAgentHandle

  An agent living behind the network frontend. The engine cannot call
  it; the agent calls in:

    Heartbeat  -> refreshes liveness, returns the ballots it owes
    SubmitVote -> answers one open ballot

  Probe() is answered from the last heartbeat. A ballot stays open only
  while CastVote waits on it; votes for closed or withdrawn ballots are
  discarded.
*/
class RemoteAgentHandle final : public AgentHandle {
 public:
  RemoteAgentHandle(std::string agent_id, std::chrono::milliseconds heartbeat_ttl);

  const std::string& Id() const override {
    return agent_id_;
  }

  TaskOutcome                            Execute(const TaskRequest& task) override;
  ProbeResult                            Probe(std::chrono::milliseconds timeout) override;
  std::optional<swarm::engine::v1::Vote> CastVote(const swarm::engine::v1::Ballot& ballot) override;
  bool                                   Restart() override;
  void                                   WithdrawBallot(const swarm::engine::v1::Ballot& ballot) override;

  void                                  RecordHeartbeat(uint64_t latency_ms);
  std::vector<swarm::engine::v1::Ballot> PendingBallots() const;

  // Returns false when no ballot (proposal, round) is waiting.
  bool SubmitVote(const std::string& proposal_id, uint32_t round, swarm::engine::v1::Vote vote);

 private:
  using BallotKey = std::pair<std::string, uint32_t>;

  struct OpenBallot {
    swarm::engine::v1::Ballot              ballot;
    std::optional<swarm::engine::v1::Vote> vote;
    bool                                   withdrawn = false;
  };

  bool HeartbeatFreshLocked(util::TimePoint now) const;

  const std::string               agent_id_;
  const std::chrono::milliseconds heartbeat_ttl_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  util::TimePoint         last_heartbeat_;
  uint64_t                last_latency_ms_ = 0;

  std::map<BallotKey, OpenBallot> ballots_;
  // withdrawn before CastVote arrived; value is the ballot deadline
  std::map<BallotKey, util::TimePoint> withdrawn_early_;
};

/*
  Default directory for the daemon: every agent is remote.
*/
class RemoteAgentDirectory final : public AgentDirectory {
 public:
  explicit RemoteAgentDirectory(std::chrono::milliseconds heartbeat_ttl) : heartbeat_ttl_(heartbeat_ttl) {
  }

  std::shared_ptr<AgentHandle> Resolve(const std::string& session_id, const swarm::engine::v1::AgentSpec& spec) override;

 private:
  std::chrono::milliseconds heartbeat_ttl_;
};

} // namespace swarm::agent
