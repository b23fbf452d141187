#include "remote_agent.hpp"

#include "internal/util/errors.hpp"

namespace swarm::agent {

namespace v1 = swarm::engine::v1;

RemoteAgentHandle::RemoteAgentHandle(std::string agent_id, std::chrono::milliseconds heartbeat_ttl)
    : agent_id_(std::move(agent_id)), heartbeat_ttl_(heartbeat_ttl), last_heartbeat_(util::Now()) {
}

TaskOutcome RemoteAgentHandle::Execute(const TaskRequest& task) {
  throw util::AgentUnreachable("agent " + agent_id_ + " is remote; task " + task.task_id + " must be dispatched by the host");
}

bool RemoteAgentHandle::HeartbeatFreshLocked(util::TimePoint now) const {
  return now - last_heartbeat_ <= heartbeat_ttl_;
}

ProbeResult RemoteAgentHandle::Probe(std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  ProbeResult     result;
  result.reachable  = HeartbeatFreshLocked(util::Now());
  result.latency_ms = last_latency_ms_;
  return result;
}

std::optional<v1::Vote> RemoteAgentHandle::CastVote(const v1::Ballot& ballot) {
  const BallotKey key{ballot.proposal_id(), ballot.round()};
  const auto      deadline = util::FromUnixMillis(ballot.deadline_ms());

  std::unique_lock lock(mutex_);
  if (withdrawn_early_.erase(key) > 0) return std::nullopt;

  auto [it, inserted] = ballots_.try_emplace(key);
  it->second.ballot   = ballot;

  cv_.wait_until(lock, deadline, [&] { return it->second.vote.has_value() || it->second.withdrawn; });

  auto vote = it->second.withdrawn ? std::nullopt : it->second.vote;
  ballots_.erase(it);
  return vote;
}

void RemoteAgentHandle::WithdrawBallot(const v1::Ballot& ballot) {
  const BallotKey key{ballot.proposal_id(), ballot.round()};
  const auto      now = util::Now();
  {
    std::lock_guard lock(mutex_);
    std::erase_if(withdrawn_early_, [&](const auto& kv) { return kv.second <= now; });

    auto it = ballots_.find(key);
    if (it != ballots_.end()) {
      it->second.withdrawn = true;
    } else {
      const auto deadline = util::FromUnixMillis(ballot.deadline_ms());
      if (deadline > now) withdrawn_early_[key] = deadline;
    }
  }
  cv_.notify_all();
}

bool RemoteAgentHandle::Restart() {
  // The engine cannot restart a remote process; the agent counts as
  // restarted once it heartbeats again.
  std::lock_guard lock(mutex_);
  return HeartbeatFreshLocked(util::Now());
}

void RemoteAgentHandle::RecordHeartbeat(uint64_t latency_ms) {
  std::lock_guard lock(mutex_);
  last_heartbeat_  = util::Now();
  last_latency_ms_ = latency_ms;
}

std::vector<v1::Ballot> RemoteAgentHandle::PendingBallots() const {
  std::lock_guard         lock(mutex_);
  std::vector<v1::Ballot> out;
  for (const auto& [_, open] : ballots_) {
    if (!open.vote && !open.withdrawn) out.push_back(open.ballot);
  }
  return out;
}

bool RemoteAgentHandle::SubmitVote(const std::string& proposal_id, uint32_t round, v1::Vote vote) {
  {
    std::lock_guard lock(mutex_);
    auto            it = ballots_.find(BallotKey{proposal_id, round});
    if (it == ballots_.end() || it->second.vote || it->second.withdrawn) return false;
    it->second.vote = vote;
  }
  cv_.notify_all();
  return true;
}

std::shared_ptr<AgentHandle> RemoteAgentDirectory::Resolve(const std::string&, const v1::AgentSpec& spec) {
  return std::make_shared<RemoteAgentHandle>(spec.agent_id(), heartbeat_ttl_);
}

} // namespace swarm::agent
