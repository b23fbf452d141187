#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/agent/agent_handle.hpp"
#include "swarm/engine/v1/types.pb.h"

namespace swarm::testing {

/*
  Scripted in-process agent.

  By default it answers every probe, votes YES in every round and
  restarts successfully. A custom voter overrides the fixed vote.
*/
class FakeAgent final : public agent::AgentHandle {
 public:
  using Voter = std::function<std::optional<swarm::engine::v1::Vote>(const swarm::engine::v1::Ballot&)>;

  explicit FakeAgent(std::string agent_id, swarm::engine::v1::Vote vote = swarm::engine::v1::VOTE_YES)
      : agent_id_(std::move(agent_id)), vote_(vote) {
  }

  const std::string& Id() const override {
    return agent_id_;
  }

  agent::TaskOutcome Execute(const agent::TaskRequest& task) override {
    agent::TaskOutcome outcome;
    outcome.result = swarm::engine::v1::TASK_RESULT_SUCCESS;
    outcome.output = task.payload;
    return outcome;
  }

  agent::ProbeResult Probe(std::chrono::milliseconds) override {
    probes_++;
    agent::ProbeResult result;
    result.reachable  = reachable_.load();
    result.latency_ms = result.reachable ? 1 : 0;
    return result;
  }

  std::optional<swarm::engine::v1::Vote> CastVote(const swarm::engine::v1::Ballot& ballot) override {
    ballots_++;
    Voter                     voter;
    swarm::engine::v1::Vote   vote;
    std::chrono::milliseconds delay;
    {
      std::lock_guard lock(mutex_);
      voter = voter_;
      vote  = vote_;
      delay = vote_delay_;
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    if (silent_.load()) return std::nullopt;
    if (voter) return voter(ballot);
    return vote;
  }

  bool Restart() override {
    restarts_++;
    const bool ok = restart_succeeds_.load();
    if (ok) reachable_ = true;
    return ok;
  }

  void set_vote(swarm::engine::v1::Vote vote) {
    std::lock_guard lock(mutex_);
    vote_ = vote;
  }

  void set_voter(Voter voter) {
    std::lock_guard lock(mutex_);
    voter_ = std::move(voter);
  }

  void set_vote_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    vote_delay_ = delay;
  }

  void set_silent(bool silent) {
    silent_ = silent;
  }

  void set_reachable(bool reachable) {
    reachable_ = reachable;
  }

  void set_restart_succeeds(bool ok) {
    restart_succeeds_ = ok;
  }

  int probes() const {
    return probes_.load();
  }

  int ballots() const {
    return ballots_.load();
  }

  int restarts() const {
    return restarts_.load();
  }

 private:
  const std::string agent_id_;

  std::mutex                mutex_;
  swarm::engine::v1::Vote   vote_;
  Voter                     voter_;
  std::chrono::milliseconds vote_delay_{0};

  std::atomic<bool> silent_{false};
  std::atomic<bool> reachable_{true};
  std::atomic<bool> restart_succeeds_{true};

  std::atomic<int> probes_{0};
  std::atomic<int> ballots_{0};
  std::atomic<int> restarts_{0};
};

/*
  Hands out FakeAgents; tests script them by id before or after the
  session starts.
*/
class FakeDirectory final : public agent::AgentDirectory {
 public:
  std::shared_ptr<agent::AgentHandle> Resolve(const std::string&, const swarm::engine::v1::AgentSpec& spec) override {
    return Get(spec.agent_id());
  }

  std::shared_ptr<FakeAgent> Get(const std::string& agent_id) {
    std::lock_guard lock(mutex_);
    auto&           agent = agents_[agent_id];
    if (!agent) agent = std::make_shared<FakeAgent>(agent_id);
    return agent;
  }

 private:
  std::mutex                                        mutex_;
  std::map<std::string, std::shared_ptr<FakeAgent>> agents_;
};

inline swarm::engine::v1::AgentSpec Spec(const std::string& agent_id, double weight = 0.0) {
  swarm::engine::v1::AgentSpec spec;
  spec.set_agent_id(agent_id);
  spec.set_weight(weight);
  return spec;
}

} // namespace swarm::testing
