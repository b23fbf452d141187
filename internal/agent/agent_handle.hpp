#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::agent {

struct ProbeResult {
  bool     reachable  = false;
  uint64_t latency_ms = 0;
};

struct TaskRequest {
  std::string task_id;
  std::string payload;
};

struct TaskOutcome {
  swarm::engine::v1::TaskResult result = swarm::engine::v1::TASK_RESULT_UNSPECIFIED;
  std::string                   output;
};

/*
  AgentHandle

  Opaque worker. The engine only probes, restarts and asks for votes;
  Execute exists for hosts that dispatch work through the same handle.

  Implementations must be thread-safe: probes run on the session's
  writer thread while ballots are cast from consensus fan-out threads.
*/
class AgentHandle {
 public:
  virtual ~AgentHandle() = default;

  virtual const std::string& Id() const = 0;

  virtual TaskOutcome Execute(const TaskRequest& task) = 0;

  // Must return within `timeout`; an unanswered probe is unreachable.
  virtual ProbeResult Probe(std::chrono::milliseconds timeout) = 0;

  // Blocks until the agent votes or the ballot deadline passes.
  // std::nullopt means the agent did not answer.
  virtual std::optional<swarm::engine::v1::Vote> CastVote(const swarm::engine::v1::Ballot& ballot) = 0;

  // The decision was cancelled before this agent answered; a pending
  // CastVote for the ballot should return std::nullopt early.
  virtual void WithdrawBallot(const swarm::engine::v1::Ballot&) {
  }

  virtual bool Restart() = 0;
};

/*
  Resolves the handle for an agent joining a session. The coordinator
  calls this once per agent at InitSession/RegisterAgent.
*/
class AgentDirectory {
 public:
  virtual ~AgentDirectory() = default;

  virtual std::shared_ptr<AgentHandle> Resolve(const std::string& session_id, const swarm::engine::v1::AgentSpec& spec) = 0;
};

} // namespace swarm::agent
