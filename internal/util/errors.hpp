#pragma once

#include <stdexcept>
#include <string>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::util {

/*
  Central error types.

  The coordinator surfaces these to callers; the gRPC frontend
  translates them to status codes.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unknown session id, or a session already closed by CloseSession.
class SessionNotFound : public std::runtime_error {
 public:
  explicit SessionNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The session keeps its prior topology when this is thrown.
class TopologyTransitionError : public std::runtime_error {
 public:
  explicit TopologyTransitionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoLeaderAvailable : public std::runtime_error {
 public:
  explicit NoLeaderAvailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProposalAlreadyDecided : public std::runtime_error {
 public:
  ProposalAlreadyDecided(const std::string& msg, swarm::engine::v1::Outcome outcome) : std::runtime_error(msg), outcome_(outcome) {
  }

  swarm::engine::v1::Outcome outcome() const {
    return outcome_;
  }

 private:
  swarm::engine::v1::Outcome outcome_;
};

// Transient; retried by the healer and never surfaced to consensus callers.
class AgentUnreachable : public std::runtime_error {
 public:
  explicit AgentUnreachable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Any persistence failure. Fatal to the affected session only.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace swarm::util
