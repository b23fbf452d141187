#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::util {

/*
  Text forms used by the YAML config, the session state file and logs.

  Topology and algorithm names are lower-case ("mesh", "raft");
  states and outcomes are upper-case ("HEALTHY", "APPROVED").
*/

std::optional<swarm::engine::v1::TopologyKind>       ParseTopologyKind(std::string_view name);
std::optional<swarm::engine::v1::ConsensusAlgorithm> ParseConsensusAlgorithm(std::string_view name);

std::string TopologyKindName(swarm::engine::v1::TopologyKind kind);
std::string ConsensusAlgorithmName(swarm::engine::v1::ConsensusAlgorithm algorithm);
std::string AgentStateName(swarm::engine::v1::AgentState state);
std::string SessionStateName(swarm::engine::v1::SessionState state);
std::string OutcomeName(swarm::engine::v1::Outcome outcome);
std::string VoteName(swarm::engine::v1::Vote vote);
std::string HealingActionKindName(swarm::engine::v1::HealingActionKind kind);

} // namespace swarm::util
