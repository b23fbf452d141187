#include "names.hpp"

#include <algorithm>
#include <cctype>

namespace swarm::util {

using namespace swarm::engine::v1;

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::optional<TopologyKind> ParseTopologyKind(std::string_view name) {
  const auto lowered = Lower(name);
  if (lowered == "mesh") return TOPOLOGY_KIND_MESH;
  if (lowered == "star") return TOPOLOGY_KIND_STAR;
  if (lowered == "ring") return TOPOLOGY_KIND_RING;
  if (lowered == "hierarchical") return TOPOLOGY_KIND_HIERARCHICAL;
  if (lowered == "adaptive") return TOPOLOGY_KIND_ADAPTIVE;
  return std::nullopt;
}

std::optional<ConsensusAlgorithm> ParseConsensusAlgorithm(std::string_view name) {
  const auto lowered = Lower(name);
  if (lowered == "quorum") return CONSENSUS_ALGORITHM_QUORUM;
  if (lowered == "weighted") return CONSENSUS_ALGORITHM_WEIGHTED;
  if (lowered == "byzantine") return CONSENSUS_ALGORITHM_BYZANTINE;
  if (lowered == "raft") return CONSENSUS_ALGORITHM_RAFT;
  if (lowered == "gossip") return CONSENSUS_ALGORITHM_GOSSIP;
  if (lowered == "crdt") return CONSENSUS_ALGORITHM_CRDT;
  return std::nullopt;
}

std::string TopologyKindName(TopologyKind kind) {
  switch (kind) {
    case TOPOLOGY_KIND_MESH:
      return "mesh";
    case TOPOLOGY_KIND_STAR:
      return "star";
    case TOPOLOGY_KIND_RING:
      return "ring";
    case TOPOLOGY_KIND_HIERARCHICAL:
      return "hierarchical";
    case TOPOLOGY_KIND_ADAPTIVE:
      return "adaptive";
    default:
      return "unspecified";
  }
}

std::string ConsensusAlgorithmName(ConsensusAlgorithm algorithm) {
  switch (algorithm) {
    case CONSENSUS_ALGORITHM_QUORUM:
      return "quorum";
    case CONSENSUS_ALGORITHM_WEIGHTED:
      return "weighted";
    case CONSENSUS_ALGORITHM_BYZANTINE:
      return "byzantine";
    case CONSENSUS_ALGORITHM_RAFT:
      return "raft";
    case CONSENSUS_ALGORITHM_GOSSIP:
      return "gossip";
    case CONSENSUS_ALGORITHM_CRDT:
      return "crdt";
    default:
      return "unspecified";
  }
}

std::string AgentStateName(AgentState state) {
  switch (state) {
    case AGENT_STATE_HEALTHY:
      return "HEALTHY";
    case AGENT_STATE_DEGRADED:
      return "DEGRADED";
    case AGENT_STATE_UNREACHABLE:
      return "UNREACHABLE";
    case AGENT_STATE_RECOVERED:
      return "RECOVERED";
    case AGENT_STATE_REMOVED:
      return "REMOVED";
    default:
      return "UNSPECIFIED";
  }
}

std::string SessionStateName(SessionState state) {
  switch (state) {
    case SESSION_STATE_ACTIVE:
      return "ACTIVE";
    case SESSION_STATE_CLOSED:
      return "CLOSED";
    default:
      return "UNSPECIFIED";
  }
}

std::string OutcomeName(Outcome outcome) {
  switch (outcome) {
    case OUTCOME_PENDING:
      return "PENDING";
    case OUTCOME_APPROVED:
      return "APPROVED";
    case OUTCOME_REJECTED:
      return "REJECTED";
    case OUTCOME_TIMEOUT:
      return "TIMEOUT";
    default:
      return "UNSPECIFIED";
  }
}

std::string VoteName(Vote vote) {
  switch (vote) {
    case VOTE_YES:
      return "YES";
    case VOTE_NO:
      return "NO";
    case VOTE_ABSTAIN:
      return "ABSTAIN";
    default:
      return "UNSPECIFIED";
  }
}

std::string HealingActionKindName(HealingActionKind kind) {
  switch (kind) {
    case HEALING_ACTION_KIND_RESTART_AGENT:
      return "RESTART_AGENT";
    case HEALING_ACTION_KIND_REASSIGN_TASK:
      return "REASSIGN_TASK";
    case HEALING_ACTION_KIND_SWITCH_TOPOLOGY:
      return "SWITCH_TOPOLOGY";
    default:
      return "UNSPECIFIED";
  }
}

} // namespace swarm::util
