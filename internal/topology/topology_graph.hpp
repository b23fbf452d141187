#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::topology {

struct TopologyOptions {
  uint32_t hierarchical_branching_factor = 4;

  // adaptive: mesh up to this many agents ...
  uint32_t adaptive_mesh_max_agents = 5;
  // ... star up to this many, hierarchical above
  uint32_t adaptive_star_max_agents = 20;
};

struct AgentNode {
  std::string agent_id;
  bool        leader_eligible = true;
};

/*
  Graph construction rules. Agents are always ordered by agent_id, so
  the same agent set and kind always produce the same graph.

    mesh          complete graph, no leader
    star          hub <-> every other agent
    ring          each agent -> its successor (circular)
    hierarchical  tree rooted at the leader, children assigned
                  breadth-first, parent <-> child
    adaptive      mesh / star / hierarchical by agent count

  Adjacency lists every vertex, including isolated ones.
*/

// Effective kind for `kind` over `agent_count` agents (identity unless adaptive).
swarm::engine::v1::TopologyKind ResolveEffectiveKind(swarm::engine::v1::TopologyKind kind, std::size_t agent_count,
                                                     const TopologyOptions& options);

// Leader for star/hierarchical: the pin if set, else the lowest
// leader-eligible id. Returns nullopt when nobody qualifies.
// Throws TopologyTransitionError when the pin is not an agent.
std::optional<std::string> ChooseLeader(const std::vector<AgentNode>& agents, const std::string& pinned_leader_id);

/*
  Builds the graph for `kind`. `effective_override` replaces the
  adaptive bracket choice when set (healer bottleneck override).

  Throws TopologyTransitionError when the agent set cannot satisfy the
  kind (hierarchical without a leader-eligible agent, unknown pin,
  unsupported kind).
*/
swarm::engine::v1::TopologyGraph BuildGraph(swarm::engine::v1::TopologyKind kind, const std::vector<AgentNode>& agents,
                                            const std::string& pinned_leader_id, const TopologyOptions& options,
                                            std::optional<swarm::engine::v1::TopologyKind> effective_override = std::nullopt);

std::set<std::string> VertexSet(const swarm::engine::v1::TopologyGraph& graph);

bool HasEdge(const swarm::engine::v1::TopologyGraph& graph, const std::string& from, const std::string& to);

std::vector<std::string> Peers(const swarm::engine::v1::TopologyGraph& graph, const std::string& agent_id);

bool IsSupportedKind(swarm::engine::v1::TopologyKind kind);

} // namespace swarm::topology
