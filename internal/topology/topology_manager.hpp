#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "topology_graph.hpp"

namespace swarm::state {
class StateStore;
}

namespace swarm::topology {

/*
  TopologyManager

  Owns the TopologyGraph of one session.

  Concurrency model:
    - every mutating call runs on the session's writer thread
    - Current() may be called from any thread
    - graphs are immutable once published; a transition builds a new
      graph, persists it, then swaps the shared pointer. Readers holding
      the old pointer keep a consistent snapshot.

  Version numbers start at 1 and increase by one per published graph.
*/
class TopologyManager {
 public:
  using GraphPtr = std::shared_ptr<const swarm::engine::v1::TopologyGraph>;

  TopologyManager(std::string session_id, TopologyOptions options, std::shared_ptr<state::StateStore> store);

  // First graph of the session. Not persisted here: the session row
  // must be written together with it.
  GraphPtr Initialize(swarm::engine::v1::TopologyKind kind, std::vector<AgentNode> agents, std::string pinned_leader_id);

  GraphPtr Current() const;

  std::vector<AgentNode> Agents() const;

  // Same vertex set, new kind. Throws TopologyTransitionError and keeps
  // the prior graph when the agent set cannot satisfy `kind`.
  GraphPtr TransitionTo(swarm::engine::v1::TopologyKind kind);

  // Vertex set grows by one.
  GraphPtr AddAgent(const AgentNode& agent);

  /*
    Vertex set shrinks by one.

    strict=true  (explicit deregistration): throws when the remaining
                 set cannot satisfy the current kind or would be empty.
    strict=false (healer removal): falls back to mesh instead.
  */
  GraphPtr RemoveAgent(const std::string& agent_id, bool strict);

  // Applies the bottleneck recommendation. Returns nullopt when there is none.
  std::optional<GraphPtr> SwitchForBottleneck();

  static std::optional<swarm::engine::v1::TopologyKind> RecommendForBottleneck(const swarm::engine::v1::TopologyGraph& graph);

 private:
  GraphPtr Publish(swarm::engine::v1::TopologyGraph next);

  const std::string                  session_id_;
  const TopologyOptions              options_;
  std::shared_ptr<state::StateStore> store_;

  // writer-thread state
  std::vector<AgentNode>                         agents_;
  std::string                                    pinned_leader_id_;
  std::optional<swarm::engine::v1::TopologyKind> adaptive_override_;

  // guards the pointer swap only
  mutable std::mutex graph_mutex_;
  GraphPtr           current_;
};

} // namespace swarm::topology
