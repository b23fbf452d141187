#include "topology_manager.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace swarm::topology {

namespace v1 = swarm::engine::v1;

TopologyManager::TopologyManager(std::string session_id, TopologyOptions options, std::shared_ptr<state::StateStore> store)
    : session_id_(std::move(session_id)), options_(options), store_(std::move(store)) {
}

TopologyManager::GraphPtr TopologyManager::Initialize(v1::TopologyKind kind, std::vector<AgentNode> agents, std::string pinned_leader_id) {
  auto graph = BuildGraph(kind, agents, pinned_leader_id, options_);
  graph.set_version(1);

  agents_           = std::move(agents);
  pinned_leader_id_ = std::move(pinned_leader_id);

  auto ptr = std::make_shared<const v1::TopologyGraph>(std::move(graph));
  {
    std::lock_guard lock(graph_mutex_);
    current_ = ptr;
  }
  return ptr;
}

TopologyManager::GraphPtr TopologyManager::Current() const {
  std::lock_guard lock(graph_mutex_);
  return current_;
}

std::vector<AgentNode> TopologyManager::Agents() const {
  return agents_;
}

TopologyManager::GraphPtr TopologyManager::Publish(v1::TopologyGraph next) {
  const auto prior = Current();
  next.set_version(prior ? prior->version() + 1 : 1);

  // persist first: a failed write leaves the prior graph in place
  store_->SaveTopology(session_id_, next);

  auto ptr = std::make_shared<const v1::TopologyGraph>(std::move(next));
  {
    std::lock_guard lock(graph_mutex_);
    current_ = ptr;
  }

  SWARM_LOG_INFO("topology published", {observability::StringField("session_id", session_id_),
                                        observability::StringField("kind", util::TopologyKindName(ptr->kind())),
                                        observability::StringField("effective_kind", util::TopologyKindName(ptr->effective_kind())),
                                        observability::StringField("leader_id", ptr->leader_id()),
                                        observability::IntField("agents", ptr->adjacency_size()),
                                        observability::IntField("version", static_cast<int64_t>(ptr->version()))});
  return ptr;
}

TopologyManager::GraphPtr TopologyManager::TransitionTo(v1::TopologyKind kind) {
  const auto prior = Current();

  // an explicit switch clears any healer override
  auto next = BuildGraph(kind, agents_, pinned_leader_id_, options_);

  if (prior && VertexSet(next) != VertexSet(*prior)) {
    throw util::TopologyTransitionError("transition to " + util::TopologyKindName(kind) + " would change the agent set");
  }

  adaptive_override_.reset();
  return Publish(std::move(next));
}

TopologyManager::GraphPtr TopologyManager::AddAgent(const AgentNode& agent) {
  const auto prior = Current();
  auto       grown = agents_;
  grown.push_back(agent);

  auto next = BuildGraph(prior->kind(), grown, pinned_leader_id_, options_, adaptive_override_);

  auto expected = VertexSet(*prior);
  expected.insert(agent.agent_id);
  if (VertexSet(next) != expected) {
    throw util::TopologyTransitionError("add-agent transition for " + agent.agent_id + " produced an inconsistent vertex set");
  }

  auto published = Publish(std::move(next));
  agents_        = std::move(grown);
  return published;
}

TopologyManager::GraphPtr TopologyManager::RemoveAgent(const std::string& agent_id, bool strict) {
  const auto prior = Current();

  auto shrunk = agents_;
  std::erase_if(shrunk, [&](const AgentNode& a) { return a.agent_id == agent_id; });
  if (shrunk.size() == agents_.size()) {
    throw util::TopologyTransitionError("agent " + agent_id + " is not part of the topology");
  }
  if (strict && shrunk.empty()) {
    throw util::TopologyTransitionError("cannot remove the last agent of a session");
  }

  const std::string pin = pinned_leader_id_ == agent_id ? std::string() : pinned_leader_id_;

  v1::TopologyGraph next;
  try {
    next = BuildGraph(prior->kind(), shrunk, pin, options_, adaptive_override_);
  } catch (const util::TopologyTransitionError& e) {
    if (strict) throw;
    SWARM_LOG_WARN("remove-agent transition falling back to mesh",
                   {observability::StringField("session_id", session_id_), observability::StringField("agent_id", agent_id),
                    observability::StringField("error", e.what())});
    next = BuildGraph(v1::TOPOLOGY_KIND_MESH, shrunk, std::string(), options_);
  }

  auto published    = Publish(std::move(next));
  agents_           = std::move(shrunk);
  pinned_leader_id_ = pin;
  if (published->kind() != v1::TOPOLOGY_KIND_ADAPTIVE) adaptive_override_.reset();
  return published;
}

std::optional<v1::TopologyKind> TopologyManager::RecommendForBottleneck(const v1::TopologyGraph& graph) {
  if (graph.kind() == v1::TOPOLOGY_KIND_ADAPTIVE) {
    // next larger adaptive bracket
    switch (graph.effective_kind()) {
      case v1::TOPOLOGY_KIND_MESH:
        return v1::TOPOLOGY_KIND_STAR;
      case v1::TOPOLOGY_KIND_STAR:
        return v1::TOPOLOGY_KIND_HIERARCHICAL;
      default:
        return std::nullopt;
    }
  }

  switch (graph.kind()) {
    case v1::TOPOLOGY_KIND_MESH:
    case v1::TOPOLOGY_KIND_STAR:
      return v1::TOPOLOGY_KIND_HIERARCHICAL;
    case v1::TOPOLOGY_KIND_RING:
    case v1::TOPOLOGY_KIND_HIERARCHICAL:
      return v1::TOPOLOGY_KIND_STAR;
    default:
      return std::nullopt;
  }
}

std::optional<TopologyManager::GraphPtr> TopologyManager::SwitchForBottleneck() {
  const auto prior  = Current();
  const auto target = RecommendForBottleneck(*prior);
  if (!target) return std::nullopt;

  if (prior->kind() != v1::TOPOLOGY_KIND_ADAPTIVE) return TransitionTo(*target);

  auto next = BuildGraph(v1::TOPOLOGY_KIND_ADAPTIVE, agents_, pinned_leader_id_, options_, target);
  if (VertexSet(next) != VertexSet(*prior)) {
    throw util::TopologyTransitionError("adaptive override would change the agent set");
  }
  auto published     = Publish(std::move(next));
  adaptive_override_ = target;
  return published;
}

} // namespace swarm::topology
