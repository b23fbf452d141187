#include "topology_graph.hpp"

#include <algorithm>
#include <deque>
#include <map>

#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace swarm::topology {

namespace v1 = swarm::engine::v1;

namespace {

using AdjacencyMap = std::map<std::string, std::set<std::string>>;

std::vector<std::string> SortedIds(const std::vector<AgentNode>& agents) {
  std::vector<std::string> ids;
  ids.reserve(agents.size());
  for (const auto& a : agents) ids.push_back(a.agent_id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

AdjacencyMap EmptyAdjacency(const std::vector<std::string>& ids) {
  AdjacencyMap adj;
  for (const auto& id : ids) adj[id];
  return adj;
}

void Link(AdjacencyMap& adj, const std::string& a, const std::string& b) {
  adj[a].insert(b);
  adj[b].insert(a);
}

AdjacencyMap BuildMesh(const std::vector<std::string>& ids) {
  auto adj = EmptyAdjacency(ids);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    for (std::size_t j = i + 1; j < ids.size(); ++j) {
      Link(adj, ids[i], ids[j]);
    }
  }
  return adj;
}

AdjacencyMap BuildStar(const std::vector<std::string>& ids, const std::string& hub) {
  auto adj = EmptyAdjacency(ids);
  for (const auto& id : ids) {
    if (id != hub) Link(adj, hub, id);
  }
  return adj;
}

AdjacencyMap BuildRing(const std::vector<std::string>& ids) {
  auto adj = EmptyAdjacency(ids);
  if (ids.size() < 2) return adj;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    adj[ids[i]].insert(ids[(i + 1) % ids.size()]);
  }
  return adj;
}

AdjacencyMap BuildTree(const std::vector<std::string>& ids, const std::string& root, uint32_t branching) {
  auto adj = EmptyAdjacency(ids);

  std::deque<std::string> parents{root};
  uint32_t                assigned = 0;

  for (const auto& id : ids) {
    if (id == root) continue;
    if (assigned == branching) {
      parents.pop_front();
      assigned = 0;
    }
    Link(adj, parents.front(), id);
    parents.push_back(id);
    ++assigned;
  }
  return adj;
}

} // namespace

bool IsSupportedKind(v1::TopologyKind kind) {
  switch (kind) {
    case v1::TOPOLOGY_KIND_MESH:
    case v1::TOPOLOGY_KIND_STAR:
    case v1::TOPOLOGY_KIND_RING:
    case v1::TOPOLOGY_KIND_HIERARCHICAL:
    case v1::TOPOLOGY_KIND_ADAPTIVE:
      return true;
    default:
      return false;
  }
}

v1::TopologyKind ResolveEffectiveKind(v1::TopologyKind kind, std::size_t agent_count, const TopologyOptions& options) {
  if (kind != v1::TOPOLOGY_KIND_ADAPTIVE) return kind;
  if (agent_count <= options.adaptive_mesh_max_agents) return v1::TOPOLOGY_KIND_MESH;
  if (agent_count <= options.adaptive_star_max_agents) return v1::TOPOLOGY_KIND_STAR;
  return v1::TOPOLOGY_KIND_HIERARCHICAL;
}

std::optional<std::string> ChooseLeader(const std::vector<AgentNode>& agents, const std::string& pinned_leader_id) {
  if (!pinned_leader_id.empty()) {
    auto it = std::find_if(agents.begin(), agents.end(), [&](const AgentNode& a) { return a.agent_id == pinned_leader_id; });
    if (it == agents.end()) throw util::TopologyTransitionError("pinned leader " + pinned_leader_id + " is not a member of the agent set");
    return pinned_leader_id;
  }

  std::optional<std::string> best;
  for (const auto& a : agents) {
    if (!a.leader_eligible) continue;
    if (!best || a.agent_id < *best) best = a.agent_id;
  }
  return best;
}

v1::TopologyGraph BuildGraph(v1::TopologyKind kind, const std::vector<AgentNode>& agents, const std::string& pinned_leader_id,
                             const TopologyOptions& options, std::optional<v1::TopologyKind> effective_override) {
  if (!IsSupportedKind(kind)) {
    throw util::TopologyTransitionError("unsupported topology kind " + std::to_string(static_cast<int>(kind)));
  }

  const auto       ids       = SortedIds(agents);
  v1::TopologyKind effective = ResolveEffectiveKind(kind, ids.size(), options);
  if (kind == v1::TOPOLOGY_KIND_ADAPTIVE && effective_override) effective = *effective_override;

  AdjacencyMap adj;
  std::string  leader;

  switch (effective) {
    case v1::TOPOLOGY_KIND_MESH:
      adj = BuildMesh(ids);
      break;
    case v1::TOPOLOGY_KIND_RING:
      adj = BuildRing(ids);
      break;
    case v1::TOPOLOGY_KIND_STAR: {
      if (ids.empty()) break;
      // the hub does not need to be leader-eligible; fall back to the lowest id
      leader = ChooseLeader(agents, pinned_leader_id).value_or(ids.front());
      adj    = BuildStar(ids, leader);
      break;
    }
    case v1::TOPOLOGY_KIND_HIERARCHICAL: {
      if (ids.empty()) break;
      auto root = ChooseLeader(agents, pinned_leader_id);
      if (!root) throw util::TopologyTransitionError("hierarchical topology requires at least one leader-eligible agent");
      leader = *root;
      adj    = BuildTree(ids, leader, std::max<uint32_t>(1, options.hierarchical_branching_factor));
      break;
    }
    default:
      throw util::TopologyTransitionError("cannot build topology " + util::TopologyKindName(effective));
  }

  v1::TopologyGraph graph;
  graph.set_kind(kind);
  graph.set_effective_kind(effective);
  graph.set_leader_id(leader);
  for (const auto& [id, peers] : adj) {
    auto* entry = graph.add_adjacency();
    entry->set_agent_id(id);
    for (const auto& p : peers) entry->add_peers(p);
  }
  return graph;
}

std::set<std::string> VertexSet(const v1::TopologyGraph& graph) {
  std::set<std::string> out;
  for (const auto& entry : graph.adjacency()) out.insert(entry.agent_id());
  return out;
}

bool HasEdge(const v1::TopologyGraph& graph, const std::string& from, const std::string& to) {
  for (const auto& entry : graph.adjacency()) {
    if (entry.agent_id() != from) continue;
    return std::find(entry.peers().begin(), entry.peers().end(), to) != entry.peers().end();
  }
  return false;
}

std::vector<std::string> Peers(const v1::TopologyGraph& graph, const std::string& agent_id) {
  for (const auto& entry : graph.adjacency()) {
    if (entry.agent_id() == agent_id) return {entry.peers().begin(), entry.peers().end()};
  }
  return {};
}

} // namespace swarm::topology
