#include "internal/topology/topology_graph.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace v1 = swarm::engine::v1;

using swarm::topology::AgentNode;
using swarm::topology::BuildGraph;
using swarm::topology::HasEdge;
using swarm::topology::Peers;
using swarm::topology::TopologyOptions;
using swarm::topology::VertexSet;

std::vector<AgentNode> Nodes(const std::vector<std::string>& ids) {
  std::vector<AgentNode> out;
  for (const auto& id : ids) out.push_back(AgentNode{id, true});
  return out;
}

void TestMeshConnectsEveryPair() {
  const auto graph = BuildGraph(v1::TOPOLOGY_KIND_MESH, Nodes({"a3", "a1", "a2"}), "", TopologyOptions{});

  assert(graph.leader_id().empty());
  assert(graph.effective_kind() == v1::TOPOLOGY_KIND_MESH);
  assert(VertexSet(graph) == (std::set<std::string>{"a1", "a2", "a3"}));
  for (const std::string a : {"a1", "a2", "a3"}) {
    for (const std::string b : {"a1", "a2", "a3"}) {
      if (a != b) assert(HasEdge(graph, a, b));
    }
  }
}

void TestStarHubIsLowestIdUnlessPinned() {
  const auto agents = Nodes({"b", "c", "a"});

  const auto graph = BuildGraph(v1::TOPOLOGY_KIND_STAR, agents, "", TopologyOptions{});
  assert(graph.leader_id() == "a");
  assert(HasEdge(graph, "a", "b") && HasEdge(graph, "b", "a"));
  assert(HasEdge(graph, "a", "c"));
  assert(!HasEdge(graph, "b", "c"));

  const auto pinned = BuildGraph(v1::TOPOLOGY_KIND_STAR, agents, "c", TopologyOptions{});
  assert(pinned.leader_id() == "c");
  assert(Peers(pinned, "c").size() == 2);
  assert(!HasEdge(pinned, "a", "b"));
}

void TestRingLinksSuccessorsInIdOrder() {
  const auto graph = BuildGraph(v1::TOPOLOGY_KIND_RING, Nodes({"r3", "r1", "r2"}), "", TopologyOptions{});

  assert(Peers(graph, "r1") == std::vector<std::string>{"r2"});
  assert(Peers(graph, "r2") == std::vector<std::string>{"r3"});
  assert(Peers(graph, "r3") == std::vector<std::string>{"r1"});

  const auto single = BuildGraph(v1::TOPOLOGY_KIND_RING, Nodes({"solo"}), "", TopologyOptions{});
  assert(VertexSet(single) == std::set<std::string>{"solo"});
  assert(Peers(single, "solo").empty());
}

void TestHierarchicalTreeRootedAtLeader() {
  TopologyOptions options;
  options.hierarchical_branching_factor = 2;

  const auto graph = BuildGraph(v1::TOPOLOGY_KIND_HIERARCHICAL, Nodes({"a1", "a2", "a3", "a4", "a5"}), "", options);

  assert(graph.leader_id() == "a1");
  // root takes a2,a3; a2 takes a4,a5
  assert(HasEdge(graph, "a1", "a2") && HasEdge(graph, "a1", "a3"));
  assert(HasEdge(graph, "a2", "a4") && HasEdge(graph, "a2", "a5"));
  assert(!HasEdge(graph, "a1", "a4"));
  assert(!HasEdge(graph, "a3", "a4"));
}

void TestHierarchicalNeedsEligibleLeader() {
  std::vector<AgentNode> agents{{"a1", false}, {"a2", false}};

  bool threw = false;
  try {
    BuildGraph(v1::TOPOLOGY_KIND_HIERARCHICAL, agents, "", TopologyOptions{});
  } catch (const swarm::util::TopologyTransitionError&) {
    threw = true;
  }
  assert(threw);

  agents[1].leader_eligible = true;
  const auto graph = BuildGraph(v1::TOPOLOGY_KIND_HIERARCHICAL, agents, "", TopologyOptions{});
  assert(graph.leader_id() == "a2");
}

void TestUnknownPinIsRejected() {
  bool threw = false;
  try {
    BuildGraph(v1::TOPOLOGY_KIND_STAR, Nodes({"a1", "a2"}), "ghost", TopologyOptions{});
  } catch (const swarm::util::TopologyTransitionError&) {
    threw = true;
  }
  assert(threw);
}

void TestAdaptiveFollowsAgentCount() {
  TopologyOptions options;
  options.adaptive_mesh_max_agents = 2;
  options.adaptive_star_max_agents = 4;

  auto small = BuildGraph(v1::TOPOLOGY_KIND_ADAPTIVE, Nodes({"a", "b"}), "", options);
  assert(small.kind() == v1::TOPOLOGY_KIND_ADAPTIVE);
  assert(small.effective_kind() == v1::TOPOLOGY_KIND_MESH);

  auto medium = BuildGraph(v1::TOPOLOGY_KIND_ADAPTIVE, Nodes({"a", "b", "c"}), "", options);
  assert(medium.effective_kind() == v1::TOPOLOGY_KIND_STAR);
  assert(medium.leader_id() == "a");

  auto large = BuildGraph(v1::TOPOLOGY_KIND_ADAPTIVE, Nodes({"a", "b", "c", "d", "e"}), "", options);
  assert(large.effective_kind() == v1::TOPOLOGY_KIND_HIERARCHICAL);

  auto forced = BuildGraph(v1::TOPOLOGY_KIND_ADAPTIVE, Nodes({"a", "b"}), "", options, v1::TOPOLOGY_KIND_STAR);
  assert(forced.effective_kind() == v1::TOPOLOGY_KIND_STAR);
}

void TestSameInputsGiveSameGraph() {
  const auto a = BuildGraph(v1::TOPOLOGY_KIND_HIERARCHICAL, Nodes({"x", "y", "z", "w"}), "", TopologyOptions{});
  const auto b = BuildGraph(v1::TOPOLOGY_KIND_HIERARCHICAL, Nodes({"w", "z", "y", "x"}), "", TopologyOptions{});
  assert(a.SerializeAsString() == b.SerializeAsString());
}

void TestUnsupportedKindIsRejected() {
  bool threw = false;
  try {
    BuildGraph(v1::TOPOLOGY_KIND_UNSPECIFIED, Nodes({"a"}), "", TopologyOptions{});
  } catch (const swarm::util::TopologyTransitionError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMeshConnectsEveryPair();
  TestStarHubIsLowestIdUnlessPinned();
  TestRingLinksSuccessorsInIdOrder();
  TestHierarchicalTreeRootedAtLeader();
  TestHierarchicalNeedsEligibleLeader();
  TestUnknownPinIsRejected();
  TestAdaptiveFollowsAgentCount();
  TestSameInputsGiveSameGraph();
  TestUnsupportedKindIsRejected();

  std::cout << "swarm_engine_unit_topology_graph: pass\n";
  return 0;
}
