#include "internal/topology/topology_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = swarm::engine::v1;

using swarm::topology::AgentNode;
using swarm::topology::TopologyManager;
using swarm::topology::TopologyOptions;
using swarm::topology::VertexSet;

std::shared_ptr<swarm::state::StateStore> MakeStore(const std::string& session_id) {
  auto store = std::make_shared<swarm::state::StateStore>(std::make_shared<swarm::db::memory::MemoryRepository>());

  swarm::db::model::SessionRecord session;
  session.session_id = session_id;
  session.topology   = v1::TOPOLOGY_KIND_MESH;
  session.status     = v1::SESSION_STATE_ACTIVE;
  store->SaveSession(session);
  return store;
}

std::vector<AgentNode> Nodes(const std::vector<std::string>& ids) {
  std::vector<AgentNode> out;
  for (const auto& id : ids) out.push_back(AgentNode{id, true});
  return out;
}

void TestTransitionKeepsVertexSetAndBumpsVersion() {
  auto            store = MakeStore("s1");
  TopologyManager manager("s1", TopologyOptions{}, store);

  auto first = manager.Initialize(v1::TOPOLOGY_KIND_MESH, Nodes({"a1", "a2", "a3"}), "");
  assert(first->version() == 1);

  auto star = manager.TransitionTo(v1::TOPOLOGY_KIND_STAR);
  assert(star->version() == 2);
  assert(VertexSet(*star) == VertexSet(*first));
  assert(star->leader_id() == "a1");

  // readers holding the old pointer keep their snapshot
  assert(first->kind() == v1::TOPOLOGY_KIND_MESH);
  assert(manager.Current()->kind() == v1::TOPOLOGY_KIND_STAR);

  auto persisted = store->LoadTopology("s1");
  assert(persisted.has_value());
  assert(persisted->version() == 2);
  assert(persisted->kind() == v1::TOPOLOGY_KIND_STAR);
}

void TestFailedTransitionKeepsPriorGraph() {
  auto            store = MakeStore("s2");
  TopologyManager manager("s2", TopologyOptions{}, store);

  std::vector<AgentNode> agents{{"a1", false}, {"a2", false}};
  manager.Initialize(v1::TOPOLOGY_KIND_RING, agents, "");

  bool threw = false;
  try {
    manager.TransitionTo(v1::TOPOLOGY_KIND_HIERARCHICAL);
  } catch (const swarm::util::TopologyTransitionError&) {
    threw = true;
  }
  assert(threw);
  assert(manager.Current()->kind() == v1::TOPOLOGY_KIND_RING);
  assert(manager.Current()->version() == 1);
}

void TestAddAndRemoveAgent() {
  auto            store = MakeStore("s3");
  TopologyManager manager("s3", TopologyOptions{}, store);
  manager.Initialize(v1::TOPOLOGY_KIND_STAR, Nodes({"b", "c"}), "");

  auto grown = manager.AddAgent(AgentNode{"a", true});
  assert(VertexSet(*grown).size() == 3);
  assert(grown->leader_id() == "a");

  auto shrunk = manager.RemoveAgent("a", true);
  assert(VertexSet(*shrunk).size() == 2);
  assert(shrunk->leader_id() == "b");
  assert(shrunk->version() == 3);

  bool threw = false;
  try {
    manager.RemoveAgent("ghost", true);
  } catch (const swarm::util::TopologyTransitionError&) {
    threw = true;
  }
  assert(threw);
}

void TestStrictRemovalRefusesLastAgent() {
  auto            store = MakeStore("s4");
  TopologyManager manager("s4", TopologyOptions{}, store);
  manager.Initialize(v1::TOPOLOGY_KIND_MESH, Nodes({"only"}), "");

  bool threw = false;
  try {
    manager.RemoveAgent("only", true);
  } catch (const swarm::util::TopologyTransitionError&) {
    threw = true;
  }
  assert(threw);
  assert(VertexSet(*manager.Current()).size() == 1);
}

void TestHealerRemovalFallsBackToMesh() {
  auto            store = MakeStore("s5");
  TopologyManager manager("s5", TopologyOptions{}, store);

  std::vector<AgentNode> agents{{"a1", true}, {"a2", false}, {"a3", false}};
  manager.Initialize(v1::TOPOLOGY_KIND_HIERARCHICAL, agents, "");
  assert(manager.Current()->leader_id() == "a1");

  // the only eligible leader goes away
  auto next = manager.RemoveAgent("a1", false);
  assert(next->kind() == v1::TOPOLOGY_KIND_MESH);
  assert(VertexSet(*next) == (std::set<std::string>{"a2", "a3"}));
}

void TestBottleneckRecommendations() {
  v1::TopologyGraph graph;

  graph.set_kind(v1::TOPOLOGY_KIND_MESH);
  assert(TopologyManager::RecommendForBottleneck(graph) == v1::TOPOLOGY_KIND_HIERARCHICAL);
  graph.set_kind(v1::TOPOLOGY_KIND_RING);
  assert(TopologyManager::RecommendForBottleneck(graph) == v1::TOPOLOGY_KIND_STAR);

  graph.set_kind(v1::TOPOLOGY_KIND_ADAPTIVE);
  graph.set_effective_kind(v1::TOPOLOGY_KIND_MESH);
  assert(TopologyManager::RecommendForBottleneck(graph) == v1::TOPOLOGY_KIND_STAR);
  graph.set_effective_kind(v1::TOPOLOGY_KIND_HIERARCHICAL);
  assert(!TopologyManager::RecommendForBottleneck(graph).has_value());
}

void TestAdaptiveBottleneckOverrideSurvivesChurn() {
  auto            store = MakeStore("s6");
  TopologyManager manager("s6", TopologyOptions{}, store);
  manager.Initialize(v1::TOPOLOGY_KIND_ADAPTIVE, Nodes({"a1", "a2", "a3"}), "");
  assert(manager.Current()->effective_kind() == v1::TOPOLOGY_KIND_MESH);

  auto switched = manager.SwitchForBottleneck();
  assert(switched.has_value());
  assert((*switched)->kind() == v1::TOPOLOGY_KIND_ADAPTIVE);
  assert((*switched)->effective_kind() == v1::TOPOLOGY_KIND_STAR);

  auto grown = manager.AddAgent(AgentNode{"a4", true});
  assert(grown->effective_kind() == v1::TOPOLOGY_KIND_STAR);

  // an explicit switch clears the override
  auto reset = manager.TransitionTo(v1::TOPOLOGY_KIND_ADAPTIVE);
  assert(reset->effective_kind() == v1::TOPOLOGY_KIND_MESH);
}

} // namespace

int main() {
  TestTransitionKeepsVertexSetAndBumpsVersion();
  TestFailedTransitionKeepsPriorGraph();
  TestAddAndRemoveAgent();
  TestStrictRemovalRefusesLastAgent();
  TestHealerRemovalFallsBackToMesh();
  TestBottleneckRecommendations();
  TestAdaptiveBottleneckOverrideSurvivesChurn();

  std::cout << "swarm_engine_unit_topology_manager: pass\n";
  return 0;
}
