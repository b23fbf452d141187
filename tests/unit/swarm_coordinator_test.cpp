#include "internal/core/swarm_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/state_store.hpp"
#include "internal/topology/topology_graph.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/fake_agent.hpp"

namespace {

namespace fs = std::filesystem;
namespace v1 = swarm::engine::v1;

using namespace std::chrono_literals;

using swarm::core::CoordinatorOptions;
using swarm::core::SwarmCoordinator;
using swarm::testing::FakeDirectory;
using swarm::testing::Spec;

/*
  Memory repository whose health snapshot appends can be made to fail
  and whose new-proposal writes can be stalled.
*/
class FlakyRepository final : public swarm::db::Repository {
 public:
  using Transaction = swarm::db::Transaction;
  using Result      = swarm::db::Result;

  void set_fail_health(bool fail) {
    fail_health_ = fail;
  }

  // stalls the write that registers a new proposal
  void set_pending_proposal_delay(std::chrono::milliseconds delay) {
    pending_proposal_delay_ms_ = delay.count();
  }

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertSession(Transaction& tx, const swarm::db::model::SessionRecord& r) override {
    return inner_.InsertSession(tx, r);
  }
  Result UpdateSession(Transaction& tx, const swarm::db::model::SessionRecord& r) override {
    return inner_.UpdateSession(tx, r);
  }
  std::optional<swarm::db::model::SessionRecord> GetSession(Transaction& tx, const std::string& id) override {
    return inner_.GetSession(tx, id);
  }
  std::vector<swarm::db::model::SessionRecord> ListSessions(Transaction& tx) override {
    return inner_.ListSessions(tx);
  }

  Result UpsertAgent(Transaction& tx, const swarm::db::model::AgentRecord& r) override {
    return inner_.UpsertAgent(tx, r);
  }
  Result DeleteAgent(Transaction& tx, const std::string& session_id, const std::string& agent_id) override {
    return inner_.DeleteAgent(tx, session_id, agent_id);
  }
  std::vector<swarm::db::model::AgentRecord> ListAgents(Transaction& tx, const std::string& session_id) override {
    return inner_.ListAgents(tx, session_id);
  }

  Result SaveTopology(Transaction& tx, const swarm::db::model::TopologyRecord& r) override {
    return inner_.SaveTopology(tx, r);
  }
  std::optional<swarm::db::model::TopologyRecord> GetTopology(Transaction& tx, const std::string& session_id) override {
    return inner_.GetTopology(tx, session_id);
  }

  Result AppendTaskMetric(Transaction& tx, const v1::TaskMetric& m) override {
    return inner_.AppendTaskMetric(tx, m);
  }
  std::vector<v1::TaskMetric> ListRecentTaskMetrics(Transaction& tx, const std::string& session_id, std::size_t limit) override {
    return inner_.ListRecentTaskMetrics(tx, session_id, limit);
  }
  Result AppendHealthSnapshot(Transaction& tx, const v1::HealthSnapshot& s) override {
    if (fail_health_) return Result::Err(swarm::db::ErrorCode::IOError, "disk full");
    return inner_.AppendHealthSnapshot(tx, s);
  }
  std::vector<v1::HealthSnapshot> ListRecentHealthSnapshots(Transaction& tx, const std::string& session_id,
                                                            const std::string& agent_id, std::size_t limit) override {
    return inner_.ListRecentHealthSnapshots(tx, session_id, agent_id, limit);
  }
  Result DeleteTaskMetricsBefore(Transaction& tx, uint64_t cutoff_ms) override {
    return inner_.DeleteTaskMetricsBefore(tx, cutoff_ms);
  }
  Result DeleteHealthSnapshotsBefore(Transaction& tx, uint64_t cutoff_ms) override {
    return inner_.DeleteHealthSnapshotsBefore(tx, cutoff_ms);
  }

  Result AppendHealingAction(Transaction& tx, const v1::HealingAction& a) override {
    return inner_.AppendHealingAction(tx, a);
  }
  std::vector<v1::HealingAction> ListRecentHealingActions(Transaction& tx, const std::string& session_id, std::size_t limit) override {
    return inner_.ListRecentHealingActions(tx, session_id, limit);
  }

  Result UpsertProposal(Transaction& tx, const v1::ConsensusProposal& p) override {
    if (p.outcome() == v1::OUTCOME_PENDING) {
      const auto delay = std::chrono::milliseconds(pending_proposal_delay_ms_.load());
      if (delay.count() > 0) std::this_thread::sleep_for(delay);
    }
    return inner_.UpsertProposal(tx, p);
  }
  std::optional<v1::ConsensusProposal> GetProposal(Transaction& tx, const std::string& proposal_id) override {
    return inner_.GetProposal(tx, proposal_id);
  }
  std::vector<v1::ConsensusProposal> ListRecentProposals(Transaction& tx, const std::string& session_id, std::size_t limit,
                                                         bool decided_only) override {
    return inner_.ListRecentProposals(tx, session_id, limit, decided_only);
  }

 private:
  swarm::db::memory::MemoryRepository inner_;
  std::atomic<bool>                   fail_health_{false};
  std::atomic<int64_t>                pending_proposal_delay_ms_{0};
};

struct Harness {
  explicit Harness(CoordinatorOptions options = Options())
      : repository(std::make_shared<FlakyRepository>()),
        store(std::make_shared<swarm::state::StateStore>(repository)),
        directory(std::make_shared<FakeDirectory>()),
        coordinator(std::move(options), store, directory) {
  }

  static CoordinatorOptions Options() {
    CoordinatorOptions options;
    // iterations only run through SyncNow
    options.session.sync_interval = 0ms;
    return options;
  }

  std::shared_ptr<FlakyRepository>          repository;
  std::shared_ptr<swarm::state::StateStore> store;
  std::shared_ptr<FakeDirectory>            directory;
  SwarmCoordinator                          coordinator;
};

std::vector<v1::AgentSpec> Agents(std::initializer_list<std::string> ids) {
  std::vector<v1::AgentSpec> out;
  for (const auto& id : ids) out.push_back(Spec(id));
  return out;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

const v1::AgentStatus* FindAgent(const v1::SessionStatus& status, const std::string& agent_id) {
  for (const auto& agent : status.agents()) {
    if (agent.agent_id() == agent_id) return &agent;
  }
  return nullptr;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream     in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// ------------------------------------------------------------------

void TestMeshSessionStartsHealthy() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2", "a3"}));

  auto status = h.coordinator.GetStatus(session_id);
  assert(status.state() == v1::SESSION_STATE_ACTIVE);
  assert(!status.degraded());
  assert(status.agents_size() == 3);
  for (const auto& agent : status.agents()) assert(agent.state() == v1::AGENT_STATE_HEALTHY);

  const auto& graph = status.topology();
  assert(graph.kind() == v1::TOPOLOGY_KIND_MESH);
  for (const std::string a : {"a1", "a2", "a3"}) {
    for (const std::string b : {"a1", "a2", "a3"}) {
      if (a != b) assert(swarm::topology::HasEdge(graph, a, b));
    }
  }

  assert(h.coordinator.ListSessions() == std::vector<std::string>{session_id});
}

void TestQuorumApprovesMajority() {
  Harness h;
  h.directory->Get("a3")->set_vote(v1::VOTE_NO);
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2", "a3"}));

  auto proposal = h.coordinator.RequestConsensus(session_id, "deploy", 5s);
  assert(proposal.outcome() == v1::OUTCOME_APPROVED);
  assert(proposal.votes().at("a3") == v1::VOTE_NO);
  assert(proposal.text() == "deploy");

  auto history = h.coordinator.GetConsensusHistory(session_id, 10);
  assert(history.size() == 1);
  assert(history[0].proposal_id() == proposal.proposal_id());
  assert(history[0].outcome() == v1::OUTCOME_APPROVED);

  assert(h.coordinator.GetStatus(session_id).open_proposals_size() == 0);
}

void TestRaftNeedsLeader() {
  Harness h;
  const auto mesh = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_RAFT, Agents({"a1", "a2", "a3"}));

  assert(Throws<swarm::util::NoLeaderAvailable>([&] { h.coordinator.RequestConsensus(mesh, "deploy", 5s); }));
  // nothing was recorded for the refused request
  assert(h.coordinator.GetConsensusHistory(mesh, 10).empty());

  const auto star = h.coordinator.InitSession(v1::TOPOLOGY_KIND_STAR, v1::CONSENSUS_ALGORITHM_RAFT, Agents({"b1", "b2", "b3"}));
  auto       proposal = h.coordinator.RequestConsensus(star, "deploy", 5s);
  assert(proposal.outcome() == v1::OUTCOME_APPROVED);
}

void TestUnreachableAgentIsRestarted() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2", "a3"}));

  h.directory->Get("a2")->set_reachable(false);

  h.coordinator.SyncNow(session_id);
  assert(FindAgent(h.coordinator.GetStatus(session_id), "a2")->state() == v1::AGENT_STATE_DEGRADED);
  h.coordinator.SyncNow(session_id);
  h.coordinator.SyncNow(session_id);
  assert(FindAgent(h.coordinator.GetStatus(session_id), "a2")->state() == v1::AGENT_STATE_UNREACHABLE);
  assert(FindAgent(h.coordinator.GetStatus(session_id), "a1")->state() == v1::AGENT_STATE_HEALTHY);

  // the fake comes back reachable once restarted
  h.coordinator.SyncNow(session_id);
  assert(h.directory->Get("a2")->restarts() == 1);
  assert(FindAgent(h.coordinator.GetStatus(session_id), "a2")->state() == v1::AGENT_STATE_HEALTHY);

  auto history = h.coordinator.GetHealingHistory(session_id, 10);
  bool restarted = false;
  for (const auto& action : history) {
    if (action.kind() == v1::HEALING_ACTION_KIND_RESTART_AGENT && action.agent_id() == "a2") restarted = action.success();
  }
  assert(restarted);
}

void TestFailedRestartsRemoveAgent() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2", "a3"}));

  auto a3 = h.directory->Get("a3");
  a3->set_reachable(false);
  a3->set_restart_succeeds(false);

  // 3 misses, then 3 failed restarts
  for (int i = 0; i < 6; ++i) h.coordinator.SyncNow(session_id);

  auto status = h.coordinator.GetStatus(session_id);
  assert(FindAgent(status, "a3") == nullptr);
  assert(status.agents_size() == 2);
  assert(swarm::topology::VertexSet(status.topology()) == (std::set<std::string>{"a1", "a2"}));
  assert(a3->restarts() == 3);
}

void TestHierarchicalSwitchAssignsLowestLeader() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a3", "a1", "a2"}));

  auto graph = h.coordinator.SwitchTopology(session_id, v1::TOPOLOGY_KIND_HIERARCHICAL);
  assert(graph.kind() == v1::TOPOLOGY_KIND_HIERARCHICAL);
  assert(graph.leader_id() == "a1");
  assert(swarm::topology::HasEdge(graph, "a1", "a2"));
  assert(swarm::topology::HasEdge(graph, "a1", "a3"));
  assert(graph.version() == 2);

  assert(h.coordinator.GetStatus(session_id).topology().leader_id() == "a1");
  assert(Throws<swarm::util::InvalidConfig>([&] { h.coordinator.SwitchTopology(session_id, v1::TOPOLOGY_KIND_UNSPECIFIED); }));
}

void TestInvalidSessionsAreRejected() {
  auto options       = Harness::Options();
  options.max_agents = 3;
  Harness h(options);

  auto& c = h.coordinator;
  assert(Throws<swarm::util::InvalidConfig>([&] { c.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, {}); }));
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { c.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2", "a3", "a4"})); }));
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { c.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a1"})); }));
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { c.InitSession(v1::TOPOLOGY_KIND_STAR, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2"}), "zz"); }));
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { c.InitSession(static_cast<v1::TopologyKind>(42), v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1"})); }));
  assert(Throws<swarm::util::InvalidConfig>([&] { c.InitSession(v1::TOPOLOGY_KIND_MESH, static_cast<v1::ConsensusAlgorithm>(42), Agents({"a1"})); }));
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { c.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, {Spec("a1", -1.0)}); }));

  // hierarchical with nobody eligible to lead
  auto ineligible = Agents({"a1", "a2"});
  for (auto& spec : ineligible) spec.set_leader_eligible(false);
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { c.InitSession(v1::TOPOLOGY_KIND_HIERARCHICAL, v1::CONSENSUS_ALGORITHM_QUORUM, ineligible); }));

  assert(c.ListSessions().empty());

  // UNSPECIFIED picks the defaults
  const auto session_id = c.InitSession(v1::TOPOLOGY_KIND_UNSPECIFIED, v1::CONSENSUS_ALGORITHM_UNSPECIFIED, Agents({"a1"}));
  auto       status     = c.GetStatus(session_id);
  assert(status.topology().kind() == v1::TOPOLOGY_KIND_MESH);
  assert(status.consensus_algorithm() == v1::CONSENSUS_ALGORITHM_QUORUM);
}

void TestSessionLimit() {
  auto options         = Harness::Options();
  options.max_sessions = 1;
  Harness h(options);

  const auto first = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1"}));
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"b1"})); }));

  h.coordinator.CloseSession(first);
  h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"b1"}));
}

void TestCloseIsIdempotent() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_RING, v1::CONSENSUS_ALGORITHM_CRDT, Agents({"a1", "a2"}));
  h.coordinator.RequestConsensus(session_id, "merge", 2s);

  h.coordinator.CloseSession(session_id);
  h.coordinator.CloseSession(session_id);

  assert(h.store->LoadSession(session_id)->status == v1::SESSION_STATE_CLOSED);
  assert(h.coordinator.ListSessions().empty());
  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.GetStatus(session_id); }));
  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.RequestConsensus(session_id, "again", 1s); }));

  // history outlives the session
  assert(h.coordinator.GetConsensusHistory(session_id, 10).size() == 1);

  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.CloseSession("nope"); }));
  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.GetStatus("nope"); }));
  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.GetHealingHistory("nope", 10); }));
}

void TestCloseDuringConsensusTimesOut() {
  // closed while the proposal is still being registered
  {
    Harness h;
    const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2", "a3"}));
    h.repository->set_pending_proposal_delay(300ms);

    v1::ConsensusProposal decided;
    std::thread           requester([&] { decided = h.coordinator.RequestConsensus(session_id, "deploy", 5s); });
    std::this_thread::sleep_for(100ms);
    h.coordinator.CloseSession(session_id);
    requester.join();

    assert(decided.outcome() == v1::OUTCOME_TIMEOUT);
    assert(h.store->LoadProposal(decided.proposal_id())->outcome() == v1::OUTCOME_TIMEOUT);
    assert(h.store->LoadSession(session_id)->status == v1::SESSION_STATE_CLOSED);
  }

  // closed while ballots are out
  {
    Harness h;
    for (const std::string id : {"a1", "a2", "a3"}) h.directory->Get(id)->set_vote_delay(2s);
    const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2", "a3"}));

    const auto            started = swarm::util::Now();
    v1::ConsensusProposal decided;
    std::thread           requester([&] { decided = h.coordinator.RequestConsensus(session_id, "deploy", 5s); });
    std::this_thread::sleep_for(100ms);
    h.coordinator.CloseSession(session_id);
    requester.join();

    assert(decided.outcome() == v1::OUTCOME_TIMEOUT);
    assert(swarm::util::Now() - started < 1500ms);
  }
}

void TestConsensusHistoryListsDecidedOnly() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2"}));

  auto first  = h.coordinator.RequestConsensus(session_id, "one", 2s);
  auto second = h.coordinator.RequestConsensus(session_id, "two", 2s);

  // a newer proposal still waiting for votes
  v1::ConsensusProposal open;
  open.set_proposal_id("prop-open");
  open.set_session_id(session_id);
  open.set_text("three");
  open.set_algorithm(v1::CONSENSUS_ALGORITHM_QUORUM);
  open.set_outcome(v1::OUTCOME_PENDING);
  open.set_created_at_ms(second.created_at_ms() + 1000);
  h.store->SaveProposal(open);

  auto history = h.coordinator.GetConsensusHistory(session_id, 2);
  assert(history.size() == 2);
  assert(history[0].proposal_id() == second.proposal_id());
  assert(history[1].proposal_id() == first.proposal_id());
}

void TestAgentChurn() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2"}));

  auto graph = h.coordinator.RegisterAgent(session_id, Spec("a3"));
  assert(swarm::topology::HasEdge(graph, "a3", "a1"));
  assert(graph.version() == 2);
  assert(h.coordinator.GetStatus(session_id).agents_size() == 3);
  assert(Throws<swarm::util::InvalidConfig>([&] { h.coordinator.RegisterAgent(session_id, Spec("a3")); }));

  graph = h.coordinator.DeregisterAgent(session_id, "a1");
  assert(!swarm::topology::VertexSet(graph).contains("a1"));
  assert(h.store->LoadAgents(session_id).size() == 2);
  assert(Throws<swarm::util::InvalidConfig>([&] { h.coordinator.DeregisterAgent(session_id, "a1"); }));

  h.coordinator.DeregisterAgent(session_id, "a2");
  assert(Throws<swarm::util::TopologyTransitionError>([&] { h.coordinator.DeregisterAgent(session_id, "a3"); }));
  assert(h.coordinator.GetStatus(session_id).agents_size() == 1);
}

void TestTaskHooksFeedStatus() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2"}));

  h.coordinator.OnTaskStart(session_id, "a1", "t1");
  h.coordinator.OnTaskEnd(session_id, "a1", "t1", 40, v1::TASK_RESULT_SUCCESS);
  h.coordinator.OnTaskEnd(session_id, "a2", "t2", 90, v1::TASK_RESULT_FAILURE);

  auto status = h.coordinator.GetStatus(session_id);
  assert(status.recent_metrics_size() == 2);
  std::set<std::string> tasks;
  for (const auto& metric : status.recent_metrics()) tasks.insert(metric.task_id());
  assert(tasks == (std::set<std::string>{"t1", "t2"}));

  assert(Throws<swarm::util::InvalidConfig>([&] { h.coordinator.OnTaskStart(session_id, "ghost", "t3"); }));
  assert(Throws<swarm::util::InvalidConfig>(
      [&] { h.coordinator.OnTaskEnd(session_id, "a1", "t3", 1, v1::TASK_RESULT_UNSPECIFIED); }));
  assert(Throws<swarm::util::SessionNotFound>(
      [&] { h.coordinator.OnTaskEnd("nope", "a1", "t3", 1, v1::TASK_RESULT_SUCCESS); }));

  // closing releases the session's per-agent timestamp floor
  h.coordinator.CloseSession(session_id);
  v1::TaskMetric late;
  late.set_session_id(session_id);
  late.set_agent_id("a1");
  late.set_task_id("t9");
  late.set_result(v1::TASK_RESULT_SUCCESS);
  late.set_timestamp_ms(1);
  assert(h.store->AppendMetric(late).timestamp_ms() == 1);
  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.OnTaskStart(session_id, "a1", "t10"); }));
}

void TestInProcessAgentsIgnoreRemoteCalls() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1"}));

  assert(h.coordinator.Heartbeat(session_id, "a1", 3).empty());
  assert(h.coordinator.GetStatus(session_id).agents(0).last_heartbeat_at_ms() > 0);
  assert(!h.coordinator.SubmitVote(session_id, "a1", "p1", 1, v1::VOTE_YES));

  assert(Throws<swarm::util::InvalidConfig>([&] { h.coordinator.Heartbeat(session_id, "ghost", 3); }));
  assert(Throws<swarm::util::InvalidConfig>([&] { h.coordinator.SubmitVote(session_id, "a1", "p1", 1, v1::VOTE_UNSPECIFIED); }));
  assert(Throws<swarm::util::InvalidConfig>([&] { h.coordinator.SubmitVote(session_id, "ghost", "p1", 1, v1::VOTE_YES); }));
}

void TestRetentionDropsOldMetrics() {
  auto options                 = Harness::Options();
  options.task_metrics_max_age = 1s;
  Harness h(options);
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1"}));

  h.coordinator.OnTaskEnd(session_id, "a1", "t1", 5, v1::TASK_RESULT_SUCCESS);

  h.coordinator.RunRetention(swarm::util::NowMillis());
  assert(h.coordinator.GetStatus(session_id).recent_metrics_size() == 1);

  h.coordinator.RunRetention(swarm::util::NowMillis() + 10000);
  assert(h.coordinator.GetStatus(session_id).recent_metrics_size() == 0);
}

void TestStoreFailureDegradesSession() {
  Harness h;
  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1", "a2"}));

  h.repository->set_fail_health(true);
  assert(Throws<swarm::util::StoreError>([&] { h.coordinator.SyncNow(session_id); }));

  auto status = h.coordinator.GetStatus(session_id);
  assert(status.degraded());
  assert(status.state() == v1::SESSION_STATE_CLOSED);
  assert(!status.failure_reason().empty());
  assert(status.agents_size() == 2);

  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.RequestConsensus(session_id, "deploy", 1s); }));
  assert(Throws<swarm::util::SessionNotFound>([&] { h.coordinator.SwitchTopology(session_id, v1::TOPOLOGY_KIND_STAR); }));

  auto stored = h.store->LoadSession(session_id);
  assert(stored->status == v1::SESSION_STATE_CLOSED);
  assert(stored->failure_reason == status.failure_reason());

  h.coordinator.CloseSession(session_id);
  assert(h.coordinator.ListSessions().empty());
}

void TestSessionFileTracksLifecycle() {
  const auto dir = fs::temp_directory_path() / swarm::util::GenerateId("swarm_coordinator_");

  auto options              = Harness::Options();
  options.session.state_dir = dir;
  Harness h(options);

  const auto session_id = h.coordinator.InitSession(v1::TOPOLOGY_KIND_STAR, v1::CONSENSUS_ALGORITHM_WEIGHTED, Agents({"a1", "a2"}));
  const auto path       = dir / (session_id + ".json");

  auto json = ReadFile(path);
  assert(json.find("\"star\"") != std::string::npos);
  assert(json.find("\"weighted\"") != std::string::npos);
  assert(json.find("\"ACTIVE\"") != std::string::npos);
  assert(json.find("\"a2\"") != std::string::npos);

  h.coordinator.CloseSession(session_id);
  json = ReadFile(path);
  assert(json.find("\"CLOSED\"") != std::string::npos);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestCloseAllStopsEverySession() {
  Harness h;
  h.coordinator.InitSession(v1::TOPOLOGY_KIND_MESH, v1::CONSENSUS_ALGORITHM_QUORUM, Agents({"a1"}));
  h.coordinator.InitSession(v1::TOPOLOGY_KIND_RING, v1::CONSENSUS_ALGORITHM_GOSSIP, Agents({"b1", "b2"}));
  assert(h.coordinator.ListSessions().size() == 2);

  h.coordinator.CloseAll();
  assert(h.coordinator.ListSessions().empty());
  for (const auto& session : h.store->ListSessions()) assert(session.status == v1::SESSION_STATE_CLOSED);
}

} // namespace

int main() {
  TestMeshSessionStartsHealthy();
  TestQuorumApprovesMajority();
  TestRaftNeedsLeader();
  TestUnreachableAgentIsRestarted();
  TestFailedRestartsRemoveAgent();
  TestHierarchicalSwitchAssignsLowestLeader();
  TestInvalidSessionsAreRejected();
  TestSessionLimit();
  TestCloseIsIdempotent();
  TestCloseDuringConsensusTimesOut();
  TestConsensusHistoryListsDecidedOnly();
  TestAgentChurn();
  TestTaskHooksFeedStatus();
  TestInProcessAgentsIgnoreRemoteCalls();
  TestRetentionDropsOldMetrics();
  TestStoreFailureDegradesSession();
  TestSessionFileTracksLifecycle();
  TestCloseAllStopsEverySession();

  std::cout << "swarm_engine_unit_swarm_coordinator: pass\n";
  return 0;
}
