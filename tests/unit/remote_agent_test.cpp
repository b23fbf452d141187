#include "internal/agent/remote_agent.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1 = swarm::engine::v1;

using namespace std::chrono_literals;

using swarm::agent::RemoteAgentHandle;

v1::Ballot MakeBallot(const std::string& proposal_id, uint32_t round, std::chrono::milliseconds timeout) {
  v1::Ballot ballot;
  ballot.set_proposal_id(proposal_id);
  ballot.set_text("deploy");
  ballot.set_round(round);
  ballot.set_deadline_ms(swarm::util::NowMillis() + static_cast<uint64_t>(timeout.count()));
  return ballot;
}

void TestProbeFollowsHeartbeat() {
  RemoteAgentHandle agent("a1", 50ms);
  assert(agent.Probe(10ms).reachable);

  std::this_thread::sleep_for(80ms);
  assert(!agent.Probe(10ms).reachable);
  assert(!agent.Restart());

  agent.RecordHeartbeat(7);
  auto probe = agent.Probe(10ms);
  assert(probe.reachable);
  assert(probe.latency_ms == 7);
  assert(agent.Restart());
}

void TestVoteDeliveredThroughPendingBallot() {
  RemoteAgentHandle agent("a1", 1s);

  std::optional<v1::Vote> vote;
  std::thread             voter([&] { vote = agent.CastVote(MakeBallot("p1", 1, 2s)); });

  // the agent sees the ballot on its next heartbeat
  std::vector<v1::Ballot> pending;
  for (int i = 0; i < 100 && pending.empty(); ++i) {
    std::this_thread::sleep_for(5ms);
    pending = agent.PendingBallots();
  }
  assert(pending.size() == 1);
  assert(pending[0].proposal_id() == "p1");

  assert(!agent.SubmitVote("p1", 2, v1::VOTE_YES));
  assert(agent.SubmitVote("p1", 1, v1::VOTE_NO));
  voter.join();

  assert(vote == v1::VOTE_NO);
  assert(agent.PendingBallots().empty());

  // the ballot closed with the vote
  assert(!agent.SubmitVote("p1", 1, v1::VOTE_YES));
}

void TestUnansweredBallotExpires() {
  RemoteAgentHandle agent("a1", 1s);

  const auto started = swarm::util::Now();
  auto       vote    = agent.CastVote(MakeBallot("p2", 1, 60ms));
  assert(!vote.has_value());
  assert(swarm::util::Now() - started >= 50ms);
  assert(!agent.SubmitVote("p2", 1, v1::VOTE_YES));
}

void TestWithdrawnBallotReleasesVoter() {
  RemoteAgentHandle agent("a1", 1s);
  const auto        ballot = MakeBallot("p3", 1, 5s);

  std::optional<v1::Vote> vote = v1::VOTE_YES;
  const auto              started = swarm::util::Now();
  std::thread             voter([&] { vote = agent.CastVote(ballot); });

  for (int i = 0; i < 100 && agent.PendingBallots().empty(); ++i) {
    std::this_thread::sleep_for(5ms);
  }
  assert(agent.PendingBallots().size() == 1);

  agent.WithdrawBallot(ballot);
  voter.join();

  assert(!vote.has_value());
  assert(swarm::util::Now() - started < 2s);
  assert(agent.PendingBallots().empty());
  assert(!agent.SubmitVote("p3", 1, v1::VOTE_YES));

  // withdrawn before the voter thread got to it
  const auto late = MakeBallot("p4", 1, 5s);
  agent.WithdrawBallot(late);
  const auto late_started = swarm::util::Now();
  assert(!agent.CastVote(late).has_value());
  assert(swarm::util::Now() - late_started < 1s);

  // the next round of the same proposal is unaffected
  std::optional<v1::Vote> next;
  std::thread             next_voter([&] { next = agent.CastVote(MakeBallot("p4", 2, 2s)); });
  bool                    delivered = false;
  for (int i = 0; i < 100 && !delivered; ++i) {
    std::this_thread::sleep_for(5ms);
    delivered = agent.SubmitVote("p4", 2, v1::VOTE_NO);
  }
  next_voter.join();
  assert(delivered);
  assert(next == v1::VOTE_NO);
}

void TestExecuteIsNotDispatchedByEngine() {
  RemoteAgentHandle agent("a1", 1s);

  bool threw = false;
  try {
    agent.Execute(swarm::agent::TaskRequest{"t1", "payload"});
  } catch (const swarm::util::AgentUnreachable&) {
    threw = true;
  }
  assert(threw);
}

void TestDirectoryResolvesRemoteHandles() {
  swarm::agent::RemoteAgentDirectory directory(1s);

  v1::AgentSpec spec;
  spec.set_agent_id("worker-7");
  auto handle = directory.Resolve("s1", spec);
  assert(handle->Id() == "worker-7");
  assert(std::dynamic_pointer_cast<RemoteAgentHandle>(handle) != nullptr);
}

} // namespace

int main() {
  TestProbeFollowsHeartbeat();
  TestVoteDeliveredThroughPendingBallot();
  TestUnansweredBallotExpires();
  TestWithdrawnBallotReleasesVoter();
  TestExecuteIsNotDispatchedByEngine();
  TestDirectoryResolvesRemoteHandles();

  std::cout << "swarm_engine_unit_remote_agent: pass\n";
  return 0;
}
