#include "internal/state/snapshot_writer.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace fs = std::filesystem;
namespace v1 = swarm::engine::v1;

std::string ReadFile(const fs::path& path) {
  std::ifstream     in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

v1::SessionSnapshot MakeSnapshot(const std::string& status) {
  v1::SessionSnapshot snapshot;
  snapshot.set_session_id("s1");
  snapshot.set_topology("star");
  snapshot.set_consensus_algorithm("raft");
  snapshot.set_status(status);
  auto* agent = snapshot.add_agents();
  agent->set_id("a1");
  agent->set_state("healthy");
  return snapshot;
}

void TestWritesJsonFile(const fs::path& dir) {
  swarm::state::WriteSessionSnapshot(dir, MakeSnapshot("active"));

  const auto path = swarm::state::SessionSnapshotPath(dir, "s1");
  assert(path == dir / "s1.json");
  assert(fs::exists(path));
  assert(!fs::exists(dir / "s1.json.tmp"));

  const auto json = ReadFile(path);
  assert(json.find("\"session_id\"") != std::string::npos);
  assert(json.find("\"consensus_algorithm\": \"raft\"") != std::string::npos);
  assert(json.find("\"topology\": \"star\"") != std::string::npos);
  assert(json.find("\"healthy\"") != std::string::npos);
}

void TestRewriteReplacesContents(const fs::path& dir) {
  swarm::state::WriteSessionSnapshot(dir, MakeSnapshot("closed"));

  const auto json = ReadFile(swarm::state::SessionSnapshotPath(dir, "s1"));
  assert(json.find("\"closed\"") != std::string::npos);
  assert(json.find("\"active\"") == std::string::npos);
}

void TestUnwritableDirFails(const fs::path& dir) {
  // a regular file where the directory should be
  const auto blocker = dir / "blocker";
  std::ofstream(blocker) << "x";

  bool threw = false;
  try {
    swarm::state::WriteSessionSnapshot(blocker / "nested", MakeSnapshot("active"));
  } catch (const swarm::util::StoreError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  const auto dir = fs::temp_directory_path() / swarm::util::GenerateId("swarm_snapshot_");

  TestWritesJsonFile(dir);
  TestRewriteReplacesContents(dir);
  TestUnwritableDirFails(dir);

  std::error_code ec;
  fs::remove_all(dir, ec);

  std::cout << "swarm_engine_unit_snapshot_writer: pass\n";
  return 0;
}
