#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <sstream>

#include "internal/util/names.hpp"

namespace swarm::db::sqlite {

using swarm::db::ErrorCode;
using swarm::db::Result;

namespace v1 = swarm::engine::v1;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

static double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

// Tags never contain newlines (validated at registration).
static std::string JoinTags(const std::vector<std::string>& tags) {
  std::string out;
  for (std::size_t i = 0; i < tags.size(); ++i) {
    if (i) out += '\n';
    out += tags[i];
  }
  return out;
}

static std::vector<std::string> SplitTags(const std::string& joined) {
  std::vector<std::string> out;
  if (joined.empty()) return out;
  std::istringstream in(joined);
  std::string        tag;
  while (std::getline(in, tag)) {
    out.push_back(tag);
  }
  return out;
}

static v1::SessionState ParseSessionState(const std::string& s) {
  if (s == util::SessionStateName(v1::SESSION_STATE_ACTIVE)) return v1::SESSION_STATE_ACTIVE;
  if (s == util::SessionStateName(v1::SESSION_STATE_CLOSED)) return v1::SESSION_STATE_CLOSED;
  return v1::SESSION_STATE_UNSPECIFIED;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

static void BindSession(sqlite3_stmt* st, const model::SessionRecord& r) {
  BindText(st, 1, util::TopologyKindName(r.topology));
  BindText(st, 2, util::ConsensusAlgorithmName(r.consensus_algorithm));
  BindU64(st, 3, r.created_at_ms);
  if (r.closed_at_ms) {
    BindU64(st, 4, *r.closed_at_ms);
  } else {
    sqlite3_bind_null(st, 4);
  }
  BindText(st, 5, util::SessionStateName(r.status));
  BindText(st, 6, r.failure_reason);
  BindText(st, 7, r.pinned_leader_id);
  BindText(st, 8, r.session_id);
}

static model::SessionRecord ReadSession(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.session_id          = ColText(st, 0);
  r.topology            = util::ParseTopologyKind(ColText(st, 1)).value_or(v1::TOPOLOGY_KIND_UNSPECIFIED);
  r.consensus_algorithm = util::ParseConsensusAlgorithm(ColText(st, 2)).value_or(v1::CONSENSUS_ALGORITHM_UNSPECIFIED);
  r.created_at_ms       = ColU64(st, 3);
  if (sqlite3_column_type(st, 4) != SQLITE_NULL) r.closed_at_ms = ColU64(st, 4);
  r.status           = ParseSessionState(ColText(st, 5));
  r.failure_reason   = ColText(st, 6);
  r.pinned_leader_id = ColText(st, 7);
  return r;
}

static constexpr const char* kSessionColumns =
    "session_id,topology,consensus_algorithm,created_at_ms,closed_at_ms,status,failure_reason,pinned_leader_id";

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO sessions(topology,consensus_algorithm,created_at_ms,closed_at_ms,status,failure_reason,pinned_leader_id,session_id) "
      "VALUES(?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSession(st, r);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.session_id);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE sessions SET topology=?,consensus_algorithm=?,created_at_ms=?,closed_at_ms=?,status=?,failure_reason=?,pinned_leader_id=? "
      "WHERE session_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSession(st, r);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.session_id);
  return Translate(db, rc);
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& session_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE session_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, session_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadSession(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions ORDER BY session_id;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return {};

  std::vector<model::SessionRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadSession(st));
  }

  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO session_agents(session_id,agent_id,capability_tags,weight,leader_eligible,state,last_heartbeat_at_ms) "
      "VALUES(?,?,?,?,?,?,?) "
      "ON CONFLICT(session_id,agent_id) DO UPDATE SET capability_tags=excluded.capability_tags, weight=excluded.weight, "
      "leader_eligible=excluded.leader_eligible, state=excluded.state, last_heartbeat_at_ms=excluded.last_heartbeat_at_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.session_id);
  BindText(st, 2, r.agent_id);
  BindText(st, 3, JoinTags(r.capability_tags));
  BindDouble(st, 4, r.weight);
  BindI32(st, 5, r.leader_eligible ? 1 : 0);
  BindI32(st, 6, static_cast<int>(r.state));
  BindU64(st, 7, r.last_heartbeat_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteRepository::DeleteAgent(Transaction& t, const std::string& session_id, const std::string& agent_id) {
  auto* db = TX(t).Handle();

  const char* sql = "DELETE FROM session_agents WHERE session_id=? AND agent_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, session_id);
  BindText(st, 2, agent_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, agent_id);
  return Translate(db, rc);
}

std::vector<model::AgentRecord> SqliteRepository::ListAgents(Transaction& t, const std::string& session_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT session_id,agent_id,capability_tags,weight,leader_eligible,state,last_heartbeat_at_ms "
      "FROM session_agents WHERE session_id=? ORDER BY agent_id;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindText(st, 1, session_id);

  std::vector<model::AgentRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    model::AgentRecord r;
    r.session_id           = ColText(st, 0);
    r.agent_id             = ColText(st, 1);
    r.capability_tags      = SplitTags(ColText(st, 2));
    r.weight               = ColDouble(st, 3);
    r.leader_eligible      = ColI32(st, 4) != 0;
    r.state                = static_cast<v1::AgentState>(ColI32(st, 5));
    r.last_heartbeat_at_ms = ColU64(st, 6);
    out.push_back(std::move(r));
  }

  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Topology
// ------------------------------------------------------------------

Result SqliteRepository::SaveTopology(Transaction& t, const model::TopologyRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO topology_graphs(session_id,kind,effective_kind,leader_id,version,graph) VALUES(?,?,?,?,?,?) "
      "ON CONFLICT(session_id) DO UPDATE SET kind=excluded.kind, effective_kind=excluded.effective_kind, "
      "leader_id=excluded.leader_id, version=excluded.version, graph=excluded.graph;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.session_id);
  BindText(st, 2, util::TopologyKindName(r.graph.kind()));
  BindText(st, 3, util::TopologyKindName(r.graph.effective_kind()));
  BindText(st, 4, r.graph.leader_id());
  BindU64(st, 5, r.graph.version());
  BindBlob(st, 6, r.graph.SerializeAsString());

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::TopologyRecord> SqliteRepository::GetTopology(Transaction& t, const std::string& session_id) {
  auto* db = TX(t).Handle();

  const char* sql = "SELECT session_id,graph FROM topology_graphs WHERE session_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, session_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  model::TopologyRecord r;
  r.session_id = ColText(st, 0);
  const bool ok = r.graph.ParseFromString(ColBlob(st, 1));
  sqlite3_finalize(st);

  if (!ok) return std::nullopt;
  return r;
}

// ------------------------------------------------------------------
// Task metrics / health snapshots
// ------------------------------------------------------------------

Result SqliteRepository::AppendTaskMetric(Transaction& t, const v1::TaskMetric& m) {
  auto* db = TX(t).Handle();

  const char* sql = "INSERT INTO task_metrics(task_id,session_id,agent_id,duration_ms,result,timestamp_ms) VALUES(?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, m.task_id());
  BindText(st, 2, m.session_id());
  BindText(st, 3, m.agent_id());
  BindU64(st, 4, m.duration_ms());
  BindI32(st, 5, static_cast<int>(m.result()));
  BindU64(st, 6, m.timestamp_ms());

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<v1::TaskMetric> SqliteRepository::ListRecentTaskMetrics(Transaction& t, const std::string& session_id, std::size_t limit) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT task_id,session_id,agent_id,duration_ms,result,timestamp_ms FROM task_metrics "
      "WHERE session_id=? ORDER BY timestamp_ms DESC, rowid DESC LIMIT ?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindText(st, 1, session_id);
  BindU64(st, 2, limit);

  std::vector<v1::TaskMetric> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    v1::TaskMetric m;
    m.set_task_id(ColText(st, 0));
    m.set_session_id(ColText(st, 1));
    m.set_agent_id(ColText(st, 2));
    m.set_duration_ms(ColU64(st, 3));
    m.set_result(static_cast<v1::TaskResult>(ColI32(st, 4)));
    m.set_timestamp_ms(ColU64(st, 5));
    out.push_back(std::move(m));
  }

  sqlite3_finalize(st);
  return out;
}

Result SqliteRepository::AppendHealthSnapshot(Transaction& t, const v1::HealthSnapshot& h) {
  auto* db = TX(t).Handle();

  const char* sql = "INSERT INTO health_snapshots(agent_id,session_id,timestamp_ms,reachable,latency_ms) VALUES(?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, h.agent_id());
  BindText(st, 2, h.session_id());
  BindU64(st, 3, h.timestamp_ms());
  BindI32(st, 4, h.reachable() ? 1 : 0);
  BindU64(st, 5, h.latency_ms());

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<v1::HealthSnapshot> SqliteRepository::ListRecentHealthSnapshots(Transaction& t, const std::string& session_id,
                                                                           const std::string& agent_id, std::size_t limit) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT agent_id,session_id,timestamp_ms,reachable,latency_ms FROM health_snapshots "
      "WHERE session_id=? AND (?='' OR agent_id=?) ORDER BY timestamp_ms DESC, rowid DESC LIMIT ?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindText(st, 1, session_id);
  BindText(st, 2, agent_id);
  BindText(st, 3, agent_id);
  BindU64(st, 4, limit);

  std::vector<v1::HealthSnapshot> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    v1::HealthSnapshot h;
    h.set_agent_id(ColText(st, 0));
    h.set_session_id(ColText(st, 1));
    h.set_timestamp_ms(ColU64(st, 2));
    h.set_reachable(ColI32(st, 3) != 0);
    h.set_latency_ms(ColU64(st, 4));
    out.push_back(std::move(h));
  }

  sqlite3_finalize(st);
  return out;
}

static Result DeleteBefore(sqlite3* db, const char* sql, uint64_t cutoff_ms, Result (*translate)(sqlite3*, int)) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, cutoff_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return translate(db, rc);
}

Result SqliteRepository::DeleteTaskMetricsBefore(Transaction& t, uint64_t cutoff_ms) {
  return DeleteBefore(TX(t).Handle(), "DELETE FROM task_metrics WHERE timestamp_ms < ?;", cutoff_ms, &SqliteRepository::Translate);
}

Result SqliteRepository::DeleteHealthSnapshotsBefore(Transaction& t, uint64_t cutoff_ms) {
  return DeleteBefore(TX(t).Handle(), "DELETE FROM health_snapshots WHERE timestamp_ms < ?;", cutoff_ms, &SqliteRepository::Translate);
}

// ------------------------------------------------------------------
// Healing audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendHealingAction(Transaction& t, const v1::HealingAction& a) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO healing_actions(action_id,session_id,agent_id,trigger,kind,applied_at_ms,success) VALUES(?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, a.action_id());
  BindText(st, 2, a.session_id());
  BindText(st, 3, a.agent_id());
  BindText(st, 4, a.trigger());
  BindI32(st, 5, static_cast<int>(a.kind()));
  BindU64(st, 6, a.applied_at_ms());
  BindI32(st, 7, a.success() ? 1 : 0);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<v1::HealingAction> SqliteRepository::ListRecentHealingActions(Transaction& t, const std::string& session_id, std::size_t limit) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT action_id,session_id,agent_id,trigger,kind,applied_at_ms,success FROM healing_actions "
      "WHERE session_id=? ORDER BY applied_at_ms DESC, rowid DESC LIMIT ?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindText(st, 1, session_id);
  BindU64(st, 2, limit);

  std::vector<v1::HealingAction> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    v1::HealingAction a;
    a.set_action_id(ColText(st, 0));
    a.set_session_id(ColText(st, 1));
    a.set_agent_id(ColText(st, 2));
    a.set_trigger(ColText(st, 3));
    a.set_kind(static_cast<v1::HealingActionKind>(ColI32(st, 4)));
    a.set_applied_at_ms(ColU64(st, 5));
    a.set_success(ColI32(st, 6) != 0);
    out.push_back(std::move(a));
  }

  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Consensus proposals
// ------------------------------------------------------------------

Result SqliteRepository::UpsertProposal(Transaction& t, const v1::ConsensusProposal& p) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO proposals(proposal_id,session_id,algorithm,outcome,created_at_ms,decided_at_ms,body) VALUES(?,?,?,?,?,?,?) "
      "ON CONFLICT(proposal_id) DO UPDATE SET outcome=excluded.outcome, decided_at_ms=excluded.decided_at_ms, body=excluded.body;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, p.proposal_id());
  BindText(st, 2, p.session_id());
  BindI32(st, 3, static_cast<int>(p.algorithm()));
  BindI32(st, 4, static_cast<int>(p.outcome()));
  BindU64(st, 5, p.created_at_ms());
  BindU64(st, 6, p.decided_at_ms());
  BindBlob(st, 7, p.SerializeAsString());

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<v1::ConsensusProposal> SqliteRepository::GetProposal(Transaction& t, const std::string& proposal_id) {
  auto* db = TX(t).Handle();

  const char* sql = "SELECT body FROM proposals WHERE proposal_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, proposal_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  v1::ConsensusProposal p;
  const bool            ok = p.ParseFromString(ColBlob(st, 0));
  sqlite3_finalize(st);

  if (!ok) return std::nullopt;
  return p;
}

std::vector<v1::ConsensusProposal> SqliteRepository::ListRecentProposals(Transaction& t, const std::string& session_id, std::size_t limit,
                                                                         bool decided_only) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT body FROM proposals WHERE session_id=? AND (?=0 OR outcome<>?) ORDER BY created_at_ms DESC, rowid DESC LIMIT ?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindText(st, 1, session_id);
  BindI32(st, 2, decided_only ? 1 : 0);
  BindI32(st, 3, static_cast<int>(v1::OUTCOME_PENDING));
  BindU64(st, 4, limit);

  std::vector<v1::ConsensusProposal> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    v1::ConsensusProposal p;
    if (p.ParseFromString(ColBlob(st, 0))) out.push_back(std::move(p));
  }

  sqlite3_finalize(st);
  return out;
}

} // namespace swarm::db::sqlite
