#include "sqlite_schema.hpp"

#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace swarm::db::sqlite {

void BootstrapSchema(const std::shared_ptr<SqliteDB>& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sessions (session_id TEXT PRIMARY KEY, topology TEXT NOT NULL, consensus_algorithm TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL, closed_at_ms INTEGER, status TEXT NOT NULL, failure_reason TEXT NOT NULL DEFAULT '', "
      "pinned_leader_id TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS session_agents (session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "agent_id TEXT NOT NULL, capability_tags TEXT NOT NULL DEFAULT '', weight REAL NOT NULL, leader_eligible INTEGER NOT NULL, "
      "state INTEGER NOT NULL, last_heartbeat_at_ms INTEGER NOT NULL, PRIMARY KEY (session_id, agent_id));",
      "CREATE TABLE IF NOT EXISTS topology_graphs (session_id TEXT PRIMARY KEY REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "kind TEXT NOT NULL, effective_kind TEXT NOT NULL, leader_id TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL, graph BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS task_metrics (task_id TEXT NOT NULL, session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "agent_id TEXT NOT NULL, duration_ms INTEGER NOT NULL, result INTEGER NOT NULL, timestamp_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_task_metrics_session_ts ON task_metrics(session_id, timestamp_ms);",
      "CREATE INDEX IF NOT EXISTS idx_task_metrics_agent_ts ON task_metrics(agent_id, timestamp_ms);",
      "CREATE TABLE IF NOT EXISTS health_snapshots (agent_id TEXT NOT NULL, session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "timestamp_ms INTEGER NOT NULL, reachable INTEGER NOT NULL, latency_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_health_snapshots_session_agent_ts ON health_snapshots(session_id, agent_id, timestamp_ms);",
      "CREATE TABLE IF NOT EXISTS healing_actions (action_id TEXT PRIMARY KEY, session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "agent_id TEXT NOT NULL DEFAULT '', trigger TEXT NOT NULL, kind INTEGER NOT NULL, applied_at_ms INTEGER NOT NULL, success INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_healing_actions_session_ts ON healing_actions(session_id, applied_at_ms);",
      "CREATE TABLE IF NOT EXISTS proposals (proposal_id TEXT PRIMARY KEY, session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE, "
      "algorithm INTEGER NOT NULL, outcome INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, decided_at_ms INTEGER NOT NULL DEFAULT 0, body BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_proposals_session_ts ON proposals(session_id, created_at_ms);"};

  for (const auto& sql : kBootstrapSql) {
    db->Exec(sql);
  }

  db->Exec("INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) + "," +
           std::to_string(util::NowMillis()) + ");");

  db->Exec("SELECT session_id,topology,consensus_algorithm,created_at_ms,closed_at_ms,status,failure_reason,pinned_leader_id FROM sessions LIMIT 1;");
  db->Exec("SELECT session_id,agent_id,capability_tags,weight,leader_eligible,state,last_heartbeat_at_ms FROM session_agents LIMIT 1;");
  db->Exec("SELECT session_id,kind,effective_kind,leader_id,version,graph FROM topology_graphs LIMIT 1;");
  db->Exec("SELECT task_id,session_id,agent_id,duration_ms,result,timestamp_ms FROM task_metrics LIMIT 1;");
  db->Exec("SELECT agent_id,session_id,timestamp_ms,reachable,latency_ms FROM health_snapshots LIMIT 1;");
  db->Exec("SELECT action_id,session_id,agent_id,trigger,kind,applied_at_ms,success FROM healing_actions LIMIT 1;");
  db->Exec("SELECT proposal_id,session_id,algorithm,outcome,created_at_ms,decided_at_ms,body FROM proposals LIMIT 1;");
  db->Exec("SELECT version FROM schema_migrations LIMIT 1;");
}

} // namespace swarm::db::sqlite
