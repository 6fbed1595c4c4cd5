#include "sqlite_schema.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace trustmem::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS artifact ("
      "reference TEXT PRIMARY KEY, loop_id TEXT NOT NULL, component TEXT NOT NULL, category INTEGER NOT NULL, "
      "payload_json TEXT NOT NULL, domain TEXT NOT NULL, "
      "trust REAL NOT NULL, provenance REAL NOT NULL, consensus REAL NOT NULL, governance REAL NOT NULL, usage REAL NOT NULL, "
      "producer_confidence REAL NOT NULL, importance REAL NOT NULL, reasoning_chain_id TEXT NOT NULL, "
      "decay_curve INTEGER NOT NULL, half_life_ms INTEGER NOT NULL, "
      "access_count INTEGER NOT NULL, success_count INTEGER NOT NULL, failure_count INTEGER NOT NULL, last_accessed_at_ms INTEGER NOT NULL, "
      "constitutional_compliance INTEGER NOT NULL, violations_json TEXT NOT NULL, requires_manual_review INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, scored_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, "
      "archived INTEGER NOT NULL, deleted INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS artifact_component_idx ON artifact(component);",
      "CREATE INDEX IF NOT EXISTS artifact_category_idx ON artifact(category);",
      "CREATE INDEX IF NOT EXISTS artifact_loop_idx ON artifact(loop_id);",
      "CREATE INDEX IF NOT EXISTS artifact_domain_idx ON artifact(domain);",
      "CREATE TABLE IF NOT EXISTS artifact_tag (reference TEXT NOT NULL, position INTEGER NOT NULL, tag TEXT NOT NULL, "
      "PRIMARY KEY (reference, position), FOREIGN KEY(reference) REFERENCES artifact(reference) ON DELETE CASCADE);",
      "CREATE INDEX IF NOT EXISTS artifact_tag_tag_idx ON artifact_tag(tag);",
      // No foreign key: history outlives purged artifacts.
      "CREATE TABLE IF NOT EXISTS trust_event (sequence INTEGER PRIMARY KEY AUTOINCREMENT, reference TEXT NOT NULL, kind INTEGER NOT NULL, "
      "reason TEXT NOT NULL, actor TEXT NOT NULL, trust_before REAL NOT NULL, trust_after REAL NOT NULL, "
      "provenance_delta REAL NOT NULL, consensus_delta REAL NOT NULL, governance_delta REAL NOT NULL, usage_delta REAL NOT NULL, "
      "timestamp_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS trust_event_reference_idx ON trust_event(reference, sequence);",
      "CREATE TABLE IF NOT EXISTS gc_log (sequence INTEGER PRIMARY KEY AUTOINCREMENT, policy_name TEXT NOT NULL, "
      "scanned INTEGER NOT NULL, archived INTEGER NOT NULL, deleted INTEGER NOT NULL, "
      "archive_threshold REAL NOT NULL, delete_threshold REAL NOT NULL, max_age_ms INTEGER NOT NULL, "
      "duration_ms INTEGER NOT NULL, timestamp_ms INTEGER NOT NULL, dry_run INTEGER NOT NULL, cancelled INTEGER NOT NULL);"};

  const int found = db.SchemaVersion();
  if (found > kSchemaVersion) {
    throw std::runtime_error(db.Path() + ": schema version " + std::to_string(found) + " is newer than supported version " +
                             std::to_string(kSchemaVersion));
  }

  std::lock_guard<std::mutex> lock(db.TxMutex());
  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : kBootstrapSql) {
      db.Exec(sql);
    }
    if (found < kSchemaVersion) db.SetSchemaVersion(kSchemaVersion);
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }

  db.Exec("SELECT reference,trust,decay_curve,half_life_ms,scored_at_ms,archived,deleted,version FROM artifact LIMIT 1;");
  db.Exec("SELECT reference,position,tag FROM artifact_tag LIMIT 1;");
  db.Exec("SELECT sequence,reference,kind,trust_before,trust_after FROM trust_event LIMIT 1;");
  db.Exec("SELECT sequence,policy_name,scanned,archived,deleted FROM gc_log LIMIT 1;");
}

} // namespace trustmem::db::sqlite
