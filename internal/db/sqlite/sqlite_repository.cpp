#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"

namespace trustmem::db::sqlite {

using trustmem::db::ErrorCode;
using trustmem::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kArtifactColumns =
    "reference,loop_id,component,category,payload_json,domain,"
    "trust,provenance,consensus,governance,usage,"
    "producer_confidence,importance,reasoning_chain_id,"
    "decay_curve,half_life_ms,"
    "access_count,success_count,failure_count,last_accessed_at_ms,"
    "constitutional_compliance,violations_json,requires_manual_review,"
    "created_at_ms,updated_at_ms,scored_at_ms,expires_at_ms,"
    "archived,deleted,version";

constexpr int kArtifactColumnCount = 30;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    return StmtPtr(nullptr, &sqlite3_finalize);
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

std::string EncodeViolations(const std::vector<std::string>& violations) {
  google::protobuf::ListValue list;
  for (const auto& v : violations) {
    list.add_values()->set_string_value(v);
  }
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(list, &json).ok()) {
    return "[]";
  }
  return json;
}

std::vector<std::string> DecodeViolations(const std::string& reference, const std::string& json) {
  google::protobuf::ListValue list;
  if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
    TRUSTMEM_LOG_WARN("unreadable violations column", {observability::StringField("reference", reference)});
    return {};
  }
  std::vector<std::string> out;
  out.reserve(list.values_size());
  for (const auto& v : list.values()) {
    out.push_back(v.string_value());
  }
  return out;
}

// Binds every artifact column except version starting at parameter `first`.
// Returns the next free parameter index.
int BindArtifactFields(sqlite3_stmt* st, int first, const model::ArtifactRecord& r) {
  int i = first;
  BindText(st, i++, r.loop_id);
  BindText(st, i++, r.component);
  BindI64(st, i++, static_cast<int64_t>(r.category));
  BindText(st, i++, r.payload_json);
  BindText(st, i++, r.domain);
  BindDouble(st, i++, r.trust);
  BindDouble(st, i++, r.provenance);
  BindDouble(st, i++, r.consensus);
  BindDouble(st, i++, r.governance);
  BindDouble(st, i++, r.usage);
  BindDouble(st, i++, r.producer_confidence);
  BindDouble(st, i++, r.importance);
  BindText(st, i++, r.reasoning_chain_id);
  BindI64(st, i++, static_cast<int64_t>(r.decay_curve));
  BindI64(st, i++, r.half_life_ms);
  BindU64(st, i++, r.access_count);
  BindU64(st, i++, r.success_count);
  BindU64(st, i++, r.failure_count);
  BindI64(st, i++, r.last_accessed_at_ms);
  BindBool(st, i++, r.constitutional_compliance);
  BindText(st, i++, EncodeViolations(r.violations));
  BindBool(st, i++, r.requires_manual_review);
  BindI64(st, i++, r.created_at_ms);
  BindI64(st, i++, r.updated_at_ms);
  BindI64(st, i++, r.scored_at_ms);
  BindI64(st, i++, r.expires_at_ms);
  BindBool(st, i++, r.archived);
  BindBool(st, i++, r.deleted);
  return i;
}

model::ArtifactRecord ReadArtifact(sqlite3_stmt* st) {
  model::ArtifactRecord r;
  int                   c    = 0;
  r.reference                = ColText(st, c++);
  r.loop_id                  = ColText(st, c++);
  r.component                = ColText(st, c++);
  r.category                 = static_cast<trustmem::v1::OutputCategory>(ColI64(st, c++));
  r.payload_json             = ColText(st, c++);
  r.domain                   = ColText(st, c++);
  r.trust                    = ColDouble(st, c++);
  r.provenance               = ColDouble(st, c++);
  r.consensus                = ColDouble(st, c++);
  r.governance               = ColDouble(st, c++);
  r.usage                    = ColDouble(st, c++);
  r.producer_confidence      = ColDouble(st, c++);
  r.importance               = ColDouble(st, c++);
  r.reasoning_chain_id       = ColText(st, c++);
  r.decay_curve              = static_cast<trustmem::v1::DecayCurve>(ColI64(st, c++));
  r.half_life_ms             = ColI64(st, c++);
  r.access_count             = ColU64(st, c++);
  r.success_count            = ColU64(st, c++);
  r.failure_count            = ColU64(st, c++);
  r.last_accessed_at_ms      = ColI64(st, c++);
  r.constitutional_compliance = ColBool(st, c++);
  r.violations               = DecodeViolations(r.reference, ColText(st, c++));
  r.requires_manual_review   = ColBool(st, c++);
  r.created_at_ms            = ColI64(st, c++);
  r.updated_at_ms            = ColI64(st, c++);
  r.scored_at_ms             = ColI64(st, c++);
  r.expires_at_ms            = ColI64(st, c++);
  r.archived                 = ColBool(st, c++);
  r.deleted                  = ColBool(st, c++);
  r.version                  = ColU64(st, c++);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Tags
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceTags(sqlite3* db, const model::ArtifactRecord& r) {
  auto del = Prepare(db, "DELETE FROM artifact_tag WHERE reference=?;");
  if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(del.get(), 1, r.reference);
  int rc = sqlite3_step(del.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  auto ins = Prepare(db, "INSERT INTO artifact_tag(reference,position,tag) VALUES(?,?,?);");
  if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  for (size_t i = 0; i < r.tags.size(); ++i) {
    sqlite3_reset(ins.get());
    BindText(ins.get(), 1, r.reference);
    BindI64(ins.get(), 2, static_cast<int64_t>(i));
    BindText(ins.get(), 3, r.tags[i]);
    rc = sqlite3_step(ins.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

std::vector<std::string> SqliteRepository::LoadTags(sqlite3* db, const std::string& reference) {
  std::vector<std::string> tags;
  auto st = Prepare(db, "SELECT tag FROM artifact_tag WHERE reference=? ORDER BY position;");
  if (!st) return tags;
  BindText(st.get(), 1, reference);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    tags.push_back(ColText(st.get(), 0));
  }
  return tags;
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result SqliteRepository::InsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("INSERT INTO artifact(") + kArtifactColumns + ") VALUES(?";
  for (int i = 1; i < kArtifactColumnCount; ++i) sql += ",?";
  sql += ");";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.reference);
  int next = BindArtifactFields(st.get(), 2, r);
  BindU64(st.get(), next, r.version);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.reference);
    return Translate(db, rc);
  }
  return ReplaceTags(db, r);
}

std::optional<model::ArtifactRecord>
SqliteRepository::GetArtifact(Transaction& t, const std::string& reference) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kArtifactColumns + " FROM artifact WHERE reference=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, reference);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  auto r = ReadArtifact(st.get());
  r.tags = LoadTags(db, reference);
  return r;
}

std::vector<model::ArtifactRecord>
SqliteRepository::ScanArtifacts(Transaction& t, const ArtifactScan& scan) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kArtifactColumns + " FROM artifact WHERE 1=1";
  if (!scan.include_deleted) sql += " AND deleted=0";
  if (scan.component) sql += " AND component=?";
  if (scan.category) sql += " AND category=?";
  if (scan.loop_id) sql += " AND loop_id=?";
  if (scan.domain) sql += " AND domain=?";
  sql += " ORDER BY reference;";

  std::vector<model::ArtifactRecord> out;
  auto st = Prepare(db, sql);
  if (!st) return out;

  int i = 1;
  if (scan.component) BindText(st.get(), i++, *scan.component);
  if (scan.category) BindI64(st.get(), i++, static_cast<int64_t>(*scan.category));
  if (scan.loop_id) BindText(st.get(), i++, *scan.loop_id);
  if (scan.domain) BindText(st.get(), i++, *scan.domain);

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadArtifact(st.get()));
  }
  for (auto& r : out) {
    r.tags = LoadTags(db, r.reference);
  }
  return out;
}

Result SqliteRepository::UpdateArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto* db = TX(t).Handle();

  std::string sql = "UPDATE artifact SET loop_id=?,component=?,category=?,payload_json=?,domain=?,"
                    "trust=?,provenance=?,consensus=?,governance=?,usage=?,"
                    "producer_confidence=?,importance=?,reasoning_chain_id=?,"
                    "decay_curve=?,half_life_ms=?,"
                    "access_count=?,success_count=?,failure_count=?,last_accessed_at_ms=?,"
                    "constitutional_compliance=?,violations_json=?,requires_manual_review=?,"
                    "created_at_ms=?,updated_at_ms=?,scored_at_ms=?,expires_at_ms=?,"
                    "archived=?,deleted=?,version=? WHERE reference=? AND version=?;";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int next = BindArtifactFields(st.get(), 1, r);
  BindU64(st.get(), next++, r.version);
  BindText(st.get(), next++, r.reference);
  BindU64(st.get(), next, r.version - 1);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) {
    auto probe = Prepare(db, "SELECT version FROM artifact WHERE reference=?;");
    if (!probe) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(probe.get(), 1, r.reference);
    if (sqlite3_step(probe.get()) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, r.reference);
    return Result::Err(ErrorCode::Conflict, "stale version for " + r.reference);
  }

  return ReplaceTags(db, r);
}

Result SqliteRepository::DeleteArtifact(Transaction& t, const std::string& reference) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM artifact WHERE reference=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, reference);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, reference);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendTrustEvent(Transaction& t, const model::TrustEventRecord& r) {
  auto* db = TX(t).Handle();
  if (r.reference.empty()) return Result::Err(ErrorCode::ConstraintViolation, "trust event without reference");

  const char* sql =
      "INSERT INTO trust_event(reference,kind,reason,actor,trust_before,trust_after,"
      "provenance_delta,consensus_delta,governance_delta,usage_delta,timestamp_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?);";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.reference);
  BindI64(st.get(), 2, static_cast<int64_t>(r.kind));
  BindText(st.get(), 3, r.reason);
  BindText(st.get(), 4, r.actor);
  BindDouble(st.get(), 5, r.trust_before);
  BindDouble(st.get(), 6, r.trust_after);
  BindDouble(st.get(), 7, r.provenance_delta);
  BindDouble(st.get(), 8, r.consensus_delta);
  BindDouble(st.get(), 9, r.governance_delta);
  BindDouble(st.get(), 10, r.usage_delta);
  BindI64(st.get(), 11, r.timestamp_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TrustEventRecord>
SqliteRepository::ListTrustEvents(Transaction& t, const std::string& reference) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT sequence,reference,kind,reason,actor,trust_before,trust_after,"
      "provenance_delta,consensus_delta,governance_delta,usage_delta,timestamp_ms "
      "FROM trust_event WHERE reference=? ORDER BY sequence;";

  std::vector<model::TrustEventRecord> out;
  auto st = Prepare(db, sql);
  if (!st) return out;

  BindText(st.get(), 1, reference);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::TrustEventRecord e;
    e.sequence         = ColU64(st.get(), 0);
    e.reference        = ColText(st.get(), 1);
    e.kind             = static_cast<trustmem::v1::TrustEventKind>(ColI64(st.get(), 2));
    e.reason           = ColText(st.get(), 3);
    e.actor            = ColText(st.get(), 4);
    e.trust_before     = ColDouble(st.get(), 5);
    e.trust_after      = ColDouble(st.get(), 6);
    e.provenance_delta = ColDouble(st.get(), 7);
    e.consensus_delta  = ColDouble(st.get(), 8);
    e.governance_delta = ColDouble(st.get(), 9);
    e.usage_delta      = ColDouble(st.get(), 10);
    e.timestamp_ms     = ColI64(st.get(), 11);
    out.push_back(std::move(e));
  }
  return out;
}

Result SqliteRepository::AppendGcLog(Transaction& t, const model::GcLogRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO gc_log(policy_name,scanned,archived,deleted,archive_threshold,delete_threshold,"
      "max_age_ms,duration_ms,timestamp_ms,dry_run,cancelled) VALUES(?,?,?,?,?,?,?,?,?,?,?);";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.policy_name);
  BindU64(st.get(), 2, r.scanned);
  BindU64(st.get(), 3, r.archived);
  BindU64(st.get(), 4, r.deleted);
  BindDouble(st.get(), 5, r.archive_threshold);
  BindDouble(st.get(), 6, r.delete_threshold);
  BindI64(st.get(), 7, r.max_age_ms);
  BindI64(st.get(), 8, r.duration_ms);
  BindI64(st.get(), 9, r.timestamp_ms);
  BindBool(st.get(), 10, r.dry_run);
  BindBool(st.get(), 11, r.cancelled);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::GcLogRecord> SqliteRepository::ListGcLog(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();

  std::string sql =
      "SELECT sequence,policy_name,scanned,archived,deleted,archive_threshold,delete_threshold,"
      "max_age_ms,duration_ms,timestamp_ms,dry_run,cancelled FROM gc_log ORDER BY sequence DESC";
  if (limit != 0) sql += " LIMIT " + std::to_string(limit);
  sql += ";";

  std::vector<model::GcLogRecord> out;
  auto st = Prepare(db, sql);
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::GcLogRecord r;
    r.sequence          = ColU64(st.get(), 0);
    r.policy_name       = ColText(st.get(), 1);
    r.scanned           = ColU64(st.get(), 2);
    r.archived          = ColU64(st.get(), 3);
    r.deleted           = ColU64(st.get(), 4);
    r.archive_threshold = ColDouble(st.get(), 5);
    r.delete_threshold  = ColDouble(st.get(), 6);
    r.max_age_ms        = ColI64(st.get(), 7);
    r.duration_ms       = ColI64(st.get(), 8);
    r.timestamp_ms      = ColI64(st.get(), 9);
    r.dry_run           = ColBool(st.get(), 10);
    r.cancelled         = ColBool(st.get(), 11);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace trustmem::db::sqlite
