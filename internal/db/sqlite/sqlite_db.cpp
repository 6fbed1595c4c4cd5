#include "sqlite_db.hpp"

#include <stdexcept>
#include <utility>

namespace trustmem::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

} // namespace

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    throw std::invalid_argument("sqlite path is empty");
  }
  if (options_.busy_timeout.count() < 0) {
    throw std::invalid_argument("sqlite busy timeout is negative");
  }

  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "open " + options_.path + ": " + (db_ ? sqlite3_errmsg(db_) : "sqlite open failed");
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int64_t SqliteDB::QueryInt(const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr), db_, "prepare " + sql);
  std::unique_ptr<sqlite3_stmt, StatementDeleter> stmt(raw);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) return 0;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error("step " + sql + ": " + sqlite3_errmsg(db_));
  }
  return sqlite3_column_int64(stmt.get(), 0);
}

int SqliteDB::SchemaVersion() {
  return static_cast<int>(QueryInt("PRAGMA user_version;"));
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  // WAL lets memoryctl read history while the daemon holds the write lock.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // artifact_tag rows cascade when GC purges an artifact.
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace trustmem::db::sqlite
