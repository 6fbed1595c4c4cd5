#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace trustmem::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_ || rolled_back_) {
    return;
  }

  char* err = nullptr;
  if (sqlite3_exec(Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    TRUSTMEM_LOG_WARN("sqlite rollback failed", {observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  rolled_back_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace trustmem::db::sqlite
