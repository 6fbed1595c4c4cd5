#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace trustmem::db::sqlite {

struct SqliteOptions {
  std::string path;

  // How long a writer waits on another process (memoryctl, a second daemon)
  // before SQLITE_BUSY surfaces as a StorageError.
  std::chrono::milliseconds busy_timeout{5000};
};

/*
  RAII handle for the memory store's sqlite file.

  One connection is shared by every transaction; tx_mutex_ serializes them so
  BEGIN/COMMIT pairs from different threads never interleave.

  The schema version lives in PRAGMA user_version and is stamped by
  BootstrapSchema.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  std::chrono::milliseconds BusyTimeout() const {
    return options_.busy_timeout;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  void Exec(const std::string& sql);

  // First column of the first row as an integer; 0 when there is no row.
  int64_t QueryInt(const std::string& sql);

  int  SchemaVersion();
  void SetSchemaVersion(int version);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace trustmem::db::sqlite
