#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace trustmem::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertArtifact(Transaction&, const model::ArtifactRecord&) override;
  std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string&) override;
  std::vector<model::ArtifactRecord> ScanArtifacts(Transaction&, const ArtifactScan&) override;
  Result UpdateArtifact(Transaction&, const model::ArtifactRecord&) override;
  Result DeleteArtifact(Transaction&, const std::string&) override;

  Result AppendTrustEvent(Transaction&, const model::TrustEventRecord&) override;
  std::vector<model::TrustEventRecord> ListTrustEvents(Transaction&, const std::string&) override;
  Result AppendGcLog(Transaction&, const model::GcLogRecord&) override;
  std::vector<model::GcLogRecord> ListGcLog(Transaction&, std::size_t limit) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  Result ReplaceTags(sqlite3* db, const model::ArtifactRecord& r);
  std::vector<std::string> LoadTags(sqlite3* db, const std::string& reference);

  std::shared_ptr<SqliteDB> db_;
};

}
