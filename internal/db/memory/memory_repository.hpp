#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace trustmem::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Committed state lives behind a shared_mutex. Transactions read through their
  own write set into the committed state and publish the write set under a
  short exclusive section at commit, so independent writers never serialize on
  each other's open transactions.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ArtifactRecord> artifacts;
    std::unordered_map<std::string, std::vector<model::TrustEventRecord>> events;
    std::vector<model::GcLogRecord> gc_log;

    uint64_t next_event_sequence = 1;
    uint64_t next_gc_sequence = 1;
  };

  std::optional<model::ArtifactRecord> Committed(const std::string& reference) const;

  mutable std::shared_mutex mutex_;
  State committed_;
};

}
