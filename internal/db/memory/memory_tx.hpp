#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace trustmem::db::memory {

/*
  Transaction = committed snapshot + write set

  Each touched reference carries the precondition it was written under
  (absent for inserts, expected version for updates). Commit re-checks every
  precondition against the committed state and fails the whole set if any
  moved.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  struct ArtifactWrite {
    // nullopt = physical delete
    std::optional<model::ArtifactRecord> record;

    bool                    expect_absent = false;
    std::optional<uint64_t> expect_version;
  };

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  std::map<std::string, ArtifactWrite>& Artifacts() {
    return artifacts_;
  }
  std::vector<model::TrustEventRecord>& Events() {
    return events_;
  }
  std::vector<model::GcLogRecord>& GcLog() {
    return gc_log_;
  }

 private:
  MemoryRepository&                    repo_;
  std::map<std::string, ArtifactWrite> artifacts_;
  std::vector<model::TrustEventRecord> events_;
  std::vector<model::GcLogRecord>      gc_log_;
  bool                                 committed_   = false;
  bool                                 rolled_back_ = false;
};

} // namespace trustmem::db::memory
