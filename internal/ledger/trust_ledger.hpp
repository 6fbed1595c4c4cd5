#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace trustmem::ledger {

/*
  Append-only audit trail of trust events and GC runs.

  Appends run in their own repository transaction after the artifact write
  has committed. They are best-effort-but-required: a failed append is logged
  as an audit gap, counted, and reported as false. It never undoes the
  artifact write.
*/
class TrustLedger {
 public:
  explicit TrustLedger(std::shared_ptr<db::Repository> repository);

  bool Append(const db::model::TrustEventRecord& event);
  bool Append(const std::vector<db::model::TrustEventRecord>& events);
  bool AppendGcLog(const db::model::GcLogRecord& entry);

  // Ordered by sequence. Throws util::StorageError if the store is unreachable.
  std::vector<db::model::TrustEventRecord> History(const std::string& reference) const;

  // Most recent first. Throws util::StorageError if the store is unreachable.
  std::vector<db::model::GcLogRecord> RecentGcLog(std::size_t limit) const;

  uint64_t AuditGaps() const {
    return audit_gaps_.load();
  }

 private:
  void RecordGap(const std::string& what, const std::string& reference, const std::string& error);

  std::shared_ptr<db::Repository> repository_;
  std::atomic<uint64_t>           audit_gaps_{0};
};

} // namespace trustmem::ledger
