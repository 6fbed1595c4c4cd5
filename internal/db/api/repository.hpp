#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/artifact_record.hpp"
#include "internal/db/model/gc_log_record.hpp"
#include "internal/db/model/trust_event_record.hpp"

namespace trustmem::db {

// Equality filters for ScanArtifacts; unset fields match everything.
struct ArtifactScan {
  std::optional<std::string>                component;
  std::optional<trustmem::v1::OutputCategory> category;
  std::optional<std::string>                loop_id;
  std::optional<std::string>                domain;
  bool                                      include_deleted = false;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateArtifact is a compare-and-set on version: the stored row must carry
    record.version - 1, otherwise Conflict
  - Trust events and GC log rows are append-only; the backend assigns their
    sequence numbers at commit

  The DB is the source of truth for artifact state. The ledger tables are
  diagnostic and never reference artifact rows by foreign key, so purging an
  artifact keeps its history.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Artifacts
  // ---------------------------------------------------------------------

  virtual Result InsertArtifact(Transaction&, const model::ArtifactRecord&) = 0;

  virtual std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& reference) = 0;

  // Ordered by reference.
  virtual std::vector<model::ArtifactRecord> ScanArtifacts(Transaction&, const ArtifactScan& scan) = 0;

  virtual Result UpdateArtifact(Transaction&, const model::ArtifactRecord&) = 0;

  // Physical removal.
  virtual Result DeleteArtifact(Transaction&, const std::string& reference) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual Result AppendTrustEvent(Transaction&, const model::TrustEventRecord&) = 0;

  // Ordered by sequence.
  virtual std::vector<model::TrustEventRecord> ListTrustEvents(Transaction&, const std::string& reference) = 0;

  virtual Result AppendGcLog(Transaction&, const model::GcLogRecord&) = 0;

  // Most recent first; limit 0 returns everything.
  virtual std::vector<model::GcLogRecord> ListGcLog(Transaction&, std::size_t limit) = 0;
};

} // namespace trustmem::db
