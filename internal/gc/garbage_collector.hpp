#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/artifact_record.hpp"
#include "internal/index/memory_index.hpp"
#include "internal/scoring/scoring_model.hpp"
#include "internal/util/time.hpp"
#include "trustmem/v1/memory.pb.h"

namespace trustmem::gc {

enum class GcAction {
  kNone,
  kArchive,
  kDelete,
};

enum class GcReason {
  kNone,
  kBelowDeleteThreshold,
  kBelowArchiveThreshold,
  kMaxAge,
  kExpired,
  kCapacity,
};

const char* ToString(GcAction action);
const char* ToString(GcReason reason);

struct GcDecision {
  GcAction action = GcAction::kNone;
  GcReason reason = GcReason::kNone;
  // Decayed trust at evaluation time.
  double trust = 0.0;
};

/*
  Garbage collection rules.

  Pure decision logic; the bank owns locking, persistence and the ledger.
  Per artifact:
    decayed trust < delete_threshold                    -> delete
    else (live only) trust < archive_threshold,
         age > max_age, or past expires_at              -> archive
  Afterwards, live survivors beyond max_artifacts are archived lowest rank
  first (rank with relevance 0, recency 0, stored importance).
*/
class GarbageCollector {
 public:
  explicit GarbageCollector(std::shared_ptr<const scoring::ScoringModel> model);

  // ValidationError for out-of-range values, PolicyConflict when
  // delete_threshold > archive_threshold.
  static void ValidatePolicy(const trustmem::v1::GcPolicy& policy);

  static index::IndexQuery ScopeQuery(const trustmem::v1::GcPolicy& policy);

  // Throws std::invalid_argument when the record's decay config is unusable.
  double CurrentTrust(const db::model::ArtifactRecord& record, util::TimePoint now) const;

  // Archived records only ever yield kDelete or kNone.
  GcDecision Evaluate(const trustmem::v1::GcPolicy& policy, const db::model::ArtifactRecord& record, util::TimePoint now) const;

  scoring::RankKey EvictionKey(const db::model::ArtifactRecord& record, double trust) const;

  // References to archive so at most max_artifacts survivors remain.
  std::vector<std::string> CapacityEvictions(const trustmem::v1::GcPolicy& policy, std::vector<scoring::RankKey> survivors) const;

 private:
  std::shared_ptr<const scoring::ScoringModel> model_;
};

} // namespace trustmem::gc
