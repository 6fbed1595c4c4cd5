#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/artifact_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/gc/garbage_collector.hpp"
#include "internal/governance/category_policy.hpp"
#include "internal/governance/governance_gate.hpp"
#include "internal/index/memory_index.hpp"
#include "internal/ledger/trust_ledger.hpp"
#include "internal/scoring/scoring_model.hpp"
#include "internal/util/time.hpp"
#include "trustmem/v1/memory.pb.h"

namespace trustmem::core {

struct BankOptions {
  // Window over which read recency falls from 1 to 0.
  util::Duration recency_window = util::Days(7);
  double         default_relevance = 1.0;
  uint32_t       default_k         = 10;
};

/*
  MemoryBank

  Public surface of the trust-scored memory. Composes the scoring model,
  index, snapshot cache, ledger and garbage collector over a repository.

  Write paths (Store, UpdateTrust, AdjustTrust, Reclassify, GC decisions)
  commit to the repository first and only then refresh the index and cache.
  Updates on one reference serialize on that reference's mutex; there is no
  bank-wide write lock. Read never touches the repository.

  Every operation except HydrateCaches and Stats throws util::InvalidState
  while the bank is stopped.
*/
class MemoryBank {
 public:
  MemoryBank(std::shared_ptr<db::Repository> repository, std::shared_ptr<governance::GovernanceGate> gate,
             governance::CategoryPolicyTable category_policy, std::shared_ptr<const scoring::ScoringModel> model,
             std::shared_ptr<util::Clock> clock, BankOptions options = {});

  MemoryBank(const MemoryBank&)            = delete;
  MemoryBank& operator=(const MemoryBank&) = delete;

  // Hydrates the index and cache, then accepts operations.
  void Start();
  void Stop();
  bool Running() const {
    return running_.load();
  }

  trustmem::v1::MemoryRef Store(const trustmem::v1::ProducerOutput& output);

  std::vector<trustmem::v1::MemoryHit> Read(const trustmem::v1::ReadRequest& request);

  double UpdateTrust(const std::string& reference, trustmem::v1::UseOutcome outcome, const std::string& reason,
                     const std::string& actor = "system");

  double AdjustTrust(const std::string& reference, double delta, const std::string& reason, const std::string& actor = "system");

  double Reclassify(const std::string& reference, trustmem::v1::DecayCurve curve, util::Duration half_life, const std::string& reason,
                    const std::string& actor = "system");

  trustmem::v1::GcSummary GarbageCollect(const trustmem::v1::GcPolicy& policy, std::stop_token stop = {});

  std::vector<trustmem::v1::TrustEvent> GetTrustHistory(const std::string& reference);

  std::optional<trustmem::v1::MemoryHit> Get(const std::string& reference, bool include_non_compliant = false);

  // Appends one decay-snapshot event per live artifact. Returns the number of events.
  std::size_t SnapshotDecay();

  std::vector<trustmem::v1::GcLogEntry> ListGcLog(std::size_t limit = 0);

  trustmem::v1::BankStats Stats() const;

  void HydrateCaches();

  const scoring::ScoringModel& Model() const {
    return *model_;
  }

  // Number of per-reference mutexes currently registered.
  std::size_t TrackedLocks() const;

 private:
  void RequireRunning(const char* op) const;

  void ValidateOutput(const trustmem::v1::ProducerOutput& output, util::TimePoint now) const;

  // NotFound unless the reference is live in the cache.
  std::shared_ptr<std::mutex> ArtifactMutex(const std::string& reference);
  void                        ReleaseArtifactMutex(const std::string& reference);

  // Locked read of the authoritative row; NotFound for missing or deleted.
  db::model::ArtifactRecord LoadLive(db::Transaction& tx, const std::string& reference);

  void Persist(db::Transaction& tx, db::model::ArtifactRecord& record, const char* op);

  void Publish(const db::model::ArtifactRecord& record);

  double DecayedTrust(const db::model::ArtifactRecord& record, util::TimePoint now) const;

  trustmem::v1::MemoryHit ToHit(const db::model::ArtifactRecord& record, double trust, double rank) const;

  // Applies one GC decision under the artifact lock. Returns the action taken.
  gc::GcAction ApplyGcDecision(const trustmem::v1::GcPolicy& policy, const std::string& reference, gc::GcAction planned,
                               gc::GcReason reason);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<governance::GovernanceGate>  gate_;
  governance::CategoryPolicyTable              category_policy_;
  std::shared_ptr<const scoring::ScoringModel> model_;
  std::shared_ptr<util::Clock>                 clock_;
  BankOptions                                  options_;

  index::MemoryIndex  index_;
  ArtifactCache       cache_;
  ledger::TrustLedger ledger_;
  gc::GarbageCollector collector_;

  std::atomic<bool> running_{false};

  mutable std::mutex                                            artifact_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> artifact_mutexes_;

  std::atomic<uint64_t> stores_{0};
  std::atomic<uint64_t> reads_{0};
  std::atomic<uint64_t> trust_updates_{0};
  std::atomic<uint64_t> skipped_candidates_{0};
};

} // namespace trustmem::core
