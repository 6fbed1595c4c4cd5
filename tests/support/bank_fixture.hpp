#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/memory_bank.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/governance/governance_gate.hpp"
#include "internal/scoring/scoring_model.hpp"
#include "internal/util/time.hpp"

namespace trustmem::testing {

inline util::TimePoint Epoch() {
  return util::FromUnixMillis(1'700'000'000'000);
}

/*
  Repository decorator with switchable faults.
*/
class HookedRepository final : public db::Repository {
 public:
  explicit HookedRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::atomic<bool> fail_begin{false};
  std::atomic<bool> fail_insert{false};
  std::atomic<bool> fail_update{false};
  std::atomic<bool> fail_trust_events{false};
  std::atomic<bool> throw_on_history{false};

  std::unique_ptr<db::Transaction> Begin() override {
    if (fail_begin) throw std::runtime_error("injected begin failure");
    return inner_->Begin();
  }

  db::Result InsertArtifact(db::Transaction& tx, const db::model::ArtifactRecord& r) override {
    if (fail_insert) return db::Result::Err(db::ErrorCode::IOError, "injected insert failure");
    return inner_->InsertArtifact(tx, r);
  }

  std::optional<db::model::ArtifactRecord> GetArtifact(db::Transaction& tx, const std::string& reference) override {
    return inner_->GetArtifact(tx, reference);
  }

  std::vector<db::model::ArtifactRecord> ScanArtifacts(db::Transaction& tx, const db::ArtifactScan& scan) override {
    return inner_->ScanArtifacts(tx, scan);
  }

  db::Result UpdateArtifact(db::Transaction& tx, const db::model::ArtifactRecord& r) override {
    if (fail_update) return db::Result::Err(db::ErrorCode::Busy, "injected update failure");
    return inner_->UpdateArtifact(tx, r);
  }

  db::Result DeleteArtifact(db::Transaction& tx, const std::string& reference) override {
    return inner_->DeleteArtifact(tx, reference);
  }

  db::Result AppendTrustEvent(db::Transaction& tx, const db::model::TrustEventRecord& r) override {
    if (fail_trust_events) return db::Result::Err(db::ErrorCode::IOError, "injected ledger failure");
    return inner_->AppendTrustEvent(tx, r);
  }

  std::vector<db::model::TrustEventRecord> ListTrustEvents(db::Transaction& tx, const std::string& reference) override {
    if (throw_on_history) throw std::runtime_error("injected history failure");
    return inner_->ListTrustEvents(tx, reference);
  }

  db::Result AppendGcLog(db::Transaction& tx, const db::model::GcLogRecord& r) override {
    return inner_->AppendGcLog(tx, r);
  }

  std::vector<db::model::GcLogRecord> ListGcLog(db::Transaction& tx, std::size_t limit) override {
    return inner_->ListGcLog(tx, limit);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
};

struct BankFixture {
  std::shared_ptr<util::ManualClock> clock;
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<core::MemoryBank>  bank;
};

// Started bank over the given repository (fresh in-memory one by default).
inline BankFixture MakeBank(std::shared_ptr<db::Repository> repository = nullptr, governance::CategoryPolicyTable policy = {},
                            scoring::ScoringConfig config = scoring::ScoringConfig::Defaults(), core::BankOptions options = {}) {
  BankFixture f;
  f.clock      = std::make_shared<util::ManualClock>(Epoch());
  f.repository = repository ? std::move(repository) : std::make_shared<db::memory::MemoryRepository>();
  f.bank       = std::make_shared<core::MemoryBank>(f.repository, std::make_shared<governance::DeclaredComplianceGate>(), std::move(policy),
                                                    std::make_shared<const scoring::ScoringModel>(std::move(config)), f.clock, options);
  f.bank->Start();
  return f;
}

inline trustmem::v1::ProducerOutput MakeOutput(const std::string& component, trustmem::v1::OutputCategory category = trustmem::v1::OUTPUT_CATEGORY_REASONING,
                                               double confidence = 1.0, std::optional<double> consensus = 1.0) {
  trustmem::v1::ProducerOutput output;
  output.set_loop_id("loop-1");
  output.set_component(component);
  output.set_category(category);
  output.set_producer_confidence(confidence);
  if (consensus) output.set_consensus_quality(*consensus);
  output.set_constitutional_compliance(true);
  (*output.mutable_payload()->mutable_fields())["summary"].set_string_value(component + " output");
  return output;
}

// Artifact row with trust pinned at `trust` as of `scored_at`.
inline db::model::ArtifactRecord MakeRecord(const std::string& reference, double trust, util::TimePoint created_at, util::TimePoint scored_at,
                                            const std::string& component = "hunter") {
  db::model::ArtifactRecord r;
  r.reference     = reference;
  r.loop_id       = "loop-1";
  r.component     = component;
  r.category      = trustmem::v1::OUTPUT_CATEGORY_REASONING;
  r.trust         = trust;
  r.decay_curve   = trustmem::v1::DECAY_CURVE_HYPERBOLIC;
  r.half_life_ms  = util::Days(7).count();
  r.created_at_ms = util::ToUnixMillis(created_at);
  r.updated_at_ms = r.created_at_ms;
  r.scored_at_ms  = util::ToUnixMillis(scored_at);
  r.version       = 1;
  return r;
}

inline void Seed(db::Repository& repository, const std::vector<db::model::ArtifactRecord>& records) {
  auto tx = repository.Begin();
  for (const auto& r : records) {
    if (!repository.InsertArtifact(*tx, r)) throw std::runtime_error("seed insert failed for " + r.reference);
  }
  tx->Commit();
}

} // namespace trustmem::testing
