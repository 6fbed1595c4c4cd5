#include "internal/core/memory_bank.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace trustmem::core {

using namespace trustmem::v1;

namespace {

constexpr int kMaxReferenceAttempts = 3;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageError(message + " (" + db::ToString(result.code) + ")");
  }
}

std::unique_ptr<db::Transaction> BeginOrThrow(db::Repository& repository, const std::string& context) {
  try {
    return repository.Begin();
  } catch (const std::exception& e) {
    throw util::StorageError(context + ": begin failed: " + e.what());
  }
}

void CommitOrThrow(db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const std::exception& e) {
    throw util::StorageError(context + ": commit failed: " + e.what());
  }
}

std::optional<db::model::ArtifactRecord> FetchOrThrow(db::Repository& repository, db::Transaction& tx, const std::string& reference) {
  try {
    return repository.GetArtifact(tx, reference);
  } catch (const std::exception& e) {
    throw util::StorageError("read artifact " + reference + ": " + e.what());
  }
}

bool InUnitInterval(double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

index::IndexEntry ToIndexEntry(const db::model::ArtifactRecord& record) {
  return index::IndexEntry{
      .reference = record.reference,
      .component = record.component,
      .category  = record.category,
      .loop_id   = record.loop_id,
      .domain    = record.domain,
      .tags      = record.tags,
  };
}

TrustEvent ToProto(const db::model::TrustEventRecord& r) {
  TrustEvent event;
  event.set_sequence(r.sequence);
  event.set_reference(r.reference);
  event.set_kind(r.kind);
  event.set_reason(r.reason);
  event.set_actor(r.actor);
  event.set_trust_before(r.trust_before);
  event.set_trust_after(r.trust_after);
  event.set_provenance_delta(r.provenance_delta);
  event.set_consensus_delta(r.consensus_delta);
  event.set_governance_delta(r.governance_delta);
  event.set_usage_delta(r.usage_delta);
  *event.mutable_timestamp() = util::ToProto(util::FromUnixMillis(r.timestamp_ms));
  return event;
}

GcLogEntry ToProto(const db::model::GcLogRecord& r) {
  GcLogEntry entry;
  entry.set_policy_name(r.policy_name);
  entry.set_scanned(r.scanned);
  entry.set_archived(r.archived);
  entry.set_deleted(r.deleted);
  entry.set_archive_threshold(r.archive_threshold);
  entry.set_delete_threshold(r.delete_threshold);
  *entry.mutable_max_age()   = util::ToProtoDuration(util::Duration(r.max_age_ms));
  *entry.mutable_duration()  = util::ToProtoDuration(util::Duration(r.duration_ms));
  *entry.mutable_timestamp() = util::ToProto(util::FromUnixMillis(r.timestamp_ms));
  entry.set_dry_run(r.dry_run);
  entry.set_cancelled(r.cancelled);
  return entry;
}

TrustEventKind EventKindFor(UseOutcome outcome) {
  switch (outcome) {
    case USE_OUTCOME_SUCCESS:
      return TRUST_EVENT_KIND_SUCCESS;
    case USE_OUTCOME_FAILURE:
      return TRUST_EVENT_KIND_FAILURE;
    default:
      return TRUST_EVENT_KIND_NEUTRAL_ACCESS;
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

MemoryBank::MemoryBank(std::shared_ptr<db::Repository> repository, std::shared_ptr<governance::GovernanceGate> gate,
                       governance::CategoryPolicyTable category_policy, std::shared_ptr<const scoring::ScoringModel> model,
                       std::shared_ptr<util::Clock> clock, BankOptions options)
    : repository_(std::move(repository)),
      gate_(std::move(gate)),
      category_policy_(std::move(category_policy)),
      model_(std::move(model)),
      clock_(std::move(clock)),
      options_(options),
      ledger_(repository_),
      collector_(model_) {
  if (!repository_ || !gate_ || !model_ || !clock_) {
    throw std::invalid_argument("MemoryBank requires repository, governance gate, scoring model and clock");
  }
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void MemoryBank::Start() {
  HydrateCaches();
  running_.store(true);
  TRUSTMEM_LOG_INFO("memory bank started", {observability::IntField("artifacts", static_cast<int64_t>(cache_.Size()))});
}

void MemoryBank::Stop() {
  if (running_.exchange(false)) {
    TRUSTMEM_LOG_INFO("memory bank stopped");
  }
}

void MemoryBank::RequireRunning(const char* op) const {
  if (!running_.load()) {
    throw util::InvalidState(std::string(op) + ": memory bank is not running");
  }
}

void MemoryBank::HydrateCaches() {
  std::vector<db::model::ArtifactRecord> records;
  {
    auto tx = BeginOrThrow(*repository_, "hydrate");
    try {
      records = repository_->ScanArtifacts(*tx, db::ArtifactScan{});
    } catch (const std::exception& e) {
      throw util::StorageError(std::string("hydrate: scan failed: ") + e.what());
    }
    CommitOrThrow(*tx, "hydrate");
  }

  index_.Clear();
  cache_.Clear();
  for (const auto& record : records) {
    index_.Insert(ToIndexEntry(record));
    cache_.Put(record);
  }
}

std::shared_ptr<std::mutex> MemoryBank::ArtifactMutex(const std::string& reference) {
  // Only live references get a registry entry.
  auto cached = cache_.Get(reference);
  if (!cached || cached->deleted) {
    throw util::NotFound("artifact not found: " + reference);
  }

  std::lock_guard<std::mutex> lock(artifact_mutexes_guard_);
  auto&                       artifact_mutex = artifact_mutexes_[reference];
  if (!artifact_mutex) {
    artifact_mutex = std::make_shared<std::mutex>();
  }
  return artifact_mutex;
}

void MemoryBank::ReleaseArtifactMutex(const std::string& reference) {
  std::lock_guard<std::mutex> lock(artifact_mutexes_guard_);
  artifact_mutexes_.erase(reference);
}

std::size_t MemoryBank::TrackedLocks() const {
  std::lock_guard<std::mutex> lock(artifact_mutexes_guard_);
  return artifact_mutexes_.size();
}

// ------------------------------------------------------------
// Store
// ------------------------------------------------------------

void MemoryBank::ValidateOutput(const ProducerOutput& output, util::TimePoint now) const {
  if (output.loop_id().empty()) {
    throw util::ValidationError("producer output: loop_id is required");
  }
  if (output.component().empty()) {
    throw util::ValidationError("producer output: component is required");
  }
  if (!OutputCategory_IsValid(output.category()) || output.category() == OUTPUT_CATEGORY_UNSPECIFIED) {
    throw util::ValidationError("producer output: category is not recognized");
  }
  if (!InUnitInterval(output.producer_confidence())) {
    throw util::ValidationError("producer output: producer_confidence must be in [0,1]");
  }
  if (output.has_consensus_quality() && !InUnitInterval(output.consensus_quality())) {
    throw util::ValidationError("producer output: consensus_quality must be in [0,1]");
  }
  if (output.has_importance() && !InUnitInterval(output.importance())) {
    throw util::ValidationError("producer output: importance must be in [0,1]");
  }

  if (output.has_decay_override()) {
    const auto& decay = output.decay_override();
    if (!scoring::IsKnownCurve(decay.curve())) {
      throw util::ValidationError("producer output: decay override curve is not recognized");
    }
    if (util::FromProtoDuration(decay.half_life()).count() <= 0) {
      throw util::ValidationError("producer output: decay override half_life must be positive");
    }
  } else {
    try {
      (void)model_->DefaultDecay(output.category());
    } catch (const std::invalid_argument& e) {
      throw util::ValidationError(std::string("producer output: ") + e.what());
    }
  }

  if (output.has_expires_at() && util::FromProto(output.expires_at()) < now) {
    throw util::ValidationError("producer output: expires_at is in the past");
  }
}

MemoryRef MemoryBank::Store(const ProducerOutput& output) {
  RequireRunning("store");
  const auto started = std::chrono::steady_clock::now();
  const auto now     = clock_->Now();
  const auto now_ms  = util::ToUnixMillis(now);

  ValidateOutput(output, now);

  const auto verdict = gate_->Evaluate(output);

  scoring::DecaySetting decay;
  if (output.has_decay_override()) {
    decay.curve     = output.decay_override().curve();
    decay.half_life = util::FromProtoDuration(output.decay_override().half_life());
  } else {
    decay = model_->DefaultDecay(output.category());
  }

  std::optional<double> consensus;
  if (output.has_consensus_quality()) consensus = output.consensus_quality();

  const auto initial = model_->ComputeInitialTrust(model_->Reputation(output.component()), output.producer_confidence(), consensus,
                                                   verdict.compliant, verdict.violations.size());

  db::model::ArtifactRecord record;
  record.loop_id   = output.loop_id();
  record.component = output.component();
  record.category  = output.category();
  std::string payload_json;
  if (!google::protobuf::util::MessageToJsonString(output.payload(), &payload_json).ok()) {
    throw util::ValidationError("producer output: payload cannot be serialized");
  }
  record.payload_json = std::move(payload_json);
  record.tags.assign(output.tags().begin(), output.tags().end());
  record.domain = output.domain();

  record.trust      = initial.trust;
  record.provenance = initial.signals.provenance;
  record.consensus  = initial.signals.consensus;
  record.governance = initial.signals.governance;
  record.usage      = initial.signals.usage;

  record.producer_confidence = output.producer_confidence();
  record.importance          = output.has_importance() ? output.importance() : 0.5;
  record.reasoning_chain_id  = output.reasoning_chain_id();

  record.decay_curve  = decay.curve;
  record.half_life_ms = decay.half_life.count();

  record.constitutional_compliance = verdict.compliant;
  record.violations                = verdict.violations;
  record.requires_manual_review    = initial.requires_manual_review;

  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;
  record.scored_at_ms  = now_ms;
  record.expires_at_ms = output.has_expires_at() ? util::ToUnixMillis(util::FromProto(output.expires_at())) : 0;
  record.version       = 1;

  for (int attempt = 1;; ++attempt) {
    record.reference = util::GenerateReference();

    auto tx = BeginOrThrow(*repository_, "store");
    db::Result result;
    try {
      result = repository_->InsertArtifact(*tx, record);
    } catch (const std::exception& e) {
      observability::Metrics::Instance().RecordOperation("store", false);
      throw util::StorageError(std::string("store: insert failed: ") + e.what());
    }

    if (result.code == db::ErrorCode::AlreadyExists && attempt < kMaxReferenceAttempts) {
      tx->Rollback();
      continue;
    }
    if (!result) {
      observability::Metrics::Instance().RecordOperation("store", false);
    }
    ThrowIfDbError(result, "store " + record.reference);
    CommitOrThrow(*tx, "store " + record.reference);
    break;
  }

  index_.Insert(ToIndexEntry(record));
  cache_.Put(record);

  db::model::TrustEventRecord event;
  event.reference        = record.reference;
  event.kind             = TRUST_EVENT_KIND_CREATE;
  event.reason           = verdict.compliant ? "stored" : "stored with governance violations";
  event.actor            = record.component;
  event.trust_before     = 0.0;
  event.trust_after      = record.trust;
  event.provenance_delta = record.provenance;
  event.consensus_delta  = record.consensus;
  event.governance_delta = record.governance;
  event.usage_delta      = record.usage;
  event.timestamp_ms     = now_ms;
  ledger_.Append(event);

  stores_.fetch_add(1);

  const bool flagged = !verdict.compliant && category_policy_.RequiresCompliance(record.category);
  if (flagged) {
    TRUSTMEM_LOG_WARN("artifact stored with constitutional violation",
                      {observability::StringField("reference", record.reference), observability::StringField("component", record.component),
                       observability::IntField("violations", static_cast<int64_t>(record.violations.size()))});
  } else {
    TRUSTMEM_LOG_DEBUG("artifact stored", {observability::StringField("reference", record.reference),
                                           observability::StringField("component", record.component),
                                           observability::DoubleField("trust", record.trust)});
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordOperation("store", true);
  metrics.ObserveOperationLatencyMs("store", ElapsedMs(started));

  MemoryRef ref;
  ref.set_reference(record.reference);
  *ref.mutable_created_at() = util::ToProto(now);
  ref.set_trust(record.trust);
  ref.set_constitutional_violation(flagged);
  for (const auto& violation : record.violations) ref.add_violations(violation);
  ref.set_requires_manual_review(record.requires_manual_review);
  return ref;
}

// ------------------------------------------------------------
// Read
// ------------------------------------------------------------

double MemoryBank::DecayedTrust(const db::model::ArtifactRecord& record, util::TimePoint now) const {
  try {
    return collector_.CurrentTrust(record, now);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidState("artifact " + record.reference + " has an unusable decay config: " + e.what());
  }
}

MemoryHit MemoryBank::ToHit(const db::model::ArtifactRecord& record, double trust, double rank) const {
  MemoryHit hit;
  if (!google::protobuf::util::JsonStringToMessage(record.payload_json, hit.mutable_payload()).ok()) {
    throw util::StorageError("artifact " + record.reference + " has a corrupt payload");
  }
  hit.set_reference(record.reference);
  hit.set_trust(trust);
  hit.set_rank(rank);
  hit.set_component(record.component);
  hit.set_category(record.category);
  *hit.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  hit.set_loop_id(record.loop_id);
  hit.set_domain(record.domain);
  for (const auto& tag : record.tags) hit.add_tags(tag);
  hit.set_importance(record.importance);
  hit.set_access_count(record.access_count);
  hit.set_archived(record.archived);
  hit.set_constitutional_compliance(record.constitutional_compliance);
  return hit;
}

std::vector<MemoryHit> MemoryBank::Read(const ReadRequest& request) {
  RequireRunning("read");
  const auto started = std::chrono::steady_clock::now();
  reads_.fetch_add(1);

  const auto& filters = request.filters();

  index::IndexQuery query;
  if (filters.has_component()) query.component = filters.component();
  if (filters.has_category()) query.category = filters.category();
  if (filters.has_loop_id()) query.loop_id = filters.loop_id();
  if (filters.has_domain()) query.domain = filters.domain();
  if (filters.has_tag()) query.tag = filters.tag();

  const auto candidates = index_.Lookup(query);

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto window = options_.recency_window;
  if (request.has_recency_window() && util::FromProtoDuration(request.recency_window()).count() > 0) {
    window = util::FromProtoDuration(request.recency_window());
  }
  const double   default_relevance = request.has_default_relevance() ? request.default_relevance() : options_.default_relevance;
  const uint32_t k                 = request.k() > 0 ? request.k() : options_.default_k;

  struct Scored {
    scoring::RankKey          key;
    db::model::ArtifactRecord record;
  };
  std::vector<Scored> scored;
  scored.reserve(candidates.size());

  auto skip = [this](const std::string& reference, const std::string& error) {
    skipped_candidates_.fetch_add(1);
    observability::Metrics::Instance().RecordReadSkipped();
    TRUSTMEM_LOG_WARN("read skipped candidate",
                      {observability::StringField("reference", reference), observability::StringField("error", error)});
  };

  for (const auto& reference : candidates) {
    auto record = cache_.Get(reference);
    if (!record || record->deleted) continue;
    if (record->archived && !filters.include_archived()) continue;
    if (!record->constitutional_compliance && !filters.include_non_compliant()) continue;

    double trust = 0.0;
    try {
      trust = DecayedTrust(*record, now);
    } catch (const std::exception& e) {
      skip(reference, e.what());
      continue;
    }
    if (filters.has_min_trust() && trust < filters.min_trust()) continue;

    auto       rel_it     = request.relevance().find(reference);
    const auto relevance  = rel_it == request.relevance().end() ? default_relevance : rel_it->second;
    auto       imp_it     = request.importance().find(reference);
    const auto importance = imp_it == request.importance().end() ? record->importance : imp_it->second;
    const auto recency    = scoring::ScoringModel::Recency(util::Duration(now_ms - record->created_at_ms), window);
    const auto rank       = model_->ComputeRank(trust, relevance, recency, importance);

    scored.push_back(Scored{
        .key    = scoring::RankKey{.rank = rank, .trust = trust, .created_at_ms = record->created_at_ms, .reference = reference},
        .record = std::move(*record),
    });
  }

  std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) { return scoring::RankOrder(a.key, b.key); });

  std::vector<MemoryHit> hits;
  for (const auto& candidate : scored) {
    if (hits.size() >= k) break;
    try {
      hits.push_back(ToHit(candidate.record, candidate.key.trust, candidate.key.rank));
    } catch (const std::exception& e) {
      skip(candidate.key.reference, e.what());
    }
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordOperation("read", true);
  metrics.ObserveOperationLatencyMs("read", ElapsedMs(started));
  return hits;
}

std::optional<MemoryHit> MemoryBank::Get(const std::string& reference, bool include_non_compliant) {
  RequireRunning("get");

  auto record = cache_.Get(reference);
  if (!record || record->deleted) return std::nullopt;
  if (!record->constitutional_compliance && !include_non_compliant) return std::nullopt;

  const auto now     = clock_->Now();
  const auto trust   = DecayedTrust(*record, now);
  const auto recency = scoring::ScoringModel::Recency(util::Duration(util::ToUnixMillis(now) - record->created_at_ms), options_.recency_window);
  return ToHit(*record, trust, model_->ComputeRank(trust, options_.default_relevance, recency, record->importance));
}

// ------------------------------------------------------------
// Trust updates
// ------------------------------------------------------------

db::model::ArtifactRecord MemoryBank::LoadLive(db::Transaction& tx, const std::string& reference) {
  auto record = FetchOrThrow(*repository_, tx, reference);
  if (!record || record->deleted) {
    throw util::NotFound("artifact not found: " + reference);
  }
  return *record;
}

void MemoryBank::Persist(db::Transaction& tx, db::model::ArtifactRecord& record, const char* op) {
  ++record.version;
  db::Result result;
  try {
    result = repository_->UpdateArtifact(tx, record);
  } catch (const std::exception& e) {
    throw util::StorageError(std::string(op) + ": update failed: " + e.what());
  }
  ThrowIfDbError(result, std::string(op) + " " + record.reference);
  CommitOrThrow(tx, std::string(op) + " " + record.reference);
}

void MemoryBank::Publish(const db::model::ArtifactRecord& record) {
  cache_.Put(record);
}

double MemoryBank::UpdateTrust(const std::string& reference, UseOutcome outcome, const std::string& reason, const std::string& actor) {
  RequireRunning("update_trust");
  if (outcome != USE_OUTCOME_SUCCESS && outcome != USE_OUTCOME_FAILURE && outcome != USE_OUTCOME_NEUTRAL) {
    throw util::ValidationError("update_trust: outcome is not recognized");
  }

  const auto                  started = std::chrono::steady_clock::now();
  auto                        mutex   = ArtifactMutex(reference);
  std::lock_guard<std::mutex> lock(*mutex);

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx     = BeginOrThrow(*repository_, "update_trust");
  auto record = LoadLive(*tx, reference);

  const double before       = DecayedTrust(record, now);
  const auto   update       = model_->UpdateOnUse(before, record.success_count, record.failure_count, outcome);
  const double usage_before = record.usage;

  ++record.access_count;
  if (outcome == USE_OUTCOME_SUCCESS) ++record.success_count;
  if (outcome == USE_OUTCOME_FAILURE) ++record.failure_count;

  record.usage               = model_->UsageSignal(record.access_count, record.success_count, record.failure_count);
  record.trust               = update.trust;
  record.scored_at_ms        = now_ms;
  record.updated_at_ms       = now_ms;
  record.last_accessed_at_ms = now_ms;

  Persist(*tx, record, "update_trust");
  Publish(record);

  db::model::TrustEventRecord event;
  event.reference    = reference;
  event.kind         = EventKindFor(outcome);
  event.reason       = reason;
  event.actor        = actor;
  event.trust_before = before;
  event.trust_after  = record.trust;
  event.usage_delta  = record.usage - usage_before;
  event.timestamp_ms = now_ms;
  ledger_.Append(event);

  trust_updates_.fetch_add(1);

  TRUSTMEM_LOG_DEBUG("trust updated", {observability::StringField("reference", reference),
                                       observability::StringField("outcome", UseOutcome_Name(outcome)),
                                       observability::DoubleField("before", before), observability::DoubleField("after", record.trust),
                                       observability::BoolField("bonus", update.bonus > 0.0)});

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordOperation("update_trust", true);
  metrics.ObserveOperationLatencyMs("update_trust", ElapsedMs(started));
  return record.trust;
}

double MemoryBank::AdjustTrust(const std::string& reference, double delta, const std::string& reason, const std::string& actor) {
  RequireRunning("adjust_trust");
  if (!std::isfinite(delta)) {
    throw util::ValidationError("adjust_trust: delta must be finite");
  }

  auto                        mutex = ArtifactMutex(reference);
  std::lock_guard<std::mutex> lock(*mutex);

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx     = BeginOrThrow(*repository_, "adjust_trust");
  auto record = LoadLive(*tx, reference);

  const double before  = DecayedTrust(record, now);
  record.trust         = scoring::Clamp01(before + delta);
  record.scored_at_ms  = now_ms;
  record.updated_at_ms = now_ms;

  Persist(*tx, record, "adjust_trust");
  Publish(record);

  db::model::TrustEventRecord event;
  event.reference    = reference;
  event.kind         = TRUST_EVENT_KIND_MANUAL_ADJUSTMENT;
  event.reason       = reason;
  event.actor        = actor;
  event.trust_before = before;
  event.trust_after  = record.trust;
  event.timestamp_ms = now_ms;
  ledger_.Append(event);

  trust_updates_.fetch_add(1);
  TRUSTMEM_LOG_INFO("trust adjusted", {observability::StringField("reference", reference), observability::StringField("actor", actor),
                                       observability::DoubleField("before", before), observability::DoubleField("after", record.trust)});
  return record.trust;
}

double MemoryBank::Reclassify(const std::string& reference, DecayCurve curve, util::Duration half_life, const std::string& reason,
                              const std::string& actor) {
  RequireRunning("reclassify");
  if (!scoring::IsKnownCurve(curve)) {
    throw util::ValidationError("reclassify: decay curve is not recognized");
  }
  if (half_life.count() <= 0) {
    throw util::ValidationError("reclassify: half_life must be positive");
  }

  auto                        mutex = ArtifactMutex(reference);
  std::lock_guard<std::mutex> lock(*mutex);

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx     = BeginOrThrow(*repository_, "reclassify");
  auto record = LoadLive(*tx, reference);

  // Re-base: trust so far keeps the old curve, the new curve starts now.
  const double before  = DecayedTrust(record, now);
  record.trust         = before;
  record.decay_curve   = curve;
  record.half_life_ms  = half_life.count();
  record.scored_at_ms  = now_ms;
  record.updated_at_ms = now_ms;

  Persist(*tx, record, "reclassify");
  Publish(record);

  db::model::TrustEventRecord event;
  event.reference    = reference;
  event.kind         = TRUST_EVENT_KIND_RECLASSIFY;
  event.reason       = reason.empty() ? "decay reclassified to " + DecayCurve_Name(curve) : reason;
  event.actor        = actor;
  event.trust_before = before;
  event.trust_after  = record.trust;
  event.timestamp_ms = now_ms;
  ledger_.Append(event);

  return record.trust;
}

// ------------------------------------------------------------
// Garbage collection
// ------------------------------------------------------------

gc::GcAction MemoryBank::ApplyGcDecision(const GcPolicy& policy, const std::string& reference, gc::GcAction planned, gc::GcReason reason) {
  std::shared_ptr<std::mutex> mutex;
  try {
    mutex = ArtifactMutex(reference);
  } catch (const util::NotFound&) {
    // Deleted by a concurrent run since the scan.
    return gc::GcAction::kNone;
  }
  std::lock_guard<std::mutex> lock(*mutex);

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx     = BeginOrThrow(*repository_, "gc");
  auto stored = FetchOrThrow(*repository_, *tx, reference);

  // Another run or writer may have handled it since the scan.
  if (!stored || stored->deleted) return gc::GcAction::kNone;
  if (stored->archived && planned == gc::GcAction::kArchive) return gc::GcAction::kNone;

  auto   action = planned;
  double trust  = 0.0;
  if (reason == gc::GcReason::kCapacity) {
    trust = DecayedTrust(*stored, now);
  } else {
    const auto decision = collector_.Evaluate(policy, *stored, now);
    action              = decision.action;
    reason              = decision.reason;
    trust               = decision.trust;
  }
  if (action == gc::GcAction::kNone) return action;

  if (action == gc::GcAction::kDelete) {
    stored->deleted = true;
  } else {
    stored->archived = true;
  }
  stored->updated_at_ms = now_ms;

  Persist(*tx, *stored, "gc");

  if (action == gc::GcAction::kDelete) {
    // A Read holding this reference from an earlier index lookup drops it
    // on the cache miss. Waiters on the released mutex load the deleted row.
    index_.Remove(reference);
    cache_.Erase(reference);
    ReleaseArtifactMutex(reference);
  } else {
    Publish(*stored);
  }

  db::model::TrustEventRecord event;
  event.reference    = reference;
  event.kind         = action == gc::GcAction::kDelete ? TRUST_EVENT_KIND_GC_DELETE : TRUST_EVENT_KIND_GC_ARCHIVE;
  event.reason       = gc::ToString(reason);
  event.actor        = "gc:" + policy.name();
  event.trust_before = trust;
  event.trust_after  = trust;
  event.timestamp_ms = now_ms;
  ledger_.Append(event);

  if (action == gc::GcAction::kDelete && policy.purge_deleted()) {
    try {
      auto purge = repository_->Begin();
      ThrowIfDbError(repository_->DeleteArtifact(*purge, reference), "purge " + reference);
      purge->Commit();
    } catch (const std::exception& e) {
      TRUSTMEM_LOG_WARN("gc purge failed; artifact stays marked deleted",
                        {observability::StringField("reference", reference), observability::StringField("error", e.what())});
    }
  }

  TRUSTMEM_LOG_DEBUG("gc decision applied", {observability::StringField("reference", reference),
                                             observability::StringField("action", gc::ToString(action)),
                                             observability::StringField("reason", gc::ToString(reason)),
                                             observability::DoubleField("trust", trust)});
  return action;
}

GcSummary MemoryBank::GarbageCollect(const GcPolicy& policy, std::stop_token stop) {
  RequireRunning("garbage_collect");
  gc::GarbageCollector::ValidatePolicy(policy);

  const auto started = std::chrono::steady_clock::now();
  const auto now     = clock_->Now();

  uint64_t scanned   = 0;
  uint64_t archived  = 0;
  uint64_t deleted   = 0;
  bool     cancelled = false;

  auto count = [&](gc::GcAction action) {
    if (action == gc::GcAction::kArchive) ++archived;
    if (action == gc::GcAction::kDelete) ++deleted;
  };

  auto apply = [&](const std::string& reference, gc::GcAction action, gc::GcReason reason) {
    if (policy.dry_run()) {
      count(action);
      return;
    }
    try {
      count(ApplyGcDecision(policy, reference, action, reason));
    } catch (const std::exception& e) {
      TRUSTMEM_LOG_ERROR("gc decision failed", {observability::StringField("policy", policy.name()),
                                                observability::StringField("reference", reference),
                                                observability::StringField("error", e.what())});
    }
  };

  std::vector<scoring::RankKey> survivors;

  for (const auto& reference : index_.Lookup(gc::GarbageCollector::ScopeQuery(policy))) {
    if (stop.stop_requested()) {
      cancelled = true;
      break;
    }

    auto record = cache_.Get(reference);
    if (!record || record->deleted) continue;
    if (record->archived && !policy.rescan_archived()) continue;
    ++scanned;

    gc::GcDecision decision;
    try {
      decision = collector_.Evaluate(policy, *record, now);
    } catch (const std::exception& e) {
      TRUSTMEM_LOG_WARN("gc skipped candidate", {observability::StringField("reference", reference), observability::StringField("error", e.what())});
      continue;
    }

    if (decision.action == gc::GcAction::kNone) {
      if (!record->archived) survivors.push_back(collector_.EvictionKey(*record, decision.trust));
      continue;
    }
    apply(reference, decision.action, decision.reason);
  }

  if (!cancelled) {
    for (const auto& reference : collector_.CapacityEvictions(policy, std::move(survivors))) {
      if (stop.stop_requested()) {
        cancelled = true;
        break;
      }
      apply(reference, gc::GcAction::kArchive, gc::GcReason::kCapacity);
    }
  }

  const auto duration = std::chrono::duration_cast<util::Duration>(std::chrono::steady_clock::now() - started);

  db::model::GcLogRecord entry;
  entry.policy_name       = policy.name();
  entry.scanned           = scanned;
  entry.archived          = archived;
  entry.deleted           = deleted;
  entry.archive_threshold = policy.archive_threshold();
  entry.delete_threshold  = policy.delete_threshold();
  entry.max_age_ms        = util::FromProtoDuration(policy.max_age()).count();
  entry.duration_ms       = duration.count();
  entry.timestamp_ms      = util::ToUnixMillis(now);
  entry.dry_run           = policy.dry_run();
  entry.cancelled         = cancelled;
  ledger_.AppendGcLog(entry);

  auto& metrics = observability::Metrics::Instance();
  metrics.ObserveGcDurationMs(policy.name(), static_cast<double>(duration.count()));
  if (!policy.dry_run()) metrics.RecordGcDecisions(policy.name(), archived, deleted);

  TRUSTMEM_LOG_INFO("gc run finished", {observability::StringField("policy", policy.name()),
                                        observability::IntField("scanned", static_cast<int64_t>(scanned)),
                                        observability::IntField("archived", static_cast<int64_t>(archived)),
                                        observability::IntField("deleted", static_cast<int64_t>(deleted)),
                                        observability::BoolField("dry_run", policy.dry_run()), observability::BoolField("cancelled", cancelled)});

  GcSummary summary;
  summary.set_policy_name(policy.name());
  summary.set_scanned(scanned);
  summary.set_archived(archived);
  summary.set_deleted(deleted);
  *summary.mutable_duration()  = util::ToProtoDuration(duration);
  *summary.mutable_timestamp() = util::ToProto(now);
  summary.set_dry_run(policy.dry_run());
  summary.set_cancelled(cancelled);
  return summary;
}

// ------------------------------------------------------------
// Audit
// ------------------------------------------------------------

std::vector<TrustEvent> MemoryBank::GetTrustHistory(const std::string& reference) {
  RequireRunning("get_trust_history");

  const auto records = ledger_.History(reference);
  if (records.empty()) {
    auto tx     = BeginOrThrow(*repository_, "get_trust_history");
    auto stored = FetchOrThrow(*repository_, *tx, reference);
    CommitOrThrow(*tx, "get_trust_history");

    if (!stored) {
      throw util::NotFound("artifact not found: " + reference);
    }
    TRUSTMEM_LOG_WARN("data integrity: artifact has no trust history", {observability::StringField("reference", reference)});
    return {};
  }

  std::vector<TrustEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) events.push_back(ToProto(record));
  return events;
}

std::size_t MemoryBank::SnapshotDecay() {
  RequireRunning("snapshot_decay");

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  std::vector<db::model::TrustEventRecord> events;
  for (const auto& record : cache_.Snapshot()) {
    if (record.archived || record.deleted) continue;

    double trust = 0.0;
    try {
      trust = DecayedTrust(record, now);
    } catch (const std::exception& e) {
      TRUSTMEM_LOG_WARN("decay snapshot skipped artifact",
                        {observability::StringField("reference", record.reference), observability::StringField("error", e.what())});
      continue;
    }

    db::model::TrustEventRecord event;
    event.reference    = record.reference;
    event.kind         = TRUST_EVENT_KIND_DECAY_SNAPSHOT;
    event.reason       = "periodic decay snapshot";
    event.actor        = "scheduler";
    event.trust_before = record.trust;
    event.trust_after  = trust;
    event.timestamp_ms = now_ms;
    events.push_back(std::move(event));
  }

  if (!ledger_.Append(events)) return 0;
  return events.size();
}

std::vector<GcLogEntry> MemoryBank::ListGcLog(std::size_t limit) {
  RequireRunning("list_gc_log");

  std::vector<GcLogEntry> out;
  for (const auto& record : ledger_.RecentGcLog(limit)) out.push_back(ToProto(record));
  return out;
}

BankStats MemoryBank::Stats() const {
  BankStats stats;
  for (const auto& record : cache_.Snapshot()) {
    if (record.deleted) continue;
    if (record.archived) {
      stats.set_archived_artifacts(stats.archived_artifacts() + 1);
    } else {
      stats.set_live_artifacts(stats.live_artifacts() + 1);
    }
    if (!record.constitutional_compliance) {
      stats.set_non_compliant_artifacts(stats.non_compliant_artifacts() + 1);
    }
  }
  stats.set_stores(stores_.load());
  stats.set_reads(reads_.load());
  stats.set_trust_updates(trust_updates_.load());
  stats.set_skipped_candidates(skipped_candidates_.load());
  stats.set_audit_gaps(ledger_.AuditGaps());
  return stats;
}

} // namespace trustmem::core
