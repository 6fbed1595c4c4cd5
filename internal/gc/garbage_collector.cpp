#include "internal/gc/garbage_collector.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace trustmem::gc {

const char* ToString(GcAction action) {
  switch (action) {
    case GcAction::kNone:
      return "none";
    case GcAction::kArchive:
      return "archive";
    case GcAction::kDelete:
      return "delete";
  }
  return "unknown";
}

const char* ToString(GcReason reason) {
  switch (reason) {
    case GcReason::kNone:
      return "none";
    case GcReason::kBelowDeleteThreshold:
      return "below_delete_threshold";
    case GcReason::kBelowArchiveThreshold:
      return "below_archive_threshold";
    case GcReason::kMaxAge:
      return "max_age";
    case GcReason::kExpired:
      return "expired";
    case GcReason::kCapacity:
      return "capacity";
  }
  return "unknown";
}

GarbageCollector::GarbageCollector(std::shared_ptr<const scoring::ScoringModel> model) : model_(std::move(model)) {
}

void GarbageCollector::ValidatePolicy(const trustmem::v1::GcPolicy& policy) {
  auto in_unit = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };

  if (policy.name().empty()) {
    throw util::ValidationError("gc policy: name is required");
  }
  if (!in_unit(policy.archive_threshold())) {
    throw util::ValidationError("gc policy " + policy.name() + ": archive_threshold must be in [0,1]");
  }
  if (!in_unit(policy.delete_threshold())) {
    throw util::ValidationError("gc policy " + policy.name() + ": delete_threshold must be in [0,1]");
  }
  if (policy.max_age().seconds() < 0 || policy.max_age().nanos() < 0) {
    throw util::ValidationError("gc policy " + policy.name() + ": max_age must not be negative");
  }
  if (policy.delete_threshold() > policy.archive_threshold()) {
    throw util::PolicyConflict("gc policy " + policy.name() + ": delete_threshold exceeds archive_threshold");
  }
}

index::IndexQuery GarbageCollector::ScopeQuery(const trustmem::v1::GcPolicy& policy) {
  index::IndexQuery query;
  if (!policy.has_scope()) return query;

  const auto& scope = policy.scope();
  if (scope.has_component()) query.component = scope.component();
  if (scope.has_category()) query.category = scope.category();
  if (scope.has_loop_id()) query.loop_id = scope.loop_id();
  if (scope.has_domain()) query.domain = scope.domain();
  return query;
}

double GarbageCollector::CurrentTrust(const db::model::ArtifactRecord& record, util::TimePoint now) const {
  const auto age = util::Duration(util::ToUnixMillis(now) - record.scored_at_ms);
  return scoring::ScoringModel::ApplyDecay(record.trust, age, record.decay_curve, util::Duration(record.half_life_ms));
}

GcDecision GarbageCollector::Evaluate(const trustmem::v1::GcPolicy& policy, const db::model::ArtifactRecord& record, util::TimePoint now) const {
  GcDecision decision;
  if (record.deleted) return decision;

  decision.trust = CurrentTrust(record, now);

  if (decision.trust < policy.delete_threshold()) {
    decision.action = GcAction::kDelete;
    decision.reason = GcReason::kBelowDeleteThreshold;
    return decision;
  }

  if (record.archived) return decision;

  const auto now_ms  = util::ToUnixMillis(now);
  const auto max_age = util::FromProtoDuration(policy.max_age());

  if (decision.trust < policy.archive_threshold()) {
    decision.action = GcAction::kArchive;
    decision.reason = GcReason::kBelowArchiveThreshold;
  } else if (max_age.count() > 0 && now_ms - record.created_at_ms > max_age.count()) {
    decision.action = GcAction::kArchive;
    decision.reason = GcReason::kMaxAge;
  } else if (record.expires_at_ms > 0 && now_ms >= record.expires_at_ms) {
    decision.action = GcAction::kArchive;
    decision.reason = GcReason::kExpired;
  }
  return decision;
}

scoring::RankKey GarbageCollector::EvictionKey(const db::model::ArtifactRecord& record, double trust) const {
  return scoring::RankKey{
      .rank          = model_->ComputeRank(trust, 0.0, 0.0, record.importance),
      .trust         = trust,
      .created_at_ms = record.created_at_ms,
      .reference     = record.reference,
  };
}

std::vector<std::string> GarbageCollector::CapacityEvictions(const trustmem::v1::GcPolicy& policy, std::vector<scoring::RankKey> survivors) const {
  const auto cap = policy.max_artifacts();
  if (cap == 0 || survivors.size() <= cap) return {};

  std::sort(survivors.begin(), survivors.end(), scoring::RankOrder);

  std::vector<std::string> evict;
  evict.reserve(survivors.size() - cap);
  // Lowest rank first.
  for (auto it = survivors.rbegin(); it != survivors.rend() - static_cast<std::ptrdiff_t>(cap); ++it) {
    evict.push_back(it->reference);
  }
  return evict;
}

} // namespace trustmem::gc
