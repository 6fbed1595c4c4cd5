#include "internal/scoring/scoring_model.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace trustmem::scoring {

using trustmem::v1::DecayCurve;
using trustmem::v1::OutputCategory;
using trustmem::v1::UseOutcome;

double Clamp01(double value) {
  if (std::isnan(value)) return 0.0;
  return std::clamp(value, 0.0, 1.0);
}

bool IsKnownCurve(DecayCurve curve) {
  return curve == trustmem::v1::DECAY_CURVE_HYPERBOLIC || curve == trustmem::v1::DECAY_CURVE_EXPONENTIAL ||
         curve == trustmem::v1::DECAY_CURVE_LINEAR;
}

ScoringConfig ScoringConfig::Defaults() {
  ScoringConfig config;

  config.reputation = {
      {"parliament", 0.95},
      {"reflection", 0.90},
      {"hunter", 0.90},
      {"meta_loop", 0.85},
  };

  config.decay = {
      {trustmem::v1::OUTPUT_CATEGORY_REASONING, {trustmem::v1::DECAY_CURVE_HYPERBOLIC, util::Days(7)}},
      {trustmem::v1::OUTPUT_CATEGORY_DECISION, {trustmem::v1::DECAY_CURVE_HYPERBOLIC, util::Days(7)}},
      {trustmem::v1::OUTPUT_CATEGORY_ACTION, {trustmem::v1::DECAY_CURVE_EXPONENTIAL, util::Days(3.5)}},
      {trustmem::v1::OUTPUT_CATEGORY_PREDICTION, {trustmem::v1::DECAY_CURVE_EXPONENTIAL, util::Days(3.5)}},
      {trustmem::v1::OUTPUT_CATEGORY_OBSERVATION, {trustmem::v1::DECAY_CURVE_LINEAR, util::Days(1.5)}},
      {trustmem::v1::OUTPUT_CATEGORY_GENERATION, {trustmem::v1::DECAY_CURVE_LINEAR, util::Days(1.5)}},
  };

  return config;
}

ScoringModel::ScoringModel(ScoringConfig config) : config_(std::move(config)) {
  for (auto& [_, value] : config_.reputation) {
    value = std::clamp(value, config_.min_reputation, config_.max_reputation);
  }
  config_.default_reputation = std::clamp(config_.default_reputation, config_.min_reputation, config_.max_reputation);
}

InitialTrust ScoringModel::ComputeInitialTrust(double provenance_reputation, double producer_confidence, std::optional<double> consensus_quality,
                                               bool governance_compliant, std::size_t violation_count, double usage_signal) const {
  InitialTrust out;

  out.signals.provenance = Clamp01(Clamp01(provenance_reputation) * Clamp01(producer_confidence));
  out.signals.consensus  = Clamp01(consensus_quality.value_or(config_.default_consensus));

  if (governance_compliant) {
    out.signals.governance = 1.0;
  } else {
    // A non-compliant verdict with no listed reasons still counts as one violation.
    const auto counted     = std::max<std::size_t>(1, violation_count);
    out.signals.governance = Clamp01(1.0 - config_.violation_penalty * static_cast<double>(counted));
    out.requires_manual_review = true;
  }

  out.signals.usage = Clamp01(usage_signal);
  out.trust         = Composite(out.signals);
  return out;
}

double ScoringModel::Composite(const TrustSignals& s) const {
  const auto& w = config_.trust_weights;
  return Clamp01(Clamp01(s.provenance) * w.provenance + Clamp01(s.consensus) * w.consensus + Clamp01(s.governance) * w.governance +
                 Clamp01(s.usage) * w.usage);
}

double ScoringModel::ApplyDecay(double value, util::Duration age, DecayCurve curve, util::Duration half_life) {
  if (half_life.count() <= 0) {
    throw std::invalid_argument("decay half-life must be positive");
  }

  if (age.count() <= 0) {
    switch (curve) {
      case trustmem::v1::DECAY_CURVE_HYPERBOLIC:
      case trustmem::v1::DECAY_CURVE_EXPONENTIAL:
      case trustmem::v1::DECAY_CURVE_LINEAR:
        return value;
      default:
        throw std::invalid_argument("unknown decay curve");
    }
  }

  const double ratio = static_cast<double>(age.count()) / static_cast<double>(half_life.count());

  switch (curve) {
    case trustmem::v1::DECAY_CURVE_HYPERBOLIC:
      return value / (1.0 + ratio);
    case trustmem::v1::DECAY_CURVE_EXPONENTIAL:
      return value * std::exp2(-ratio);
    case trustmem::v1::DECAY_CURVE_LINEAR:
      return std::max(0.0, value * (1.0 - ratio / 2.0));
    default:
      throw std::invalid_argument("unknown decay curve");
  }
}

UsageUpdate ScoringModel::UpdateOnUse(double current_trust, uint64_t success_count, uint64_t failure_count, UseOutcome outcome) const {
  // The bonus sample floor counts judged uses before this one.
  const auto prior_judged = success_count + failure_count;

  double delta = 0.0;
  switch (outcome) {
    case trustmem::v1::USE_OUTCOME_SUCCESS:
      delta = config_.success_reward / (1.0 + static_cast<double>(success_count) * config_.success_damping);
      ++success_count;
      break;
    case trustmem::v1::USE_OUTCOME_FAILURE:
      delta = -config_.failure_penalty / (1.0 + static_cast<double>(failure_count) * config_.failure_damping);
      ++failure_count;
      break;
    case trustmem::v1::USE_OUTCOME_NEUTRAL:
      break;
    default:
      throw std::invalid_argument("unknown use outcome");
  }

  UsageUpdate out;
  const auto  judged = success_count + failure_count;
  if (outcome != trustmem::v1::USE_OUTCOME_NEUTRAL && prior_judged >= config_.consistency_min_uses && judged > 0) {
    const double rate = static_cast<double>(success_count) / static_cast<double>(judged);
    if (rate > config_.consistency_rate) {
      out.bonus = config_.consistency_bonus;
    }
  }

  const double before = Clamp01(current_trust);
  out.trust           = Clamp01(before + delta + out.bonus);
  out.delta           = out.trust - before;
  return out;
}

double ScoringModel::UsageSignal(uint64_t access_count, uint64_t success_count, uint64_t failure_count) const {
  const auto   judged = success_count + failure_count;
  const double rate   = judged == 0 ? 0.0 : static_cast<double>(success_count) / static_cast<double>(judged);
  return std::min(1.0, static_cast<double>(access_count) / config_.usage_access_saturation + rate * config_.usage_success_weight);
}

double ScoringModel::ComputeRank(double trust, double relevance, double recency, double importance) const {
  const auto& w = config_.rank_weights;
  return Clamp01(trust) * w.trust + Clamp01(relevance) * w.relevance + Clamp01(recency) * w.recency + Clamp01(importance) * w.importance;
}

double ScoringModel::Recency(util::Duration age, util::Duration window) {
  if (window.count() <= 0) return 0.0;
  const double normalized = static_cast<double>(age.count()) / static_cast<double>(window.count());
  return 1.0 - std::clamp(normalized, 0.0, 1.0);
}

DecaySetting ScoringModel::DefaultDecay(OutputCategory category) const {
  auto it = config_.decay.find(category);
  if (it == config_.decay.end()) {
    throw std::invalid_argument("no decay configured for category " + trustmem::v1::OutputCategory_Name(category));
  }
  return it->second;
}

double ScoringModel::Reputation(const std::string& component) const {
  auto it = config_.reputation.find(component);
  return it == config_.reputation.end() ? config_.default_reputation : it->second;
}

bool RankOrder(const RankKey& a, const RankKey& b) {
  if (a.rank != b.rank) return a.rank > b.rank;
  if (a.trust != b.trust) return a.trust > b.trust;
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
  return a.reference < b.reference;
}

} // namespace trustmem::scoring
