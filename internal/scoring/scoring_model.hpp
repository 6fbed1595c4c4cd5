#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/util/time.hpp"
#include "trustmem/v1/memory.pb.h"

namespace trustmem::scoring {

/*
  Scoring model

  Stateless formulas for initial trust, time decay, usage updates and
  retrieval rank. Every function is const and never touches shared state, so
  one instance is shared by all bank threads.
*/

struct TrustWeights {
  double provenance = 0.30;
  double consensus  = 0.25;
  double governance = 0.30;
  double usage      = 0.15;
};

struct RankWeights {
  double trust      = 0.40;
  double relevance  = 0.35;
  double recency    = 0.15;
  double importance = 0.10;
};

struct DecaySetting {
  trustmem::v1::DecayCurve curve = trustmem::v1::DECAY_CURVE_UNSPECIFIED;
  util::Duration           half_life{0};
};

struct ScoringConfig {
  TrustWeights trust_weights;
  RankWeights  rank_weights;

  // Configured reputations are clamped into [min_reputation, max_reputation].
  double                        min_reputation     = 0.70;
  double                        max_reputation     = 0.95;
  double                        default_reputation = 0.70;
  std::map<std::string, double> reputation;

  double default_consensus = 0.5;
  double violation_penalty = 0.15;

  double   success_reward       = 0.05;
  double   success_damping      = 0.1;
  double   failure_penalty      = 0.08;
  double   failure_damping      = 0.05;
  double   consistency_bonus    = 0.02;
  double   consistency_rate     = 0.80;
  uint64_t consistency_min_uses = 5;

  double usage_access_saturation = 20.0;
  double usage_success_weight    = 0.5;

  std::map<trustmem::v1::OutputCategory, DecaySetting> decay;

  static ScoringConfig Defaults();
};

struct TrustSignals {
  double provenance = 0.0;
  double consensus  = 0.0;
  double governance = 0.0;
  double usage      = 0.0;
};

struct InitialTrust {
  double       trust = 0.0;
  TrustSignals signals;
  bool         requires_manual_review = false;
};

struct UsageUpdate {
  double trust = 0.0;
  // trust - current_trust after clamping
  double delta = 0.0;
  double bonus = 0.0;
};

class ScoringModel {
 public:
  explicit ScoringModel(ScoringConfig config = ScoringConfig::Defaults());

  const ScoringConfig& Config() const {
    return config_;
  }

  InitialTrust ComputeInitialTrust(double provenance_reputation, double producer_confidence, std::optional<double> consensus_quality,
                                   bool governance_compliant, std::size_t violation_count, double usage_signal = 0.0) const;

  double Composite(const TrustSignals& signals) const;

  // Throws std::invalid_argument for an unknown curve or a non-positive half-life.
  static double ApplyDecay(double value, util::Duration age, trustmem::v1::DecayCurve curve, util::Duration half_life);

  // Counts are the pre-update counts. The consistency bonus needs
  // consistency_min_uses judged uses before this one.
  UsageUpdate UpdateOnUse(double current_trust, uint64_t success_count, uint64_t failure_count, trustmem::v1::UseOutcome outcome) const;

  double UsageSignal(uint64_t access_count, uint64_t success_count, uint64_t failure_count) const;

  double ComputeRank(double trust, double relevance, double recency, double importance) const;

  static double Recency(util::Duration age, util::Duration window);

  DecaySetting DefaultDecay(trustmem::v1::OutputCategory category) const;

  double Reputation(const std::string& component) const;

 private:
  ScoringConfig config_;
};

double Clamp01(double value);

bool IsKnownCurve(trustmem::v1::DecayCurve curve);

// Result ordering: rank desc, trust desc, created_at desc, reference asc.
struct RankKey {
  double      rank          = 0.0;
  double      trust         = 0.0;
  int64_t     created_at_ms = 0;
  std::string reference;
};

bool RankOrder(const RankKey& a, const RankKey& b);

} // namespace trustmem::scoring
