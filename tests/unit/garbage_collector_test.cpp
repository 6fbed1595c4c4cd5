#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/gc/garbage_collector.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/bank_fixture.hpp"

namespace {

using trustmem::gc::GarbageCollector;
using trustmem::gc::GcAction;
using trustmem::gc::GcReason;
using trustmem::scoring::ScoringModel;
using trustmem::testing::Epoch;
using trustmem::testing::MakeRecord;
using trustmem::util::Days;
using namespace trustmem::v1;

GcPolicy Policy(double archive, double del, double max_age_days = 0) {
  GcPolicy p;
  p.set_name("unit");
  p.set_archive_threshold(archive);
  p.set_delete_threshold(del);
  if (max_age_days > 0) *p.mutable_max_age() = trustmem::util::ToProtoDuration(Days(max_age_days));
  return p;
}

GarbageCollector Collector() {
  return GarbageCollector(std::make_shared<const ScoringModel>());
}

template <typename E>
bool Throws(const GcPolicy& p) {
  try {
    GarbageCollector::ValidatePolicy(p);
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestValidatePolicy() {
  GarbageCollector::ValidatePolicy(Policy(0.2, 0.1, 30));
  GarbageCollector::ValidatePolicy(Policy(0.2, 0.2));

  assert(Throws<trustmem::util::PolicyConflict>(Policy(0.1, 0.3)));
  assert(Throws<trustmem::util::ValidationError>(Policy(1.2, 0.1)));
  assert(Throws<trustmem::util::ValidationError>(Policy(0.2, -0.1)));
  assert(Throws<trustmem::util::ValidationError>(Policy(std::nan(""), 0.1)));

  auto unnamed = Policy(0.2, 0.1);
  unnamed.clear_name();
  assert(Throws<trustmem::util::ValidationError>(unnamed));

  auto negative_age = Policy(0.2, 0.1);
  negative_age.mutable_max_age()->set_seconds(-5);
  assert(Throws<trustmem::util::ValidationError>(negative_age));
}

void TestEvaluateThresholds() {
  const auto gc     = Collector();
  const auto policy = Policy(0.2, 0.1, 30);
  const auto now    = Epoch() + Days(1);

  // 0.05 / (1 + 1/7) is below delete.
  auto low      = gc.Evaluate(policy, MakeRecord("mem_low", 0.05, Epoch(), Epoch()), now);
  assert(low.action == GcAction::kDelete);
  assert(low.reason == GcReason::kBelowDeleteThreshold);
  assert(std::abs(low.trust - 0.05 / (1.0 + 1.0 / 7.0)) < 1e-9);

  auto mid = gc.Evaluate(policy, MakeRecord("mem_mid", 0.2, Epoch(), Epoch()), now);
  assert(mid.action == GcAction::kArchive);
  assert(mid.reason == GcReason::kBelowArchiveThreshold);

  auto high = gc.Evaluate(policy, MakeRecord("mem_high", 0.8, Epoch(), Epoch()), now);
  assert(high.action == GcAction::kNone);
  assert(high.reason == GcReason::kNone);
}

void TestEvaluateAgeAndExpiry() {
  const auto gc     = Collector();
  const auto policy = Policy(0.2, 0.1, 30);
  const auto now    = Epoch();

  // Scored recently but created long ago.
  auto old = MakeRecord("mem_old", 0.9, Epoch() - Days(31), Epoch());
  auto d   = gc.Evaluate(policy, old, now);
  assert(d.action == GcAction::kArchive);
  assert(d.reason == GcReason::kMaxAge);

  auto expiring          = MakeRecord("mem_exp", 0.9, Epoch() - Days(1), Epoch());
  expiring.expires_at_ms = trustmem::util::ToUnixMillis(now);
  d                      = gc.Evaluate(policy, expiring, now);
  assert(d.action == GcAction::kArchive);
  assert(d.reason == GcReason::kExpired);

  expiring.expires_at_ms = trustmem::util::ToUnixMillis(now + Days(1));
  assert(gc.Evaluate(policy, expiring, now).action == GcAction::kNone);

  // No max_age configured.
  assert(gc.Evaluate(Policy(0.2, 0.1), old, now).action == GcAction::kNone);
}

void TestArchivedAndDeleted() {
  const auto gc     = Collector();
  const auto policy = Policy(0.2, 0.1, 30);

  auto archived     = MakeRecord("mem_a", 0.15, Epoch(), Epoch());
  archived.archived = true;
  assert(gc.Evaluate(policy, archived, Epoch()).action == GcAction::kNone);

  archived.trust = 0.05;
  auto d         = gc.Evaluate(policy, archived, Epoch());
  assert(d.action == GcAction::kDelete);

  auto deleted    = MakeRecord("mem_d", 0.0, Epoch(), Epoch());
  deleted.deleted = true;
  assert(gc.Evaluate(policy, deleted, Epoch()).action == GcAction::kNone);
}

void TestUnusableDecayThrows() {
  const auto gc     = Collector();
  auto       broken = MakeRecord("mem_x", 0.5, Epoch(), Epoch());
  broken.decay_curve = DECAY_CURVE_UNSPECIFIED;

  bool threw = false;
  try {
    gc.Evaluate(Policy(0.2, 0.1), broken, Epoch() + Days(1));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestCapacityEvictions() {
  const auto gc     = Collector();
  auto       policy = Policy(0.2, 0.1);
  policy.set_max_artifacts(2);

  std::vector<trustmem::scoring::RankKey> survivors;
  for (auto [ref, trust] : std::vector<std::pair<std::string, double>>{{"mem_a", 0.9}, {"mem_b", 0.3}, {"mem_c", 0.6}, {"mem_d", 0.4}}) {
    survivors.push_back(gc.EvictionKey(MakeRecord(ref, trust, Epoch(), Epoch()), trust));
  }

  const auto evict = gc.CapacityEvictions(policy, survivors);
  assert(evict.size() == 2);
  assert(evict[0] == "mem_b");
  assert(evict[1] == "mem_d");

  policy.set_max_artifacts(4);
  assert(gc.CapacityEvictions(policy, survivors).empty());
  policy.set_max_artifacts(0);
  assert(gc.CapacityEvictions(policy, survivors).empty());
}

void TestScopeQuery() {
  auto policy = Policy(0.2, 0.1);
  auto query  = GarbageCollector::ScopeQuery(policy);
  assert(!query.component && !query.category && !query.loop_id && !query.domain);

  policy.mutable_scope()->set_component("hunter");
  policy.mutable_scope()->set_category(OUTPUT_CATEGORY_ACTION);
  query = GarbageCollector::ScopeQuery(policy);
  assert(query.component && *query.component == "hunter");
  assert(query.category && *query.category == OUTPUT_CATEGORY_ACTION);
  assert(!query.loop_id);
}

void TestNames() {
  assert(std::string(trustmem::gc::ToString(GcAction::kArchive)) == "archive");
  assert(std::string(trustmem::gc::ToString(GcReason::kMaxAge)) == "max_age");
  assert(std::string(trustmem::gc::ToString(GcReason::kCapacity)) == "capacity");
}

} // namespace

int main() {
  TestValidatePolicy();
  TestEvaluateThresholds();
  TestEvaluateAgeAndExpiry();
  TestArchivedAndDeleted();
  TestUnusableDecayThrows();
  TestCapacityEvictions();
  TestScopeQuery();
  TestNames();

  std::cout << "garbage_collector_test: pass\n";
  return 0;
}
