#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/memory_bank.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/bank_fixture.hpp"

namespace {

using trustmem::testing::Epoch;
using trustmem::testing::HookedRepository;
using trustmem::testing::MakeBank;
using trustmem::testing::MakeOutput;
using trustmem::testing::MakeRecord;
using trustmem::util::Days;
using namespace trustmem::v1;

bool Near(double a, double b, double eps = 1e-6) {
  return std::abs(a - b) < eps;
}

template <typename E>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestSuccessesHaveDiminishingReturns() {
  auto       f     = MakeBank();
  const auto ref   = f.bank->Store(MakeOutput("meta_loop", OUTPUT_CATEGORY_REASONING, 0.95, 0.90)).reference();
  double     trust = f.bank->Get(ref)->trust();
  const auto start = trust;

  double last_delta = 1.0;
  for (int i = 0; i < 5; ++i) {
    const double next  = f.bank->UpdateTrust(ref, USE_OUTCOME_SUCCESS, "plan executed");
    const double delta = next - trust;
    assert(delta > 0.0);
    assert(delta < last_delta);
    last_delta = delta;
    trust      = next;
  }
  assert(trust > start);
  assert(trust < start + 5 * 0.05);

  const auto hit = f.bank->Get(ref);
  assert(hit->access_count() == 5);
  assert(Near(hit->trust(), trust));
  assert(f.bank->Stats().trust_updates() == 5);
}

void TestFailureAndNeutral() {
  auto       f   = MakeBank();
  const auto ref = f.bank->Store(MakeOutput("hunter")).reference();

  const double after_failure = f.bank->UpdateTrust(ref, USE_OUTCOME_FAILURE, "wrong answer", "evaluator");
  assert(Near(after_failure, 0.82 - 0.08));

  const double after_neutral = f.bank->UpdateTrust(ref, USE_OUTCOME_NEUTRAL, "retrieved");
  assert(Near(after_neutral, after_failure));
  assert(f.bank->Get(ref)->access_count() == 2);

  assert(Throws<trustmem::util::ValidationError>([&] { f.bank->UpdateTrust(ref, USE_OUTCOME_UNSPECIFIED, "?"); }));
  assert(Throws<trustmem::util::NotFound>([&] { f.bank->UpdateTrust("mem_missing", USE_OUTCOME_SUCCESS, "?"); }));
}

void TestUnknownReferencesRegisterNoLock() {
  auto       f   = MakeBank();
  const auto ref = f.bank->Store(MakeOutput("hunter")).reference();
  assert(f.bank->TrackedLocks() == 0);

  f.bank->UpdateTrust(ref, USE_OUTCOME_SUCCESS, "ok");
  assert(f.bank->TrackedLocks() == 1);

  for (int i = 0; i < 10; ++i) {
    const auto missing = "mem_missing_" + std::to_string(i);
    assert(Throws<trustmem::util::NotFound>([&] { f.bank->UpdateTrust(missing, USE_OUTCOME_SUCCESS, "?"); }));
    assert(Throws<trustmem::util::NotFound>([&] { f.bank->AdjustTrust(missing, 0.1, "?"); }));
    assert(Throws<trustmem::util::NotFound>([&] { f.bank->Reclassify(missing, DECAY_CURVE_LINEAR, Days(1), "?"); }));
  }
  assert(f.bank->TrackedLocks() == 1);
}

void TestHistoryRecordsEveryChange() {
  auto       f   = MakeBank();
  const auto ref = f.bank->Store(MakeOutput("hunter")).reference();

  f.bank->UpdateTrust(ref, USE_OUTCOME_SUCCESS, "ok", "evaluator");
  f.bank->UpdateTrust(ref, USE_OUTCOME_FAILURE, "bad", "evaluator");
  f.bank->UpdateTrust(ref, USE_OUTCOME_NEUTRAL, "seen");
  f.bank->AdjustTrust(ref, -0.1, "operator override", "ops");

  const auto history = f.bank->GetTrustHistory(ref);
  assert(history.size() == 5);
  assert(history[0].kind() == TRUST_EVENT_KIND_CREATE);
  assert(history[1].kind() == TRUST_EVENT_KIND_SUCCESS);
  assert(history[2].kind() == TRUST_EVENT_KIND_FAILURE);
  assert(history[3].kind() == TRUST_EVENT_KIND_NEUTRAL_ACCESS);
  assert(history[4].kind() == TRUST_EVENT_KIND_MANUAL_ADJUSTMENT);

  assert(history[1].actor() == "evaluator");
  assert(history[1].reason() == "ok");
  assert(history[3].actor() == "system");
  assert(history[4].actor() == "ops");

  for (std::size_t i = 1; i < history.size(); ++i) {
    assert(history[i - 1].sequence() < history[i].sequence());
    assert(Near(history[i].trust_before(), history[i - 1].trust_after()));
  }
  assert(history[1].usage_delta() > 0.0);
}

void TestSeededRowWithoutHistory() {
  auto repo = std::make_shared<trustmem::db::memory::MemoryRepository>();
  trustmem::testing::Seed(*repo, {MakeRecord("mem_seeded", 0.6, Epoch(), Epoch())});
  auto f = MakeBank(repo);

  assert(f.bank->GetTrustHistory("mem_seeded").empty());
  assert(Throws<trustmem::util::NotFound>([&] { f.bank->GetTrustHistory("mem_other"); }));
}

void TestUpdateDecaysFirst() {
  auto       f   = MakeBank();
  const auto ref = f.bank->Store(MakeOutput("hunter")).reference();

  f.clock->Advance(Days(7));
  const double after = f.bank->UpdateTrust(ref, USE_OUTCOME_SUCCESS, "late success");
  assert(Near(after, 0.41 + 0.05));

  const auto history = f.bank->GetTrustHistory(ref);
  assert(Near(history.back().trust_before(), 0.41));

  // The stored value is re-based at the update time.
  assert(Near(f.bank->Get(ref)->trust(), after));
  f.clock->Advance(Days(7));
  assert(Near(f.bank->Get(ref)->trust(), after / 2.0));
}

void TestAdjustTrustClamps() {
  auto       f   = MakeBank();
  const auto ref = f.bank->Store(MakeOutput("hunter")).reference();

  assert(Near(f.bank->AdjustTrust(ref, 1.0, "promote"), 1.0));
  assert(Near(f.bank->AdjustTrust(ref, -5.0, "demote"), 0.0));
  assert(Near(f.bank->AdjustTrust(ref, 0.25, "restore"), 0.25));

  assert(Throws<trustmem::util::ValidationError>([&] { f.bank->AdjustTrust(ref, std::nan(""), "bad"); }));
  assert(Throws<trustmem::util::NotFound>([&] { f.bank->AdjustTrust("mem_missing", 0.1, "bad"); }));
}

void TestReclassify() {
  auto       f   = MakeBank();
  const auto ref = f.bank->Store(MakeOutput("hunter")).reference();

  f.clock->Advance(Days(7));
  const double rebased = f.bank->Reclassify(ref, DECAY_CURVE_EXPONENTIAL, Days(1), "", "curator");
  assert(Near(rebased, 0.41));

  f.clock->Advance(Days(1));
  assert(Near(f.bank->Get(ref)->trust(), 0.205));

  const auto history = f.bank->GetTrustHistory(ref);
  assert(history.back().kind() == TRUST_EVENT_KIND_RECLASSIFY);
  assert(history.back().actor() == "curator");
  assert(history.back().reason().find("DECAY_CURVE_EXPONENTIAL") != std::string::npos);

  assert(Throws<trustmem::util::ValidationError>([&] { f.bank->Reclassify(ref, DECAY_CURVE_UNSPECIFIED, Days(1), "x"); }));
  assert(Throws<trustmem::util::ValidationError>([&] { f.bank->Reclassify(ref, DECAY_CURVE_LINEAR, trustmem::util::Duration(0), "x"); }));
  assert(Throws<trustmem::util::NotFound>([&] { f.bank->Reclassify("mem_missing", DECAY_CURVE_LINEAR, Days(1), "x"); }));
}

void TestTrustStaysInBounds() {
  auto       f    = MakeBank();
  const auto down = f.bank->Store(MakeOutput("hunter")).reference();
  const auto up   = f.bank->Store(MakeOutput("hunter")).reference();

  for (int i = 0; i < 50; ++i) {
    const double t = f.bank->UpdateTrust(down, USE_OUTCOME_FAILURE, "fail");
    assert(t >= 0.0 && t <= 1.0);
  }
  assert(Near(f.bank->Get(down)->trust(), 0.0));

  for (int i = 0; i < 50; ++i) {
    const double t = f.bank->UpdateTrust(up, USE_OUTCOME_SUCCESS, "ok");
    assert(t >= 0.0 && t <= 1.0);
  }
  assert(Near(f.bank->Get(up)->trust(), 1.0));
}

void TestFailedUpdateLeavesStateUnchanged() {
  auto       repo = std::make_shared<HookedRepository>(std::make_shared<trustmem::db::memory::MemoryRepository>());
  auto       f    = MakeBank(repo);
  const auto ref  = f.bank->Store(MakeOutput("hunter")).reference();

  repo->fail_update = true;
  assert(Throws<trustmem::util::StorageError>([&] { f.bank->UpdateTrust(ref, USE_OUTCOME_SUCCESS, "ok"); }));
  repo->fail_update = false;

  const auto hit = f.bank->Get(ref);
  assert(Near(hit->trust(), 0.82));
  assert(hit->access_count() == 0);
  assert(f.bank->GetTrustHistory(ref).size() == 1);

  // The next attempt goes through against the unchanged version.
  assert(Near(f.bank->UpdateTrust(ref, USE_OUTCOME_SUCCESS, "ok"), 0.87));
}

} // namespace

int main() {
  TestSuccessesHaveDiminishingReturns();
  TestFailureAndNeutral();
  TestUnknownReferencesRegisterNoLock();
  TestHistoryRecordsEveryChange();
  TestSeededRowWithoutHistory();
  TestUpdateDecaysFirst();
  TestAdjustTrustClamps();
  TestReclassify();
  TestTrustStaysInBounds();
  TestFailedUpdateLeavesStateUnchanged();

  std::cout << "memory_bank_trust_update_test: pass\n";
  return 0;
}
