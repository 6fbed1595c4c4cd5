#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/core/memory_bank.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/bank_fixture.hpp"

namespace {

using trustmem::testing::BankFixture;
using trustmem::testing::Epoch;
using trustmem::testing::MakeBank;
using trustmem::testing::MakeOutput;
using trustmem::testing::MakeRecord;
using trustmem::util::Days;
using namespace trustmem::v1;

bool Near(double a, double b, double eps = 1e-6) {
  return std::abs(a - b) < eps;
}

GcPolicy Nightly(bool dry_run = false) {
  GcPolicy p;
  p.set_name("nightly");
  p.set_archive_threshold(0.2);
  p.set_delete_threshold(0.1);
  *p.mutable_max_age() = trustmem::util::ToProtoDuration(Days(30));
  p.set_dry_run(dry_run);
  return p;
}

// One artifact per GC outcome, trust pinned as of Epoch().
BankFixture MixedAgeBank() {
  auto repo = std::make_shared<trustmem::db::memory::MemoryRepository>();
  trustmem::testing::Seed(*repo, {
                                     MakeRecord("mem_old", 0.05, Epoch() - Days(40), Epoch()),
                                     MakeRecord("mem_mid", 0.15, Epoch() - Days(10), Epoch()),
                                     MakeRecord("mem_new", 0.50, Epoch() - Days(1), Epoch()),
                                 });
  return MakeBank(repo);
}

void TestThresholdsArchiveAndDelete() {
  auto f       = MixedAgeBank();
  auto summary = f.bank->GarbageCollect(Nightly());

  assert(summary.policy_name() == "nightly");
  assert(summary.scanned() == 3);
  assert(summary.deleted() == 1);
  assert(summary.archived() == 1);
  assert(!summary.dry_run());
  assert(!summary.cancelled());

  assert(!f.bank->Get("mem_old"));
  auto mid = f.bank->Get("mem_mid");
  assert(mid && mid->archived());
  auto fresh = f.bank->Get("mem_new");
  assert(fresh && !fresh->archived());

  ReadRequest request;
  assert(f.bank->Read(request).size() == 1);
  request.mutable_filters()->set_include_archived(true);
  assert(f.bank->Read(request).size() == 2);

  const auto deleted = f.bank->GetTrustHistory("mem_old");
  assert(deleted.size() == 1);
  assert(deleted[0].kind() == TRUST_EVENT_KIND_GC_DELETE);
  assert(deleted[0].actor() == "gc:nightly");
  assert(deleted[0].reason() == "below_delete_threshold");

  const auto archived = f.bank->GetTrustHistory("mem_mid");
  assert(archived.size() == 1);
  assert(archived[0].kind() == TRUST_EVENT_KIND_GC_ARCHIVE);
  assert(archived[0].reason() == "below_archive_threshold");

  assert(f.bank->GetTrustHistory("mem_new").empty());

  const auto stats = f.bank->Stats();
  assert(stats.live_artifacts() == 1);
  assert(stats.archived_artifacts() == 1);

  // Soft-deleted rows are gone for every operation.
  bool not_found = false;
  try {
    f.bank->UpdateTrust("mem_old", USE_OUTCOME_SUCCESS, "late");
  } catch (const trustmem::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestSecondRunIsIdempotent() {
  auto f = MixedAgeBank();
  f.bank->GarbageCollect(Nightly());
  auto second = f.bank->GarbageCollect(Nightly());

  assert(second.archived() == 0);
  assert(second.deleted() == 0);
  assert(second.scanned() == 1);

  const auto log = f.bank->ListGcLog();
  assert(log.size() == 2);
  assert(log[0].archived() == 0 && log[0].deleted() == 0);
  assert(log[1].archived() == 1 && log[1].deleted() == 1);
  assert(f.bank->ListGcLog(1).size() == 1);
}

void TestDryRunOnlyProjects() {
  auto f       = MixedAgeBank();
  auto summary = f.bank->GarbageCollect(Nightly(true));

  assert(summary.dry_run());
  assert(summary.deleted() == 1);
  assert(summary.archived() == 1);

  auto old = f.bank->Get("mem_old");
  assert(old && !old->archived());
  auto mid = f.bank->Get("mem_mid");
  assert(mid && !mid->archived());
  assert(f.bank->GetTrustHistory("mem_old").empty());
  assert(f.bank->Stats().live_artifacts() == 3);

  const auto log = f.bank->ListGcLog();
  assert(log.size() == 1);
  assert(log[0].dry_run());
  assert(log[0].deleted() == 1);
  assert(Near(log[0].archive_threshold(), 0.2));
  assert(Near(log[0].delete_threshold(), 0.1));
  assert(trustmem::util::FromProtoDuration(log[0].max_age()) == Days(30));
}

void TestConflictingPolicyIsRejected() {
  auto f      = MixedAgeBank();
  auto policy = Nightly();
  policy.set_archive_threshold(0.1);
  policy.set_delete_threshold(0.3);

  bool threw = false;
  try {
    f.bank->GarbageCollect(policy);
  } catch (const trustmem::util::PolicyConflict&) {
    threw = true;
  }
  assert(threw);
  assert(f.bank->ListGcLog().empty());
  assert(f.bank->Stats().live_artifacts() == 3);
}

void TestMaxAgeArchivesOldTrustedArtifacts() {
  auto repo = std::make_shared<trustmem::db::memory::MemoryRepository>();
  trustmem::testing::Seed(*repo, {MakeRecord("mem_ancient", 0.9, Epoch() - Days(31), Epoch())});
  auto f = MakeBank(repo);

  auto summary = f.bank->GarbageCollect(Nightly());
  assert(summary.archived() == 1);
  assert(f.bank->GetTrustHistory("mem_ancient")[0].reason() == "max_age");
}

void TestCapacityArchivesLowestRank() {
  auto f = MakeBank();

  std::vector<std::string> refs;
  for (double confidence : {1.0, 0.2, 0.8, 0.4}) {
    refs.push_back(f.bank->Store(MakeOutput("hunter", OUTPUT_CATEGORY_REASONING, confidence)).reference());
  }

  GcPolicy policy;
  policy.set_name("cap");
  policy.set_max_artifacts(2);
  auto summary = f.bank->GarbageCollect(policy);

  assert(summary.scanned() == 4);
  assert(summary.archived() == 2);
  assert(f.bank->Get(refs[1])->archived());
  assert(f.bank->Get(refs[3])->archived());
  assert(!f.bank->Get(refs[0])->archived());
  assert(!f.bank->Get(refs[2])->archived());
  assert(f.bank->GetTrustHistory(refs[1]).back().reason() == "capacity");
}

void TestCancelledRunStopsEarly() {
  auto f = MixedAgeBank();

  std::stop_source source;
  source.request_stop();
  auto summary = f.bank->GarbageCollect(Nightly(), source.get_token());

  assert(summary.cancelled());
  assert(summary.scanned() == 0);
  assert(f.bank->Stats().live_artifacts() == 3);

  const auto log = f.bank->ListGcLog();
  assert(log.size() == 1);
  assert(log[0].cancelled());
}

void TestScopeLimitsCandidates() {
  auto f      = MakeBank();
  auto hunter = f.bank->Store(MakeOutput("hunter")).reference();
  auto parl   = f.bank->Store(MakeOutput("parliament")).reference();
  f.bank->AdjustTrust(hunter, -1.0, "zero");
  f.bank->AdjustTrust(parl, -1.0, "zero");

  auto policy = Nightly();
  policy.mutable_scope()->set_component("parliament");
  auto summary = f.bank->GarbageCollect(policy);

  assert(summary.scanned() == 1);
  assert(summary.deleted() == 1);
  assert(!f.bank->Get(parl));
  assert(f.bank->Get(hunter));
}

void TestLinearDecayReachesDelete() {
  auto       f   = MakeBank();
  const auto ref = f.bank->Store(MakeOutput("hunter", OUTPUT_CATEGORY_OBSERVATION)).reference();

  f.clock->Advance(Days(3));
  assert(Near(f.bank->Get(ref)->trust(), 0.0));

  auto summary = f.bank->GarbageCollect(Nightly());
  assert(summary.deleted() == 1);
}

void TestRescanArchivedDeletesDecayedArchive() {
  auto f = MixedAgeBank();
  f.bank->GarbageCollect(Nightly());
  f.clock->Advance(Days(7));

  auto policy = Nightly();
  policy.set_rescan_archived(true);
  auto summary = f.bank->GarbageCollect(policy);

  assert(summary.deleted() == 1);
  assert(!f.bank->Get("mem_mid"));
  assert(f.bank->GetTrustHistory("mem_mid").back().kind() == TRUST_EVENT_KIND_GC_DELETE);
}

void TestPurgeKeepsHistory() {
  auto f      = MixedAgeBank();
  auto policy = Nightly();
  policy.set_purge_deleted(true);
  f.bank->GarbageCollect(policy);

  {
    auto tx = f.repository->Begin();
    assert(!f.repository->GetArtifact(*tx, "mem_old"));
    assert(f.repository->GetArtifact(*tx, "mem_mid"));
    tx->Commit();
  }

  const auto history = f.bank->GetTrustHistory("mem_old");
  assert(history.size() == 1);
  assert(history[0].kind() == TRUST_EVENT_KIND_GC_DELETE);
}

void TestDeleteReleasesArtifactLock() {
  auto       f    = MakeBank();
  const auto kept = f.bank->Store(MakeOutput("hunter")).reference();
  const auto gone = f.bank->Store(MakeOutput("hunter")).reference();
  f.bank->UpdateTrust(kept, USE_OUTCOME_SUCCESS, "ok");
  f.bank->AdjustTrust(gone, -1.0, "zero");
  assert(f.bank->TrackedLocks() == 2);

  auto summary = f.bank->GarbageCollect(Nightly());
  assert(summary.deleted() == 1);
  assert(f.bank->TrackedLocks() == 1);

  bool not_found = false;
  try {
    f.bank->UpdateTrust(gone, USE_OUTCOME_SUCCESS, "late");
  } catch (const trustmem::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  assert(f.bank->TrackedLocks() == 1);
}

void TestSnapshotDecay() {
  auto       f    = MakeBank();
  const auto live = f.bank->Store(MakeOutput("hunter")).reference();
  const auto gone = f.bank->Store(MakeOutput("hunter")).reference();
  f.bank->AdjustTrust(gone, -1.0, "zero");
  f.bank->GarbageCollect(Nightly());

  f.clock->Advance(Days(7));
  assert(f.bank->SnapshotDecay() == 1);

  const auto history = f.bank->GetTrustHistory(live);
  assert(history.back().kind() == TRUST_EVENT_KIND_DECAY_SNAPSHOT);
  assert(Near(history.back().trust_before(), 0.82));
  assert(Near(history.back().trust_after(), 0.41));
  assert(history.back().actor() == "scheduler");
}

} // namespace

int main() {
  TestThresholdsArchiveAndDelete();
  TestSecondRunIsIdempotent();
  TestDryRunOnlyProjects();
  TestConflictingPolicyIsRejected();
  TestMaxAgeArchivesOldTrustedArtifacts();
  TestCapacityArchivesLowestRank();
  TestCancelledRunStopsEarly();
  TestScopeLimitsCandidates();
  TestLinearDecayReachesDelete();
  TestRescanArchivedDeletesDecayedArchive();
  TestPurgeKeepsHistory();
  TestDeleteReleasesArtifactLock();
  TestSnapshotDecay();

  std::cout << "memory_bank_gc_test: pass\n";
  return 0;
}
