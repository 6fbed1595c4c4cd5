#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/memory_bank.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/governance/category_policy.hpp"
#include "internal/runtime/gc_scheduler.hpp"
#include "internal/scoring/scoring_model.hpp"
#include "internal/util/time.hpp"

namespace trustmem::factory {

/*
  Application

  Owns the long-lived components of one process. The bank is constructed but
  not started; callers Start() it, then the scheduler.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<core::MemoryBank>        bank;
  std::unique_ptr<runtime::GcScheduler>    scheduler;
  std::vector<trustmem::v1::GcPolicy>      policies;
};

scoring::ScoringConfig BuildScoringConfig(const trustmem::runtime::config::RuntimeConfig& config);

governance::CategoryPolicyTable BuildCategoryPolicy(const trustmem::runtime::config::RuntimeConfig& config);

core::BankOptions BuildBankOptions(const trustmem::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const trustmem::runtime::config::RuntimeConfig& config);

/*
  Composition root. The ONLY place that knows concrete repository types.

  clock defaults to the system clock.
*/
Application Build(const trustmem::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock = nullptr);

} // namespace trustmem::factory
