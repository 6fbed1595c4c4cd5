#include "internal/factory.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/governance/governance_gate.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#if TRUSTMEM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace trustmem::factory {

using trustmem::runtime::config::RuntimeConfig;

scoring::ScoringConfig BuildScoringConfig(const RuntimeConfig& config) {
  auto        out = scoring::ScoringConfig::Defaults();
  const auto& in  = config.scoring();

  if (in.has_provenance_weight()) out.trust_weights.provenance = in.provenance_weight();
  if (in.has_consensus_weight()) out.trust_weights.consensus = in.consensus_weight();
  if (in.has_governance_weight()) out.trust_weights.governance = in.governance_weight();
  if (in.has_usage_weight()) out.trust_weights.usage = in.usage_weight();

  if (in.has_default_reputation()) out.default_reputation = in.default_reputation();
  for (const auto& entry : in.reputation()) {
    out.reputation[entry.component()] = entry.reputation();
  }
  if (in.has_default_consensus()) out.default_consensus = in.default_consensus();
  if (in.has_violation_penalty()) out.violation_penalty = in.violation_penalty();

  if (in.has_success_reward()) out.success_reward = in.success_reward();
  if (in.has_success_damping()) out.success_damping = in.success_damping();
  if (in.has_failure_penalty()) out.failure_penalty = in.failure_penalty();
  if (in.has_failure_damping()) out.failure_damping = in.failure_damping();
  if (in.has_consistency_bonus()) out.consistency_bonus = in.consistency_bonus();
  if (in.has_consistency_rate()) out.consistency_rate = in.consistency_rate();
  if (in.has_consistency_min_uses()) out.consistency_min_uses = in.consistency_min_uses();

  if (in.has_rank_trust_weight()) out.rank_weights.trust = in.rank_trust_weight();
  if (in.has_rank_relevance_weight()) out.rank_weights.relevance = in.rank_relevance_weight();
  if (in.has_rank_recency_weight()) out.rank_weights.recency = in.rank_recency_weight();
  if (in.has_rank_importance_weight()) out.rank_weights.importance = in.rank_importance_weight();

  for (const auto& category : config.categories()) {
    if (category.decay_curve() == trustmem::v1::DECAY_CURVE_UNSPECIFIED) continue;
    out.decay[category.category()] = scoring::DecaySetting{
        .curve     = category.decay_curve(),
        .half_life = util::FromProtoDuration(category.half_life()),
    };
  }
  return out;
}

governance::CategoryPolicyTable BuildCategoryPolicy(const RuntimeConfig& config) {
  governance::CategoryPolicyTable table;
  for (const auto& category : config.categories()) {
    if (category.has_requires_compliance()) {
      table.SetRequiresCompliance(category.category(), category.requires_compliance());
    }
  }
  return table;
}

core::BankOptions BuildBankOptions(const RuntimeConfig& config) {
  core::BankOptions options;
  const auto&       bank = config.bank();
  if (bank.has_recency_window() && util::FromProtoDuration(bank.recency_window()).count() > 0) {
    options.recency_window = util::FromProtoDuration(bank.recency_window());
  }
  if (bank.has_default_relevance()) options.default_relevance = bank.default_relevance();
  if (bank.default_k() > 0) options.default_k = bank.default_k();
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TRUSTMEM_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("sqlite backend requires database.sqlite.path");
    }
    db::sqlite::SqliteOptions options;
    options.path = database.sqlite().path();
    if (database.sqlite().has_busy_timeout()) {
      options.busy_timeout = util::FromProtoDuration(database.sqlite().busy_timeout());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    db::sqlite::BootstrapSchema(*sqlite_db);
    TRUSTMEM_LOG_INFO("using sqlite repository", {observability::StringField("path", sqlite_db->Path()),
                                                  observability::IntField("schema_version", sqlite_db->SchemaVersion()),
                                                  observability::IntField("busy_timeout_ms", sqlite_db->BusyTimeout().count())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  TRUSTMEM_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  Application app;

  if (!clock) clock = std::make_shared<util::SystemClock>();

  app.repository = BuildRepository(config);

  auto model = std::make_shared<const scoring::ScoringModel>(BuildScoringConfig(config));
  auto gate  = std::make_shared<governance::DeclaredComplianceGate>();

  app.bank = std::make_shared<core::MemoryBank>(app.repository, std::move(gate), BuildCategoryPolicy(config), std::move(model),
                                                std::move(clock), BuildBankOptions(config));

  app.policies.assign(config.gc().policies().begin(), config.gc().policies().end());

  runtime::GcSchedule schedule;
  if (!app.policies.empty()) schedule.policy = app.policies.front();
  schedule.gc_interval             = util::FromProtoDuration(config.gc().interval());
  schedule.decay_snapshot_interval = util::FromProtoDuration(config.gc().decay_snapshot_interval());
  app.scheduler                    = std::make_unique<runtime::GcScheduler>(app.bank, std::move(schedule));

  return app;
}

} // namespace trustmem::factory
