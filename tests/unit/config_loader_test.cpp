#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/bank_fixture.hpp"

namespace {

using trustmem::config::ConfigLoader;
using namespace trustmem::v1;

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "trustmem_config_loader_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto    file_path = TestDir() / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename E>
bool Rejects(const std::string& yaml) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto path = WriteYaml("full", R"(logging:
  level: debug
database:
  memory: {}
scoring:
  violation_penalty: 0.2
  default_reputation: 0.75
  reputation:
    - component: hunter
      reputation: 0.99
    - component: "scout"
      reputation: 0.8
categories:
  - category: OUTPUT_CATEGORY_OBSERVATION
    requires_compliance: false
    decay_curve: DECAY_CURVE_EXPONENTIAL
    half_life: "43200s"
bank:
  recency_window: "86400s"
  default_k: 5
gc:
  interval: "3600s"
  decay_snapshot_interval: "21600s"
  policies:
    - name: nightly
      archive_threshold: 0.2
      delete_threshold: 0.1
      max_age: "2592000s"
      max_artifacts: 1000
      scope:
        component: hunter
)");

  auto config = ConfigLoader::LoadFromYaml(path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_memory());
  assert(config.scoring().has_violation_penalty());
  assert(config.scoring().reputation_size() == 2);
  assert(config.categories(0).category() == OUTPUT_CATEGORY_OBSERVATION);
  assert(config.categories(0).has_requires_compliance() && !config.categories(0).requires_compliance());
  assert(config.bank().default_k() == 5);
  assert(config.gc().policies_size() == 1);
  assert(config.gc().policies(0).max_artifacts() == 1000);
  assert(config.gc().policies(0).scope().component() == "hunter");

  const auto scoring = trustmem::factory::BuildScoringConfig(config);
  assert(scoring.violation_penalty == 0.2);
  // Reputations are clamped by the model, not the loader.
  assert(scoring.reputation.at("hunter") == 0.99);
  assert(scoring.reputation.at("parliament") == 0.95);
  assert(scoring.default_reputation == 0.75);
  assert(scoring.success_reward == 0.05);
  assert(scoring.decay.at(OUTPUT_CATEGORY_OBSERVATION).curve == DECAY_CURVE_EXPONENTIAL);
  assert(scoring.decay.at(OUTPUT_CATEGORY_OBSERVATION).half_life == trustmem::util::Days(0.5));
  assert(scoring.decay.at(OUTPUT_CATEGORY_REASONING).curve == DECAY_CURVE_HYPERBOLIC);

  trustmem::scoring::ScoringModel model(scoring);
  assert(model.Reputation("hunter") == 0.95);

  const auto categories = trustmem::factory::BuildCategoryPolicy(config);
  assert(!categories.RequiresCompliance(OUTPUT_CATEGORY_OBSERVATION));
  assert(categories.RequiresCompliance(OUTPUT_CATEGORY_REASONING));

  const auto options = trustmem::factory::BuildBankOptions(config);
  assert(options.recency_window == trustmem::util::Days(1));
  assert(options.default_k == 5);
  assert(options.default_relevance == 1.0);
}

void TestEmptyDocumentGivesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(config.gc().policies_size() == 0);

  const auto scoring = trustmem::factory::BuildScoringConfig(config);
  assert(scoring.violation_penalty == 0.15);
  assert(scoring.consistency_min_uses == 5);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "12345"
database:
  sqlite:
    path: "true"
)");
  assert(config.logging().pattern() == "12345");
  assert(config.database().sqlite().path() == "true");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects<std::runtime_error>("bank:\n  no_such_field: 1\n"));
  assert(Rejects<std::runtime_error>("categories:\n  - category: OUTPUT_CATEGORY_NOPE\n"));
  assert(Rejects<std::runtime_error>("gc:\n  interval: soon\n"));

  assert(Rejects<trustmem::util::ValidationError>("scoring:\n  violation_penalty: 1.5\n"));
  assert(Rejects<trustmem::util::ValidationError>("scoring:\n  reputation:\n    - reputation: 0.9\n"));
  assert(Rejects<trustmem::util::ValidationError>("bank:\n  default_relevance: 2\n"));
  assert(Rejects<trustmem::util::ValidationError>("database:\n  sqlite:\n    path: a.db\n    busy_timeout: \"-1s\"\n"));
  assert(Rejects<trustmem::util::ValidationError>(R"(categories:
  - category: OUTPUT_CATEGORY_ACTION
    decay_curve: DECAY_CURVE_LINEAR
)"));
  assert(Rejects<trustmem::util::ValidationError>(R"(categories:
  - category: OUTPUT_CATEGORY_ACTION
    requires_compliance: true
  - category: OUTPUT_CATEGORY_ACTION
    requires_compliance: false
)"));
  assert(Rejects<trustmem::util::ValidationError>(R"(gc:
  policies:
    - name: a
      archive_threshold: 0.2
    - name: a
      archive_threshold: 0.3
)"));
  assert(Rejects<trustmem::util::PolicyConflict>(R"(gc:
  policies:
    - name: inverted
      archive_threshold: 0.1
      delete_threshold: 0.3
)"));

  bool missing = false;
  try {
    ConfigLoader::LoadFromYaml((TestDir() / "does_not_exist.yaml").string());
  } catch (const std::runtime_error&) {
    missing = true;
  }
  assert(missing);
}

#if TRUSTMEM_DB_SQLITE
void TestSqliteApplicationSurvivesRestart() {
  const auto db_path = TestDir() / "restart.sqlite";
  std::filesystem::remove(db_path);

  auto config = ConfigLoader::LoadFromYamlString("database:\n  sqlite:\n    path: \"" + db_path.string() + "\"\n    busy_timeout: \"2s\"\n");
  assert(config.database().sqlite().busy_timeout().seconds() == 2);
  auto clock  = std::make_shared<trustmem::util::ManualClock>(trustmem::testing::Epoch());

  std::string reference;
  {
    auto app = trustmem::factory::Build(config, clock);
    app.bank->Start();
    reference = app.bank->Store(trustmem::testing::MakeOutput("hunter")).reference();
    app.bank->UpdateTrust(reference, USE_OUTCOME_SUCCESS, "ok");
    app.bank->Stop();
  }

  auto app = trustmem::factory::Build(config, clock);
  app.bank->Start();
  auto hit = app.bank->Get(reference);
  assert(hit);
  assert(std::abs(hit->trust() - 0.87) < 1e-9);
  assert(hit->access_count() == 1);
  assert(app.bank->GetTrustHistory(reference).size() == 2);
  app.bank->Stop();

  std::filesystem::remove(db_path);
}
#endif

} // namespace

int main() {
  TestFullConfig();
  TestEmptyDocumentGivesDefaults();
  TestQuotedScalarsStayStrings();
  TestInvalidConfigsAreRejected();
#if TRUSTMEM_DB_SQLITE
  TestSqliteApplicationSurvivesRestart();
#endif

  std::cout << "config_loader_test: pass\n";
  return 0;
}
