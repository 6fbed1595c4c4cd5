#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using namespace trustmem::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  memoryctl <config.yaml> gc <policy> [--dry-run]\n"
            << "  memoryctl <config.yaml> history <reference>\n"
            << "  memoryctl <config.yaml> stats\n"
            << "  memoryctl <config.yaml> gc-log [limit]\n";
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = false;
  options.always_print_primitive_fields = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json, options).ok()) {
    std::cerr << "failed to render " << message.GetTypeName() << "\n";
    return;
  }
  std::cout << json << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = trustmem::config::ConfigLoader::LoadFromYaml(config_path);
    trustmem::observability::InitializeLogging(config);

    auto app = trustmem::factory::Build(config);
    app.bank->Start();

    // ------------------------------------------------------------

    if (cmd == "gc") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      const std::string name    = argv[3];
      const bool        dry_run = argc >= 5 && std::string(argv[4]) == "--dry-run";

      const GcPolicy* policy = nullptr;
      for (const auto& candidate : app.policies) {
        if (candidate.name() == name) policy = &candidate;
      }
      if (!policy) {
        std::cerr << "unknown gc policy: " << name << "\n";
        return 1;
      }

      GcPolicy run = *policy;
      if (dry_run) run.set_dry_run(true);

      PrintJson(app.bank->GarbageCollect(run));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "history") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      for (const auto& event : app.bank->GetTrustHistory(argv[3])) PrintJson(event);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      PrintJson(app.bank->Stats());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "gc-log") {
      const std::size_t limit = argc >= 4 ? std::stoull(argv[3]) : 20;
      for (const auto& entry : app.bank->ListGcLog(limit)) PrintJson(entry);
      return 0;
    }

    Usage();
    return 1;
  } catch (const trustmem::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
