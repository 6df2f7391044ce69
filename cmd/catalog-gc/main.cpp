#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using catalog::observability::BoolField;
using catalog::observability::IntField;
using catalog::observability::StringField;

static void Usage() {
  std::cerr << "Usage: catalog-gc <config.yaml> [--dry-run]\n"
            << "       catalog-gc --config <config.yaml> [--dry-run]\n"
            << "\n"
            << "Runs one orphan collection pass in a single transaction.\n"
            << "--dry-run rolls the transaction back after reporting.\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  bool        dry_run = false;

  std::vector<std::string> args(argv + 1, argv + argc);
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--dry-run") {
      dry_run = true;
    } else if (args[i] == "--config" && i + 1 < args.size()) {
      config_path = args[++i];
    } else if (args[i] == "-h" || args[i] == "--help") {
      Usage();
      return 0;
    } else if (config_path.empty() && !args[i].starts_with("-")) {
      config_path = args[i];
    } else {
      Usage();
      return 1;
    }
  }

  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = catalog::config::ConfigLoader::LoadFromYaml(config_path);

    catalog::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = catalog::factory::Build(config);

    // ------------------------------------------------------------
    // One collection pass; the destructor rolls back on throw
    // ------------------------------------------------------------
    auto tx    = app.repository->Begin();
    auto stats = app.collector->Run(*tx);

    if (dry_run) {
      tx->Rollback();
    } else {
      tx->Commit();
    }

    CATALOG_LOG_INFO("orphan collection pass complete",
                     {IntField("deleted", static_cast<std::int64_t>(stats.deleted_entities)),
                      IntField("marked", static_cast<std::int64_t>(stats.marked_entities)), BoolField("dry_run", dry_run)});

    catalog::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CATALOG_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    catalog::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
