#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using snapmig::migration::MigrationMode;
using snapmig::migration::MigrationReport;
using snapmig::observability::IntField;
using snapmig::observability::StringField;

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitFailed    = 2;
constexpr int kExitCancelled = 3;

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleSignal(int) {
  g_stop_requested = 1;
}

void PrintUsage() {
  std::cerr << "Usage: snapshot-migrator --config <config.yaml> [--mode latest|all|paged]" << std::endl;
}

std::optional<MigrationMode> ParseMode(const std::string& value) {
  if (value == "latest") return MigrationMode::kLatest;
  if (value == "all") return MigrationMode::kAll;
  if (value == "paged") return MigrationMode::kPaged;
  return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
  std::string   config_path;
  MigrationMode mode = MigrationMode::kLatest;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      auto parsed = ParseMode(argv[++i]);
      if (!parsed) {
        PrintUsage();
        return kExitUsage;
      }
      mode = *parsed;
    } else {
      PrintUsage();
      return kExitUsage;
    }
  }

  if (config_path.empty()) {
    PrintUsage();
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  snapmig::runtime::config::RuntimeConfig config;
  try {
    config = snapmig::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return kExitUsage;
  }

  try {
    snapmig::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = snapmig::factory::Build(config);

    // Handlers go in before the run starts.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::future<MigrationReport> run;
    switch (mode) {
      case MigrationMode::kLatest:
        run = app.orchestrator->MigrateLatest();
        break;
      case MigrationMode::kAll:
        run = app.orchestrator->MigrateAll();
        break;
      case MigrationMode::kPaged:
        run = app.orchestrator->MigratePaged();
        break;
    }

    bool cancel_sent = false;
    while (run.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
      if (g_stop_requested && !cancel_sent) {
        SNAPMIG_LOG_WARN("Stop requested, cancelling migration");
        app.orchestrator->Cancel();
        cancel_sent = true;
      }
    }

    auto report = run.get();
    SNAPMIG_LOG_INFO("Snapshot migration finished",
                     {StringField("mode", snapmig::migration::ToString(report.mode)),
                      IntField("migrated", static_cast<int64_t>(report.snapshots_migrated))});

    snapmig::observability::ShutdownLogging();
  } catch (const snapmig::util::MigrationCancelled& e) {
    SNAPMIG_LOG_WARN("Migration cancelled", {StringField("error", e.what())});
    snapmig::observability::ShutdownLogging();
    return kExitCancelled;
  } catch (const std::exception& e) {
    SNAPMIG_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    snapmig::observability::ShutdownLogging();
    return kExitFailed;
  }

  return kExitOk;
}
