#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using relaystore::factory::Build;

namespace {

enum class Command {
  kUpgrade,
  kStatus,
  kRebuildTags,
};

void Usage() {
  std::cerr << "Usage:\n"
            << "  relaystore-migrate <config.yaml>\n"
            << "  relaystore-migrate --config <config.yaml> [--status | --rebuild-tags]\n";
}

void PrintSerials(const char* label, const std::vector<int64_t>& serials) {
  std::cout << label << ":";
  for (auto serial : serials) {
    std::cout << ' ' << serial;
  }
  std::cout << "\n";
}

void Shutdown() {
  relaystore::observability::ShutdownLogging();
  relaystore::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  Command     command = Command::kUpgrade;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--status") {
      command = Command::kStatus;
    } else if (arg == "--rebuild-tags") {
      command = Command::kRebuildTags;
    } else if (config_path.empty() && !arg.empty() && arg[0] != '-') {
      config_path = arg;
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
    auto config = relaystore::config::ConfigLoader::LoadFromYaml(config_path);

    relaystore::observability::InitializeTracing(config.observability());
    relaystore::observability::InitializeLogging(config.logging());

    auto app = Build(config);
    app.runner->EnsureLedger();

    switch (command) {
      case Command::kUpgrade: {
        auto version = app.runner->Upgrade();
        std::cout << "schema version: " << version << "\n";
        break;
      }
      case Command::kStatus: {
        auto status = app.runner->Status();
        std::cout << "current version: " << status.current_version << "\n"
                  << "latest version: " << status.latest_version << "\n";
        PrintSerials("applied", status.applied);
        PrintSerials("pending", status.pending);
        break;
      }
      case Command::kRebuildTags: {
        auto stats = app.runner->RunBackfill(relaystore::migration::Backfill::kRebuildTags);
        std::cout << "events scanned: " << stats.events_scanned << "\n"
                  << "tags indexed: " << stats.tags_indexed << "\n";
        break;
      }
    }

    Shutdown();
  } catch (const std::exception& e) {
    RELAYSTORE_LOG_ERROR("Fatal error", {relaystore::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
