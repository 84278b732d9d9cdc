#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/fetch/graph_codec.hpp"
#include "internal/model/status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using modstore::model::StatusName;
using modstore::model::FromCode;

static void Usage() {
  std::cout << "Usage:\n"
            << "  modstorectl ingest <config> <graph.json>\n"
            << "  modstorectl enqueue <config> <module> <version> [num_packages]\n"
            << "  modstorectl next-batch <config> <limit>\n"
            << "  modstorectl resolve <config> <module>\n"
            << "  modstorectl update-latest <config> <latest.json>\n"
            << "  modstorectl history <config> <module> <package>\n"
            << "  modstorectl reprocess <config> <app_version>\n"
            << "  modstorectl sweep <config> [limit]\n"
            << "  modstorectl prune-pseudo <config> <module> <keep_version>\n"
            << "  modstorectl state <config> <module> <version>\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static int Run(int argc, char** argv) {
  const std::string cmd = argv[1];

  auto config = modstore::config::ConfigLoader::LoadFromYaml(argv[2]);
  modstore::observability::InitializeLogging(config);

  auto rt = modstore::factory::BuildRuntime(config);

  // ------------------------------------------------------------

  if (cmd == "ingest") {
    if (argc < 4) return 1;

    auto graph     = modstore::fetch::ParseModuleGraphJson(ReadFile(argv[3]));
    auto path      = graph.module_path;
    auto version   = graph.version;
    bool is_latest = rt.coordinator->Ingest(std::move(graph));

    std::cout << path << "@" << version << " ingested latest=" << (is_latest ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 5) return 1;

    std::optional<int64_t> num_packages;
    if (argc >= 6) num_packages = std::stoll(argv[5]);

    bool added = rt.queue->Enqueue(argv[3], argv[4], num_packages);
    std::cout << (added ? "enqueued\n" : "already known\n");
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "next-batch") {
    if (argc < 4) return 1;

    auto batch = rt.queue->NextBatch(std::stoul(argv[3]));
    for (const auto& item : batch) {
      std::cout << item.module_path << " " << item.version << " status=" << item.status
                << " tries=" << item.try_count;
      if (item.num_packages) std::cout << " packages=" << *item.num_packages;
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (argc < 4) return 1;

    auto latest = rt.coordinator->ResolveLatest(argv[3]);
    if (!latest) {
      std::cerr << "no latest version for " << argv[3] << "\n";
      return 2;
    }

    std::cout << "good=" << latest->good_version << " raw=" << latest->raw_version
              << " cooked=" << latest->cooked_version << " retractions=" << latest->retractions.size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "update-latest") {
    if (argc < 4) return 1;

    auto info   = modstore::fetch::ParseLatestVersionsJson(ReadFile(argv[3]));
    auto stored = rt.coordinator->UpdateLatestModuleVersions(info);

    std::cout << "raw=" << stored.raw_version << " cooked=" << stored.cooked_version
              << " good=" << stored.good_version << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 5) return 1;

    for (const auto& r : rt.ledger->History(argv[3], argv[4])) {
      std::cout << r.symbol_name;
      if (!r.parent_name.empty()) std::cout << " (" << r.parent_name << ")";
      std::cout << " " << r.os << "/" << r.arch << " since=" << r.since_version << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reprocess") {
    if (argc < 4) return 1;

    auto reset = rt.queue->ResetForReprocessing(argv[3]);
    std::cout << "reset=" << reset << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sweep") {
    std::size_t limit = argc >= 4 ? std::stoul(argv[3]) : 100;

    auto removed = rt.sweeper->Sweep(limit, "modstorectl sweep");
    std::cout << "removed=" << removed << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "prune-pseudo") {
    if (argc < 5) return 1;

    auto deleted = rt.coordinator->DeletePseudoVersionsExcept(argv[3], argv[4]);
    std::cout << "deleted=" << deleted << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "state") {
    if (argc < 5) return 1;

    auto state = rt.queue->GetState(argv[3], argv[4]);
    std::cout << "status=" << state.status << " (" << StatusName(FromCode(state.status)) << ")"
              << " tries=" << state.try_count << " app_version=" << state.app_version
              << " next_after_ms=" << state.next_processed_after_ms;
    if (!state.error.empty()) std::cout << " error=" << state.error;
    std::cout << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    int rc = Run(argc, argv);
    modstore::observability::ShutdownLogging();
    return rc;
  } catch (const modstore::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const modstore::util::InvalidModule& e) {
    std::cerr << "invalid module: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
  }
  modstore::observability::ShutdownLogging();
  return 2;
}
