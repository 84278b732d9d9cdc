#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/ingestion_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/module_fixtures.hpp"

namespace {

using modstore::core::IngestionCoordinator;
using modstore::db::memory::MemoryRepository;

constexpr const char* kModule = "example.com/busy";

bool IngestWithRetry(IngestionCoordinator& coordinator, const std::string& module_path, const std::string& version) {
  for (int attempt = 0; attempt < 1000; ++attempt) {
    try {
      coordinator.Ingest(modstore::testing::Graph(module_path, version));
      return true;
    } catch (const modstore::util::TransientStoreFailure&) {
      std::this_thread::yield();
    }
  }
  return false;
}

void TestConcurrentVersionsConvergeOnHighestRelease() {
  auto                 repo = std::make_shared<MemoryRepository>();
  IngestionCoordinator coordinator(repo, {});

  std::vector<std::string> versions;
  for (int minor = 0; minor < 8; ++minor) {
    versions.push_back("v1." + std::to_string(minor) + ".0");
    versions.push_back("v1." + std::to_string(minor) + ".1-rc.1");
  }

  std::vector<std::thread> threads;
  std::vector<char>        ok(versions.size(), 0);
  for (std::size_t i = 0; i < versions.size(); ++i) {
    threads.emplace_back([&, i] { ok[i] = IngestWithRetry(coordinator, kModule, versions[i]); });
  }
  for (auto& t : threads) t.join();

  for (char c : ok) assert(c);

  auto latest = coordinator.ResolveLatest(kModule);
  assert(latest.has_value());
  assert(latest->good_version == "v1.7.0");

  auto tx   = repo->Begin();
  auto docs = repo->ListSearchDocuments(*tx, kModule);
  assert(repo->ListModuleVersions(*tx, kModule).size() == versions.size());
  auto history = repo->ListSymbolHistory(*tx, kModule, kModule);
  tx->Commit();
  assert(history.size() == 1);
  assert(history[0].symbol_name == "New");
  assert(history[0].since_version == "v1.0.0");
  assert(docs.size() == 1);
  assert(docs[0].version == "v1.7.0");
}

void TestConcurrentModulesAreIndependent() {
  auto                 repo = std::make_shared<MemoryRepository>();
  IngestionCoordinator coordinator(repo, {});

  std::vector<std::thread> threads;
  std::vector<char>        ok(6, 0);
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i] {
      const auto path = "example.com/mod" + std::to_string(i);
      ok[i]           = IngestWithRetry(coordinator, path, "v0.1.0") && IngestWithRetry(coordinator, path, "v0.2.0");
    });
  }
  for (auto& t : threads) t.join();

  for (int i = 0; i < 6; ++i) {
    assert(ok[i]);
    assert(coordinator.ResolveLatest("example.com/mod" + std::to_string(i))->good_version == "v0.2.0");
  }
}

} // namespace

int main() {
  TestConcurrentVersionsConvergeOnHighestRelease();
  TestConcurrentModulesAreIndependent();

  std::cout << "modstore_unit_ingest_concurrency: pass\n";
  return 0;
}
