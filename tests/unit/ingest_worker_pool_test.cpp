#include "internal/worker/ingest_worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/module_fixtures.hpp"

namespace {

using modstore::core::IngestionCoordinator;
using modstore::db::memory::MemoryRepository;
using modstore::model::VersionStatus;
using modstore::queue::WorkQueue;
using modstore::worker::IngestWorkerPool;
using modstore::worker::WorkerPoolOptions;

// Serves canned graphs, or runs a thrower registered for the version.
class FakeSource final : public modstore::fetch::ModuleSource {
 public:
  modstore::model::ModuleGraph Fetch(const std::string& module_path, const std::string& version) override {
    const auto key = module_path + "@" + version;
    if (auto it = throwers_.find(key); it != throwers_.end()) {
      it->second();
    }
    auto it = graphs_.find(key);
    if (it == graphs_.end()) {
      throw modstore::util::NotFound(key);
    }
    return it->second;
  }

  void Add(const modstore::model::ModuleGraph& graph) {
    graphs_[graph.module_path + "@" + graph.version] = graph;
  }

  void Fail(const std::string& key, std::function<void()> thrower) {
    throwers_[key] = std::move(thrower);
  }

 private:
  std::map<std::string, modstore::model::ModuleGraph> graphs_;
  std::map<std::string, std::function<void()>>        throwers_;
};

struct Fixture {
  std::shared_ptr<MemoryRepository>     repo        = std::make_shared<MemoryRepository>();
  std::shared_ptr<WorkQueue>            queue       = std::make_shared<WorkQueue>(repo, modstore::queue::QueueOptions{});
  std::shared_ptr<IngestionCoordinator> coordinator = std::make_shared<IngestionCoordinator>(repo, modstore::core::IngestOptions{});
  std::shared_ptr<FakeSource>           source      = std::make_shared<FakeSource>();
};

void TestNullSourceIsRejected() {
  Fixture f;
  bool    threw = false;
  try {
    IngestWorkerPool pool(f.queue, f.coordinator, nullptr, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestOutcomesMapToStatuses() {
  Fixture f;
  IngestWorkerPool pool(f.queue, f.coordinator, f.source, {});

  f.source->Add(modstore::testing::Graph("example.com/ok", "v1.0.0"));
  assert(pool.ProcessOne("example.com/ok", "v1.0.0") == VersionStatus::kSuccess);
  auto ok = f.queue->GetState("example.com/ok", "v1.0.0");
  assert(ok.status == 200);
  assert(ok.num_packages == 1);
  assert(f.coordinator->ResolveLatest("example.com/ok")->good_version == "v1.0.0");

  auto incomplete = modstore::testing::Graph("example.com/partial", "v1.0.0");
  incomplete.units[0].documentation.clear();
  f.source->Add(incomplete);
  assert(pool.ProcessOne("example.com/partial", "v1.0.0") == VersionStatus::kHasIncompletePackages);

  assert(pool.ProcessOne("example.com/missing", "v1.0.0") == VersionStatus::kNotFound);

  f.source->Fail("example.com/Alt@v1.0.0", [] {
    throw modstore::util::AlternativeModule("alternative of example.com/alt", "example.com/alt");
  });
  assert(pool.ProcessOne("example.com/Alt", "v1.0.0") == VersionStatus::kAlternativePath);
  {
    auto tx  = f.repo->Begin();
    auto alt = f.repo->GetAlternativeModulePath(*tx, "example.com/Alt");
    assert(alt && alt->canonical == "example.com/alt");
    tx->Commit();
  }

  f.source->Fail("example.com/garbled@v1.0.0", [] { throw modstore::util::InvalidModule("malformed module graph"); });
  assert(pool.ProcessOne("example.com/garbled", "v1.0.0") == VersionStatus::kBadModule);
  assert(f.queue->GetState("example.com/garbled", "v1.0.0").error == "malformed module graph");

  auto empty = modstore::testing::Graph("example.com/empty", "v1.0.0");
  empty.units.clear();
  f.source->Add(empty);
  assert(pool.ProcessOne("example.com/empty", "v1.0.0") == VersionStatus::kValidationFailure);

  f.source->Fail("example.com/flaky@v1.0.0",
                 [] { throw modstore::util::TransientStoreFailure("database is locked"); });
  assert(pool.ProcessOne("example.com/flaky", "v1.0.0") == VersionStatus::kSoftFailure);
  assert(pool.ProcessOne("example.com/flaky", "v1.0.0") == VersionStatus::kSoftFailure);
  assert(f.queue->GetState("example.com/flaky", "v1.0.0").try_count == 2);

  f.source->Fail("example.com/broken@v1.0.0", [] { throw std::runtime_error("disk on fire"); });
  assert(pool.ProcessOne("example.com/broken", "v1.0.0") == VersionStatus::kSoftFailure);
}

void TestPoolDrainsQueue() {
  Fixture f;
  for (const auto* path : {"example.com/a", "example.com/b", "example.com/c"}) {
    f.source->Add(modstore::testing::Graph(path, "v1.0.0"));
    f.queue->Enqueue(path, "v1.0.0");
  }

  WorkerPoolOptions options;
  options.threads       = 1;
  options.batch_size    = 2;
  options.poll_interval = std::chrono::milliseconds(10);
  IngestWorkerPool pool(f.queue, f.coordinator, f.source, options);
  pool.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  bool       drained  = false;
  while (!drained && std::chrono::steady_clock::now() < deadline) {
    drained = true;
    for (const auto* path : {"example.com/a", "example.com/b", "example.com/c"}) {
      if (f.queue->GetState(path, "v1.0.0").status != 200) drained = false;
    }
    if (!drained) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  pool.Stop();

  assert(drained);
  assert(f.coordinator->ResolveLatest("example.com/c")->good_version == "v1.0.0");
}

void TestContractErrorIsNeitherRecordedNorRetried() {
  Fixture f;
  auto    fetches = std::make_shared<std::atomic<int>>(0);
  f.source->Fail("example.com/broken@v1.0.0", [fetches] {
    fetches->fetch_add(1);
    throw modstore::util::NotInTransaction("module lock taken outside a transaction");
  });
  f.queue->Enqueue("example.com/broken", "v1.0.0");

  {
    IngestWorkerPool pool(f.queue, f.coordinator, f.source, {});
    bool             threw = false;
    try {
      pool.ProcessOne("example.com/broken", "v1.0.0");
    } catch (const modstore::util::NotInTransaction&) {
      threw = true;
    }
    assert(threw);
  }
  auto state = f.queue->GetState("example.com/broken", "v1.0.0");
  assert(state.status == 0);
  assert(state.try_count == 0);

  fetches->store(0);
  f.source->Add(modstore::testing::Graph("example.com/fine", "v1.0.0"));
  f.queue->Enqueue("example.com/fine", "v1.0.0");

  WorkerPoolOptions options;
  options.threads       = 1;
  options.poll_interval = std::chrono::milliseconds(10);
  IngestWorkerPool pool(f.queue, f.coordinator, f.source, options);
  pool.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (f.queue->GetState("example.com/fine", "v1.0.0").status != 200 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  // many more polls, the broken version is still eligible
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  pool.Stop();

  assert(f.queue->GetState("example.com/fine", "v1.0.0").status == 200);
  assert(fetches->load() == 1);
  assert(f.queue->GetState("example.com/broken", "v1.0.0").try_count == 0);
}

} // namespace

int main() {
  TestNullSourceIsRejected();
  TestOutcomesMapToStatuses();
  TestPoolDrainsQueue();
  TestContractErrorIsNeitherRecordedNorRetried();

  std::cout << "modstore_unit_ingest_worker_pool: pass\n";
  return 0;
}
