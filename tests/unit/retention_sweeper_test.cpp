#include "internal/retention/retention_sweeper.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "tests/unit/module_fixtures.hpp"

namespace {

using modstore::core::IngestionCoordinator;
using modstore::db::memory::MemoryRepository;
using modstore::model::VersionStatus;
using modstore::retention::RetentionOptions;
using modstore::retention::RetentionSweeper;
using modstore::testing::Graph;
using modstore::util::ManualClock;

constexpr const char* kModule = "example.com/tool";
constexpr const char* kOld    = "v0.0.0-20200101000000-aaaaaaaaaaaa";
constexpr const char* kOlder  = "v0.0.0-20200102000000-bbbbbbbbbbbb";
constexpr const char* kPinned = "v0.0.0-20200103000000-cccccccccccc";
constexpr const char* kFresh  = "v0.0.0-20200104000000-dddddddddddd";

constexpr auto kMonth = std::chrono::hours(24 * 31);

struct Fixture {
  ManualClock                                     clock;
  std::shared_ptr<MemoryRepository>               repo = std::make_shared<MemoryRepository>();
  std::shared_ptr<IngestionCoordinator>           coordinator;
  std::shared_ptr<modstore::queue::WorkQueue>     queue;
  std::unique_ptr<RetentionSweeper>               sweeper;

  Fixture() {
    coordinator = std::make_shared<IngestionCoordinator>(repo, modstore::core::IngestOptions{}, nullptr, clock.Fn());
    queue       = std::make_shared<modstore::queue::WorkQueue>(repo, modstore::queue::QueueOptions{}, clock.Fn());
    sweeper     = std::make_unique<RetentionSweeper>(repo, coordinator, queue, RetentionOptions{}, clock.Fn());
  }

  void Ingest(const std::string& version, const std::string& requested = "") {
    coordinator->Ingest(Graph(kModule, version));
    modstore::queue::RecordDetail detail;
    detail.requested_version = requested;
    queue->Record(kModule, version, VersionStatus::kSuccess, detail);
  }

  bool Stored(const std::string& version) {
    auto tx    = repo->Begin();
    auto found = repo->GetModule(*tx, kModule, version).has_value();
    tx->Commit();
    return found;
  }
};

void TestSweepRemovesOnlyUnreferencedStalePseudoVersions() {
  Fixture f;
  f.Ingest(kOld);
  f.Ingest(kOlder);
  f.Ingest(kPinned, "master");
  f.Ingest("v1.0.0");

  // nothing is old enough yet
  assert(f.sweeper->FindCandidates(10).empty());

  f.clock.Advance(kMonth);
  f.Ingest(kFresh);

  auto candidates = f.sweeper->FindCandidates(10);
  assert(candidates.size() == 2);
  assert(candidates[0].version == kOld);
  assert(candidates[1].version == kOlder);
  assert(f.sweeper->FindCandidates(1).size() == 1);

  assert(f.sweeper->Sweep(10, "stale pseudo-version") == 2);
  assert(!f.Stored(kOld));
  assert(!f.Stored(kOlder));
  assert(f.Stored(kPinned));
  assert(f.Stored(kFresh));
  assert(f.Stored("v1.0.0"));

  auto state = f.queue->GetState(kModule, kOld);
  assert(state.status == modstore::model::ToCode(VersionStatus::kCleaned));
  assert(state.error == "stale pseudo-version");

  assert(f.coordinator->ResolveLatest(kModule)->good_version == "v1.0.0");
  assert(f.sweeper->Sweep(10, "stale pseudo-version") == 0);
}

void TestGoodAndSearchVersionsAreKept() {
  Fixture f;
  f.Ingest(kOld);
  f.Ingest(kOlder);
  f.clock.Advance(kMonth);

  // kOlder is the good version and backs the search rows
  auto candidates = f.sweeper->FindCandidates(10);
  assert(candidates.size() == 1);
  assert(candidates[0].version == kOld);
}

void TestPinnedNamesAreConfigurable() {
  Fixture          f;
  RetentionOptions options;
  options.min_age         = std::chrono::hours(1);
  options.pinned_versions = {"develop"};
  RetentionSweeper sweeper(f.repo, f.coordinator, f.queue, options, f.clock.Fn());

  f.Ingest(kOld, "develop");
  f.Ingest(kOlder, "master");
  f.Ingest("v1.0.0");
  f.clock.Advance(std::chrono::hours(2));

  auto candidates = sweeper.FindCandidates(10);
  assert(candidates.size() == 1);
  assert(candidates[0].version == kOlder);
}

void TestCleanModuleRemovesEveryVersion() {
  Fixture f;
  f.Ingest(kOld);
  f.Ingest("v1.0.0");
  f.Ingest("v1.1.0");

  assert(f.sweeper->CleanModule(kModule, "module removed upstream") == 3);
  assert(!f.Stored("v1.0.0"));
  assert(f.coordinator->ResolveLatest(kModule)->good_version.empty());
  assert(f.queue->GetState(kModule, "v1.1.0").status == modstore::model::ToCode(VersionStatus::kCleaned));
}

} // namespace

int main() {
  TestSweepRemovesOnlyUnreferencedStalePseudoVersions();
  TestGoodAndSearchVersionsAreKept();
  TestPinnedNamesAreConfigurable();
  TestCleanModuleRemovesEveryVersion();

  std::cout << "modstore_unit_retention_sweeper: pass\n";
  return 0;
}
