#include "internal/queue/work_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using modstore::db::memory::MemoryRepository;
using modstore::model::ToCode;
using modstore::model::VersionStatus;
using modstore::queue::QueueOptions;
using modstore::queue::WorkQueue;
using modstore::util::ManualClock;

constexpr auto kMinute = std::chrono::minutes(1);

QueueOptions Options(const std::string& app_version = "app-1") {
  QueueOptions options;
  options.app_version = app_version;
  return options;
}

void TestEnqueueIsIdempotent() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   queue(repo, Options(), clock.Fn());

  assert(queue.Enqueue("example.com/mod", "v1.0.0", 3));
  assert(!queue.Enqueue("example.com/mod", "v1.0.0", 3));

  auto state = queue.GetState("example.com/mod", "v1.0.0");
  assert(state.status == 0);
  assert(state.try_count == 0);
  assert(state.num_packages == 3);
  assert(state.sort_version == "1,0,0~");

  bool threw = false;
  try {
    queue.Enqueue("example.com/mod", "master");
  } catch (const modstore::util::InvalidModule&) {
    threw = true;
  }
  assert(threw);
}

void TestRecordSchedulesRetryWithBackoff() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   queue(repo, Options(), clock.Fn());

  queue.Enqueue("example.com/mod", "v1.0.0");
  assert(queue.NextBatch(10).size() == 1);

  queue.Record("example.com/mod", "v1.0.0", VersionStatus::kSoftFailure, {"connection reset"});
  auto state = queue.GetState("example.com/mod", "v1.0.0");
  assert(state.status == 500);
  assert(state.try_count == 1);
  assert(state.error == "connection reset");
  assert(state.app_version == "app-1");
  assert(state.next_processed_after_ms == modstore::util::ToUnixMillis(clock.Now() + kMinute));

  assert(queue.NextBatch(10).empty());
  clock.Advance(kMinute);
  assert(queue.NextBatch(10).size() == 1);

  queue.Record("example.com/mod", "v1.0.0", VersionStatus::kSoftFailure, {"connection reset"});
  state = queue.GetState("example.com/mod", "v1.0.0");
  assert(state.try_count == 2);
  assert(state.next_processed_after_ms == modstore::util::ToUnixMillis(clock.Now() + 2 * kMinute));
}

void TestTerminalStatusesAreNotDequeued() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   queue(repo, Options(), clock.Fn());

  queue.Enqueue("example.com/ok", "v1.0.0");
  queue.Enqueue("example.com/gone", "v1.0.0");
  queue.Record("example.com/ok", "v1.0.0", VersionStatus::kSuccess, {"", 4});
  queue.Record("example.com/gone", "v1.0.0", VersionStatus::kNotFound);

  clock.Advance(std::chrono::hours(24));
  assert(queue.NextBatch(10).empty());
  assert(queue.GetState("example.com/ok", "v1.0.0").num_packages == 4);
}

void TestDequeuePriority() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   queue(repo, Options(), clock.Fn());

  queue.Enqueue("example.com/c", "v1.0.0", 5000);      // large
  queue.Enqueue("example.com/a", "v0.9.0", 2);         // small, not latest
  queue.Enqueue("example.com/b", "v2.0.0-rc.1", 2);    // small, latest, prerelease
  queue.Enqueue("example.com/a", "v1.0.0", 2);         // small, latest release
  queue.Enqueue("example.com/d", "v1.1.0", 1);         // small, latest release, fewer packages

  auto batch = queue.NextBatch(10);
  assert(batch.size() == 5);
  assert(batch[0].module_path == "example.com/d");
  assert(batch[1].module_path == "example.com/a" && batch[1].version == "v1.0.0");
  assert(batch[2].module_path == "example.com/b");
  assert(batch[3].module_path == "example.com/a" && batch[3].version == "v0.9.0");
  assert(batch[4].module_path == "example.com/c");

  auto limited = queue.NextBatch(2);
  assert(limited.size() == 2);
  assert(limited[0].module_path == "example.com/d");
  assert(limited[1].module_path == "example.com/a");
}

void TestSmallNonLatestPrecedesOversized() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   queue(repo, Options(), clock.Fn());

  queue.Enqueue("example.com/a", "v1.0.0", 2);
  queue.Enqueue("example.com/a", "v0.9.0", 2);
  queue.Enqueue("example.com/big", "v1.0.0", 5000);

  auto batch = queue.NextBatch(3);
  assert(batch.size() == 3);
  assert(batch[0].module_path == "example.com/a" && batch[0].version == "v1.0.0");
  assert(batch[1].module_path == "example.com/a" && batch[1].version == "v0.9.0");
  assert(batch[2].module_path == "example.com/big");

  // with room for two, the oversized module is the one left out
  auto limited = queue.NextBatch(2);
  assert(limited.size() == 2);
  assert(limited[1].version == "v0.9.0");
}

void TestLargeModulesAreCapped() {
  auto         repo    = std::make_shared<MemoryRepository>();
  ManualClock  clock;
  QueueOptions options = Options();
  options.large_modules_limit            = 1;
  options.large_module_package_threshold = 100;
  WorkQueue queue(repo, options, clock.Fn());

  queue.Enqueue("example.com/big1", "v1.0.0", 500);
  queue.Enqueue("example.com/big2", "v1.0.0", 400);
  queue.Enqueue("example.com/small", "v1.0.0", 99);
  queue.Enqueue("example.com/unknown", "v1.0.0");

  auto batch = queue.NextBatch(10);
  assert(batch.size() == 3);
  assert(batch[0].module_path == "example.com/small" || batch[0].module_path == "example.com/unknown");
  assert(batch[2].module_path == "example.com/big2");
}

void TestResetForReprocessing() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   old_queue(repo, Options("2023-01"), clock.Fn());
  WorkQueue   new_queue(repo, Options("2024-01"), clock.Fn());

  old_queue.Record("example.com/a", "v1.0.0", VersionStatus::kSuccess);
  old_queue.Record("example.com/b", "v1.0.0", VersionStatus::kBadModule);
  old_queue.Record("example.com/c", "v1.0.0", VersionStatus::kNotFound);
  new_queue.Record("example.com/d", "v1.0.0", VersionStatus::kSuccess);

  assert(new_queue.ResetForReprocessing("2024-01") == 2);

  assert(new_queue.GetState("example.com/a", "v1.0.0").status == ToCode(VersionStatus::kReprocessSuccess));
  assert(new_queue.GetState("example.com/b", "v1.0.0").status == ToCode(VersionStatus::kReprocessBadModule));
  assert(new_queue.GetState("example.com/c", "v1.0.0").status == ToCode(VersionStatus::kNotFound));
  assert(new_queue.GetState("example.com/d", "v1.0.0").status == ToCode(VersionStatus::kSuccess));

  auto a = new_queue.GetState("example.com/a", "v1.0.0");
  assert(!a.last_processed_at_ms.has_value());
  assert(a.next_processed_after_ms == modstore::util::ToUnixMillis(clock.Now()));

  auto batch = new_queue.NextBatch(10);
  assert(batch.size() == 2);
}

void TestAlternativePathRecordsCanonical() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   queue(repo, Options(), clock.Fn());

  {
    auto tx = repo->Begin();
    assert(repo->ReplaceSearchDocuments(*tx, "github.com/Upper/mod",
                                        {{"github.com/Upper/mod", "github.com/Upper/mod", "v1.0.0", "mod", "", {}, true, 1}}));
    tx->Commit();
  }

  modstore::queue::RecordDetail detail;
  detail.error          = "module declares github.com/upper/mod";
  detail.canonical_path = "github.com/upper/mod";
  queue.Record("github.com/Upper/mod", "v1.0.0", VersionStatus::kAlternativePath, detail);

  auto tx  = repo->Begin();
  auto alt = repo->GetAlternativeModulePath(*tx, "github.com/Upper/mod");
  assert(alt.has_value());
  assert(alt->canonical == "github.com/upper/mod");
  assert(repo->ListSearchDocuments(*tx, "github.com/Upper/mod").empty());
  tx->Commit();
}

void TestRecordWritesVersionMap() {
  auto        repo = std::make_shared<MemoryRepository>();
  ManualClock clock;
  WorkQueue   queue(repo, Options(), clock.Fn());

  modstore::queue::RecordDetail detail;
  detail.requested_version = "master";
  queue.Record("example.com/mod", "v0.0.0-20200101000000-abcdef123456", VersionStatus::kSuccess, detail);

  auto tx     = repo->Begin();
  auto mapped = repo->GetVersionMap(*tx, "example.com/mod", "master");
  assert(mapped.has_value());
  assert(mapped->resolved_version == "v0.0.0-20200101000000-abcdef123456");
  assert(mapped->status == 200);
  assert(repo->GetVersionMap(*tx, "example.com/mod", "v0.0.0-20200101000000-abcdef123456") == std::nullopt);
  tx->Commit();
}

void TestGetStateThrowsNotFound() {
  auto      repo = std::make_shared<MemoryRepository>();
  WorkQueue queue(repo, Options());

  bool threw = false;
  try {
    queue.GetState("example.com/none", "v1.0.0");
  } catch (const modstore::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEnqueueIsIdempotent();
  TestRecordSchedulesRetryWithBackoff();
  TestTerminalStatusesAreNotDequeued();
  TestDequeuePriority();
  TestSmallNonLatestPrecedesOversized();
  TestLargeModulesAreCapped();
  TestResetForReprocessing();
  TestAlternativePathRecordsCanonical();
  TestRecordWritesVersionMap();
  TestGetStateThrowsNotFound();

  std::cout << "modstore_unit_work_queue: pass\n";
  return 0;
}
