#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "dispatcher.hpp"
#include "internal/core/ingestion_coordinator.hpp"
#include "internal/fetch/module_source.hpp"
#include "internal/model/status.hpp"
#include "internal/queue/work_queue.hpp"

namespace modstore::worker {

struct WorkerPoolOptions {
  std::size_t               threads    = 4;
  std::size_t               batch_size = 32;
  std::chrono::milliseconds poll_interval{1000};
};

/*
  Background workers that drain the work queue.

  One dispatcher thread polls WorkQueue::NextBatch and hands items that are
  not already in flight to N worker threads. A worker runs
      fetch -> ingest -> record
  and records the status its outcome maps to. A failed record is logged and
  the item stays eligible for the next poll.
*/
class IngestWorkerPool {
 public:
  IngestWorkerPool(std::shared_ptr<queue::WorkQueue> queue, std::shared_ptr<core::IngestionCoordinator> coordinator,
                   std::shared_ptr<fetch::ModuleSource> source, WorkerPoolOptions options);
  ~IngestWorkerPool();

  void Start();
  void Stop();

  // Runs one item on the calling thread. Returns the status it maps to.
  // util::NotInTransaction propagates without recording anything; pool
  // workers then stop dispatching that item.
  model::VersionStatus ProcessOne(const std::string& module_path, const std::string& version);

 private:
  // One dispatcher cycle. Returns the number of items handed to workers.
  std::size_t PollOnce();
  void RunDispatcher();
  void RunWorker();

  bool MarkInFlight(const std::string& key);
  void ClearInFlight(const std::string& key);

  std::shared_ptr<queue::WorkQueue>           queue_;
  std::shared_ptr<core::IngestionCoordinator> coordinator_;
  std::shared_ptr<fetch::ModuleSource>        source_;
  WorkerPoolOptions                           options_;

  Dispatcher dispatcher_;

  std::mutex                      in_flight_mutex_;
  std::unordered_set<std::string> in_flight_;

  std::mutex              poll_mutex_;
  std::condition_variable poll_cv_;

  std::thread              dispatcher_thread_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace modstore::worker
