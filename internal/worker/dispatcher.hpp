#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/queue/work_queue.hpp"

namespace modstore::worker {

/*
  Thread-safe blocking queue feeding ingest workers.
*/
class Dispatcher {
 public:
  void Enqueue(const queue::PendingItem& item);

  // blocking wait
  std::optional<queue::PendingItem> Dequeue();

  void Shutdown();

  std::size_t Size();

 private:
  std::mutex                     mutex_;
  std::condition_variable        cv_;
  std::queue<queue::PendingItem> queue_;
  bool                           shutdown_ = false;
};

} // namespace modstore::worker
