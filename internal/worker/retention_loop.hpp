#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/retention/retention_sweeper.hpp"

namespace modstore::worker {

// Runs RetentionSweeper::Sweep every interval until stopped.
class RetentionLoop {
 public:
  RetentionLoop(std::shared_ptr<retention::RetentionSweeper> sweeper, std::size_t batch_limit,
                std::chrono::seconds interval);
  ~RetentionLoop();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<retention::RetentionSweeper> sweeper_;
  std::size_t                                  batch_limit_;
  std::chrono::seconds                         interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace modstore::worker
