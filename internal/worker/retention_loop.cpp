#include "retention_loop.hpp"

#include "internal/observability/logging.hpp"

namespace modstore::worker {

RetentionLoop::RetentionLoop(std::shared_ptr<retention::RetentionSweeper> sweeper, std::size_t batch_limit,
                             std::chrono::seconds interval)
    : sweeper_(std::move(sweeper)), batch_limit_(batch_limit), interval_(interval) {
}

RetentionLoop::~RetentionLoop() {
  Stop();
}

void RetentionLoop::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RetentionLoop::Run, this);
}

void RetentionLoop::Stop() {
  if (!running_.exchange(false)) return;
  {
    std::lock_guard lock(mutex_);
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RetentionLoop::Run() {
  while (running_) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return !running_; })) break;
    }

    try {
      const auto removed = sweeper_->Sweep(batch_limit_, "retention: stale pseudo-version");
      if (removed > 0) {
        MODSTORE_LOG_INFO("retention sweep finished", {observability::IntField("removed", static_cast<int64_t>(removed))});
      }
    } catch (const std::exception& e) {
      MODSTORE_LOG_ERROR("retention sweep failed", {observability::ErrorField(e.what())});
    }
  }
}

} // namespace modstore::worker
