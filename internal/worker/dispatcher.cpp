#include "dispatcher.hpp"

namespace modstore::worker {

void Dispatcher::Enqueue(const queue::PendingItem& item) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(item);
  }
  cv_.notify_one();
}

std::optional<queue::PendingItem> Dispatcher::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  queue::PendingItem item = queue_.front();
  queue_.pop();
  return item;
}

void Dispatcher::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t Dispatcher::Size() {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace modstore::worker
