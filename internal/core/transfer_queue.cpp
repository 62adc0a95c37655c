#include "internal/core/transfer_queue.hpp"

namespace satp::core {

bool TransferQueue::Enqueue(TransferTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<TransferTask> TransferQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  TransferTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TransferQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TransferQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace satp::core
