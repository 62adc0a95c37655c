#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace satp::core {

struct TransferTask {
  std::string           session_id;
  std::function<void()> run;
};

/*
  Thread-safe blocking queue feeding the transfer workers.

  After Shutdown() new tasks are refused; tasks already queued are still
  handed out so their callers get an answer.
*/
class TransferQueue {
 public:
  // false once the queue is shut down
  bool Enqueue(TransferTask task);

  // blocking wait; nullopt when shut down and drained
  std::optional<TransferTask> Dequeue();

  void Shutdown();

  std::size_t Depth() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::queue<TransferTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace satp::core
