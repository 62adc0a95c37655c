#pragma once

#include <memory>
#include <thread>
#include <vector>

#include "internal/core/transfer_queue.hpp"

namespace satp::core {

/*
  Fixed pool of threads draining the TransferQueue. Each task runs one
  session to completion, so sessions progress independently.
*/
class TransferWorkerPool {
 public:
  TransferWorkerPool(std::shared_ptr<TransferQueue> queue, std::size_t threads);
  ~TransferWorkerPool();

  void Start();
  // Shuts the queue down and joins after the backlog drains.
  void Stop();

 private:
  void Run();

  std::shared_ptr<TransferQueue> queue_;
  std::size_t                    thread_count_;
  std::vector<std::thread>       threads_;
};

} // namespace satp::core
