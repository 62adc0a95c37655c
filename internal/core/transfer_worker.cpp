#include "internal/core/transfer_worker.hpp"

#include "internal/observability/logging.hpp"

namespace satp::core {

TransferWorkerPool::TransferWorkerPool(std::shared_ptr<TransferQueue> queue, std::size_t threads)
    : queue_(std::move(queue)), thread_count_(threads == 0 ? 1 : threads) {
}

TransferWorkerPool::~TransferWorkerPool() {
  Stop();
}

void TransferWorkerPool::Start() {
  if (!threads_.empty()) return;
  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&TransferWorkerPool::Run, this);
  }
}

void TransferWorkerPool::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void TransferWorkerPool::Run() {
  while (auto task = queue_->Dequeue()) {
    try {
      task->run();
    } catch (const std::exception& e) {
      // tasks report through their promise; reaching here is a bug in the task
      SATP_LOG_ERROR("transfer task escaped", {observability::StringField("session_id", task->session_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace satp::core
