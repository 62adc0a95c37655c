#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/transfer_queue.hpp"
#include "internal/core/transfer_worker.hpp"

namespace {

using satp::core::TransferQueue;
using satp::core::TransferTask;

void TestFifoOrder() {
  TransferQueue queue;
  assert(queue.Enqueue({"a", [] {}}));
  assert(queue.Enqueue({"b", [] {}}));
  assert(queue.Depth() == 2);

  assert(queue.Dequeue()->session_id == "a");
  assert(queue.Dequeue()->session_id == "b");
  assert(queue.Depth() == 0);
}

void TestShutdownRefusesNewButDrainsBacklog() {
  TransferQueue queue;
  assert(queue.Enqueue({"a", [] {}}));
  queue.Shutdown();

  assert(!queue.Enqueue({"b", [] {}}));
  auto task = queue.Dequeue();
  assert(task.has_value());
  assert(task->session_id == "a");
  assert(!queue.Dequeue().has_value());
}

void TestWorkersRunEveryTask() {
  auto queue = std::make_shared<TransferQueue>();
  std::atomic<int> ran{0};

  satp::core::TransferWorkerPool pool(queue, 3);
  pool.Start();
  for (int i = 0; i < 50; ++i) {
    assert(queue->Enqueue({"s-" + std::to_string(i), [&] { ran.fetch_add(1); }}));
  }
  pool.Stop();

  assert(ran.load() == 50);
  assert(!queue->Enqueue({"late", [] {}}));
}

} // namespace

int main() {
  TestFifoOrder();
  TestShutdownRefusesNewButDrainsBacklog();
  TestWorkersRunEveryTask();

  std::cout << "transfer_queue_test: pass\n";
  return 0;
}
