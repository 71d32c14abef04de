#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

#include "executor.hpp"
#include "work_queue.hpp"

namespace finq::executor {

/*
  Fixed set of worker threads draining a shared WorkQueue.

  At most `workers` posted units run at the same time; the rest wait
  in the queue in FIFO order.
*/
class WorkerPool final : public Executor {
 public:
  // workers == 0 selects std::thread::hardware_concurrency().
  explicit WorkerPool(std::size_t workers);
  ~WorkerPool() override;

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void        Post(Work work) override;
  void        Shutdown() override;
  std::size_t InFlight() const override;

  std::size_t WorkerCount() const {
    return threads_.size();
  }

 private:
  void Run(std::size_t worker_id);

  WorkQueue                queue_;
  std::vector<std::thread> threads_;
  std::atomic<std::size_t> in_flight_{0};
  std::once_flag           shutdown_once_;
};

} // namespace finq::executor
