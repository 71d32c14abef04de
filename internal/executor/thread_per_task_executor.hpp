#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "executor.hpp"

namespace finq::executor {

/*
  Spawns one thread per posted unit. No concurrency cap.

  Finished threads are joined on the next Post(); Shutdown() joins the rest.
*/
class ThreadPerTaskExecutor final : public Executor {
 public:
  ThreadPerTaskExecutor() = default;
  ~ThreadPerTaskExecutor() override;

  ThreadPerTaskExecutor(const ThreadPerTaskExecutor&)            = delete;
  ThreadPerTaskExecutor& operator=(const ThreadPerTaskExecutor&) = delete;

  void        Post(Work work) override;
  void        Shutdown() override;
  std::size_t InFlight() const override;

 private:
  struct Worker {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // Requires mutex_.
  void ReapFinishedLocked();

  mutable std::mutex       mutex_;
  std::list<Worker>        workers_;
  bool                     shutdown_ = false;
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace finq::executor
