#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace finq::queue {

class TaskQueue;

/*
  Background thread that periodically runs TaskQueue::Clean().

  A zero interval leaves the sweeper idle; finished tasks then stay
  until someone calls Clean() explicitly.
*/
class CleanupSweeper {
 public:
  CleanupSweeper(std::shared_ptr<TaskQueue> queue, std::chrono::milliseconds interval, std::chrono::seconds max_age);
  ~CleanupSweeper();

  CleanupSweeper(const CleanupSweeper&)            = delete;
  CleanupSweeper& operator=(const CleanupSweeper&) = delete;

  void Start();
  void Stop();

  bool Enabled() const {
    return interval_.count() > 0;
  }

  // Completed sweep passes.
  std::uint64_t Sweeps() const;

 private:
  void Run();

  std::shared_ptr<TaskQueue> queue_;
  std::chrono::milliseconds  interval_;
  std::chrono::seconds       max_age_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stop_   = false;
  std::uint64_t           sweeps_ = 0;
  std::thread             thread_;
};

} // namespace finq::queue
