#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "executor.hpp"

namespace finq::executor {

/*
  Thread-safe blocking queue for pool workers.
*/
class WorkQueue {
 public:
  // Returns false once shut down.
  bool Enqueue(Work work);

  // blocking wait; nullopt after shutdown once drained
  std::optional<Work> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Work>        queue_;
  bool                    shutdown_ = false;
};

} // namespace finq::executor
