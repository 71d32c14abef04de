#include "work_queue.hpp"

#include <utility>

namespace finq::executor {

bool WorkQueue::Enqueue(Work work) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(work));
  }
  cv_.notify_one();
  return true;
}

std::optional<Work> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Work work = std::move(queue_.front());
  queue_.pop();
  return work;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t WorkQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace finq::executor
