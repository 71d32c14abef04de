#include "internal/queue/cleanup_sweeper.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/queue/task_queue.hpp"

namespace finq::queue {

CleanupSweeper::CleanupSweeper(std::shared_ptr<TaskQueue> queue, std::chrono::milliseconds interval, std::chrono::seconds max_age)
    : queue_(std::move(queue)), interval_(interval), max_age_(max_age) {
}

CleanupSweeper::~CleanupSweeper() {
  Stop();
}

void CleanupSweeper::Start() {
  if (!Enabled()) {
    FINQ_LOG_INFO("cleanup sweeper disabled");
    return;
  }
  if (thread_.joinable()) return;

  {
    std::lock_guard lock(mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&CleanupSweeper::Run, this);
  FINQ_LOG_INFO("cleanup sweeper started", {observability::IntField("interval_ms", interval_.count()),
                                            observability::IntField("max_age_s", max_age_.count())});
}

void CleanupSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::uint64_t CleanupSweeper::Sweeps() const {
  std::lock_guard lock(mutex_);
  return sweeps_;
}

void CleanupSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [&] { return stop_; })) {
    lock.unlock();
    try {
      queue_->Clean(max_age_);
    } catch (const std::exception& e) {
      FINQ_LOG_ERROR("cleanup sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
    ++sweeps_;
  }
}

} // namespace finq::queue
