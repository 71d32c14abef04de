#include "thread_per_task_executor.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace finq::executor {

ThreadPerTaskExecutor::~ThreadPerTaskExecutor() {
  Shutdown();
}

void ThreadPerTaskExecutor::Post(Work work) {
  std::lock_guard lock(mutex_);
  if (shutdown_) {
    throw util::InvalidState("executor is shut down");
  }

  ReapFinishedLocked();

  auto done = std::make_shared<std::atomic<bool>>(false);
  ++in_flight_;
  try {
    std::thread thread([this, done, work = std::move(work)] {
      try {
        work();
      } catch (const std::exception& e) {
        FINQ_LOG_ERROR("detached job threw", {observability::StringField("error", e.what())});
      }
      --in_flight_;
      done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
  } catch (...) {
    --in_flight_;
    throw;
  }
}

void ThreadPerTaskExecutor::Shutdown() {
  std::list<Worker> pending;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    pending.swap(workers_);
  }

  for (auto& worker : pending) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

std::size_t ThreadPerTaskExecutor::InFlight() const {
  return in_flight_.load();
}

void ThreadPerTaskExecutor::ReapFinishedLocked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
      continue;
    }
    ++it;
  }
}

} // namespace finq::executor
