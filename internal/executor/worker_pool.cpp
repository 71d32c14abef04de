#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace finq::executor {

WorkerPool::WorkerPool(std::size_t workers) {
  if (workers == 0) {
    workers = std::max(1u, std::thread::hardware_concurrency());
  }

  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this, i);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

void WorkerPool::Post(Work work) {
  ++in_flight_;
  if (!queue_.Enqueue(std::move(work))) {
    --in_flight_;
    throw util::InvalidState("worker pool is shut down");
  }
}

void WorkerPool::Shutdown() {
  std::call_once(shutdown_once_, [this] {
    queue_.Shutdown();
    for (auto& thread : threads_) {
      if (thread.joinable()) thread.join();
    }
  });
}

std::size_t WorkerPool::InFlight() const {
  return in_flight_.load();
}

void WorkerPool::Run(std::size_t worker_id) {
  while (auto work = queue_.Dequeue()) {
    try {
      (*work)();
    } catch (const std::exception& e) {
      FINQ_LOG_ERROR("worker pool job threw",
                     {observability::IntField("worker", static_cast<std::int64_t>(worker_id)), observability::StringField("error", e.what())});
    }
    --in_flight_;
  }
}

} // namespace finq::executor
