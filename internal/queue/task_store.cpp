#include "internal/queue/task_store.hpp"

#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"

namespace finq::queue {

void TaskStore::Insert(model::TaskRecord record) {
  std::unique_lock lock(mutex_);

  auto key             = record.task_id;
  auto [it, inserted] = tasks_.try_emplace(std::move(key), std::move(record));
  if (!inserted) {
    throw util::AlreadyExists("task " + it->first + " already exists");
  }
}

std::optional<model::TaskRecord> TaskStore::Get(const std::string& task_id) const {
  std::shared_lock lock(mutex_);

  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;

  return it->second;
}

bool TaskStore::Update(const std::string& task_id, const Mutator& mutator) {
  std::unique_lock lock(mutex_);

  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return false;

  mutator(it->second);
  return true;
}

std::vector<model::TaskRecord> TaskStore::List(const Predicate& predicate) const {
  std::shared_lock lock(mutex_);

  std::vector<model::TaskRecord> out;
  out.reserve(tasks_.size());
  for (const auto& [id, record] : tasks_) {
    if (!predicate || predicate(record)) {
      out.push_back(record);
    }
  }
  return out;
}

std::size_t TaskStore::DeleteWhere(const Predicate& predicate) {
  std::unique_lock lock(mutex_);

  std::size_t removed = 0;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (predicate(it->second)) {
      it = tasks_.erase(it);
      ++removed;
      continue;
    }
    ++it;
  }
  return removed;
}

QueueStats TaskStore::Census() const {
  std::shared_lock lock(mutex_);

  QueueStats stats;
  stats.total = tasks_.size();
  for (const auto& [id, record] : tasks_) {
    switch (record.status) {
      case model::TaskStatus::kPending:
        ++stats.pending;
        break;
      case model::TaskStatus::kRunning:
        ++stats.running;
        break;
      case model::TaskStatus::kCompleted:
        ++stats.completed;
        break;
      case model::TaskStatus::kFailed:
        ++stats.failed;
        break;
    }
  }
  return stats;
}

std::size_t TaskStore::Size() const {
  std::shared_lock lock(mutex_);
  return tasks_.size();
}

} // namespace finq::queue
