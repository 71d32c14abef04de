#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/task_record.hpp"

namespace finq::queue {

struct QueueStats {
  std::size_t total     = 0;
  std::size_t pending   = 0;
  std::size_t running   = 0;
  std::size_t completed = 0;
  std::size_t failed    = 0;
};

/*
  In-memory id -> TaskRecord map.

  Owns every record. Readers get copies; writers go through Update()
  under the exclusive lock, so a record is never observed mid-mutation.
*/
class TaskStore {
 public:
  using Predicate = std::function<bool(const model::TaskRecord&)>;
  using Mutator   = std::function<void(model::TaskRecord&)>;

  // Throws util::AlreadyExists if the id is taken.
  void Insert(model::TaskRecord record);

  std::optional<model::TaskRecord> Get(const std::string& task_id) const;

  // Returns false (and does nothing) when the id is absent.
  bool Update(const std::string& task_id, const Mutator& mutator);

  // Unordered. An empty predicate matches everything.
  std::vector<model::TaskRecord> List(const Predicate& predicate = {}) const;

  std::size_t DeleteWhere(const Predicate& predicate);

  QueueStats  Census() const;
  std::size_t Size() const;

 private:
  mutable std::shared_mutex                          mutex_;
  std::unordered_map<std::string, model::TaskRecord> tasks_;
};

} // namespace finq::queue
