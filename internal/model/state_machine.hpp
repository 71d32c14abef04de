#pragma once

#include "internal/model/task_record.hpp"

namespace finq::model {

constexpr bool IsTerminal(TaskStatus state) {
  return state == TaskStatus::kCompleted || state == TaskStatus::kFailed;
}

// Pending -> Running -> Completed | Failed. Terminal states are final.
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == TaskStatus::kPending) {
    return to == TaskStatus::kRunning;
  }
  return IsTerminal(to);
}

static_assert(CanTransition(TaskStatus::kPending, TaskStatus::kRunning));
static_assert(!CanTransition(TaskStatus::kPending, TaskStatus::kCompleted));
static_assert(!CanTransition(TaskStatus::kCompleted, TaskStatus::kFailed));

} // namespace finq::model
