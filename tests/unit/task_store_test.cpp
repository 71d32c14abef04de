#include "internal/queue/task_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using finq::model::TaskRecord;
using finq::model::TaskStatus;
using finq::queue::TaskStore;

TaskRecord MakeRecord(const std::string& id, TaskStatus status = TaskStatus::kPending) {
  TaskRecord record(id, "op-" + id, finq::util::Now());
  record.status = status;
  return record;
}

void TestInsertAndGetReturnsCopy() {
  TaskStore store;
  store.Insert(MakeRecord("a"));

  auto record = store.Get("a");
  assert(record.has_value());
  assert(record->function_name == "op-a");
  assert(record->status == TaskStatus::kPending);

  record->status = TaskStatus::kFailed;
  assert(store.Get("a")->status == TaskStatus::kPending);
}

void TestDuplicateInsertThrows() {
  TaskStore store;
  store.Insert(MakeRecord("dup"));

  bool threw = false;
  try {
    store.Insert(MakeRecord("dup"));
  } catch (const finq::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(store.Size() == 1);
}

void TestGetMissingReturnsEmpty() {
  TaskStore store;
  assert(!store.Get("missing").has_value());
}

void TestUpdateAbsentIsNoop() {
  TaskStore store;
  bool      called = false;
  assert(!store.Update("missing", [&](TaskRecord&) { called = true; }));
  assert(!called);
  assert(store.Size() == 0);
}

void TestUpdateMutatesInPlace() {
  TaskStore store;
  store.Insert(MakeRecord("u"));

  assert(store.Update("u", [](TaskRecord& record) { record.status = TaskStatus::kRunning; }));
  assert(store.Get("u")->status == TaskStatus::kRunning);
}

void TestListFilterAndDeleteWhere() {
  TaskStore store;
  store.Insert(MakeRecord("p1"));
  store.Insert(MakeRecord("p2"));
  store.Insert(MakeRecord("c1", TaskStatus::kCompleted));
  store.Insert(MakeRecord("f1", TaskStatus::kFailed));

  assert(store.List().size() == 4);

  const auto pending = store.List([](const TaskRecord& r) { return r.status == TaskStatus::kPending; });
  assert(pending.size() == 2);

  const auto removed = store.DeleteWhere([](const TaskRecord& r) { return r.status == TaskStatus::kCompleted || r.status == TaskStatus::kFailed; });
  assert(removed == 2);
  assert(store.Size() == 2);
  assert(!store.Get("c1").has_value());
  assert(store.Get("p1").has_value());
}

void TestCensusCountsByStatus() {
  TaskStore store;
  store.Insert(MakeRecord("p"));
  store.Insert(MakeRecord("r", TaskStatus::kRunning));
  store.Insert(MakeRecord("c1", TaskStatus::kCompleted));
  store.Insert(MakeRecord("c2", TaskStatus::kCompleted));
  store.Insert(MakeRecord("f", TaskStatus::kFailed));

  const auto stats = store.Census();
  assert(stats.total == 5);
  assert(stats.pending == 1);
  assert(stats.running == 1);
  assert(stats.completed == 2);
  assert(stats.failed == 1);
}

} // namespace

int main() {
  TestInsertAndGetReturnsCopy();
  TestDuplicateInsertThrows();
  TestGetMissingReturnsEmpty();
  TestUpdateAbsentIsNoop();
  TestUpdateMutatesInPlace();
  TestListFilterAndDeleteWhere();
  TestCensusCountsByStatus();

  std::cout << "finq_unit_task_store: pass\n";
  return 0;
}
