/*
  Compare task queue: one background worker runs snapshot comparisons in
  submission order.

  For Python developers:
  - The worker is a std::thread started by the constructor and joined by the
    destructor (RAII), so a CompareQueue going out of scope stops cleanly.
  - poll()/task() return copies taken under the lock; callers never share
    state with the worker.
*/
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "bactopo/core/snapshot_store.hpp"

namespace bactopo::core {

using TaskId = std::uint64_t;

enum class TaskState { Queued, Processing, Done, Error };

[[nodiscard]] std::string_view to_string(TaskState s) noexcept;

struct CompareTask {
  TaskId id {0};
  ComparePair pair {};
  TaskState state {TaskState::Queued};
  std::string error {};  // set when state == Error
};

struct SubmitResult {
  bool accepted {false};
  // New task when accepted, otherwise the queued/processing task that
  // already covers the pair.
  TaskId task_id {0};
};

struct QueueSnapshot {
  std::optional<CompareTask> current {};
  std::vector<CompareTask> pending {};  // FIFO order
};

enum class CancelResult { Removed, NotFound, Processing };

// Runs one comparison; throws to report failure.
using CompareJob = std::function<void(const CompareTask&)>;

class CompareQueue {
public:
  // history_limit bounds how many finished tasks task() can still report.
  explicit CompareQueue(CompareJob job, std::size_t history_limit = 64);
  // Stops the worker after the task in progress; queued tasks are dropped.
  ~CompareQueue() noexcept;

  CompareQueue(const CompareQueue&) = delete;
  CompareQueue& operator=(const CompareQueue&) = delete;

  // Rejected (not an error) while the same unordered pair is queued or
  // processing.
  SubmitResult submit(ComparePair pair);

  [[nodiscard]] QueueSnapshot poll() const;
  [[nodiscard]] std::optional<CompareTask> task(TaskId id) const;

  // Only queued tasks can be removed; a processing task runs to completion.
  CancelResult cancel(TaskId id);

  void wait_idle();
  // False if the queue was still busy when the timeout expired.
  [[nodiscard]] bool wait_idle_for(std::chrono::milliseconds timeout);

private:
  void run();
  [[nodiscard]] bool idle() const noexcept { return pending_.empty() && !current_; }

  CompareJob job_;
  std::size_t history_limit_;

  mutable std::mutex mu_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<CompareTask> pending_ {};
  std::optional<CompareTask> current_ {};
  std::deque<CompareTask> history_ {};
  TaskId next_id_ {1};
  bool stopping_ {false};

  std::thread worker_;  // started last, after every member it touches
};

// Loads both snapshots, diffs them (sources named after the pair) and saves
// the result through the store.
[[nodiscard]] CompareJob make_store_job(SnapshotStorePtr store);

// Polling boundary shape: {"processing_task": null | task, "queue": [task...]}
// with task = {"id", "ttl_1", "ttl_2", "state"[, "error"]}.
[[nodiscard]] nlohmann::json to_json(const CompareTask& t);
[[nodiscard]] nlohmann::json to_json(const QueueSnapshot& s);

} // namespace bactopo::core
