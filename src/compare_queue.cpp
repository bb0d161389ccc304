#include "bactopo/core/compare_queue.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "bactopo/core/error.hpp"
#include "bactopo/core/graph_diff.hpp"
#include "bactopo/core/log.hpp"

namespace bactopo::core {

std::string_view to_string(TaskState s) noexcept {
  switch (s) {
    case TaskState::Queued: return "queued";
    case TaskState::Processing: return "processing";
    case TaskState::Done: return "done";
    case TaskState::Error: return "error";
  }
  return "unknown";
}

CompareQueue::CompareQueue(CompareJob job, std::size_t history_limit)
    : job_(std::move(job)), history_limit_(history_limit) {
  if (!job_) throw ValueError("CompareQueue requires a job");
  worker_ = std::thread([this] { run(); });
}

CompareQueue::~CompareQueue() noexcept {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

SubmitResult CompareQueue::submit(ComparePair pair) {
  std::lock_guard<std::mutex> lk(mu_);
  if (current_ && current_->pair.same_pair(pair)) return SubmitResult{false, current_->id};
  for (const auto& t : pending_) {
    if (t.pair.same_pair(pair)) return SubmitResult{false, t.id};
  }
  CompareTask t;
  t.id = next_id_++;
  t.pair = std::move(pair);
  logger()->debug("queued comparison {}: {} vs {}", t.id, t.pair.source_a, t.pair.source_b);
  pending_.push_back(t);
  work_cv_.notify_one();
  return SubmitResult{true, t.id};
}

QueueSnapshot CompareQueue::poll() const {
  std::lock_guard<std::mutex> lk(mu_);
  return QueueSnapshot{current_, std::vector<CompareTask>(pending_.begin(), pending_.end())};
}

std::optional<CompareTask> CompareQueue::task(TaskId id) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (current_ && current_->id == id) return current_;
  for (const auto& t : pending_) {
    if (t.id == id) return t;
  }
  // Newest first: history only ever holds one entry per id anyway.
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->id == id) return *it;
  }
  return std::nullopt;
}

CancelResult CompareQueue::cancel(TaskId id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (current_ && current_->id == id) return CancelResult::Processing;
  auto it = std::find_if(pending_.begin(), pending_.end(), [id](const CompareTask& t) { return t.id == id; });
  if (it == pending_.end()) return CancelResult::NotFound;
  pending_.erase(it);
  logger()->debug("removed queued comparison {}", id);
  if (idle()) idle_cv_.notify_all();
  return CancelResult::Removed;
}

void CompareQueue::wait_idle() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this] { return idle(); });
}

bool CompareQueue::wait_idle_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return idle_cv_.wait_for(lk, timeout, [this] { return idle(); });
}

void CompareQueue::run() {
  for (;;) {
    CompareTask t;
    {
      std::unique_lock<std::mutex> lk(mu_);
      work_cv_.wait(lk, [this] { return stopping_ || !pending_.empty(); });
      if (stopping_) return;
      current_ = std::move(pending_.front());
      pending_.pop_front();
      current_->state = TaskState::Processing;
      t = *current_;
    }

    logger()->info("comparing {} vs {} (task {})", t.pair.source_a, t.pair.source_b, t.id);
    try {
      job_(t);
      t.state = TaskState::Done;
    } catch (const std::exception& e) {
      t.state = TaskState::Error;
      t.error = e.what();
    } catch (...) {
      t.state = TaskState::Error;
      t.error = "unknown error";
    }
    if (t.state == TaskState::Error) {
      logger()->error("comparison task {} failed: {}", t.id, t.error);
    }

    std::lock_guard<std::mutex> lk(mu_);
    history_.push_back(std::move(t));
    while (history_.size() > history_limit_) history_.pop_front();
    current_.reset();
    if (idle()) idle_cv_.notify_all();
  }
}

CompareJob make_store_job(SnapshotStorePtr store) {
  if (!store) throw ValueError("make_store_job requires a store");
  return [store = std::move(store)](const CompareTask& task) {
    const auto a = store->load(task.pair.source_a);
    const auto b = store->load(task.pair.source_b);
    DiffOptions opts;
    opts.source_a = task.pair.source_a;
    opts.source_b = task.pair.source_b;
    store->save_diff(task.pair, diff(a, b, opts));
  };
}

nlohmann::json to_json(const CompareTask& t) {
  nlohmann::json j;
  j["id"] = std::to_string(t.id);
  j["ttl_1"] = t.pair.source_a;
  j["ttl_2"] = t.pair.source_b;
  j["state"] = std::string(to_string(t.state));
  if (t.state == TaskState::Error) j["error"] = t.error;
  return j;
}

nlohmann::json to_json(const QueueSnapshot& s) {
  nlohmann::json j;
  j["processing_task"] = s.current ? to_json(*s.current) : nlohmann::json(nullptr);
  j["queue"] = nlohmann::json::array();
  for (const auto& t : s.pending) j["queue"].push_back(to_json(t));
  return j;
}

} // namespace bactopo::core
