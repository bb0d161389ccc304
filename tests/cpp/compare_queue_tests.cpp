#include <gtest/gtest.h>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>
#include "bactopo/core/compare_queue.hpp"
#include "bactopo/core/error.hpp"
#include "bactopo/core/snapshot_store.hpp"
#include "test_utils.hpp"

using namespace bactopo::core;
using namespace bactopo::core::test;
using namespace std::chrono_literals;

namespace {

// Holds every job until release(); lets a test observe the processing state.
class Gate {
public:
  void enter() {
    std::unique_lock<std::mutex> lk(mu_);
    ++entered_;
    cv_.notify_all();
    cv_.wait(lk, [this] { return open_; });
  }
  void wait_entered(int n) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this, n] { return entered_ >= n; });
  }
  void release() {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = true;
    cv_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  int entered_ {0};
  bool open_ {false};
};

// Opens the gate on scope exit so a failed assertion cannot leave the
// worker blocked while the queue joins it.
struct OpenOnExit {
  std::shared_ptr<Gate> gate;
  ~OpenOnExit() { gate->release(); }
};

} // namespace

TEST(CompareQueue, RequiresJob) {
  EXPECT_THROW(CompareQueue(CompareJob{}), ValueError);
}

TEST(CompareQueue, RejectsDuplicatePairInEitherOrder) {
  auto gate = std::make_shared<Gate>();
  CompareQueue q([gate](const CompareTask&) { gate->enter(); });
  OpenOnExit guard{gate};

  auto first = q.submit(ComparePair{"a.ttl", "b.ttl"});
  ASSERT_TRUE(first.accepted);
  gate->wait_entered(1);

  auto reversed = q.submit(ComparePair{"b.ttl", "a.ttl"});
  EXPECT_FALSE(reversed.accepted);
  EXPECT_EQ(reversed.task_id, first.task_id);

  auto second = q.submit(ComparePair{"a.ttl", "c.ttl"});
  ASSERT_TRUE(second.accepted);
  auto dup = q.submit(ComparePair{"a.ttl", "c.ttl"});
  EXPECT_FALSE(dup.accepted);
  EXPECT_EQ(dup.task_id, second.task_id);

  auto snap = q.poll();
  ASSERT_TRUE(snap.current.has_value());
  EXPECT_EQ(snap.current->id, first.task_id);
  EXPECT_EQ(snap.current->state, TaskState::Processing);
  ASSERT_EQ(snap.pending.size(), 1u);
  EXPECT_EQ(snap.pending[0].id, second.task_id);
  EXPECT_EQ(snap.pending[0].state, TaskState::Queued);

  gate->release();
  q.wait_idle();
  EXPECT_EQ(q.task(first.task_id)->state, TaskState::Done);
  EXPECT_EQ(q.task(second.task_id)->state, TaskState::Done);

  // Once finished, the same pair may be compared again.
  auto again = q.submit(ComparePair{"b.ttl", "a.ttl"});
  EXPECT_TRUE(again.accepted);
  EXPECT_NE(again.task_id, first.task_id);
  q.wait_idle();
}

TEST(CompareQueue, CancelOnlyRemovesQueuedTasks) {
  auto gate = std::make_shared<Gate>();
  CompareQueue q([gate](const CompareTask&) { gate->enter(); });
  OpenOnExit guard{gate};
  auto running = q.submit(ComparePair{"a", "b"});
  gate->wait_entered(1);
  auto queued = q.submit(ComparePair{"c", "d"});

  EXPECT_EQ(q.cancel(running.task_id), CancelResult::Processing);
  EXPECT_EQ(q.cancel(queued.task_id), CancelResult::Removed);
  EXPECT_EQ(q.cancel(queued.task_id), CancelResult::NotFound);
  EXPECT_EQ(q.cancel(12345), CancelResult::NotFound);
  EXPECT_TRUE(q.poll().pending.empty());
  EXPECT_FALSE(q.task(queued.task_id).has_value());

  EXPECT_FALSE(q.wait_idle_for(20ms));
  gate->release();
  EXPECT_TRUE(q.wait_idle_for(10s));
}

TEST(CompareQueue, RunsInSubmissionOrder) {
  auto gate = std::make_shared<Gate>();
  auto order = std::make_shared<std::vector<std::string>>();
  auto order_mu = std::make_shared<std::mutex>();
  CompareQueue q([gate, order, order_mu](const CompareTask& t) {
    gate->enter();
    std::lock_guard<std::mutex> lk(*order_mu);
    order->push_back(t.pair.source_a);
  });
  OpenOnExit guard{gate};
  (void)q.submit(ComparePair{"1", "x"});
  gate->wait_entered(1);
  (void)q.submit(ComparePair{"2", "x"});
  (void)q.submit(ComparePair{"3", "x"});
  gate->release();
  q.wait_idle();
  std::lock_guard<std::mutex> lk(*order_mu);
  EXPECT_EQ(*order, (std::vector<std::string>{"1", "2", "3"}));
}

TEST(CompareQueue, FailedJobIsReportedAndPairCanRetry) {
  CompareQueue q([](const CompareTask& t) {
    if (t.pair.source_a == "bad") throw RuntimeError("boom");
  });
  auto r = q.submit(ComparePair{"bad", "x"});
  q.wait_idle();
  auto t = q.task(r.task_id);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->state, TaskState::Error);
  EXPECT_EQ(t->error, "boom");
  EXPECT_TRUE(q.submit(ComparePair{"bad", "x"}).accepted);
  q.wait_idle();

  // The worker survives the failure.
  auto ok = q.submit(ComparePair{"good", "x"});
  q.wait_idle();
  EXPECT_EQ(q.task(ok.task_id)->state, TaskState::Done);
}

TEST(CompareQueue, PollJsonShape) {
  auto gate = std::make_shared<Gate>();
  CompareQueue q([gate](const CompareTask&) { gate->enter(); });
  OpenOnExit guard{gate};

  auto idle = to_json(q.poll());
  EXPECT_TRUE(idle["processing_task"].is_null());
  EXPECT_TRUE(idle["queue"].is_array());
  EXPECT_TRUE(idle["queue"].empty());

  auto r = q.submit(ComparePair{"a.ttl", "b.ttl"});
  gate->wait_entered(1);
  (void)q.submit(ComparePair{"c.ttl", "d.ttl"});
  auto busy = to_json(q.poll());
  EXPECT_EQ(busy["processing_task"]["id"].get<std::string>(), std::to_string(r.task_id));
  EXPECT_EQ(busy["processing_task"]["ttl_1"].get<std::string>(), "a.ttl");
  EXPECT_EQ(busy["processing_task"]["ttl_2"].get<std::string>(), "b.ttl");
  EXPECT_EQ(busy["processing_task"]["state"].get<std::string>(), "processing");
  ASSERT_EQ(busy["queue"].size(), 1u);
  EXPECT_EQ(busy["queue"][0]["ttl_1"].get<std::string>(), "c.ttl");
  EXPECT_EQ(busy["queue"][0]["state"].get<std::string>(), "queued");
  EXPECT_FALSE(busy["queue"][0].contains("error"));

  gate->release();
  q.wait_idle();
}

TEST(CompareQueue, StoreJobWritesDiff) {
  TempDir dir("queue");
  auto store = std::make_shared<FileSnapshotStore>(dir.path());
  store->save("old.ttl", make_device_network_graph(false));
  store->save("new.ttl", make_device_network_graph(true));

  CompareQueue q(make_store_job(store));
  auto ok = q.submit(ComparePair{"old.ttl", "new.ttl"});
  auto missing = q.submit(ComparePair{"old.ttl", "missing.ttl"});
  q.wait_idle();

  EXPECT_EQ(q.task(ok.task_id)->state, TaskState::Done);
  auto d = store->load_diff("old_vs_new.ttl");
  EXPECT_EQ(d.source_a(), "old.ttl");
  EXPECT_EQ(d.source_b(), "new.ttl");
  EXPECT_EQ(d.provenance("d2"), Provenance::Added);

  auto failed = q.task(missing.task_id);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->state, TaskState::Error);
  EXPECT_EQ(failed->error, "The file 'missing.ttl' does not exist");
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "compare" / "old_vs_missing.ttl"));
}

TEST(CompareQueue, StoreJobRequiresStore) {
  EXPECT_THROW((void)make_store_job(nullptr), ValueError);
}
