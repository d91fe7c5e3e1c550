#include "cronhive/core/runtime.hpp"
#include "cronhive/scheduler/worker_pool.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <string>

#include "gtest/gtest.h"

using namespace cronhive;
using namespace std::chrono_literals;

namespace {

auto request(std::string id) -> ExecutorRequest {
  return ExecutorRequest{.instance_id = InstanceId(id),
                         .job_id = JobId("job"),
                         .command = "true",
                         .timeout = 5s};
}

} // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(runtime_.start()); }
  void TearDown() override { runtime_.stop(); }

  Runtime runtime_{2};
  test::FakeExecutor executor_{runtime_};
};

TEST_F(WorkerPoolTest, RefusesWorkBeyondCapacity) {
  executor_.set_hold(true);
  WorkerPool pool(runtime_, executor_, 2);

  std::atomic<int> done{0};
  auto on_done = [&done](ExecutionOutcome) { done.fetch_add(1); };

  EXPECT_TRUE(pool.try_submit(request("a"), on_done));
  EXPECT_TRUE(pool.try_submit(request("b"), on_done));
  EXPECT_FALSE(pool.try_submit(request("c"), on_done));
  EXPECT_EQ(pool.in_flight(), 2u);

  executor_.set_hold(false);
  ASSERT_TRUE(pool.wait_idle(5s));
  EXPECT_EQ(done.load(), 2);
  EXPECT_EQ(executor_.started(), 2);

  EXPECT_TRUE(pool.try_submit(request("d"), on_done));
  ASSERT_TRUE(pool.wait_idle(5s));
  EXPECT_EQ(done.load(), 3);
}

TEST_F(WorkerPoolTest, ZeroWorkersIsClampedToOne) {
  WorkerPool pool(runtime_, executor_, 0);
  EXPECT_EQ(pool.capacity(), 1u);
}

TEST_F(WorkerPoolTest, ClosedPoolRefusesUntilReopened) {
  WorkerPool pool(runtime_, executor_, 4);
  pool.close();
  EXPECT_FALSE(pool.is_open());
  EXPECT_FALSE(pool.try_submit(request("a"), {}));

  pool.reopen();
  EXPECT_TRUE(pool.try_submit(request("b"), {}));
  ASSERT_TRUE(pool.wait_idle(5s));
}

TEST_F(WorkerPoolTest, ReportsOutcomeOfEachExecution) {
  executor_.set_result(ExecutorResult{.exit_code = 7});
  WorkerPool pool(runtime_, executor_, 1);

  std::atomic<bool> done{false};
  ExecutionOutcome seen;
  ASSERT_TRUE(pool.try_submit(request("a"), [&](ExecutionOutcome o) {
    seen = std::move(o);
    done = true;
  }));
  ASSERT_TRUE(test::poll_until([&] { return done.load(); }, 5s));
  EXPECT_EQ(seen.kind, OutcomeKind::Failure);
  EXPECT_EQ(seen.exit_code, 7);
}

TEST_F(WorkerPoolTest, CancelInFlightEndsHeldExecutions) {
  executor_.set_hold(true);
  WorkerPool pool(runtime_, executor_, 3);
  std::atomic<int> cancelled{0};
  auto on_done = [&cancelled](ExecutionOutcome o) {
    if (o.detail == "cancelled") {
      cancelled.fetch_add(1);
    }
  };
  ASSERT_TRUE(pool.try_submit(request("a"), on_done));
  ASSERT_TRUE(pool.try_submit(request("b"), on_done));
  ASSERT_TRUE(test::poll_until([&] { return executor_.running() == 2; }, 2s));

  EXPECT_FALSE(pool.wait_idle(50ms));
  pool.cancel_in_flight();
  ASSERT_TRUE(pool.wait_idle(5s));
  EXPECT_EQ(cancelled.load(), 2);
}
