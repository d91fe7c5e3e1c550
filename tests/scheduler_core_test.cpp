#include "cronhive/core/runtime.hpp"
#include "cronhive/scheduler/scheduler_core.hpp"

#include "test_utils.hpp"

#include <memory>
#include <vector>

#include "gtest/gtest.h"

using namespace cronhive;
using namespace std::chrono_literals;
using test::utc;

namespace {

auto job_with_instances(std::string id, std::string expr, int max_instances)
    -> JobDefinition {
  auto trigger = TriggerSpec::parse(expr);
  return *JobDefinition::builder()
              .id(std::move(id))
              .command("true")
              .fields(trigger->fields())
              .max_instances(max_instances)
              .build();
}

} // namespace

class SchedulerCoreTest : public ::testing::Test {
protected:
  static constexpr auto kStart = std::chrono::sys_days{2024y / 1 / 1} + 10h;

  void SetUp() override { ASSERT_TRUE(runtime_.start()); }

  void TearDown() override {
    core_.reset();
    runtime_.stop();
  }

  auto options() -> SchedulerOptions {
    SchedulerOptions opts;
    opts.max_workers = 8;
    opts.defaults = JobPolicy{.coalesce = true,
                              .max_instances = 1,
                              .misfire_grace_time = 10s};
    opts.drain_timeout = 5s;
    opts.clock = clock_.as_function();
    opts.run_loop = false;
    return opts;
  }

  auto build(std::vector<JobDefinition> jobs) -> SchedulerCore & {
    return build(std::move(jobs), options());
  }

  auto build(std::vector<JobDefinition> jobs, SchedulerOptions opts)
      -> SchedulerCore & {
    auto core = SchedulerCore::build(std::move(jobs), std::move(opts),
                                     runtime_, executor_, events_);
    EXPECT_TRUE(core.has_value());
    core_ = std::move(*core);
    EXPECT_TRUE(core_->start());
    return *core_;
  }

  auto poll_at(test::TimePoint now) -> PollStats {
    clock_.set(now);
    return core_->poll(now);
  }

  [[nodiscard]] auto wait_idle() -> bool {
    return test::poll_until([this] { return core_->in_flight() == 0; }, 5s);
  }

  Runtime runtime_{2};
  test::FakeExecutor executor_{runtime_};
  test::RecordingEventSink events_;
  test::ManualClock clock_{test::TimePoint{kStart}};
  std::unique_ptr<SchedulerCore> core_;
};

TEST_F(SchedulerCoreTest, BuildRejectsDuplicateIds) {
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("dup", "* * * * * *"));
  jobs.push_back(test::make_job("dup", "0 * * * * *"));
  auto core = SchedulerCore::build(std::move(jobs), options(), runtime_,
                                   executor_, events_);
  ASSERT_FALSE(core.has_value());
  EXPECT_EQ(core.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(SchedulerCoreTest, FirstFireIsComputedFromBaseline) {
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("five", "*/5 * * * * *"));
  auto core = SchedulerCore::build(std::move(jobs), options(), runtime_,
                                   executor_, events_, kStart + 7s);
  ASSERT_TRUE(core.has_value());
  EXPECT_EQ((*core)->find(JobId("five"))->next_fire_time(), kStart + 10s);
  EXPECT_EQ((*core)->last_poll_time(), kStart + 7s);
  EXPECT_EQ((*core)->state(), CoreState::Created);
}

TEST_F(SchedulerCoreTest, StartRequiresRunningRuntime) {
  Runtime stopped(1);
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("a", "* * * * * *"));
  auto core = SchedulerCore::build(std::move(jobs), options(), stopped,
                                   executor_, events_);
  ASSERT_TRUE(core.has_value());
  auto r = (*core)->start();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::SystemNotRunning));
}

TEST_F(SchedulerCoreTest, FiresOnEveryFifthSecond) {
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("five", "*/5 * * * * *"));
  auto &core = build(std::move(jobs));

  EXPECT_EQ(poll_at(kStart + 4s).dispatched, 0u);
  auto stats = poll_at(kStart + 5s);
  EXPECT_EQ(stats.due, 1u);
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(core.find(JobId("five"))->next_fire_time(), kStart + 10s);
  ASSERT_TRUE(wait_idle());

  for (int s = 6; s <= 60; ++s) {
    poll_at(kStart + std::chrono::seconds(s));
    ASSERT_TRUE(wait_idle());
  }
  EXPECT_EQ(executor_.started(), 12);
  EXPECT_EQ(events_.count(EventKind::JobFired), 12u);
  EXPECT_EQ(events_.count(EventKind::JobSucceeded), 12u);
  EXPECT_EQ(core.find(JobId("five"))->succeeded.load(), 12u);

  const auto fired = events_.of_kind(EventKind::JobFired);
  for (std::size_t i = 0; i < fired.size(); ++i) {
    EXPECT_EQ(fired[i].scheduled_for,
              kStart + std::chrono::seconds(5 * (i + 1)));
  }
}

TEST_F(SchedulerCoreTest, SkipsWhenMaxInstancesRunning) {
  executor_.set_hold(true);
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("busy", "* * * * * *"));
  auto &core = build(std::move(jobs));

  EXPECT_EQ(poll_at(kStart + 1s).dispatched, 1u);
  auto stats = poll_at(kStart + 2s);
  EXPECT_EQ(stats.dispatched, 0u);
  EXPECT_EQ(stats.skipped, 1u);
  EXPECT_EQ(core.find(JobId("busy"))->next_fire_time(), kStart + 3s);

  const auto skipped = events_.of_kind(EventKind::JobSkipped);
  ASSERT_EQ(skipped.size(), 1u);
  EXPECT_EQ(skipped[0].job_id, "busy");
  EXPECT_EQ(skipped[0].scheduled_for, kStart + 2s);

  executor_.set_hold(false);
  ASSERT_TRUE(wait_idle());
  EXPECT_EQ(poll_at(kStart + 3s).dispatched, 1u);
  ASSERT_TRUE(wait_idle());
  EXPECT_EQ(executor_.started(), 2);
  EXPECT_EQ(core.find(JobId("busy"))->skipped.load(), 1u);
}

TEST_F(SchedulerCoreTest, AllowsConfiguredConcurrency) {
  executor_.set_hold(true);
  std::vector<JobDefinition> jobs;
  jobs.push_back(job_with_instances("wide", "* * * * * *", 2));
  auto &core = build(std::move(jobs));

  EXPECT_EQ(poll_at(kStart + 1s).dispatched, 1u);
  EXPECT_EQ(poll_at(kStart + 2s).dispatched, 1u);
  EXPECT_EQ(poll_at(kStart + 3s).skipped, 1u);
  EXPECT_TRUE(test::poll_until([&] { return executor_.running() == 2; }, 2s));
  EXPECT_EQ(core.find(JobId("wide"))->running(), 2);

  executor_.set_hold(false);
  ASSERT_TRUE(wait_idle());
  EXPECT_EQ(core.find(JobId("wide"))->running(), 0);
}

TEST_F(SchedulerCoreTest, CoalescesBacklogIntoOneRun) {
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("minutely", "0 * * * * *"));
  auto &core = build(std::move(jobs));

  auto stats = poll_at(kStart + 5min + 20s);
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(stats.misfired, 1u);
  ASSERT_TRUE(wait_idle());

  const auto coalesced = events_.of_kind(EventKind::JobCoalesced);
  ASSERT_EQ(coalesced.size(), 1u);
  EXPECT_EQ(coalesced[0].missed_fires, 5u);
  EXPECT_EQ(coalesced[0].scheduled_for, kStart + 5min);
  EXPECT_EQ(executor_.started(), 1);
  EXPECT_EQ(core.find(JobId("minutely"))->next_fire_time(), kStart + 6min);
}

TEST_F(SchedulerCoreTest, NonCoalescingMisfireRunsOnce) {
  auto trigger = TriggerSpec::parse("0 * * * * *");
  std::vector<JobDefinition> jobs;
  jobs.push_back(*JobDefinition::builder()
                      .id("strict")
                      .command("true")
                      .fields(trigger->fields())
                      .coalesce(false)
                      .build());
  auto &core = build(std::move(jobs));

  auto stats = poll_at(kStart + 5min + 20s);
  EXPECT_EQ(stats.dispatched, 1u);
  ASSERT_TRUE(wait_idle());

  EXPECT_EQ(events_.count(EventKind::JobCoalesced), 0u);
  const auto misfired = events_.of_kind(EventKind::JobMisfired);
  ASSERT_EQ(misfired.size(), 1u);
  EXPECT_EQ(misfired[0].scheduled_for, kStart + 1min);
  EXPECT_EQ(executor_.started(), 1);

  // The backlog is not replayed on later passes.
  EXPECT_EQ(poll_at(kStart + 5min + 30s).dispatched, 0u);
  EXPECT_EQ(core.find(JobId("strict"))->next_fire_time(), kStart + 6min);
}

TEST_F(SchedulerCoreTest, LateWithinGraceIsNotMisfire) {
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("minutely", "0 * * * * *"));
  build(std::move(jobs));

  EXPECT_EQ(poll_at(kStart + 1min + 8s).dispatched, 1u);
  ASSERT_TRUE(wait_idle());
  EXPECT_EQ(events_.count(EventKind::JobMisfired), 0u);
  EXPECT_EQ(events_.count(EventKind::JobCoalesced), 0u);
}

TEST_F(SchedulerCoreTest, SaturatedPoolDefersInsteadOfDropping) {
  executor_.set_hold(true);
  auto opts = options();
  opts.max_workers = 1;
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("first", "* * * * * *"));
  jobs.push_back(test::make_job("second", "* * * * * *"));
  auto &core = build(std::move(jobs), std::move(opts));

  auto stats = poll_at(kStart + 1s);
  EXPECT_EQ(stats.due, 2u);
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(stats.deferred, 1u);
  EXPECT_EQ(core.find(JobId("second"))->next_fire_time(), kStart + 1s);
  EXPECT_EQ(events_.count(EventKind::JobSkipped), 0u);

  executor_.set_hold(false);
  ASSERT_TRUE(wait_idle());
  stats = poll_at(kStart + 1s + 300ms);
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(stats.deferred, 0u);
  ASSERT_TRUE(wait_idle());

  EXPECT_EQ(executor_.started_for("first"), 1);
  EXPECT_EQ(executor_.started_for("second"), 1);
}

TEST_F(SchedulerCoreTest, RecordsFailureAndTimeoutOutcomes) {
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("job", "* * * * * *"));
  auto &core = build(std::move(jobs));

  executor_.set_result(ExecutorResult{.exit_code = 2});
  poll_at(kStart + 1s);
  ASSERT_TRUE(wait_idle());

  executor_.set_result(
      ExecutorResult{.exit_code = kExitCodeTimeout, .timed_out = true});
  poll_at(kStart + 2s);
  ASSERT_TRUE(wait_idle());

  EXPECT_EQ(events_.count(EventKind::JobFailed, "job"), 1u);
  EXPECT_EQ(events_.count(EventKind::JobTimedOut, "job"), 1u);
  const auto *job = core.find(JobId("job"));
  EXPECT_EQ(job->failed.load(), 1u);
  EXPECT_EQ(job->timed_out.load(), 1u);
  EXPECT_EQ(job->running(), 0);
}

TEST_F(SchedulerCoreTest, PausedCoreDoesNotDispatch) {
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("job", "* * * * * *"));
  auto &core = build(std::move(jobs));

  core.pause();
  EXPECT_EQ(core.state(), CoreState::Paused);
  EXPECT_EQ(poll_at(kStart + 1s).due, 0u);
  EXPECT_EQ(executor_.started(), 0);

  core.resume();
  EXPECT_EQ(poll_at(kStart + 2s).dispatched, 1u);
  ASSERT_TRUE(wait_idle());
}

TEST_F(SchedulerCoreTest, ImmediateShutdownCancelsRunningJobs) {
  executor_.set_hold(true);
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("long", "* * * * * *"));
  auto &core = build(std::move(jobs));

  poll_at(kStart + 1s);
  ASSERT_TRUE(test::poll_until([&] { return executor_.running() == 1; }, 2s));

  core.shutdown(DrainPolicy::Immediate);
  EXPECT_EQ(core.state(), CoreState::Stopped);
  EXPECT_EQ(core.in_flight(), 0u);
  EXPECT_EQ(events_.count(EventKind::JobFailed), 1u);
  EXPECT_EQ(poll_at(kStart + 2s).due, 0u);
}

TEST_F(SchedulerCoreTest, WaitShutdownLetsJobsFinish) {
  executor_.set_delay(200ms);
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("short", "* * * * * *"));
  auto &core = build(std::move(jobs));

  poll_at(kStart + 1s);
  core.shutdown(DrainPolicy::Wait);
  EXPECT_EQ(core.in_flight(), 0u);
  EXPECT_EQ(events_.count(EventKind::JobSucceeded), 1u);
}

TEST_F(SchedulerCoreTest, DispatchLoopRunsOnWallClock) {
  auto opts = options();
  opts.clock = {};
  opts.run_loop = true;
  opts.tick = 100ms;
  std::vector<JobDefinition> jobs;
  jobs.push_back(test::make_job("tick", "* * * * * *"));
  auto &core = build(std::move(jobs), std::move(opts));

  EXPECT_TRUE(test::poll_until([&] { return executor_.completed() >= 2; }, 5s));
  core.shutdown(DrainPolicy::Wait);
  EXPECT_EQ(core.state(), CoreState::Stopped);

  const auto started = executor_.started();
  std::this_thread::sleep_for(1500ms);
  EXPECT_EQ(executor_.started(), started);
}
