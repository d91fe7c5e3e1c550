#include "cronhive/scheduler/scheduler_core.hpp"

#include "cronhive/core/constants.hpp"
#include "cronhive/core/runtime.hpp"
#include "cronhive/util/log.hpp"
#include "cronhive/util/time.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <format>
#include <thread>
#include <unordered_set>

namespace cronhive {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

[[nodiscard]] auto to_ticks(TimePoint tp) noexcept -> std::int64_t {
  return static_cast<std::int64_t>(tp.time_since_epoch().count());
}

[[nodiscard]] auto from_ticks(std::int64_t ticks) noexcept -> TimePoint {
  return TimePoint{TimePoint::duration{ticks}};
}

[[nodiscard]] auto completion_event(OutcomeKind kind) noexcept -> EventKind {
  switch (kind) {
  case OutcomeKind::Success:
    return EventKind::JobSucceeded;
  case OutcomeKind::Timeout:
    return EventKind::JobTimedOut;
  case OutcomeKind::Failure:
    break;
  }
  return EventKind::JobFailed;
}

} // namespace

auto SchedulerOptions::from_config(const SchedulerConfig &cfg)
    -> SchedulerOptions {
  SchedulerOptions opts;
  opts.max_workers = static_cast<std::size_t>(cfg.max_workers);
  opts.defaults = JobPolicy{
      .coalesce = cfg.coalesce,
      .max_instances = cfg.max_instances,
      .misfire_grace_time = std::chrono::seconds(cfg.misfire_grace_time)};
  opts.tick = std::chrono::milliseconds(cfg.tick_interval_ms);
  opts.drain_policy = cfg.drain_policy;
  opts.drain_timeout = std::chrono::seconds(cfg.drain_timeout);
  opts.output = log_output_handler();
  return opts;
}

// ---------------------------------------------------------------------------
// ScheduledJob
// ---------------------------------------------------------------------------

ScheduledJob::ScheduledJob(JobDefinition definition, JobPolicy policy,
                           std::optional<TimePoint> next_fire)
    : definition_(std::move(definition)), policy_(policy) {
  set_next_fire_time(next_fire);
}

auto ScheduledJob::next_fire_time() const noexcept -> std::optional<TimePoint> {
  const auto ticks = next_fire_ticks_.load(std::memory_order_acquire);
  if (ticks == kNoFire) {
    return std::nullopt;
  }
  return from_ticks(ticks);
}

auto ScheduledJob::set_next_fire_time(std::optional<TimePoint> tp) noexcept
    -> void {
  next_fire_ticks_.store(tp ? to_ticks(*tp) : kNoFire,
                         std::memory_order_release);
}

auto ScheduledJob::try_acquire_slot() noexcept -> bool {
  auto current = running_.load(std::memory_order_acquire);
  do {
    if (current >= policy_.max_instances) {
      return false;
    }
  } while (!running_.compare_exchange_weak(current, current + 1,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire));
  return true;
}

auto ScheduledJob::release_slot() noexcept -> void {
  running_.fetch_sub(1, std::memory_order_acq_rel);
}

auto ScheduledJob::record_outcome(OutcomeKind kind) noexcept -> void {
  switch (kind) {
  case OutcomeKind::Success:
    succeeded.fetch_add(1, std::memory_order_relaxed);
    break;
  case OutcomeKind::Timeout:
    timed_out.fetch_add(1, std::memory_order_relaxed);
    break;
  case OutcomeKind::Failure:
    failed.fetch_add(1, std::memory_order_relaxed);
    break;
  }
}

// ---------------------------------------------------------------------------
// SchedulerCore
// ---------------------------------------------------------------------------

struct SchedulerCore::LoopControl {
  explicit LoopControl(boost::asio::io_context::executor_type ex)
      : executor(std::move(ex)) {}

  boost::asio::io_context::executor_type executor;
  std::atomic<bool> stop{false};
  std::atomic<bool> finished{false};
  // Owned by the loop coroutine; only touched on `executor`.
  boost::asio::steady_timer *timer{nullptr};
};

auto SchedulerCore::build(std::vector<JobDefinition> snapshot,
                          SchedulerOptions options, Runtime &runtime,
                          IExecutor &executor, EventSink &events,
                          std::optional<TimePoint> baseline)
    -> Result<std::unique_ptr<SchedulerCore>> {
  if (!options.clock) {
    options.clock = [] { return std::chrono::system_clock::now(); };
  }
  const auto base = baseline.value_or(options.clock());

  std::vector<std::shared_ptr<ScheduledJob>> jobs;
  jobs.reserve(snapshot.size());
  std::unordered_set<JobId> seen;
  for (auto &def : snapshot) {
    if (!seen.insert(def.id()).second) {
      log::error("Duplicate job id '{}' in snapshot", def.id());
      return fail(Error::InvalidArgument);
    }
    auto next = def.trigger().next_fire(base);
    if (!next) {
      log::error("Job '{}' has no fire time after {}", def.id(),
                 util::format_iso8601(base));
      return fail(Error::InvalidSchedule);
    }
    auto policy = def.overrides().resolve(options.defaults);
    jobs.push_back(
        std::make_shared<ScheduledJob>(std::move(def), policy, next));
  }

  return std::unique_ptr<SchedulerCore>(new SchedulerCore(
      std::move(jobs), std::move(options), runtime, executor, events, base));
}

SchedulerCore::SchedulerCore(std::vector<std::shared_ptr<ScheduledJob>> jobs,
                             SchedulerOptions options, Runtime &runtime,
                             IExecutor &executor, EventSink &events,
                             TimePoint baseline)
    : jobs_(std::move(jobs)), options_(std::move(options)), runtime_(runtime),
      events_(events),
      pool_(runtime, executor, options_.max_workers, options_.output),
      last_poll_ticks_(to_ticks(baseline)) {}

SchedulerCore::~SchedulerCore() {
  const auto s = state();
  if (s == CoreState::Running || s == CoreState::Paused) {
    shutdown(DrainPolicy::Immediate);
  }
}

auto SchedulerCore::start() -> Result<void> {
  std::lock_guard lock(poll_mutex_);
  const auto s = state();
  if (s == CoreState::Running) {
    return ok();
  }
  if (s == CoreState::Paused) {
    return fail(Error::InvalidState);
  }
  if (!runtime_.is_running()) {
    return fail(Error::SystemNotRunning);
  }

  pool_.reopen();
  state_.store(CoreState::Running, std::memory_order_release);
  if (options_.run_loop) {
    const auto shard = runtime_.next_shard();
    loop_ = std::make_shared<LoopControl>(runtime_.executor_for(shard));
    runtime_.spawn_on(shard, dispatch_loop(loop_));
  }
  log::debug("Scheduler core started with {} jobs", jobs_.size());
  return ok();
}

auto SchedulerCore::pause() -> void {
  std::lock_guard lock(poll_mutex_);
  auto expected = CoreState::Running;
  state_.compare_exchange_strong(expected, CoreState::Paused,
                                 std::memory_order_acq_rel);
}

auto SchedulerCore::resume() -> void {
  std::lock_guard lock(poll_mutex_);
  auto expected = CoreState::Paused;
  state_.compare_exchange_strong(expected, CoreState::Running,
                                 std::memory_order_acq_rel);
}

auto SchedulerCore::shutdown(DrainPolicy policy) -> void {
  {
    std::lock_guard lock(poll_mutex_);
    const auto prev = state_.exchange(CoreState::Stopped,
                                      std::memory_order_acq_rel);
    if (prev == CoreState::Stopped || prev == CoreState::Created) {
      return;
    }
  }

  stop_loop();
  pool_.close();

  if (policy == DrainPolicy::Immediate) {
    pool_.cancel_in_flight();
    if (!pool_.wait_idle(timing::kShutdownDeadline)) {
      log::warn("{} executions still running after cancel", pool_.in_flight());
    }
    return;
  }

  if (pool_.in_flight() > 0) {
    log::info("Waiting for {} running executions to finish",
              pool_.in_flight());
  }
  if (!pool_.wait_idle(options_.drain_timeout)) {
    log::warn("Drain timed out after {}s, cancelling {} executions",
              options_.drain_timeout.count(), pool_.in_flight());
    pool_.cancel_in_flight();
    (void)pool_.wait_idle(timing::kShutdownDeadline);
  }
}

auto SchedulerCore::stop_loop() -> void {
  auto control = std::exchange(loop_, nullptr);
  if (!control) {
    return;
  }
  control->stop.store(true, std::memory_order_release);
  boost::asio::post(control->executor, [control] {
    if (control->timer) {
      control->timer->cancel();
    }
  });

  const auto deadline =
      std::chrono::steady_clock::now() + timing::kShutdownDeadline;
  while (!control->finished.load(std::memory_order_acquire)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      log::error("Dispatch loop did not stop within {}s",
                 timing::kShutdownDeadline.count());
      break;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }
}

auto SchedulerCore::dispatch_loop(std::shared_ptr<LoopControl> control)
    -> spawn_task {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor);
  control->timer = &timer;

  while (!control->stop.load(std::memory_order_acquire)) {
    const auto stats = poll(options_.clock());
    timer.expires_after(next_wait(options_.clock(), stats.deferred > 0));
    [[maybe_unused]] auto [ec] = co_await timer.async_wait(use_nothrow);
  }

  control->timer = nullptr;
  control->finished.store(true, std::memory_order_release);
}

auto SchedulerCore::next_wait(TimePoint now, bool deferred) const
    -> std::chrono::milliseconds {
  using std::chrono::milliseconds;
  auto wait = options_.tick;
  if (!is_running()) {
    return wait;
  }
  if (deferred) {
    wait = std::min(wait, milliseconds(timing::kDeferredRetryInterval));
  }
  if (auto next = earliest_next_fire()) {
    const auto until = std::chrono::ceil<milliseconds>(*next - now);
    wait = std::min(wait, until);
  }
  return std::max(wait, milliseconds(1));
}

auto SchedulerCore::poll(TimePoint now) -> PollStats {
  PollStats stats;
  std::lock_guard lock(poll_mutex_);
  if (state() != CoreState::Running) {
    return stats;
  }
  last_poll_ticks_.store(to_ticks(now), std::memory_order_release);

  for (const auto &job : jobs_) {
    const auto due = job->next_fire_time();
    if (!due || *due > now) {
      continue;
    }
    ++stats.due;
    const auto plan =
        plan_fire(job->definition().trigger(), *due, now, job->policy());

    if (!job->try_acquire_slot()) {
      job->set_next_fire_time(plan.next_fire_time);
      job->skipped.fetch_add(1, std::memory_order_relaxed);
      ++stats.skipped;
      if (plan.misfire) {
        job->misfired.fetch_add(1, std::memory_order_relaxed);
        ++stats.misfired;
      }
      events_.emit(SchedulerEvent{
          .kind = EventKind::JobSkipped,
          .job_id = job->id(),
          .scheduled_for = plan.scheduled_for,
          .missed_fires = plan.missed_fires,
          .detail = std::format("max_instances ({}) reached",
                                job->policy().max_instances)});
      continue;
    }

    if (!dispatch(job, plan)) {
      // Pool saturated: leave the job due and retry on the next pass.
      job->release_slot();
      ++stats.deferred;
      continue;
    }

    job->set_next_fire_time(plan.next_fire_time);
    job->fired.fetch_add(1, std::memory_order_relaxed);
    ++stats.dispatched;
    if (plan.misfire) {
      job->misfired.fetch_add(1, std::memory_order_relaxed);
      ++stats.misfired;
      events_.emit(SchedulerEvent{
          .kind = plan.coalesced ? EventKind::JobCoalesced
                                 : EventKind::JobMisfired,
          .job_id = job->id(),
          .scheduled_for = plan.scheduled_for,
          .missed_fires = plan.missed_fires,
          .detail = std::format("late by {}s, grace {}s",
                                std::chrono::duration_cast<std::chrono::seconds>(
                                    now - *due)
                                    .count(),
                                job->policy().misfire_grace_time.count())});
    }
    events_.emit(SchedulerEvent{.kind = EventKind::JobFired,
                                .job_id = job->id(),
                                .scheduled_for = plan.scheduled_for,
                                .missed_fires = plan.missed_fires});
    if (!plan.next_fire_time) {
      log::warn("Job '{}' has no further fire times", job->id());
    }
  }

  deferred_.store(stats.deferred > 0, std::memory_order_release);
  if (stats.deferred > 0) {
    log::debug("{} due jobs deferred: worker pool saturated ({} in flight)",
               stats.deferred, pool_.in_flight());
  }
  return stats;
}

auto SchedulerCore::dispatch(const std::shared_ptr<ScheduledJob> &job,
                             const FirePlan &plan) -> bool {
  const auto &def = job->definition();
  ExecutorRequest req{.instance_id = generate_instance_id(def.id()),
                      .job_id = def.id(),
                      .command = def.command(),
                      .timeout = def.timeout()};

  auto on_done = [job, events = &events_,
                  scheduled_for = plan.scheduled_for](ExecutionOutcome outcome) {
    job->record_outcome(outcome.kind);
    job->release_slot();
    events->emit(SchedulerEvent{.kind = completion_event(outcome.kind),
                                .job_id = job->id(),
                                .scheduled_for = scheduled_for,
                                .detail = std::move(outcome.detail)});
  };
  return pool_.try_submit(std::move(req), std::move(on_done));
}

auto SchedulerCore::find(const JobId &id) const -> const ScheduledJob * {
  auto it = std::ranges::find_if(
      jobs_, [&](const auto &job) { return job->id() == id; });
  return it == jobs_.end() ? nullptr : it->get();
}

auto SchedulerCore::jobs() const -> std::vector<JobStatus> {
  std::vector<JobStatus> out;
  out.reserve(jobs_.size());
  for (const auto &job : jobs_) {
    out.push_back(JobStatus{
        .id = job->id(),
        .command = job->definition().command(),
        .schedule = job->definition().fields().to_expression(),
        .next_fire_time = job->next_fire_time(),
        .running = job->running(),
        .fired = job->fired.load(std::memory_order_relaxed),
        .skipped = job->skipped.load(std::memory_order_relaxed),
        .misfired = job->misfired.load(std::memory_order_relaxed),
        .succeeded = job->succeeded.load(std::memory_order_relaxed),
        .failed = job->failed.load(std::memory_order_relaxed),
        .timed_out = job->timed_out.load(std::memory_order_relaxed)});
  }
  return out;
}

auto SchedulerCore::last_poll_time() const noexcept -> TimePoint {
  return from_ticks(last_poll_ticks_.load(std::memory_order_acquire));
}

auto SchedulerCore::earliest_next_fire() const -> std::optional<TimePoint> {
  std::optional<TimePoint> earliest;
  for (const auto &job : jobs_) {
    if (auto next = job->next_fire_time(); next && (!earliest || *next < *earliest)) {
      earliest = next;
    }
  }
  return earliest;
}

} // namespace cronhive
