#pragma once

#include "cronhive/config/system_config.hpp"
#include "cronhive/core/coroutine.hpp"
#include "cronhive/core/error.hpp"
#include "cronhive/executor/executor.hpp"
#include "cronhive/scheduler/events.hpp"
#include "cronhive/scheduler/fire_policy.hpp"
#include "cronhive/scheduler/job.hpp"
#include "cronhive/scheduler/worker_pool.hpp"
#include "cronhive/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cronhive {

class Runtime;

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct SchedulerOptions {
  std::size_t max_workers{10};
  JobPolicy defaults{};
  std::chrono::milliseconds tick{1000};
  DrainPolicy drain_policy{DrainPolicy::Wait};
  std::chrono::seconds drain_timeout{300};
  /// Source of "now"; defaults to the system clock.
  Clock clock;
  /// When false, start() does not spawn the dispatch loop and the owner
  /// drives the core through poll().
  bool run_loop{true};
  OutputHandler output;

  [[nodiscard]] static auto from_config(const SchedulerConfig &cfg)
      -> SchedulerOptions;
};

enum class CoreState : std::uint8_t { Created, Running, Paused, Stopped };
BOOST_DESCRIBE_ENUM(CoreState, Created, Running, Paused, Stopped)
CRONHIVE_DEFINE_ENUM_NAMES(CoreState)

/// Runtime view of one job inside a core. Counters are atomics so that
/// completions never contend with the dispatch pass.
class ScheduledJob {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  ScheduledJob(JobDefinition definition, JobPolicy policy,
               std::optional<TimePoint> next_fire);

  [[nodiscard]] auto definition() const noexcept -> const JobDefinition & {
    return definition_;
  }
  [[nodiscard]] auto id() const noexcept -> const JobId & {
    return definition_.id();
  }
  [[nodiscard]] auto policy() const noexcept -> const JobPolicy & {
    return policy_;
  }

  [[nodiscard]] auto next_fire_time() const noexcept
      -> std::optional<TimePoint>;
  auto set_next_fire_time(std::optional<TimePoint> tp) noexcept -> void;

  /// Take an execution slot unless max_instances are already running.
  [[nodiscard]] auto try_acquire_slot() noexcept -> bool;
  auto release_slot() noexcept -> void;
  [[nodiscard]] auto running() const noexcept -> int {
    return running_.load(std::memory_order_acquire);
  }

  auto record_outcome(OutcomeKind kind) noexcept -> void;

  std::atomic<std::uint64_t> fired{0};
  std::atomic<std::uint64_t> skipped{0};
  std::atomic<std::uint64_t> misfired{0};
  std::atomic<std::uint64_t> succeeded{0};
  std::atomic<std::uint64_t> failed{0};
  std::atomic<std::uint64_t> timed_out{0};

private:
  static constexpr auto kNoFire = std::numeric_limits<std::int64_t>::min();

  JobDefinition definition_;
  JobPolicy policy_;
  std::atomic<std::int64_t> next_fire_ticks_{kNoFire};
  std::atomic<int> running_{0};
};

/// Point-in-time status of one job.
struct JobStatus {
  JobId id;
  std::string command;
  std::string schedule;
  std::optional<std::chrono::system_clock::time_point> next_fire_time;
  int running{0};
  std::uint64_t fired{0};
  std::uint64_t skipped{0};
  std::uint64_t misfired{0};
  std::uint64_t succeeded{0};
  std::uint64_t failed{0};
  std::uint64_t timed_out{0};
};

/// Result of one dispatch pass.
struct PollStats {
  std::size_t due{0};
  std::size_t dispatched{0};
  std::size_t skipped{0};
  std::size_t misfired{0};
  /// Due but refused by a saturated worker pool; retried next pass.
  std::size_t deferred{0};
};

/// One in-memory schedule: the jobs of a snapshot, their next fire times,
/// the dispatch loop and the worker pool executing them.
class SchedulerCore {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  /// All-or-nothing: duplicate ids or a job without any future fire time
  /// fail the whole build. First fire times are computed from `baseline`
  /// (defaults to now).
  [[nodiscard]] static auto build(std::vector<JobDefinition> snapshot,
                                  SchedulerOptions options, Runtime &runtime,
                                  IExecutor &executor, EventSink &events,
                                  std::optional<TimePoint> baseline = {})
      -> Result<std::unique_ptr<SchedulerCore>>;

  ~SchedulerCore();

  SchedulerCore(const SchedulerCore &) = delete;
  SchedulerCore &operator=(const SchedulerCore &) = delete;

  /// Created or Stopped -> Running. InvalidState from any other state.
  [[nodiscard]] auto start() -> Result<void>;
  auto pause() -> void;
  auto resume() -> void;
  /// Halt dispatch, stop accepting work and drain executions per `policy`.
  auto shutdown(DrainPolicy policy) -> void;
  auto shutdown() -> void { shutdown(options_.drain_policy); }

  /// One dispatch pass at `now`. A no-op unless Running.
  auto poll(TimePoint now) -> PollStats;

  [[nodiscard]] auto state() const noexcept -> CoreState {
    return state_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return state() == CoreState::Running;
  }
  [[nodiscard]] auto job_count() const noexcept -> std::size_t {
    return jobs_.size();
  }
  [[nodiscard]] auto find(const JobId &id) const -> const ScheduledJob *;
  [[nodiscard]] auto jobs() const -> std::vector<JobStatus>;
  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return pool_.in_flight();
  }
  /// Last instant evaluated by poll(); the handoff point for a reload.
  [[nodiscard]] auto last_poll_time() const noexcept -> TimePoint;
  [[nodiscard]] auto earliest_next_fire() const -> std::optional<TimePoint>;
  [[nodiscard]] auto now() const -> TimePoint { return options_.clock(); }

private:
  struct LoopControl;

  SchedulerCore(std::vector<std::shared_ptr<ScheduledJob>> jobs,
                SchedulerOptions options, Runtime &runtime,
                IExecutor &executor, EventSink &events, TimePoint baseline);

  auto dispatch_loop(std::shared_ptr<LoopControl> control) -> spawn_task;
  auto stop_loop() -> void;
  auto dispatch(const std::shared_ptr<ScheduledJob> &job, const FirePlan &plan)
      -> bool;
  [[nodiscard]] auto next_wait(TimePoint now, bool deferred) const
      -> std::chrono::milliseconds;

  std::vector<std::shared_ptr<ScheduledJob>> jobs_;
  SchedulerOptions options_;
  Runtime &runtime_;
  EventSink &events_;
  WorkerPool pool_;

  mutable std::mutex poll_mutex_;
  std::atomic<CoreState> state_{CoreState::Created};
  std::atomic<std::int64_t> last_poll_ticks_{0};
  std::atomic<bool> deferred_{false};
  std::shared_ptr<LoopControl> loop_;
};

} // namespace cronhive
