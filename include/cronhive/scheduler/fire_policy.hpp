#pragma once

#include "cronhive/scheduler/cron.hpp"
#include "cronhive/scheduler/job.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace cronhive {

/// What to do with one due job at one evaluation instant.
struct FirePlan {
  using TimePoint = std::chrono::system_clock::time_point;

  /// Fire time recorded for the dispatch.
  TimePoint scheduled_for;
  /// Recomputed from the evaluation instant; nullopt once the trigger is
  /// exhausted.
  std::optional<TimePoint> next_fire_time;
  /// Fire times at or before `now` that this plan accounts for (>= 1).
  std::size_t missed_fires{1};
  bool misfire{false};
  /// Several missed fires collapsed into a single run.
  bool coalesced{false};
};

/// Pure misfire decision for a job whose fire time `due` is <= `now`.
///
/// A fire older than the grace period is a misfire. Whether or not the job
/// coalesces, a backlog produces exactly one dispatch: coalescing jobs run
/// for the latest missed fire, the others for the earliest.
[[nodiscard]] auto plan_fire(const TriggerSpec &trigger,
                             FirePlan::TimePoint due, FirePlan::TimePoint now,
                             const JobPolicy &policy) -> FirePlan;

} // namespace cronhive
