#include "cronhive/scheduler/reload_controller.hpp"

#include "cronhive/storage/store_service.hpp"
#include "cronhive/util/log.hpp"

#include <format>

namespace cronhive {

ReloadController::ReloadController(storage::JobStoreService &store,
                                   CoreFactory factory, ReloadOptions options,
                                   EventSink &events)
    : store_(store), factory_(std::move(factory)),
      options_(std::move(options)), events_(events) {}

ReloadController::~ReloadController() {
  if (auto core = active(); core && core->state() != CoreState::Stopped) {
    core->shutdown(DrainPolicy::Immediate);
  }
}

auto ReloadController::emit(EventKind kind, std::string detail) -> void {
  events_.emit(SchedulerEvent{.kind = kind,
                              .scheduled_for =
                                  std::chrono::system_clock::now(),
                              .detail = std::move(detail)});
}

auto ReloadController::install_initial() -> Result<void> {
  std::lock_guard lock(reload_mutex_);
  if (active()) {
    return fail(Error::InvalidState);
  }

  auto high_water = store_.latest_pending_update();
  if (!high_water) {
    return fail(Error::StoreUnavailable);
  }
  auto snapshot = store_.load_snapshot(options_.timezone);
  if (!snapshot) {
    log::error("Failed to load jobs: {}", snapshot.error().message());
    return fail(snapshot.error());
  }
  const auto count = snapshot->size();

  auto core = factory_(std::move(*snapshot), std::nullopt);
  if (!core) {
    log::error("Failed to build schedule: {}", core.error().message());
    return fail(core.error());
  }
  if (auto started = (*core)->start(); !started) {
    return fail(started.error());
  }
  active_.store(std::shared_ptr<SchedulerCore>(std::move(*core)),
                std::memory_order_release);
  log::info("Scheduler started with {} jobs", count);

  if (*high_water) {
    if (auto marked = store_.mark_updates_processed(*high_water); !marked) {
      log::warn("Could not mark updates processed: {}",
                marked.error().message());
    }
  }
  return ok();
}

auto ReloadController::reload() -> Result<ReloadOutcome> {
  std::unique_lock lock(reload_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    busy_.fetch_add(1, std::memory_order_relaxed);
    emit(EventKind::ReloadSkipped, "another reload is in progress");
    return ok(ReloadOutcome::Busy);
  }

  attempted_.fetch_add(1, std::memory_order_relaxed);
  emit(EventKind::ReloadStarted, {});

  // Markers newer than this were not seen by the snapshot below and stay
  // pending for the next check.
  auto high_water = store_.latest_pending_update();
  if (!high_water) {
    emit(EventKind::ReloadFailed, high_water.error().message());
    return fail(Error::StoreUnavailable);
  }

  auto old = active();
  std::optional<TimePoint> baseline;
  if (old) {
    old->pause();
    old->shutdown(options_.drain_policy);
    baseline = old->last_poll_time();
  }

  auto built = [&]() -> Result<std::unique_ptr<SchedulerCore>> {
    try {
      auto snapshot = store_.load_snapshot(options_.timezone);
      if (!snapshot) {
        return fail(snapshot.error());
      }
      auto core = factory_(std::move(*snapshot), baseline);
      if (!core) {
        return fail(core.error());
      }
      if (auto started = (*core)->start(); !started) {
        (*core)->shutdown(DrainPolicy::Immediate);
        return fail(started.error());
      }
      return core;
    } catch (const std::exception &e) {
      log::error("Reload raised: {}", e.what());
      return fail(Error::Unknown);
    }
  }();

  if (!built) {
    rollback(old, built.error());
    return fail(Error::ReloadRollback);
  }

  const auto count = (*built)->job_count();
  active_.store(std::shared_ptr<SchedulerCore>(std::move(*built)),
                std::memory_order_release);
  succeeded_.fetch_add(1, std::memory_order_relaxed);
  emit(EventKind::ReloadSucceeded, std::format("{} jobs", count));

  if (*high_water) {
    auto marked = store_.mark_updates_processed(*high_water);
    if (!marked) {
      log::warn("Reload succeeded but updates stay pending: {}",
                marked.error().message());
    } else {
      log::debug("Marked {} updates processed", *marked);
    }
  }
  return ok(ReloadOutcome::Reloaded);
}

auto ReloadController::rollback(const std::shared_ptr<SchedulerCore> &old,
                                std::error_code why) -> void {
  rolled_back_.fetch_add(1, std::memory_order_relaxed);
  if (old && !old->is_running()) {
    if (auto restarted = old->start(); !restarted) {
      log::error("Could not restart previous schedule: {}",
                 restarted.error().message());
    }
  }
  emit(EventKind::ReloadRolledBack,
       std::format("{}; keeping previous schedule", why.message()));
}

auto ReloadController::check_and_reload() -> Result<ReloadOutcome> {
  auto pending = store_.pending_update_exists();
  if (!pending) {
    check_failures_.fetch_add(1, std::memory_order_relaxed);
    log::warn("Update check failed: {}", pending.error().message());
    return fail(Error::StoreUnavailable);
  }
  if (!*pending) {
    return ok(ReloadOutcome::NoChange);
  }
  log::info("Job updates pending, reloading schedule");
  return reload();
}

auto ReloadController::run(std::stop_token stop) -> void {
  log::debug("Reload loop started, interval {}s", options_.interval.count());
  while (!stop.stop_requested()) {
    {
      std::unique_lock lock(wait_mutex_);
      wait_cv_.wait_for(lock, stop, options_.interval, [] { return false; });
    }
    if (stop.stop_requested()) {
      break;
    }
    // Failures are reported through events and logs; the loop keeps going.
    [[maybe_unused]] auto outcome = check_and_reload();
  }
  log::debug("Reload loop stopped");
}

auto ReloadController::shutdown(DrainPolicy policy) -> void {
  std::lock_guard lock(reload_mutex_);
  if (auto core = active()) {
    core->shutdown(policy);
  }
}

auto ReloadController::stats() const -> ReloadStats {
  return {.attempted = attempted_.load(std::memory_order_relaxed),
          .succeeded = succeeded_.load(std::memory_order_relaxed),
          .rolled_back = rolled_back_.load(std::memory_order_relaxed),
          .busy = busy_.load(std::memory_order_relaxed),
          .check_failures = check_failures_.load(std::memory_order_relaxed)};
}

} // namespace cronhive
