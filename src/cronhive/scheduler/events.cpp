#include "cronhive/scheduler/events.hpp"

#include "cronhive/util/log.hpp"
#include "cronhive/util/time.hpp"

namespace cronhive {

auto LogEventSink::emit(const SchedulerEvent &event) -> void {
  const auto when = util::format_iso8601(event.scheduled_for);
  switch (event.kind) {
  case EventKind::JobFired:
    log::info("Job '{}' fired for {}", event.job_id, when);
    break;
  case EventKind::JobSkipped:
    log::warn("Job '{}' skipped for {}: {}", event.job_id, when, event.detail);
    break;
  case EventKind::JobMisfired:
    log::warn("Job '{}' misfired for {} ({} missed): {}", event.job_id, when,
              event.missed_fires, event.detail);
    break;
  case EventKind::JobCoalesced:
    log::warn("Job '{}' coalesced {} missed fires into one run for {}",
              event.job_id, event.missed_fires, when);
    break;
  case EventKind::JobSucceeded:
    log::info("Job '{}' succeeded ({})", event.job_id, event.detail);
    break;
  case EventKind::JobFailed:
    log::error("Job '{}' failed: {}", event.job_id, event.detail);
    break;
  case EventKind::JobTimedOut:
    log::warn("Job '{}' timed out: {}", event.job_id, event.detail);
    break;
  case EventKind::ReloadStarted:
    log::info("Reloading scheduler: {}", event.detail);
    break;
  case EventKind::ReloadSucceeded:
    log::info("Scheduler reloaded: {}", event.detail);
    break;
  case EventKind::ReloadSkipped:
    log::debug("Reload skipped: {}", event.detail);
    break;
  case EventKind::ReloadFailed:
    log::error("Reload failed: {}", event.detail);
    break;
  case EventKind::ReloadRolledBack:
    log::error("Reload rolled back to previous scheduler: {}", event.detail);
    break;
  }
}

auto default_event_sink() -> EventSink & {
  static LogEventSink instance;
  return instance;
}

} // namespace cronhive
