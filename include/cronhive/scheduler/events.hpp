#pragma once

#include "cronhive/util/enum.hpp"
#include "cronhive/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cronhive {

enum class EventKind : std::uint8_t {
  JobFired,
  JobSkipped,
  JobMisfired,
  JobCoalesced,
  JobSucceeded,
  JobFailed,
  JobTimedOut,
  ReloadStarted,
  ReloadSucceeded,
  ReloadSkipped,
  ReloadFailed,
  ReloadRolledBack,
};
BOOST_DESCRIBE_ENUM(EventKind, JobFired, JobSkipped, JobMisfired, JobCoalesced,
                    JobSucceeded, JobFailed, JobTimedOut, ReloadStarted,
                    ReloadSucceeded, ReloadSkipped, ReloadFailed,
                    ReloadRolledBack)
CRONHIVE_DEFINE_ENUM_NAMES(EventKind)

struct SchedulerEvent {
  EventKind kind{EventKind::JobFired};
  /// Empty for reload events.
  JobId job_id;
  std::chrono::system_clock::time_point scheduled_for{};
  std::size_t missed_fires{0};
  std::string detail;
};

/// Receiver of structured scheduler events. Called from dispatch, worker and
/// reload threads concurrently; implementations synchronize themselves.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual auto emit(const SchedulerEvent &event) -> void = 0;
};

/// Writes events to the process logger; reload rollbacks and failures at
/// error, skips, misfires and timeouts at warn.
class LogEventSink final : public EventSink {
public:
  auto emit(const SchedulerEvent &event) -> void override;
};

[[nodiscard]] auto default_event_sink() -> EventSink &;

} // namespace cronhive
