#pragma once

#include "cronhive/core/coroutine.hpp"
#include "cronhive/core/error.hpp"
#include "cronhive/scheduler/cron.hpp"
#include "cronhive/scheduler/job.hpp"
#include "cronhive/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cronhive::storage {

using TimePoint = std::chrono::system_clock::time_point;

/// A job row as stored. Unlike JobDefinition it is not validated, so rows
/// written by other tools can still be listed and repaired.
struct JobRecord {
  JobId id;
  std::string command;
  CronFields fields;
  std::int64_t timeout{job_defaults::kTimeout.count()};
  std::optional<bool> coalesce;
  std::optional<int> max_instances;
  std::optional<std::int64_t> misfire_grace_time;
  TimePoint created_at{};
  TimePoint updated_at{};

  [[nodiscard]] static auto from_definition(const JobDefinition &def)
      -> JobRecord;

  /// Validate through the JobDefinition builder.
  [[nodiscard]] auto to_definition(std::string_view timezone) const
      -> Result<JobDefinition>;
};

/// All-or-nothing conversion of a snapshot; the first invalid row fails it.
[[nodiscard]] auto to_definitions(const std::vector<JobRecord> &records,
                                  std::string_view timezone)
    -> Result<std::vector<JobDefinition>>;

/// JSON array of the records, used for update marker snapshots.
[[nodiscard]] auto records_to_json(const std::vector<JobRecord> &records)
    -> std::string;

/// Row of the update_info table. Appended with `updated = false` by every
/// editor; flipped to true once a reload has picked the change up.
struct UpdateMarker {
  std::int64_t id{0};
  bool updated{false};
  TimePoint insert_time{};
  TimePoint update_time{};
  std::optional<std::string> jobs_before_update;
  std::optional<std::string> jobs_after_update;
};

struct SyslogEntry {
  TimePoint created_at{};
  std::string level;
  std::string logger_name;
  std::string message;
};

/// Durable job store. All methods are coroutines; connection and query
/// failures surface as StoreUnavailable.
class JobStore {
public:
  virtual ~JobStore() = default;

  virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> task<void> = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  virtual auto list_jobs() -> task<Result<std::vector<JobRecord>>> = 0;
  virtual auto get_job(const JobId &id) -> task<Result<JobRecord>> = 0;
  virtual auto upsert_job(const JobRecord &job) -> task<Result<void>> = 0;
  /// NotFound when no such job exists.
  virtual auto delete_job(const JobId &id) -> task<Result<void>> = 0;

  virtual auto pending_update_exists() -> task<Result<bool>> = 0;
  /// Highest id among unprocessed markers, if any.
  virtual auto latest_pending_update()
      -> task<Result<std::optional<std::int64_t>>> = 0;
  /// Flip unprocessed markers to processed, limited to ids <= `up_to` when
  /// given. Returns the number of rows changed.
  virtual auto mark_updates_processed(std::optional<std::int64_t> up_to = {})
      -> task<Result<std::size_t>> = 0;
  virtual auto record_update(std::optional<std::string> before_json,
                             std::optional<std::string> after_json)
      -> task<Result<std::int64_t>> = 0;
  /// Newest first.
  virtual auto list_updates(std::size_t limit = 50)
      -> task<Result<std::vector<UpdateMarker>>> = 0;

  /// Called from the log forwarding path. Implementations report their own
  /// failures with log::Forwarding::Suppressed.
  virtual auto append_syslog(const SyslogEntry &entry)
      -> task<Result<void>> = 0;
};

} // namespace cronhive::storage
