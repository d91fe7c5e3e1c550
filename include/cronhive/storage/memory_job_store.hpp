#pragma once

#include "cronhive/storage/job_store.hpp"
#include "cronhive/util/log.hpp"

#include <atomic>
#include <map>
#include <mutex>

namespace cronhive::storage {

/// Process-local JobStore used by tests and by tooling that runs without a
/// database. Thread-safe; every call completes without suspending.
class InMemoryJobStore final : public JobStore {
public:
  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto list_jobs() -> task<Result<std::vector<JobRecord>>> override;
  auto get_job(const JobId &id) -> task<Result<JobRecord>> override;
  auto upsert_job(const JobRecord &job) -> task<Result<void>> override;
  auto delete_job(const JobId &id) -> task<Result<void>> override;

  auto pending_update_exists() -> task<Result<bool>> override;
  auto latest_pending_update()
      -> task<Result<std::optional<std::int64_t>>> override;
  auto mark_updates_processed(std::optional<std::int64_t> up_to = {})
      -> task<Result<std::size_t>> override;
  auto record_update(std::optional<std::string> before_json,
                     std::optional<std::string> after_json)
      -> task<Result<std::int64_t>> override;
  auto list_updates(std::size_t limit = 50)
      -> task<Result<std::vector<UpdateMarker>>> override;

  auto append_syslog(const SyslogEntry &entry) -> task<Result<void>> override;

  /// Make every subsequent call fail with StoreUnavailable.
  auto set_unavailable(bool unavailable) -> void;
  [[nodiscard]] auto syslog() const -> std::vector<SyslogEntry>;
  /// append_syslog calls, including failed ones.
  [[nodiscard]] auto syslog_attempts() const noexcept -> std::size_t {
    return syslog_attempts_.load(std::memory_order_relaxed);
  }

private:
  [[nodiscard]] auto check(log::Forwarding forwarding =
                               log::Forwarding::Allowed) const -> Result<void>;

  mutable std::mutex mutex_;
  bool open_{false};
  bool unavailable_{false};
  std::map<JobId, JobRecord> jobs_;
  std::vector<UpdateMarker> updates_;
  std::vector<SyslogEntry> syslog_;
  std::atomic<std::size_t> syslog_attempts_{0};
};

} // namespace cronhive::storage
