#pragma once

#include "cronhive/config/system_config.hpp"
#include "cronhive/core/coroutine.hpp"
#include "cronhive/core/error.hpp"
#include "cronhive/storage/job_store.hpp"
#include "cronhive/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace cronhive::storage {

// Synchronous facade over a JobStore. The store's coroutines run on a
// private thread pool so that reload, CLI and main threads can block on
// them without touching the scheduler runtime.
class JobStoreService {
public:
  /// MySQL backed.
  JobStoreService(const DatabaseConfig &cfg, std::size_t threads);
  /// Any backend; `make_store` receives the pool executor.
  using StoreFactory = std::move_only_function<std::unique_ptr<JobStore>(
      boost::asio::any_io_executor)>;
  JobStoreService(StoreFactory make_store, std::size_t threads = 1);
  ~JobStoreService();

  JobStoreService(const JobStoreService &) = delete;
  auto operator=(const JobStoreService &) -> JobStoreService & = delete;

  template <typename T>
  [[nodiscard]] auto sync_wait(task<Result<T>> op) -> Result<T> {
    auto fut = boost::asio::co_spawn(pool_.get_executor(), std::move(op),
                                     boost::asio::use_future);
    try {
      return fut.get();
    } catch (const std::exception &e) {
      log::error("Job store operation failed: {}", e.what());
      return fail(Error::StoreUnavailable);
    }
  }
  auto sync_wait(task<void> op) -> void {
    auto fut = boost::asio::co_spawn(pool_.get_executor(), std::move(op),
                                     boost::asio::use_future);
    try {
      fut.get();
    } catch (const std::exception &e) {
      log::error("Job store operation failed: {}", e.what());
    }
  }

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool;

  [[nodiscard]] auto list_jobs() -> Result<std::vector<JobRecord>>;
  [[nodiscard]] auto get_job(const JobId &id) -> Result<JobRecord>;
  /// Every stored job validated into a definition; fails on the first
  /// invalid row.
  [[nodiscard]] auto load_snapshot(std::string_view timezone)
      -> Result<std::vector<JobDefinition>>;

  [[nodiscard]] auto pending_update_exists() -> Result<bool>;
  [[nodiscard]] auto latest_pending_update()
      -> Result<std::optional<std::int64_t>>;
  [[nodiscard]] auto mark_updates_processed(
      std::optional<std::int64_t> up_to = {}) -> Result<std::size_t>;
  [[nodiscard]] auto list_updates(std::size_t limit)
      -> Result<std::vector<UpdateMarker>>;
  /// Append a bare marker; used to force a reload.
  [[nodiscard]] auto touch() -> Result<std::int64_t>;

  /// Upsert `def` and append a marker holding the job list before and after
  /// the change. Returns the marker id.
  [[nodiscard]] auto save_job(const JobDefinition &def) -> Result<std::int64_t>;
  /// Delete and append a marker. NotFound for an unknown id.
  [[nodiscard]] auto remove_job(const JobId &id) -> Result<std::int64_t>;

  /// Fire-and-forget syslog append. Failures are logged without being
  /// forwarded back to the syslog sink.
  auto post_syslog(SyslogEntry entry) -> void;

  [[nodiscard]] auto store() noexcept -> JobStore & { return *store_; }

private:
  auto edit_with_marker(task<Result<void>> edit) -> Result<std::int64_t>;

  boost::asio::thread_pool pool_;
  std::unique_ptr<JobStore> store_;
};

} // namespace cronhive::storage
