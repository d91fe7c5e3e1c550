#pragma once

#include "cronhive/config/system_config.hpp"
#include "cronhive/core/error.hpp"
#include "cronhive/scheduler/events.hpp"
#include "cronhive/scheduler/job.hpp"
#include "cronhive/scheduler/scheduler_core.hpp"
#include "cronhive/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace cronhive {

namespace storage {
class JobStoreService;
}

enum class ReloadOutcome : std::uint8_t { NoChange, Reloaded, Busy };
BOOST_DESCRIBE_ENUM(ReloadOutcome, NoChange, Reloaded, Busy)
CRONHIVE_DEFINE_ENUM_NAMES(ReloadOutcome)

struct ReloadStats {
  std::uint64_t attempted{0};
  std::uint64_t succeeded{0};
  std::uint64_t rolled_back{0};
  std::uint64_t busy{0};
  /// Update checks that could not reach the store.
  std::uint64_t check_failures{0};
};

struct ReloadOptions {
  std::string timezone;
  std::chrono::seconds interval{10};
  DrainPolicy drain_policy{DrainPolicy::Wait};

  [[nodiscard]] static auto from_config(const SchedulerConfig &cfg)
      -> ReloadOptions {
    return {.timezone = cfg.timezone,
            .interval = std::chrono::seconds(cfg.reload_interval),
            .drain_policy = cfg.drain_policy};
  }
};

/// Owns the active SchedulerCore and replaces it when the store reports
/// pending updates. A reload either installs a fully started core or leaves
/// the previous one running; readers of active() see one or the other.
class ReloadController {
public:
  using TimePoint = std::chrono::system_clock::time_point;
  using CoreFactory = std::function<Result<std::unique_ptr<SchedulerCore>>(
      std::vector<JobDefinition> snapshot, std::optional<TimePoint> baseline)>;

  ReloadController(storage::JobStoreService &store, CoreFactory factory,
                   ReloadOptions options, EventSink &events);
  ~ReloadController();

  ReloadController(const ReloadController &) = delete;
  ReloadController &operator=(const ReloadController &) = delete;

  /// Build and start the first core from the current store contents.
  [[nodiscard]] auto install_initial() -> Result<void>;

  /// Swap in a core built from a fresh snapshot. Busy when another reload
  /// holds the lock; ReloadRollback when the previous core was restored.
  [[nodiscard]] auto reload() -> Result<ReloadOutcome>;

  /// reload() if the store has pending markers, otherwise NoChange.
  /// StoreUnavailable when the check itself fails.
  [[nodiscard]] auto check_and_reload() -> Result<ReloadOutcome>;

  /// check_and_reload() every interval until `stop` is requested.
  auto run(std::stop_token stop) -> void;

  /// Retire the active core. Waits for a reload in progress.
  auto shutdown(DrainPolicy policy) -> void;
  auto shutdown() -> void { shutdown(options_.drain_policy); }

  [[nodiscard]] auto active() const -> std::shared_ptr<SchedulerCore> {
    return active_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto stats() const -> ReloadStats;

private:
  auto rollback(const std::shared_ptr<SchedulerCore> &old, std::error_code why)
      -> void;
  auto emit(EventKind kind, std::string detail) -> void;

  storage::JobStoreService &store_;
  CoreFactory factory_;
  ReloadOptions options_;
  EventSink &events_;

  std::mutex reload_mutex_;
  std::atomic<std::shared_ptr<SchedulerCore>> active_;

  std::mutex wait_mutex_;
  std::condition_variable_any wait_cv_;

  std::atomic<std::uint64_t> attempted_{0};
  std::atomic<std::uint64_t> succeeded_{0};
  std::atomic<std::uint64_t> rolled_back_{0};
  std::atomic<std::uint64_t> busy_{0};
  std::atomic<std::uint64_t> check_failures_{0};
};

} // namespace cronhive
