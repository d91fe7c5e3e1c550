#pragma once

#include "cronhive/core/error.hpp"

#include <boost/interprocess/sync/file_lock.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cronhive {

/// Set by SIGINT/SIGTERM.
extern std::atomic<bool> g_shutdown_requested;
/// Set by SIGHUP; cleared by whoever performs the reload.
extern std::atomic<bool> g_reload_requested;

/// Exclusive ownership of a pid file, held through an advisory file lock
/// for the lifetime of the guard. The file is removed on release.
class PidFileGuard {
public:
  PidFileGuard() = default;
  ~PidFileGuard();

  PidFileGuard(const PidFileGuard &) = delete;
  auto operator=(const PidFileGuard &) -> PidFileGuard & = delete;
  PidFileGuard(PidFileGuard &&other) noexcept;
  auto operator=(PidFileGuard &&other) noexcept -> PidFileGuard &;

  /// AlreadyExists when another live process holds the lock.
  [[nodiscard]] static auto acquire(std::string_view path)
      -> Result<PidFileGuard>;

  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

private:
  PidFileGuard(std::string path, boost::interprocess::file_lock lock) noexcept;
  auto release() noexcept -> void;

  std::string path_;
  std::optional<boost::interprocess::file_lock> lock_;
};

/// Pid recorded in a pid file and whether that process is still alive.
struct ServiceStatus {
  std::int64_t pid{0};
  bool alive{false};
};

[[nodiscard]] auto daemonize() -> Result<void>;
[[nodiscard]] auto read_pid_file(std::string_view path) -> Result<std::int64_t>;
[[nodiscard]] auto remove_pid_file(std::string_view path) -> Result<void>;
[[nodiscard]] auto service_status(std::string_view pid_file)
    -> Result<ServiceStatus>;
[[nodiscard]] auto is_process_alive(std::int64_t pid) -> bool;
[[nodiscard]] auto send_signal(std::int64_t pid, int signal_no) -> Result<void>;
[[nodiscard]] auto wait_for_process_exit(std::int64_t pid,
                                         std::chrono::milliseconds timeout)
    -> bool;

/// SIGTERM the service named by `pid_file` and wait for it to exit; with
/// `force`, SIGKILL it once `timeout` expires. Timeout if it is still alive.
[[nodiscard]] auto stop_service(std::string_view pid_file,
                                std::chrono::milliseconds timeout, bool force)
    -> Result<void>;

auto setup_signal_handlers() -> void;

} // namespace cronhive
