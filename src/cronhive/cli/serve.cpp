#include "cronhive/app/application.hpp"
#include "cronhive/cli/commands.hpp"
#include "cronhive/cli/formatting.hpp"
#include "cronhive/config/config.hpp"
#include "cronhive/util/daemon.hpp"
#include "cronhive/util/json.hpp"
#include "cronhive/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <print>
#include <string>

namespace cronhive::cli {
namespace {

struct StatusJson {
  bool running{false};
  std::int64_t pid{0};
  bool stale_pid_file{false};
  std::string pid_file;
};

auto resolve_pid_file(const Config &config) -> std::string {
  if (!config.service.pid_file.empty()) {
    return config.service.pid_file;
  }
  return "/tmp/cronhive.pid";
}

auto load_config_or_print(std::string_view path) -> Result<Config> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<Config> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

} // namespace

auto cmd_serve_start(const ServeStartOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level) {
    if (!log::parse_level(*opts.log_level)) {
      std::println(stderr, "Error: Unknown log level '{}'", *opts.log_level);
      return 1;
    }
    config.service.log_level = *opts.log_level;
  }
  if (opts.log_file) {
    config.service.log_file = *opts.log_file;
  }
  if (opts.shards) {
    config.scheduler.shards = std::max(0, *opts.shards);
  }

  if (opts.daemon && config.service.log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }

  if (opts.daemon) {
    if (auto r = daemonize(); !r) {
      std::println(stderr, "Error: Failed to daemonize - {}",
                   r.error().message());
      return 1;
    }
  }

  const auto pid_file = resolve_pid_file(config);
  auto pid_guard = PidFileGuard::acquire(pid_file);
  if (!pid_guard) {
    if (pid_guard.error() == make_error_code(Error::AlreadyExists)) {
      std::println(stderr,
                   "Error: cronhive is already running (pid file locked: {})",
                   pid_file);
    } else {
      std::println(stderr, "Error: Failed to acquire pid file '{}': {}",
                   pid_file, pid_guard.error().message());
    }
    return 1;
  }

  setup_signal_handlers();

  Application app(std::move(config));
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }
  log::info("cronhive started (pid_file={})", pid_file);

  app.wait_for_shutdown();
  app.stop();
  return 0;
}

auto cmd_serve_stop(const ServeStopOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto pid_file = resolve_pid_file(*config_res);
  const auto pid = read_pid_file(pid_file);

  const auto timeout = std::chrono::seconds(std::max(opts.timeout_sec, 1));
  auto r = stop_service(pid_file, timeout, opts.force);
  if (r) {
    std::println("cronhive stopped (pid={}).", pid.value_or(0));
    return 0;
  }

  const auto &ec = r.error();
  if (ec == make_error_code(Error::FileNotFound)) {
    std::println("cronhive is not running (no pid file: {}).", pid_file);
    return 0;
  }
  if (ec == make_error_code(Error::SystemNotRunning)) {
    std::println("cronhive is not running (stale pid file removed).");
    return 0;
  }
  if (ec == make_error_code(Error::Timeout)) {
    std::println(stderr,
                 "Error: Timed out waiting for cronhive to stop (pid={}).{}",
                 pid.value_or(0), opts.force ? "" : " Retry with --force.");
    return 1;
  }
  std::println(stderr, "Error: Failed to stop cronhive: {}", ec.message());
  return 1;
}

auto cmd_serve_status(const ServeStatusOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  StatusJson status{.pid_file = resolve_pid_file(*config_res)};

  if (auto r = service_status(status.pid_file); r) {
    status.pid = r->pid;
    status.running = r->alive;
    status.stale_pid_file = !r->alive;
  } else if (r.error() != make_error_code(Error::FileNotFound)) {
    std::println(stderr, "Error: Failed to read pid file '{}': {}",
                 status.pid_file, r.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", dump_json(status));
    return status.running ? 0 : 1;
  }

  std::println("cronhive is {}{}.", fmt::colorize_service_state(status.running),
               status.stale_pid_file ? " (stale pid file)" : "");
  if (status.pid > 0) {
    std::println("  pid: {}", status.pid);
  }
  std::println("  pid_file: {}", status.pid_file);
  return status.running ? 0 : 1;
}

} // namespace cronhive::cli
