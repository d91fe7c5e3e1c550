#include "cronhive/util/daemon.hpp"

#include "cronhive/core/constants.hpp"
#include "cronhive/util/conv.hpp"
#include "cronhive/util/log.hpp"

#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>

#include <cerrno>
#include <csignal>
#include <fstream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace cronhive {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

namespace {

auto ensure_parent_directory(std::string_view path) -> Result<void> {
  boost::system::error_code ec;
  const auto parent =
      boost::filesystem::path{std::string(path)}.parent_path();
  if (parent.empty() || boost::filesystem::exists(parent, ec)) {
    return ok();
  }
  boost::filesystem::create_directories(parent, ec);
  if (ec) {
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok();
}

auto write_pid(std::string_view path, std::int64_t pid) -> Result<void> {
  std::ofstream out(std::string(path), std::ios::trunc);
  if (!out.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  out << pid << '\n';
  out.flush();
  if (!out.good()) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

void on_shutdown_signal(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void on_reload_signal(int) {
  g_reload_requested.store(true, std::memory_order_release);
}

} // namespace

PidFileGuard::PidFileGuard(std::string path,
                           boost::interprocess::file_lock lock) noexcept
    : path_(std::move(path)) {
  lock_.emplace(std::move(lock));
}

PidFileGuard::~PidFileGuard() { release(); }

PidFileGuard::PidFileGuard(PidFileGuard &&other) noexcept
    : path_(std::exchange(other.path_, {})),
      lock_(std::exchange(other.lock_, std::nullopt)) {}

auto PidFileGuard::operator=(PidFileGuard &&other) noexcept -> PidFileGuard & {
  if (this != &other) {
    release();
    path_ = std::exchange(other.path_, {});
    lock_ = std::exchange(other.lock_, std::nullopt);
  }
  return *this;
}

auto PidFileGuard::acquire(std::string_view path) -> Result<PidFileGuard> {
  if (path.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (auto r = ensure_parent_directory(path); !r) {
    return fail(r.error());
  }
  {
    // file_lock needs an existing file.
    std::ofstream touch(std::string(path), std::ios::app);
    if (!touch.is_open()) {
      return fail(Error::FileOpenFailed);
    }
  }

  try {
    boost::interprocess::file_lock lock(std::string(path).c_str());
    if (!lock.try_lock()) {
      return fail(Error::AlreadyExists);
    }
    if (auto r = write_pid(path, static_cast<std::int64_t>(::getpid())); !r) {
      lock.unlock();
      return fail(r.error());
    }
    return ok(PidFileGuard(std::string(path), std::move(lock)));
  } catch (const boost::interprocess::interprocess_exception &) {
    return fail(Error::FileOpenFailed);
  }
}

auto PidFileGuard::release() noexcept -> void {
  if (!lock_) {
    return;
  }
  try {
    lock_->unlock();
  } catch (const boost::interprocess::interprocess_exception &) {
    // The lock dies with the descriptor below.
  }
  lock_.reset();

  boost::system::error_code ec;
  boost::filesystem::remove(boost::filesystem::path(path_), ec);
}

auto daemonize() -> Result<void> {
  // Fork twice around setsid so the daemon is no session leader and can
  // never reacquire a controlling terminal.
  for (int generation = 0; generation < 2; ++generation) {
    auto pid = sys_check(::fork());
    if (!pid) {
      return fail(pid.error());
    }
    if (*pid > 0) {
      ::_exit(0);
    }
    if (generation == 0) {
      if (auto sid = sys_check(::setsid()); !sid) {
        return fail(sid.error());
      }
    }
  }
  if (auto cd = sys_check(::chdir("/")); !cd) {
    return fail(cd.error());
  }
  ::umask(0);
  for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
    (void)::close(fd);
  }
  return ok();
}

auto read_pid_file(std::string_view path) -> Result<std::int64_t> {
  std::ifstream in{std::string(path)};
  if (!in.is_open()) {
    return fail(Error::FileNotFound);
  }
  std::string line;
  std::getline(in, line);
  return util::parse_int<std::int64_t>(util::trim(line))
      .and_then([](std::int64_t pid) -> Result<std::int64_t> {
        if (pid <= 0) {
          return fail(Error::ParseError);
        }
        return ok(pid);
      });
}

auto remove_pid_file(std::string_view path) -> Result<void> {
  boost::system::error_code ec;
  boost::filesystem::remove(boost::filesystem::path(std::string(path)), ec);
  if (ec) {
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok();
}

auto service_status(std::string_view pid_file) -> Result<ServiceStatus> {
  return read_pid_file(pid_file).transform([](std::int64_t pid) {
    return ServiceStatus{.pid = pid, .alive = is_process_alive(pid)};
  });
}

auto is_process_alive(std::int64_t pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

auto send_signal(std::int64_t pid, int signal_no) -> Result<void> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  if (::kill(static_cast<pid_t>(pid), signal_no) != 0) {
    return fail(std::error_code(errno, std::system_category()));
  }
  return ok();
}

auto wait_for_process_exit(std::int64_t pid, std::chrono::milliseconds timeout)
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool alive = is_process_alive(pid);
  while (alive && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(timing::kDaemonPollInterval);
    alive = is_process_alive(pid);
  }
  return !alive;
}

auto stop_service(std::string_view pid_file, std::chrono::milliseconds timeout,
                  bool force) -> Result<void> {
  auto status = service_status(pid_file);
  if (!status) {
    return fail(status.error());
  }
  if (!status->alive) {
    // Left behind by a crashed run.
    (void)remove_pid_file(pid_file);
    return fail(Error::SystemNotRunning);
  }

  auto terminate = [&](int signal_no,
                       std::chrono::milliseconds wait) -> Result<bool> {
    return send_signal(status->pid, signal_no).transform([&] {
      return wait_for_process_exit(status->pid, wait);
    });
  };

  auto exited = terminate(SIGTERM, timeout);
  if (exited && !*exited && force) {
    log::warn("Process {} ignored SIGTERM, sending SIGKILL", status->pid);
    exited = terminate(SIGKILL, timing::kShutdownDeadline);
    if (exited && *exited) {
      (void)remove_pid_file(pid_file);
    }
  }
  if (!exited) {
    return fail(exited.error());
  }
  if (!*exited) {
    return fail(Error::Timeout);
  }
  return ok();
}

auto setup_signal_handlers() -> void {
  std::signal(SIGINT, on_shutdown_signal);
  std::signal(SIGTERM, on_shutdown_signal);
  std::signal(SIGHUP, on_reload_signal);
  std::signal(SIGPIPE, SIG_IGN);
}

} // namespace cronhive
