#include "cronhive/core/constants.hpp"
#include "cronhive/core/coroutine.hpp"
#include "cronhive/core/runtime.hpp"
#include "cronhive/executor/executor.hpp"
#include "cronhive/executor/executor_utils.hpp"
#include "cronhive/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <csignal>
#include <optional>
#include <string>
#include <sys/wait.h>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cronhive {

namespace {

namespace bp = boost::process::v2;

struct ActiveProcess {
  pid_t pid{-1};
  bool cancelled{false};
};

struct WaitProcessResult {
  int exit_code{-1};
  int term_signal{0};
  bool timed_out{false};
};

// Only touched from its owning shard's thread.
struct ShellShardState {
  std::unordered_map<InstanceId, ActiveProcess> active_processes;
};

[[nodiscard]] auto read_pipe(boost::asio::readable_pipe &pipe,
                             OutputStream stream, const InstanceId &instance_id,
                             ExecutionSink &sink,
                             boost::asio::cancellation_signal &cancel_sig)
    -> task<void> {
  std::array<char, io::kReadBufferSize> buffer{};
  std::size_t total = 0;
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (ec) {
      co_return;
    }
    if (bytes == 0 || total >= io::kMaxOutputBytes) {
      continue;
    }
    const auto take = std::min(bytes, io::kMaxOutputBytes - total);
    total += take;
    if (sink.on_output) {
      sink.on_output(instance_id, stream, std::string_view(buffer.data(), take));
    }
  }
}

[[nodiscard]] auto
wait_process_with_timeout(bp::process &proc, std::chrono::seconds timeout,
                          boost::asio::cancellation_signal &cancel_sig)
    -> task<WaitProcessResult> {
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (!ec) {
    const auto native = proc.native_exit_code();
    if (WIFSIGNALED(native)) {
      co_return WaitProcessResult{.exit_code = -1,
                                  .term_signal = WTERMSIG(native)};
    }
    co_return WaitProcessResult{.exit_code = exit_code};
  }
  if (ec == boost::asio::error::operation_aborted) {
    cancel_sig.emit(boost::asio::cancellation_type::total);
    boost::system::error_code ignored;
    proc.terminate(ignored);
    const auto pid = proc.id();
    if (pid > 0) {
      (void)::kill(pid, SIGKILL);
    }
    [[maybe_unused]] auto [wait_ec, ignored_exit] =
        co_await proc.async_wait(use_nothrow);
    co_return WaitProcessResult{.exit_code = kExitCodeTimeout,
                                .timed_out = true};
  }
  log::warn("wait on pid {} failed: {}", proc.id(), ec.message());
  co_return WaitProcessResult{.exit_code = -1};
}

auto execute_command(ExecutorRequest req, ExecutionSink sink,
                     ShellShardState *state) -> spawn_task {
  auto executor = co_await boost::asio::this_coro::executor;
  auto [cmd, discard_output] = split_discard_suffix(req.command);

  boost::asio::readable_pipe stdout_pipe(executor);
  boost::asio::readable_pipe stderr_pipe(executor);
  ExecutorResult result;

  std::optional<bp::process> proc;
  try {
    std::vector<std::string> args{"-c", std::move(cmd)};
    auto stdio = discard_output
                     ? bp::process_stdio{.in = nullptr,
                                         .out = nullptr,
                                         .err = nullptr}
                     : bp::process_stdio{.in = nullptr,
                                         .out = stdout_pipe,
                                         .err = stderr_pipe};
    if (req.working_dir.empty()) {
      proc.emplace(executor, "/bin/sh", args, std::move(stdio));
    } else {
      proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                   bp::process_start_dir{req.working_dir});
    }
  } catch (const std::exception &ex) {
    result.exit_code = -1;
    result.error = ex.what();
    log::error("Failed to launch job {}: {}", req.job_id, ex.what());
    if (sink.on_complete) {
      sink.on_complete(req.instance_id, std::move(result));
    }
    co_return;
  }

  const auto pid = proc->id();
  state->active_processes[req.instance_id] = ActiveProcess{.pid = pid};
  log::debug("shell process started pid={} instance_id={}", pid,
             req.instance_id);

  boost::asio::cancellation_signal cancel_sig;
  WaitProcessResult wait_result;
  if (discard_output) {
    wait_result = co_await wait_process_with_timeout(*proc, req.timeout,
                                                     cancel_sig);
  } else {
    using namespace awaitable_ops;
    wait_result = co_await (
        read_pipe(stdout_pipe, OutputStream::Stdout, req.instance_id, sink,
                  cancel_sig) &&
        read_pipe(stderr_pipe, OutputStream::Stderr, req.instance_id, sink,
                  cancel_sig) &&
        wait_process_with_timeout(*proc, req.timeout, cancel_sig));
  }

  result.exit_code = wait_result.exit_code;
  result.term_signal = wait_result.term_signal;
  result.timed_out = wait_result.timed_out;
  if (auto it = state->active_processes.find(req.instance_id);
      it != state->active_processes.end()) {
    result.cancelled = it->second.cancelled;
    state->active_processes.erase(it);
  }

  if (result.timed_out) {
    log::warn("Job {} timed out after {}s (pid={})", req.job_id,
              req.timeout.count(), pid);
  }
  log::debug("shell finish: instance_id={} exit_code={} signal={} "
             "timed_out={} cancelled={}",
             req.instance_id, result.exit_code, result.term_signal,
             result.timed_out, result.cancelled);
  if (sink.on_complete) {
    sink.on_complete(req.instance_id, std::move(result));
  }
}

} // namespace

class ShellExecutor final : public IExecutor {
public:
  explicit ShellExecutor(Runtime &rt)
      : runtime_{&rt}, shard_states_(rt.shard_count()) {}

  ShellExecutor(const ShellExecutor &) = delete;
  ShellExecutor &operator=(const ShellExecutor &) = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override {
    if (req.command.empty() || req.timeout <= std::chrono::seconds::zero()) {
      return fail(Error::InvalidArgument);
    }
    if (!runtime_->is_running()) {
      return fail(Error::SystemNotRunning);
    }

    log::info("Running job {} (instance {}, timeout {}s): {}", req.job_id,
              req.instance_id, req.timeout.count(), cmd_preview(req.command));

    auto owner = owner_shard(req.instance_id);
    runtime_->spawn_on(owner, execute_command(std::move(req), std::move(sink),
                                              &shard_states_[owner]));
    return ok();
  }

  auto cancel(const InstanceId &instance_id) -> void override {
    auto owner = owner_shard(instance_id);
    runtime_->post_to(owner, [this, owner, instance_id] {
      auto &active = shard_states_[owner].active_processes;
      auto it = active.find(instance_id);
      if (it == active.end() || it->second.pid <= 0) {
        return;
      }
      it->second.cancelled = true;
      (void)::kill(it->second.pid, SIGKILL);
      log::info("Cancelled process for instance {}", instance_id);
    });
  }

private:
  [[nodiscard]] auto owner_shard(const InstanceId &instance_id) const noexcept
      -> shard_id {
    const auto shards = std::max(1U, runtime_->shard_count());
    return static_cast<shard_id>(std::hash<InstanceId>{}(instance_id) % shards);
  }

  Runtime *runtime_;
  std::vector<ShellShardState> shard_states_;
};

auto create_shell_executor(Runtime &rt) -> std::unique_ptr<IExecutor> {
  return std::make_unique<ShellExecutor>(rt);
}

} // namespace cronhive
