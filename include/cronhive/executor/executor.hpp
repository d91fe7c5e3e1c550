#pragma once

#include "cronhive/core/coroutine.hpp"
#include "cronhive/core/error.hpp"
#include "cronhive/util/enum.hpp"
#include "cronhive/util/id.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace cronhive {

class Runtime;

inline constexpr int kExitCodeTimeout = 124;

enum class OutputStream : std::uint8_t { Stdout, Stderr };
BOOST_DESCRIBE_ENUM(OutputStream, Stdout, Stderr)
CRONHIVE_DEFINE_ENUM_NAMES(OutputStream)

enum class OutcomeKind : std::uint8_t { Success, Timeout, Failure };
BOOST_DESCRIBE_ENUM(OutcomeKind, Success, Timeout, Failure)
CRONHIVE_DEFINE_ENUM_NAMES(OutcomeKind)

struct ExecutorRequest {
  InstanceId instance_id;
  JobId job_id;
  std::string command;
  std::chrono::seconds timeout{60};
  std::string working_dir;
};

/// Raw process result as reported by an executor.
struct ExecutorResult {
  int exit_code{0};
  /// Signal that terminated the process, 0 if it exited normally.
  int term_signal{0};
  bool timed_out{false};
  bool cancelled{false};
  /// Set when the process could not be started at all.
  std::string error;
};

struct ExecutionSink {
  std::move_only_function<void(const InstanceId &instance_id,
                               OutputStream stream, std::string_view data)>
      on_output;
  std::move_only_function<void(const InstanceId &instance_id,
                               ExecutorResult result)>
      on_complete;
};

/// Success, Timeout or Failure with enough detail to log.
struct ExecutionOutcome {
  OutcomeKind kind{OutcomeKind::Failure};
  int exit_code{-1};
  std::string detail;
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] static auto classify(const ExecutorResult &result,
                                     std::chrono::milliseconds elapsed)
      -> ExecutionOutcome;

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return kind == OutcomeKind::Success;
  }

  /// Success maps to an empty error code.
  [[nodiscard]] auto error_code() const -> std::error_code;
};

/// Executor seam: launches one command and reports back through the sink.
/// `on_complete` is called exactly once for every successful start().
class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual auto start(ExecutorRequest req, ExecutionSink sink)
      -> Result<void> = 0;

  /// Kill a running instance; unknown ids are ignored.
  virtual auto cancel(const InstanceId &instance_id) -> void = 0;
};

[[nodiscard]] auto create_shell_executor(Runtime &rt)
    -> std::unique_ptr<IExecutor>;

using OutputHandler =
    std::function<void(const JobId &job_id, OutputStream stream,
                       std::string_view data)>;

/// Output handler that writes each chunk to the debug log.
[[nodiscard]] auto log_output_handler() -> OutputHandler;

/// Run a request to completion and classify it. Never throws: launch
/// errors and exceptions become Failure outcomes.
[[nodiscard]] auto execute_async(IExecutor &executor, ExecutorRequest req,
                                 OutputHandler output)
    -> task<ExecutionOutcome>;

} // namespace cronhive
