#include "cronhive/executor/executor.hpp"

#include "cronhive/util/log.hpp"

#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <format>

namespace cronhive {

auto ExecutionOutcome::classify(const ExecutorResult &result,
                                std::chrono::milliseconds elapsed)
    -> ExecutionOutcome {
  ExecutionOutcome out;
  out.exit_code = result.exit_code;
  out.elapsed = elapsed;

  if (result.timed_out) {
    out.kind = OutcomeKind::Timeout;
    out.detail = std::format("killed after {} ms", elapsed.count());
  } else if (!result.error.empty()) {
    out.kind = OutcomeKind::Failure;
    out.detail = result.error;
  } else if (result.cancelled) {
    out.kind = OutcomeKind::Failure;
    out.detail = "cancelled";
  } else if (result.term_signal != 0) {
    out.kind = OutcomeKind::Failure;
    out.detail = std::format("terminated by signal {}", result.term_signal);
  } else if (result.exit_code != 0) {
    out.kind = OutcomeKind::Failure;
    out.detail = std::format("exit code {}", result.exit_code);
  } else {
    out.kind = OutcomeKind::Success;
    out.detail = std::format("exit code 0 in {} ms", elapsed.count());
  }
  return out;
}

auto ExecutionOutcome::error_code() const -> std::error_code {
  switch (kind) {
  case OutcomeKind::Success:
    return {};
  case OutcomeKind::Timeout:
    return make_error_code(Error::ExecutionTimeout);
  case OutcomeKind::Failure:
    break;
  }
  return make_error_code(Error::ExecutionFailure);
}

auto log_output_handler() -> OutputHandler {
  return [](const JobId &job_id, OutputStream stream, std::string_view data) {
    log::debug("[{}] {}: {}", job_id, to_string_view(stream), data);
  };
}

auto execute_async(IExecutor &executor, ExecutorRequest req,
                   OutputHandler output) -> task<ExecutionOutcome> {
  const auto started = std::chrono::steady_clock::now();
  auto elapsed = [started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
  };

  try {
    auto result = co_await boost::asio::async_initiate<
        const boost::asio::use_awaitable_t<>, void(ExecutorResult)>(
        [&executor, req = std::move(req),
         output = std::move(output)](auto handler) mutable {
          auto shared_h =
              std::make_shared<decltype(handler)>(std::move(handler));

          ExecutionSink sink;
          if (output) {
            sink.on_output = [output, job_id = req.job_id](
                                 const InstanceId &, OutputStream stream,
                                 std::string_view data) {
              output(job_id, stream, data);
            };
          }
          sink.on_complete = [shared_h](const InstanceId &,
                                        ExecutorResult res) mutable {
            std::move(*shared_h)(std::move(res));
          };

          auto started_res = executor.start(std::move(req), std::move(sink));
          if (!started_res) {
            // start() refused the request; on_complete will never fire.
            ExecutorResult err;
            err.exit_code = -1;
            err.error = std::format("failed to start: {}",
                                    started_res.error().message());
            std::move(*shared_h)(std::move(err));
          }
        },
        boost::asio::use_awaitable);
    co_return ExecutionOutcome::classify(result, elapsed());
  } catch (const std::exception &ex) {
    co_return ExecutionOutcome{.kind = OutcomeKind::Failure,
                               .exit_code = -1,
                               .detail = ex.what(),
                               .elapsed = elapsed()};
  }
}

} // namespace cronhive
