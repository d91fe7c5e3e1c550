#pragma once

#include "cronhive/executor/executor.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace cronhive {

class Runtime;

/// Bounded execution pool. At most `max_workers` requests are in flight;
/// try_submit() refuses further work instead of queueing it.
class WorkerPool {
public:
  using CompletionFn = std::move_only_function<void(ExecutionOutcome)>;

  WorkerPool(Runtime &runtime, IExecutor &executor, std::size_t max_workers,
             OutputHandler output = {});
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// False when saturated or closed; `on_done` then is not called.
  [[nodiscard]] auto try_submit(ExecutorRequest req, CompletionFn on_done)
      -> bool;

  auto close() noexcept -> void;
  auto reopen() noexcept -> void;

  /// Ask the executor to kill every in-flight request.
  auto cancel_in_flight() -> void;

  /// Block until nothing is in flight or the timeout expires.
  [[nodiscard]] auto wait_idle(std::chrono::milliseconds timeout) const -> bool;

  [[nodiscard]] auto in_flight() const noexcept -> std::size_t;
  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return max_workers_;
  }
  [[nodiscard]] auto is_open() const noexcept -> bool;

private:
  // Shared with running executions so a completion arriving after the pool
  // is gone stays valid.
  struct State {
    std::atomic<std::size_t> in_flight{0};
    std::atomic<bool> accepting{true};
    std::mutex mutex;
    std::unordered_set<InstanceId> active;
  };

  Runtime &runtime_;
  IExecutor &executor_;
  std::size_t max_workers_;
  OutputHandler output_;
  std::shared_ptr<State> state_;
};

} // namespace cronhive
