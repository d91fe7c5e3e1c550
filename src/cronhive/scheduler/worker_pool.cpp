#include "cronhive/scheduler/worker_pool.hpp"

#include "cronhive/core/constants.hpp"
#include "cronhive/core/runtime.hpp"
#include "cronhive/util/log.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace cronhive {

WorkerPool::WorkerPool(Runtime &runtime, IExecutor &executor,
                       std::size_t max_workers, OutputHandler output)
    : runtime_(runtime), executor_(executor),
      max_workers_(std::max<std::size_t>(1, max_workers)),
      output_(std::move(output)), state_(std::make_shared<State>()) {}

WorkerPool::~WorkerPool() { close(); }

auto WorkerPool::try_submit(ExecutorRequest req, CompletionFn on_done)
    -> bool {
  if (!state_->accepting.load(std::memory_order_acquire)) {
    return false;
  }

  auto current = state_->in_flight.load(std::memory_order_acquire);
  do {
    if (current >= max_workers_) {
      return false;
    }
  } while (!state_->in_flight.compare_exchange_weak(
      current, current + 1, std::memory_order_acq_rel,
      std::memory_order_acquire));

  {
    std::lock_guard lock(state_->mutex);
    state_->active.insert(req.instance_id);
  }

  auto run = [](std::shared_ptr<State> state, IExecutor &executor,
                ExecutorRequest request, OutputHandler output,
                CompletionFn done) -> spawn_task {
    const auto instance_id = request.instance_id;
    auto outcome =
        co_await execute_async(executor, std::move(request), std::move(output));
    {
      std::lock_guard lock(state->mutex);
      state->active.erase(instance_id);
    }
    if (done) {
      done(std::move(outcome));
    }
    state->in_flight.fetch_sub(1, std::memory_order_acq_rel);
  };

  runtime_.spawn_external(
      run(state_, executor_, std::move(req), output_, std::move(on_done)));
  return true;
}

auto WorkerPool::close() noexcept -> void {
  state_->accepting.store(false, std::memory_order_release);
}

auto WorkerPool::reopen() noexcept -> void {
  state_->accepting.store(true, std::memory_order_release);
}

auto WorkerPool::is_open() const noexcept -> bool {
  return state_->accepting.load(std::memory_order_acquire);
}

auto WorkerPool::cancel_in_flight() -> void {
  std::vector<InstanceId> ids;
  {
    std::lock_guard lock(state_->mutex);
    ids.assign(state_->active.begin(), state_->active.end());
  }
  for (const auto &id : ids) {
    executor_.cancel(id);
  }
  if (!ids.empty()) {
    log::info("Cancelled {} in-flight executions", ids.size());
  }
}

auto WorkerPool::wait_idle(std::chrono::milliseconds timeout) const -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (state_->in_flight.load(std::memory_order_acquire) > 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }
  return true;
}

auto WorkerPool::in_flight() const noexcept -> std::size_t {
  return state_->in_flight.load(std::memory_order_acquire);
}

} // namespace cronhive
