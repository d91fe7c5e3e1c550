#pragma once

#include "cronhive/core/coroutine.hpp"
#include "cronhive/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace cronhive {

using shard_id = unsigned;

/// Scheduler and executor coroutines run here: a fixed set of
/// single-threaded io_contexts ("shards"), one thread each. Every shard
/// beats a heartbeat; a watchdog thread logs shards that stop beating,
/// which means something on that shard made a blocking call.
class Runtime {
public:
  /// 0 picks min(hardware threads, 4).
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(target), std::move(coro), detached);
  }

  /// For callers with no shard of their own; spreads work round-robin.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    spawn_on(next_shard(), std::move(coro));
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(executor_for(target), std::forward<F>(fn));
  }

  [[nodiscard]] auto next_shard() noexcept -> shard_id {
    return static_cast<shard_id>(
        round_robin_.fetch_add(1, std::memory_order_relaxed) % shards_.size());
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return static_cast<unsigned>(shards_.size());
  }

  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    assert(id < shards_.size());
    return shards_[id]->io.get_executor();
  }

private:
  using WorkGuard =
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  struct Shard {
    boost::asio::io_context io{1};
    std::optional<WorkGuard> keep_alive;
    std::jthread thread;
    std::atomic<std::int64_t> last_beat_ms{0};
    bool stall_reported{false}; // watchdog thread only
  };

  static auto heartbeat(const Runtime &self, Shard &shard) -> spawn_task;
  auto watch(std::stop_token stop) -> void;

  std::vector<std::unique_ptr<Shard>> shards_;
  std::jthread watchdog_;
  alignas(64) std::atomic<bool> running_{false};
  alignas(64) std::atomic<std::uint64_t> round_robin_{0};
};

/// Suspend the calling coroutine on its own executor.
template <typename Rep, typename Period>
[[nodiscard]] inline auto async_sleep(std::chrono::duration<Rep, Period> d)
    -> task<void> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor);
  timer.expires_after(d);
  [[maybe_unused]] auto [ec] = co_await timer.async_wait(use_nothrow);
}

} // namespace cronhive
