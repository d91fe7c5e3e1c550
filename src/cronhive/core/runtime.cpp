#include "cronhive/core/runtime.hpp"

#include "cronhive/core/constants.hpp"
#include "cronhive/util/log.hpp"

#include <algorithm>
#include <chrono>

namespace cronhive {

namespace {

[[nodiscard]] auto steady_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

} // namespace

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::clamp(std::thread::hardware_concurrency(), 1U, 4U);
  }
  shards_.reserve(num_shards);
  while (shards_.size() < num_shards) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }
  log::debug("Starting runtime with {} shards", shards_.size());

  const auto now = steady_ms();
  for (auto &shard : shards_) {
    shard->io.restart();
    shard->keep_alive.emplace(boost::asio::make_work_guard(shard->io));
    shard->last_beat_ms.store(now, std::memory_order_release);
    shard->stall_reported = false;
    co_spawn(shard->io, heartbeat(*this, *shard), detached);
    shard->thread = std::jthread([&io = shard->io] { io.run(); });
  }
  watchdog_ = std::jthread([this](std::stop_token stop) { watch(stop); });
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  if (watchdog_.joinable()) {
    watchdog_.request_stop();
    watchdog_.join();
  }
  for (auto &shard : shards_) {
    shard->keep_alive.reset();
    shard->io.stop();
  }
  for (auto &shard : shards_) {
    if (shard->thread.joinable()) {
      shard->thread.join();
    }
  }
}

auto Runtime::heartbeat(const Runtime &self, Shard &shard) -> spawn_task {
  while (self.is_running()) {
    shard.last_beat_ms.store(steady_ms(), std::memory_order_release);
    co_await async_sleep(timing::kHeartbeatInterval);
  }
}

auto Runtime::watch(std::stop_token stop) -> void {
  const auto threshold = timing::kStallThreshold.count();
  while (!stop.stop_requested()) {
    std::this_thread::sleep_for(timing::kWatchdogInterval);
    const auto now = steady_ms();
    for (std::size_t i = 0; i < shards_.size(); ++i) {
      auto &shard = *shards_[i];
      const auto silent =
          now - shard.last_beat_ms.load(std::memory_order_acquire);
      if (silent <= threshold) {
        shard.stall_reported = false;
      } else if (!shard.stall_reported) {
        shard.stall_reported = true;
        log::error("Shard {} has not run for {} ms; a job or store call is "
                   "blocking its thread",
                   i, silent);
      }
    }
  }
}

} // namespace cronhive
