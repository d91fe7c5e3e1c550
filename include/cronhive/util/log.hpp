#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace cronhive::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  if (name == "warning") {
    return Level::Warn;
  }
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

/// One log event as handed to the writer thread and to forwarding sinks.
struct Record {
  Level level{Level::Info};
  std::chrono::system_clock::time_point time;
  std::string message;
  bool forward{true};
};

/// Secondary destination for log records (e.g. a database table). Called on
/// the logger's writer thread; implementations must not block on I/O.
class Sink {
public:
  virtual ~Sink() = default;
  virtual auto write(const Record &record) -> void = 0;
};

/// Per-call control over the forwarding sink. Code that runs on behalf of a
/// sink reports its own failures with Suppressed, so they cannot feed back
/// into it.
enum class Forwarding : std::uint8_t { Allowed, Suppressed };

// Async logger: producers push records into a concurrent_channel, a single
// writer thread formats, writes and forwards them.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Record)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<Level> sink_level_{Level::Warn};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<std::uint64_t> dropped_messages_{0};
  std::mutex output_mutex_;
  FILE *output_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::atomic<std::shared_ptr<Sink>> sink_;
  std::jthread writer_;

  [[nodiscard]] static auto format_line(const Record &rec, bool color)
      -> std::string {
    auto time = std::chrono::floor<std::chrono::milliseconds>(rec.time);
    if (color) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] {}\n", time,
                         level_color(rec.level), level_name(rec.level),
                         rec.message);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", time,
                       level_name(rec.level), rec.message);
  }

  auto write_out(const Record &rec) -> void {
    std::lock_guard lock(output_mutex_);
    auto *out = output_ ? output_ : stdout;
    const auto line = format_line(rec, ::isatty(::fileno(out)) != 0);
    std::fwrite(line.data(), 1, line.size(), out);
  }

  auto flush_out() -> void {
    std::lock_guard lock(output_mutex_);
    std::fflush(output_ ? output_ : stdout);
  }

  auto forward(const Record &rec) -> void {
    if (!rec.forward || rec.level < sink_level_.load(std::memory_order_acquire))
      return;
    if (auto sink = sink_.load(std::memory_order_acquire)) {
      sink->write(rec);
    }
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<Record> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      std::optional<Record> first;
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, Record item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });

      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        if (!running_.load(std::memory_order_acquire) || recv_ec)
          break;
        continue;
      }
      batch.clear();
      batch.push_back(std::move(*first));

      while (batch.size() < BATCH_SIZE) {
        std::optional<Record> rec;
        if (!queue->try_receive(
                [&](const boost::system::error_code &ec, Record item) {
                  if (!ec) {
                    rec = std::move(item);
                  }
                })) {
          break;
        }
        if (rec) {
          batch.push_back(std::move(*rec));
        }
      }

      for (const auto &rec : batch) {
        write_out(rec);
        forward(rec);
      }
      flush_out();
    }

    // Whatever is still queued at stop time goes to the primary output only.
    for (;;) {
      std::optional<Record> rec;
      if (!queue->try_receive(
              [&](const boost::system::error_code &ec, Record item) {
                if (!ec) {
                  rec = std::move(item);
                }
              })) {
        break;
      }
      if (rec) {
        write_out(*rec);
      }
    }
    flush_out();
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    queue_ctx_.restart();
    auto channel =
        std::make_shared<LogChannel>(queue_ctx_.get_executor(), QUEUE_CAPACITY);
    queue_.store(channel, std::memory_order_release);
    accepting_.store(true, std::memory_order_release);

    writer_ = std::jthread(
        [this, channel = std::move(channel)] { writer_loop(channel); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);

    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;

    auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
    if (queue) {
      queue->close();
    }
    queue_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::lock_guard lock(output_mutex_);
    output_ = stderr;
  }

  /// Append to `path`, or go back to stdout when it is empty.
  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(output_mutex_);
    if (path.empty()) {
      output_ = stdout;
      if (file_) {
        std::fclose(file_);
        file_ = nullptr;
      }
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_)
      std::fclose(file_);
    file_ = f;
    output_ = f;
    return true;
  }

  /// Install (or with nullptr, remove) the forwarding sink.
  auto set_sink(std::shared_ptr<Sink> sink, Level min_level = Level::Warn)
      -> void {
    sink_level_.store(min_level, std::memory_order_release);
    sink_.store(std::move(sink), std::memory_order_release);
  }

  [[nodiscard]] auto dropped_messages() const noexcept -> std::uint64_t {
    return dropped_messages_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    log(level, Forwarding::Allowed, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto log(Level level, Forwarding forwarding,
           std::format_string<Args...> fmt, Args &&...args) -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    Record rec{.level = level,
               .time = std::chrono::system_clock::now(),
               .message = std::format(fmt, std::forward<Args>(args)...),
               .forward = forwarding == Forwarding::Allowed};

    if (!accepting_.load(std::memory_order_acquire)) {
      write_out(rec);
      flush_out();
      return;
    }

    auto queue = queue_.load(std::memory_order_acquire);
    if (!queue || !queue->try_send(boost::system::error_code{}, rec)) {
      // Channel full: never block a runtime thread on logging.
      dropped_messages_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto set_sink(std::shared_ptr<Sink> sink, Level min_level = Level::Warn)
    -> void {
  logger().set_sink(std::move(sink), min_level);
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

/// Log with explicit control over forwarding.
template <typename... Args>
auto write(Level level, Forwarding forwarding, std::format_string<Args...> fmt,
           Args &&...args) -> void {
  logger().log(level, forwarding, fmt, std::forward<Args>(args)...);
}

} // namespace cronhive::log
