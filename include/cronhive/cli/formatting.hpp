#pragma once

#include "cronhive/util/time.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace cronhive::cli::fmt {

namespace ansi {

enum class Style { Bold = 1, Dim = 2, Red = 31, Green = 32, Yellow = 33 };

// SGR codes only when stdout is a terminal.
inline auto styled(std::string_view text, Style style) -> std::string {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  if (!tty) {
    return std::string(text);
  }
  return std::format("\033[{}m{}\033[0m", static_cast<int>(style), text);
}

inline auto bold(std::string_view text) -> std::string {
  return styled(text, Style::Bold);
}
inline auto green(std::string_view text) -> std::string {
  return styled(text, Style::Green);
}
inline auto red(std::string_view text) -> std::string {
  return styled(text, Style::Red);
}

// Printable width, not counting SGR sequences.
inline auto visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  while (!s.empty()) {
    if (s.front() == '\033') {
      const auto end = s.find('m');
      s.remove_prefix(end == std::string_view::npos ? s.size() : end + 1);
      continue;
    }
    ++width;
    s.remove_prefix(1);
  }
  return width;
}

} // namespace ansi

inline auto colorize_marker_state(bool processed) -> std::string {
  return processed ? ansi::styled("processed", ansi::Style::Dim)
                   : ansi::styled("pending", ansi::Style::Yellow);
}

inline auto colorize_service_state(bool running) -> std::string {
  return running ? ansi::green("running") : ansi::red("stopped");
}

// Space separated columns padded to a fixed width; long cells overflow.
class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    std::vector<std::string> headers;
    std::size_t rule = 0;
    for (const auto &col : columns_) {
      headers.push_back(ansi::bold(col.header));
      rule += col.width + (rule == 0 ? 0 : 1);
    }
    print_row(headers);
    std::println("{}", std::string(rule, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    std::string line;
    const auto n = std::min(columns_.size(), values.size());
    for (std::size_t i = 0; i < n; ++i) {
      const auto &col = columns_[i];
      const auto width = ansi::visible_width(values[i]);
      const std::string pad(col.width > width ? col.width - width : 0, ' ');
      if (i > 0) {
        line.push_back(' ');
      }
      line += col.right_align ? pad + values[i] : values[i] + pad;
    }
    std::println("{}", line);
  }

private:
  std::vector<Column> columns_;
};

inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  return util::format_timestamp_ms(tp);
}

// Fire time rendered both in UTC and in the trigger's zone.
inline auto format_fire_time(std::chrono::system_clock::time_point tp,
                             const std::chrono::time_zone *zone)
    -> std::string {
  const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
  if (zone == nullptr) {
    return std::format("{:%Y-%m-%d %H:%M:%S} UTC", secs);
  }
  return std::format("{:%Y-%m-%d %H:%M:%S %Z}",
                     std::chrono::zoned_time{zone, secs});
}

inline auto format_optional(const auto &value) -> std::string {
  if (!value.has_value())
    return "-";
  return std::format("{}", *value);
}

} // namespace cronhive::cli::fmt
