#pragma once

#include "cronhive/util/conv.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace cronhive {

/// Truncate a command string for log preview (max 80 chars).
[[nodiscard]] inline auto cmd_preview(std::string_view cmd) -> std::string {
  if (cmd.size() <= 80)
    return std::string(cmd);
  return std::string(cmd.substr(0, 80)) + "...";
}

/// Strip a trailing "&> /dev/null" redirect. Returns the remaining command
/// and whether the output should be discarded.
[[nodiscard]] inline auto split_discard_suffix(std::string_view cmd)
    -> std::pair<std::string, bool> {
  constexpr std::string_view kSuffix = "&> /dev/null";
  auto trimmed = util::trim(cmd);
  if (trimmed.size() > kSuffix.size() && trimmed.ends_with(kSuffix)) {
    auto head = util::trim(trimmed.substr(0, trimmed.size() - kSuffix.size()));
    if (!head.empty()) {
      return {std::string(head), true};
    }
  }
  return {std::string(cmd), false};
}

} // namespace cronhive
