#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Names for enums described with BOOST_DESCRIBE_ENUM. Output is snake_case
// ("JobTimedOut" -> "job_timed_out"); input matching ignores case and any
// non-alphanumeric separators, so "job-timed-out" and "JOBTIMEDOUT" parse.

namespace cronhive::util {

namespace detail {

[[nodiscard]] inline auto fold_enum_token(std::string_view token)
    -> std::string {
  std::string out;
  for (unsigned char c : token) {
    if (std::isalnum(c) != 0) {
      out.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return out;
}

[[nodiscard]] inline auto snake_case(std::string_view camel) -> std::string {
  std::string out;
  for (unsigned char c : camel) {
    if (std::isupper(c) != 0 && !out.empty()) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

} // namespace detail

template <typename E>
[[nodiscard]] auto enum_name(E value) -> std::string_view {
  static const auto names = [] {
    std::vector<std::pair<E, std::string>> out;
    boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
        [&](auto d) { out.emplace_back(d.value, detail::snake_case(d.name)); });
    return out;
  }();
  auto it = std::ranges::find(names, value, &std::pair<E, std::string>::first);
  return it == names.end() ? std::string_view{"unknown"}
                           : std::string_view{it->second};
}

template <typename E>
[[nodiscard]] auto try_parse_enum(std::string_view input) -> std::optional<E> {
  const auto wanted = detail::fold_enum_token(input);
  std::optional<E> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto d) {
        if (!out && wanted == detail::fold_enum_token(d.name)) {
          out = d.value;
        }
      });
  return out;
}

} // namespace cronhive::util

/// to_string_view() for a described enum, found by ADL.
#define CRONHIVE_DEFINE_ENUM_NAMES(EnumType)                                   \
  [[nodiscard]] inline auto to_string_view(EnumType value) -> std::string_view { \
    return ::cronhive::util::enum_name(value);                                 \
  }
