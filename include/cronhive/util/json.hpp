#pragma once

#include "cronhive/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace cronhive {

/// Serialize any glaze-described value; "null" if writing fails.
template <typename T> [[nodiscard]] auto dump_json(const T &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

template <typename T>
[[nodiscard]] auto parse_json(std::string_view input) -> Result<T> {
  T value{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto is_valid_json(std::string_view input) -> bool {
  glz::generic_json<glz::num_mode::i64> value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  return !static_cast<bool>(glz::read<kOpts>(value, input));
}

} // namespace cronhive
