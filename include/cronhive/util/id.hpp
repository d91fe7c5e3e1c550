#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace cronhive {

/// Ids are free text but must be non-empty and printable on one line.
[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && std::ranges::none_of(value, [](unsigned char ch) {
    return std::iscntrl(ch) != 0;
  });
}

struct JobTag {};
struct InstanceTag {};

// Phantom-typed string id; a JobId cannot be passed where an InstanceId is
// expected.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using JobId = TypedId<JobTag>;
using InstanceId = TypedId<InstanceTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace cronhive

template <typename Tag> struct std::hash<cronhive::TypedId<Tag>> {
  auto operator()(const cronhive::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<cronhive::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const cronhive::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace cronhive {

namespace detail {
[[nodiscard]] auto time_ordered_suffix() -> std::string;
} // namespace detail

/// One id per dispatched execution: "<job>@<time-ordered random suffix>".
inline auto generate_instance_id(const JobId &job_id) -> InstanceId {
  return InstanceId{std::format("{}@{}", job_id, detail::time_ordered_suffix())};
}

} // namespace cronhive
