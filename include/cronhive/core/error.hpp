#pragma once

#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace cronhive {

/// Values of the "cronhive" error category. Success must stay 0.
enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  DatabaseOpenFailed,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  SystemNotRunning,
  ResourceExhausted,
  InvalidState,
  // Scheduling domain.
  InvalidSchedule,
  StoreUnavailable,
  ExecutionTimeout,
  ExecutionFailure,
  ReloadRollback,
  Unknown,
};

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "cronhive";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
    case Error::Success:
      return "success";
    case Error::FileNotFound:
      return "file not found";
    case Error::FileOpenFailed:
      return "cannot open file";
    case Error::ParseError:
      return "parse error";
    case Error::DatabaseOpenFailed:
      return "cannot open database";
    case Error::InvalidArgument:
      return "invalid argument";
    case Error::NotFound:
      return "not found";
    case Error::AlreadyExists:
      return "already exists";
    case Error::Timeout:
      return "timed out";
    case Error::SystemNotRunning:
      return "not running";
    case Error::ResourceExhausted:
      return "resource exhausted";
    case Error::InvalidState:
      return "invalid state";
    case Error::InvalidSchedule:
      return "invalid schedule";
    case Error::StoreUnavailable:
      return "job store unavailable";
    case Error::ExecutionTimeout:
      return "command exceeded its timeout";
    case Error::ExecutionFailure:
      return "command failed";
    case Error::ReloadRollback:
      return "reload failed, previous schedule restored";
    case Error::Unknown:
      break;
    }
    return "unknown error";
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

template <typename T> [[nodiscard]] auto sys_check(T val) -> Result<T> {
  if (val < 0)
    return fail(std::error_code(errno, std::system_category()));
  return ok(val);
}

} // namespace cronhive

template <> struct std::is_error_code_enum<cronhive::Error> : std::true_type {};
