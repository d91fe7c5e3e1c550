#pragma once

#include "cronhive/core/error.hpp"

#include <bitset>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cronhive {

/// The six textual cron fields of a job, seconds first.
struct CronFields {
  std::string second{"*"};
  std::string minute{"*"};
  std::string hour{"*"};
  std::string day{"*"};
  std::string month{"*"};
  std::string day_of_week{"*"};

  [[nodiscard]] auto to_expression() const -> std::string;
  [[nodiscard]] auto operator==(const CronFields &) const -> bool = default;
};

/// Resolve an IANA zone name. Empty or "UTC" map to nullptr (plain UTC).
[[nodiscard]] auto resolve_timezone(std::string_view name)
    -> Result<const std::chrono::time_zone *>;

/// Compiled cron trigger. Immutable after parse; all queries are pure.
///
/// Field ranges: second/minute 0-59, hour 0-23, day 1-31, month 1-12 or
/// jan-dec, day_of_week 0-6 or mon-sun (0 is Monday, 6 is Sunday). Each
/// field is a comma list of `*`, `?`, `n`, `a-b`, `*/s`, `a-b/s` or `a/s`
/// (a to max).
/// When both day and day_of_week are restricted a day matches if either
/// does; otherwise only the restricted one is consulted.
class TriggerSpec {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  [[nodiscard]] static auto parse(const CronFields &fields,
                                  std::string_view timezone = {})
      -> Result<TriggerSpec>;

  /// Six whitespace separated fields, five (seconds default to 0), or one of
  /// @yearly @annually @monthly @weekly @daily @hourly.
  [[nodiscard]] static auto parse(std::string_view expression,
                                  std::string_view timezone = {})
      -> Result<TriggerSpec>;

  /// Earliest whole-second instant strictly after `after` matching every
  /// field, or nullopt if none exists within the search horizon.
  [[nodiscard]] auto next_fire(TimePoint after) const
      -> std::optional<TimePoint>;

  [[nodiscard]] auto matches(TimePoint tp) const -> bool;

  /// Number of fire times in (from, to], stopping at `cap`.
  [[nodiscard]] auto count_fires(TimePoint from, TimePoint to,
                                 std::size_t cap) const -> std::size_t;

  /// Last fire time in (from, to], if any.
  [[nodiscard]] auto last_fire_until(TimePoint from, TimePoint to) const
      -> std::optional<TimePoint>;

  [[nodiscard]] auto upcoming(TimePoint after, std::size_t count) const
      -> std::vector<TimePoint>;

  [[nodiscard]] auto fields() const noexcept -> const CronFields & {
    return fields_;
  }
  [[nodiscard]] auto timezone_name() const noexcept -> std::string_view {
    return zone_ ? zone_->name() : std::string_view{"UTC"};
  }

private:
  struct Masks {
    std::bitset<60> second;
    std::bitset<60> minute;
    std::bitset<24> hour;
    std::bitset<32> day;
    std::bitset<13> month;
    std::bitset<7> dow;
    bool day_restricted{false};
    bool dow_restricted{false};
  };

  TriggerSpec(CronFields fields, Masks masks,
              const std::chrono::time_zone *zone);

  [[nodiscard]] auto day_matches(std::chrono::local_days day) const -> bool;
  [[nodiscard]] auto next_time_of_day(std::chrono::seconds from) const
      -> std::optional<std::chrono::seconds>;
  [[nodiscard]] auto next_local(std::chrono::local_seconds from) const
      -> std::optional<std::chrono::local_seconds>;
  [[nodiscard]] auto to_local(TimePoint tp) const
      -> std::chrono::local_seconds;
  [[nodiscard]] auto to_sys(std::chrono::local_seconds lt) const
      -> std::chrono::sys_seconds;

  CronFields fields_;
  Masks masks_;
  const std::chrono::time_zone *zone_{nullptr};
};

} // namespace cronhive
