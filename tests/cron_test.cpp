#include "cronhive/scheduler/cron.hpp"
#include "cronhive/util/time.hpp"

#include "test_utils.hpp"

#include <functional>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace cronhive;
using namespace std::chrono;
using test::utc;

namespace {

auto parse_ok(std::string_view expr, std::string_view tz = {}) -> TriggerSpec {
  auto spec = TriggerSpec::parse(expr, tz);
  EXPECT_TRUE(spec.has_value()) << "expression: " << expr;
  return std::move(spec).value();
}

auto require_zone(std::string_view name) -> bool {
  return resolve_timezone(name).has_value();
}

// Broken-down UTC fields of a whole-second instant. dow counts from Monday.
struct Civil {
  int sec, min, hour, day, month, dow;
};

auto civil(test::TimePoint tp) -> Civil {
  const auto secs = floor<seconds>(tp);
  const auto day = floor<days>(secs);
  const year_month_day ymd{day};
  const hh_mm_ss hms{secs - day};
  return {static_cast<int>(hms.seconds().count()),
          static_cast<int>(hms.minutes().count()),
          static_cast<int>(hms.hours().count()),
          static_cast<int>(static_cast<unsigned>(ymd.day())),
          static_cast<int>(static_cast<unsigned>(ymd.month())),
          static_cast<int>(weekday{day}.iso_encoding()) - 1};
}

} // namespace

TEST(TriggerParseTest, SixFieldsKeepSeconds) {
  auto spec = parse_ok("*/5 * * * * *");
  EXPECT_EQ(spec.fields().second, "*/5");
  EXPECT_EQ(spec.fields().day_of_week, "*");
  EXPECT_EQ(spec.timezone_name(), "UTC");
}

TEST(TriggerParseTest, FiveFieldsFireAtSecondZero) {
  auto spec = parse_ok("15 10 * * *");
  EXPECT_EQ(spec.fields().second, "0");
  EXPECT_EQ(spec.fields().minute, "15");
  EXPECT_EQ(*spec.next_fire(utc(2024y / 1 / 1)), utc(2024y / 1 / 1, 10h, 15min));
}

TEST(TriggerParseTest, MacrosExpand) {
  EXPECT_EQ(parse_ok("@daily").fields().to_expression(), "0 0 0 * * *");
  EXPECT_EQ(parse_ok("@hourly").fields().to_expression(), "0 0 * * * *");
  EXPECT_EQ(parse_ok("@weekly").fields().to_expression(), "0 0 0 * * sun");
  EXPECT_EQ(parse_ok("@YEARLY").fields().to_expression(), "0 0 0 1 1 *");
  EXPECT_FALSE(TriggerSpec::parse("@fortnightly").has_value());
}

TEST(TriggerParseTest, NamesAreCaseInsensitive) {
  auto spec = parse_ok("0 0 12 * JAN-mar Mon-FRI");
  // 2024-03-29 is the last weekday of March; 2025-01-01 is a Wednesday.
  EXPECT_EQ(*spec.next_fire(utc(2024y / 3 / 29, 13h)), utc(2025y / 1 / 1, 12h));
}

TEST(TriggerParseTest, RejectsMalformedFields) {
  const std::vector<std::string> bad = {
      "",          "* * * *",     "* * * * * * *", "60 * * * * *",
      "* 60 * * * *", "* * 24 * * *", "* * * 0 * *",  "* * * 32 * *",
      "* * * * 13 *", "* * * * * 7",  "*/0 * * * * *", "5-1 * * * * *",
      "a * * * * *",  "1,,2 * * * * *", "? * * * * *",  "* * * * foo *"};
  for (const auto &expr : bad) {
    auto spec = TriggerSpec::parse(expr);
    ASSERT_FALSE(spec.has_value()) << "expression: '" << expr << "'";
    EXPECT_EQ(spec.error(), make_error_code(Error::InvalidSchedule));
  }
}

TEST(TriggerParseTest, RejectsDayThatNeverExists) {
  EXPECT_FALSE(TriggerSpec::parse("0 0 0 31 2 *").has_value());
  EXPECT_FALSE(TriggerSpec::parse("0 0 0 30,31 feb *").has_value());
  EXPECT_FALSE(TriggerSpec::parse("0 0 0 31 4,6,9,11 *").has_value());
  // Day-of-week makes the combination satisfiable again.
  EXPECT_TRUE(TriggerSpec::parse("0 0 0 31 2 mon").has_value());
}

TEST(TriggerParseTest, RejectsUnknownTimezone) {
  auto spec = TriggerSpec::parse("* * * * * *", "Mars/Olympus_Mons");
  ASSERT_FALSE(spec.has_value());
  EXPECT_EQ(spec.error(), make_error_code(Error::InvalidSchedule));
}

TEST(TriggerNextFireTest, IsStrictlyAfterReference) {
  auto spec = parse_ok("* * * * * *");
  const auto t = utc(2024y / 5 / 5, 5h, 5min, 5s);
  EXPECT_EQ(*spec.next_fire(t), t + 1s);
  EXPECT_EQ(*spec.next_fire(t + 250ms), t + 1s);
  EXPECT_EQ(*spec.next_fire(t - 1ms), t);
}

TEST(TriggerNextFireTest, StepWithinMinute) {
  auto spec = parse_ok("*/5 * * * * *");
  EXPECT_EQ(*spec.next_fire(utc(2024y / 1 / 1, 12h, 0min, 3s)),
            utc(2024y / 1 / 1, 12h, 0min, 5s));
  EXPECT_EQ(*spec.next_fire(utc(2024y / 1 / 1, 12h, 0min, 55s)),
            utc(2024y / 1 / 1, 12h, 1min, 0s));
}

TEST(TriggerNextFireTest, StartSlashStepRunsToFieldMaximum) {
  auto spec = parse_ok("0 50/4 * * * *");
  const auto fires = spec.upcoming(utc(2024y / 1 / 1, 9h, 49min), 5);
  const std::vector<test::TimePoint> expected = {
      utc(2024y / 1 / 1, 9h, 50min), utc(2024y / 1 / 1, 9h, 54min),
      utc(2024y / 1 / 1, 9h, 58min), utc(2024y / 1 / 1, 10h, 50min),
      utc(2024y / 1 / 1, 10h, 54min)};
  EXPECT_EQ(fires, expected);
}

TEST(TriggerNextFireTest, DayOfMonthOrDayOfWeekWhenBothRestricted) {
  // January 2024: the 1st is a Monday, Fridays are 5, 12, 19, 26.
  auto spec = parse_ok("0 0 0 13 * fri");
  const auto fires = spec.upcoming(utc(2024y / 1 / 1), 4);
  const std::vector<test::TimePoint> expected = {
      utc(2024y / 1 / 5), utc(2024y / 1 / 12), utc(2024y / 1 / 13),
      utc(2024y / 1 / 19)};
  EXPECT_EQ(fires, expected);
}

TEST(TriggerNextFireTest, OnlyRestrictedDayFieldApplies) {
  EXPECT_EQ(*parse_ok("0 0 0 13 * *").next_fire(utc(2024y / 1 / 1)),
            utc(2024y / 1 / 13));
  EXPECT_EQ(*parse_ok("0 0 0 * * mon").next_fire(utc(2024y / 1 / 1)),
            utc(2024y / 1 / 8));
  EXPECT_EQ(*parse_ok("0 0 0 ? * mon").next_fire(utc(2024y / 1 / 1)),
            utc(2024y / 1 / 8));
}

TEST(TriggerNextFireTest, DayOfWeekCountsFromMonday) {
  // 2024-01-01 is a Monday.
  EXPECT_EQ(*parse_ok("0 0 0 * * 0").next_fire(utc(2023y / 12 / 31)),
            utc(2024y / 1 / 1));
  auto sunday = parse_ok("0 0 0 * * 6");
  EXPECT_EQ(*sunday.next_fire(utc(2024y / 1 / 1)), utc(2024y / 1 / 7));
  EXPECT_EQ(sunday.upcoming(utc(2024y / 1 / 1), 3),
            parse_ok("0 0 0 * * sun").upcoming(utc(2024y / 1 / 1), 3));
  EXPECT_EQ(parse_ok("0 0 0 * * 0-4").upcoming(utc(2024y / 1 / 1), 5),
            parse_ok("0 0 0 * * mon-fri").upcoming(utc(2024y / 1 / 1), 5));
  EXPECT_EQ(*parse_ok("@weekly").next_fire(utc(2024y / 1 / 1)),
            utc(2024y / 1 / 7));
}

TEST(TriggerNextFireTest, DayOfWeekStepStopsAtSunday) {
  // 1/2 is tue, thu, sat; it must not run on to Monday.
  auto spec = parse_ok("0 0 0 * * 1/2");
  const auto fires = spec.upcoming(utc(2024y / 1 / 1), 4);
  const std::vector<test::TimePoint> expected = {
      utc(2024y / 1 / 2), utc(2024y / 1 / 4), utc(2024y / 1 / 6),
      utc(2024y / 1 / 9)};
  EXPECT_EQ(fires, expected);
  EXPECT_FALSE(spec.matches(utc(2024y / 1 / 8)));

  // 6/2 is Sunday alone.
  auto sunday_only = parse_ok("0 0 0 * * 6/2");
  EXPECT_EQ(sunday_only.upcoming(utc(2024y / 1 / 1), 2),
            (std::vector<test::TimePoint>{utc(2024y / 1 / 7), utc(2024y / 1 / 14)}));
}

TEST(TriggerNextFireTest, LeapDaySkipsToNextLeapYear) {
  auto spec = parse_ok("0 0 0 29 2 *");
  EXPECT_EQ(*spec.next_fire(utc(2024y / 3 / 1)), utc(2028y / 2 / 29));
}

TEST(TriggerNextFireTest, MatchesOnlyWholeSecondFireTimes) {
  auto spec = parse_ok("0 */15 * * * *");
  EXPECT_TRUE(spec.matches(utc(2024y / 1 / 1, 3h, 45min)));
  EXPECT_FALSE(spec.matches(utc(2024y / 1 / 1, 3h, 46min)));
  EXPECT_FALSE(spec.matches(utc(2024y / 1 / 1, 3h, 45min) + 1ms));
}

TEST(TriggerNextFireTest, CountAndLastFireInWindow) {
  auto spec = parse_ok("0 * * * * *");
  const auto from = utc(2024y / 1 / 1, 0h, 0min);
  const auto to = utc(2024y / 1 / 1, 0h, 10min);
  EXPECT_EQ(spec.count_fires(from, to, 100), 10u);
  EXPECT_EQ(spec.count_fires(from, to, 3), 3u);
  EXPECT_EQ(*spec.last_fire_until(from, to), to);
  EXPECT_FALSE(spec.last_fire_until(from, from + 30s).has_value());
}

// next_fire must equal the first matching second found by stepping through
// time one second at a time.
TEST(TriggerNextFireTest, AgreesWithBruteForceScan) {
  struct Case {
    std::string expr;
    std::function<bool(const Civil &)> match;
  };
  const std::vector<Case> cases = {
      {"0 0 12 * * 2/2",
       [](const Civil &c) {
         return c.sec == 0 && c.min == 0 && c.hour == 12 &&
                (c.dow == 2 || c.dow == 4 || c.dow == 6);
       }},
      {"*/7 * 3-5 * * *",
       [](const Civil &c) { return c.sec % 7 == 0 && c.hour >= 3 && c.hour <= 5; }},
      {"30 */20 * * * *",
       [](const Civil &c) { return c.sec == 30 && c.min % 20 == 0; }},
      {"0 0 9,17 * * 0-4",
       [](const Civil &c) {
         return c.sec == 0 && c.min == 0 && (c.hour == 9 || c.hour == 17) &&
                c.dow <= 4;
       }},
      {"15 45 23 1,15 * sat",
       [](const Civil &c) {
         return c.sec == 15 && c.min == 45 && c.hour == 23 &&
                (c.day == 1 || c.day == 15 || c.dow == 5);
       }},
  };

  const std::vector<test::TimePoint> starts = {
      utc(2024y / 2 / 28, 22h, 59min, 59s), utc(2023y / 12 / 31, 23h, 45min, 15s),
      utc(2024y / 6 / 14, 5h, 59min, 58s) + 500ms,
      utc(2025y / 3 / 1, 0h, 0min, 0s)};

  for (const auto &c : cases) {
    auto spec = parse_ok(c.expr);
    for (const auto &start : starts) {
      auto next = spec.next_fire(start);
      ASSERT_TRUE(next.has_value()) << c.expr;

      auto t = ceil<seconds>(start);
      if (t == start) {
        t += 1s;
      }
      const auto limit = start + days{16};
      while (t < limit && !c.match(civil(test::TimePoint{t}))) {
        t += 1s;
      }
      EXPECT_EQ(*next, test::TimePoint{t})
          << c.expr << " after " << util::format_iso8601(start);
    }
  }
}

TEST(TriggerNextFireTest, UpcomingIsStrictlyIncreasing) {
  auto spec = parse_ok("*/13 */7 * * * *");
  const auto fires = spec.upcoming(utc(2024y / 1 / 1), 50);
  ASSERT_EQ(fires.size(), 50u);
  for (std::size_t i = 1; i < fires.size(); ++i) {
    EXPECT_LT(fires[i - 1], fires[i]);
    EXPECT_TRUE(spec.matches(fires[i]));
  }
}

TEST(TriggerTimezoneTest, EvaluatesFieldsInLocalTime) {
  if (!require_zone("Europe/Berlin")) {
    GTEST_SKIP() << "tzdb not available";
  }
  auto spec = parse_ok("0 0 9 * * *", "Europe/Berlin");
  EXPECT_EQ(spec.timezone_name(), "Europe/Berlin");
  // CET is UTC+1 in January.
  EXPECT_EQ(*spec.next_fire(utc(2024y / 1 / 10)), utc(2024y / 1 / 10, 8h));
  // CEST is UTC+2 in July.
  EXPECT_EQ(*spec.next_fire(utc(2024y / 7 / 10)), utc(2024y / 7 / 10, 7h));
}

TEST(TriggerTimezoneTest, NonexistentLocalTimeFiresAtTransition) {
  if (!require_zone("America/New_York")) {
    GTEST_SKIP() << "tzdb not available";
  }
  // 2024-03-10 02:00 EST jumps to 03:00 EDT (07:00 UTC).
  auto spec = parse_ok("0 30 2 * * *", "America/New_York");
  EXPECT_EQ(*spec.next_fire(utc(2024y / 3 / 10, 5h)), utc(2024y / 3 / 10, 7h));
  // Next day is back to a regular 02:30 EDT.
  EXPECT_EQ(*spec.next_fire(utc(2024y / 3 / 10, 7h)),
            utc(2024y / 3 / 11, 6h, 30min));
}

TEST(TriggerTimezoneTest, AmbiguousLocalTimeFiresOnce) {
  if (!require_zone("America/New_York")) {
    GTEST_SKIP() << "tzdb not available";
  }
  // 2024-11-03 01:00-02:00 local happens twice; EDT first (UTC-4).
  auto spec = parse_ok("0 30 1 * * *", "America/New_York");
  EXPECT_EQ(*spec.next_fire(utc(2024y / 11 / 3, 4h)),
            utc(2024y / 11 / 3, 5h, 30min));
  // The second 01:30 (EST, 06:30 UTC) does not fire again.
  EXPECT_EQ(*spec.next_fire(utc(2024y / 11 / 3, 5h, 30min)),
            utc(2024y / 11 / 4, 6h, 30min));
  EXPECT_EQ(*spec.next_fire(utc(2024y / 11 / 3, 6h, 15min)),
            utc(2024y / 11 / 4, 6h, 30min));
}
