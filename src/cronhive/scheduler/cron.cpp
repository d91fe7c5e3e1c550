#include "cronhive/scheduler/cron.hpp"

#include "cronhive/core/constants.hpp"
#include "cronhive/util/conv.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <ranges>
#include <stdexcept>

namespace cronhive {
namespace {

using namespace std::chrono_literals;

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kMacros{{
    {"@yearly", "0 0 0 1 1 *"},
    {"@annually", "0 0 0 1 1 *"},
    {"@monthly", "0 0 0 1 * *"},
    {"@weekly", "0 0 0 * * sun"},
    {"@daily", "0 0 0 * * *"},
    {"@hourly", "0 0 * * * *"},
}};

constexpr std::array<std::string_view, 12> kMonthNames{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

// Day of week counts from Monday: 0 is mon, 6 is sun.
constexpr std::array<std::string_view, 7> kDowNames{"mon", "tue", "wed", "thu",
                                                    "fri", "sat", "sun"};

// Longest month length, leap years included (february counts as 29).
constexpr std::array<int, 13> kMaxDaysInMonth{0,  31, 29, 31, 30, 31, 30,
                                              31, 31, 30, 31, 30, 31};

enum class FieldKind { Plain, Day, Month, DayOfWeek };

struct FieldSpec {
  std::string_view name;
  int min_val;
  int max_val;
  FieldKind kind;
};

struct ParsedField {
  std::bitset<64> bits;
  bool restricted{true};
};

template <std::size_t N>
auto lookup_name(std::string_view s, const std::array<std::string_view, N> &names,
                 int base) -> std::optional<int> {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (boost::algorithm::iequals(s, names[i])) {
      return static_cast<int>(i) + base;
    }
  }
  return std::nullopt;
}

auto parse_value(std::string_view s, FieldKind kind) -> Result<int> {
  if (auto v = util::parse_int<int>(s))
    return *v;
  if (kind == FieldKind::Month) {
    if (auto v = lookup_name(s, kMonthNames, 1))
      return *v;
  }
  if (kind == FieldKind::DayOfWeek) {
    if (auto v = lookup_name(s, kDowNames, 0))
      return *v;
  }
  return fail(Error::InvalidSchedule);
}

auto parse_field(std::string_view field, const FieldSpec &spec)
    -> Result<ParsedField> {
  ParsedField out;
  const auto text = util::trim(field);
  if (text.empty())
    return fail(Error::InvalidSchedule);

  for (auto chunk : text | std::views::split(',')) {
    auto part = util::trim(std::string_view(chunk));
    if (part.empty())
      return fail(Error::InvalidSchedule);

    int step = 1;
    bool has_step = false;
    if (auto slash = part.find('/'); slash != std::string_view::npos) {
      auto step_val = util::parse_int<int>(part.substr(slash + 1));
      if (!step_val || *step_val <= 0)
        return fail(Error::InvalidSchedule);
      step = *step_val;
      has_step = true;
      part = part.substr(0, slash);
    }

    int start = 0;
    int end = 0;
    if (part == "*" || part == "?") {
      if (part == "?" && spec.kind != FieldKind::Day &&
          spec.kind != FieldKind::DayOfWeek)
        return fail(Error::InvalidSchedule);
      start = spec.min_val;
      end = spec.max_val;
      if (step == 1)
        out.restricted = false;
    } else if (auto dash = part.find('-'); dash != std::string_view::npos) {
      auto a = parse_value(util::trim(part.substr(0, dash)), spec.kind);
      auto b = parse_value(util::trim(part.substr(dash + 1)), spec.kind);
      if (!a || !b)
        return fail(Error::InvalidSchedule);
      start = *a;
      end = *b;
    } else {
      auto v = parse_value(part, spec.kind);
      if (!v)
        return fail(Error::InvalidSchedule);
      start = *v;
      // "a/s" runs from a to the field maximum.
      end = has_step ? spec.max_val : *v;
    }

    if (start < spec.min_val || end > spec.max_val || start > end)
      return fail(Error::InvalidSchedule);
    for (int v = start; v <= end; v += step) {
      out.bits.set(static_cast<std::size_t>(v));
    }
  }

  if (!out.bits.any())
    return fail(Error::InvalidSchedule);
  return ok(out);
}

template <std::size_t N>
auto copy_bits(const std::bitset<64> &from) -> std::bitset<N> {
  std::bitset<N> out;
  for (std::size_t i = 0; i < N; ++i) {
    out.set(i, from.test(i));
  }
  return out;
}

template <std::size_t N>
auto next_set(const std::bitset<N> &bs, int from, int max_val)
    -> std::optional<int> {
  for (int v = from; v <= max_val; ++v) {
    if (bs.test(static_cast<std::size_t>(v)))
      return v;
  }
  return std::nullopt;
}

auto split_expression(std::string_view expression) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  std::string trimmed = boost::algorithm::trim_copy(std::string(expression));
  if (trimmed.empty())
    return tokens;
  boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  return tokens;
}

} // namespace

auto CronFields::to_expression() const -> std::string {
  return std::format("{} {} {} {} {} {}", second, minute, hour, day, month,
                     day_of_week);
}

auto resolve_timezone(std::string_view name)
    -> Result<const std::chrono::time_zone *> {
  if (name.empty() || boost::algorithm::iequals(name, "UTC")) {
    return ok(static_cast<const std::chrono::time_zone *>(nullptr));
  }
  try {
    return ok(std::chrono::locate_zone(name));
  } catch (const std::runtime_error &) {
    return fail(Error::InvalidArgument);
  }
}

TriggerSpec::TriggerSpec(CronFields fields, Masks masks,
                         const std::chrono::time_zone *zone)
    : fields_(std::move(fields)), masks_(masks), zone_(zone) {}

auto TriggerSpec::parse(const CronFields &fields, std::string_view timezone)
    -> Result<TriggerSpec> {
  auto zone = resolve_timezone(timezone);
  if (!zone)
    return fail(Error::InvalidSchedule);

  auto second = parse_field(fields.second, {"second", 0, 59, FieldKind::Plain});
  auto minute = parse_field(fields.minute, {"minute", 0, 59, FieldKind::Plain});
  auto hour = parse_field(fields.hour, {"hour", 0, 23, FieldKind::Plain});
  auto day = parse_field(fields.day, {"day", 1, 31, FieldKind::Day});
  auto month = parse_field(fields.month, {"month", 1, 12, FieldKind::Month});
  auto dow = parse_field(fields.day_of_week,
                         {"day_of_week", 0, 6, FieldKind::DayOfWeek});
  if (!second || !minute || !hour || !day || !month || !dow)
    return fail(Error::InvalidSchedule);

  Masks masks;
  masks.second = copy_bits<60>(second->bits);
  masks.minute = copy_bits<60>(minute->bits);
  masks.hour = copy_bits<24>(hour->bits);
  masks.day = copy_bits<32>(day->bits);
  masks.month = copy_bits<13>(month->bits);
  masks.dow = copy_bits<7>(dow->bits);
  masks.day_restricted = day->restricted;
  masks.dow_restricted = dow->restricted;

  // A day-of-month-only schedule must name a day that exists in at least one
  // of the selected months, otherwise it never fires ("31 feb").
  if (masks.day_restricted && !masks.dow_restricted) {
    bool feasible = false;
    for (int m = 1; m <= 12 && !feasible; ++m) {
      if (!masks.month.test(static_cast<std::size_t>(m)))
        continue;
      for (int d = 1; d <= kMaxDaysInMonth[static_cast<std::size_t>(m)]; ++d) {
        if (masks.day.test(static_cast<std::size_t>(d))) {
          feasible = true;
          break;
        }
      }
    }
    if (!feasible)
      return fail(Error::InvalidSchedule);
  }

  return ok(TriggerSpec(fields, masks, *zone));
}

auto TriggerSpec::parse(std::string_view expression, std::string_view timezone)
    -> Result<TriggerSpec> {
  auto tokens = split_expression(expression);
  if (tokens.size() == 1 && tokens[0].starts_with('@')) {
    const auto *it = std::ranges::find_if(kMacros, [&](const auto &entry) {
      return boost::algorithm::iequals(tokens[0], entry.first);
    });
    if (it == kMacros.end())
      return fail(Error::InvalidSchedule);
    tokens = split_expression(it->second);
  }
  if (tokens.size() == 5) {
    tokens.insert(tokens.begin(), "0");
  }
  if (tokens.size() != 6)
    return fail(Error::InvalidSchedule);

  CronFields fields{.second = tokens[0],
                    .minute = tokens[1],
                    .hour = tokens[2],
                    .day = tokens[3],
                    .month = tokens[4],
                    .day_of_week = tokens[5]};
  return parse(fields, timezone);
}

auto TriggerSpec::to_local(TimePoint tp) const -> std::chrono::local_seconds {
  const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
  if (!zone_) {
    return std::chrono::local_seconds{secs.time_since_epoch()};
  }
  return zone_->to_local(secs);
}

auto TriggerSpec::to_sys(std::chrono::local_seconds lt) const
    -> std::chrono::sys_seconds {
  if (!zone_) {
    return std::chrono::sys_seconds{lt.time_since_epoch()};
  }
  // Ambiguous times take the earlier instant; nonexistent ones map to the
  // transition.
  return std::chrono::floor<std::chrono::seconds>(
      zone_->to_sys(lt, std::chrono::choose::earliest));
}

auto TriggerSpec::day_matches(std::chrono::local_days day) const -> bool {
  using namespace std::chrono;
  const auto ymd = year_month_day{sys_days{day.time_since_epoch()}};
  const auto dom = static_cast<unsigned>(ymd.day());
  // iso_encoding is 1 for Monday through 7 for Sunday.
  const auto dow = weekday{sys_days{day.time_since_epoch()}}.iso_encoding() - 1;
  const bool dom_ok = masks_.day.test(dom);
  const bool dow_ok = masks_.dow.test(dow);

  if (masks_.day_restricted && masks_.dow_restricted)
    return dom_ok || dow_ok;
  if (masks_.day_restricted)
    return dom_ok;
  if (masks_.dow_restricted)
    return dow_ok;
  return true;
}

auto TriggerSpec::next_time_of_day(std::chrono::seconds from) const
    -> std::optional<std::chrono::seconds> {
  const auto total = static_cast<int>(from.count());
  const int h0 = total / 3600;
  const int m0 = (total / 60) % 60;
  const int s0 = total % 60;

  for (auto h = next_set(masks_.hour, h0, 23); h;
       h = next_set(masks_.hour, *h + 1, 23)) {
    const int m_start = (*h == h0) ? m0 : 0;
    for (auto m = next_set(masks_.minute, m_start, 59); m;
         m = next_set(masks_.minute, *m + 1, 59)) {
      const int s_start = (*h == h0 && *m == m0) ? s0 : 0;
      if (auto s = next_set(masks_.second, s_start, 59)) {
        return std::chrono::seconds{*h * 3600 + *m * 60 + *s};
      }
    }
  }
  return std::nullopt;
}

auto TriggerSpec::next_local(std::chrono::local_seconds from) const
    -> std::optional<std::chrono::local_seconds> {
  using namespace std::chrono;
  auto day = floor<days>(from);
  auto tod = from - day;
  const auto limit = day + days{366 * limits::kTriggerSearchYears};

  while (day <= limit) {
    const auto ymd = year_month_day{sys_days{day.time_since_epoch()}};
    const auto month_num = static_cast<unsigned>(ymd.month());
    if (!masks_.month.test(month_num)) {
      const auto first_of_next =
          year_month_day{ymd.year() / ymd.month() / 1} + months{1};
      day = local_days{sys_days{first_of_next}.time_since_epoch()};
      tod = 0s;
      continue;
    }
    if (day_matches(day)) {
      if (auto t = next_time_of_day(tod)) {
        return day + *t;
      }
    }
    day += days{1};
    tod = 0s;
  }
  return std::nullopt;
}

auto TriggerSpec::next_fire(TimePoint after) const -> std::optional<TimePoint> {
  const auto from = std::chrono::floor<std::chrono::seconds>(after) + 1s;
  auto local_from = to_local(from);

  for (;;) {
    auto candidate = next_local(local_from);
    if (!candidate)
      return std::nullopt;
    const auto instant = to_sys(*candidate);
    if (instant > after)
      return TimePoint{instant};
    // Local time mapped before `after` (DST fold or gap): keep scanning.
    local_from = *candidate + 1s;
  }
}

auto TriggerSpec::matches(TimePoint tp) const -> bool {
  const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
  if (TimePoint{secs} != tp)
    return false;
  auto next = next_fire(tp - 1s);
  return next && *next == tp;
}

auto TriggerSpec::count_fires(TimePoint from, TimePoint to,
                              std::size_t cap) const -> std::size_t {
  std::size_t count = 0;
  auto cursor = from;
  while (count < cap) {
    auto next = next_fire(cursor);
    if (!next || *next > to)
      break;
    ++count;
    cursor = *next;
  }
  return count;
}

auto TriggerSpec::last_fire_until(TimePoint from, TimePoint to) const
    -> std::optional<TimePoint> {
  std::optional<TimePoint> last;
  auto cursor = from;
  for (std::size_t i = 0; i < limits::kMissedFireCountCap; ++i) {
    auto next = next_fire(cursor);
    if (!next || *next > to)
      break;
    last = next;
    cursor = *next;
  }
  return last;
}

auto TriggerSpec::upcoming(TimePoint after, std::size_t count) const
    -> std::vector<TimePoint> {
  std::vector<TimePoint> out;
  out.reserve(count);
  auto cursor = after;
  while (out.size() < count) {
    auto next = next_fire(cursor);
    if (!next)
      break;
    out.push_back(*next);
    cursor = *next;
  }
  return out;
}

} // namespace cronhive
