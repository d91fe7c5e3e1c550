#include "cronhive/cli/commands.hpp"
#include "cronhive/cli/formatting.hpp"
#include "cronhive/scheduler/cron.hpp"
#include "cronhive/util/json.hpp"
#include "cronhive/util/time.hpp"

#include <algorithm>
#include <chrono>
#include <print>

namespace cronhive::cli {
namespace {

struct CronCheckJson {
  bool valid{false};
  std::string expression;
  std::string timezone;
  std::string error;
  std::vector<std::string> upcoming;
};

} // namespace

auto cmd_cron_check(const CronCheckOptions &opts) -> int {
  CronCheckJson out{.expression = opts.expression, .timezone = opts.timezone};

  auto zone = resolve_timezone(opts.timezone);
  auto trigger = zone.and_then(
      [&](auto) { return TriggerSpec::parse(opts.expression, opts.timezone); });
  if (!trigger) {
    out.error = trigger.error().message();
    if (opts.json) {
      std::println("{}", dump_json(out));
    } else {
      std::println(stderr, "Error: '{}': {}", opts.expression, out.error);
    }
    return 1;
  }

  out.valid = true;
  out.expression = trigger->fields().to_expression();
  const auto fires = trigger->upcoming(std::chrono::system_clock::now(),
                                       std::max<std::size_t>(1, opts.count));
  for (const auto &tp : fires) {
    out.upcoming.push_back(util::format_iso8601(tp));
  }

  if (opts.json) {
    std::println("{}", dump_json(out));
    return 0;
  }
  std::println("{} {} ({})", fmt::ansi::green("valid"), out.expression,
               trigger->timezone_name());
  if (fires.empty()) {
    std::println("  never fires");
  }
  for (const auto &tp : fires) {
    std::println("  {}", fmt::format_fire_time(tp, *zone));
  }
  return 0;
}

} // namespace cronhive::cli
