#include "cronhive/storage/job_store.hpp"

#include "cronhive/util/json.hpp"
#include "cronhive/util/log.hpp"
#include "cronhive/util/time.hpp"

namespace cronhive::storage::dto {

struct JobJson {
  std::string id;
  std::string command;
  std::string second;
  std::string minute;
  std::string hour;
  std::string day;
  std::string month;
  std::string day_of_week;
  std::int64_t timeout{0};
  std::optional<bool> coalesce;
  std::optional<int> max_instances;
  std::optional<std::int64_t> misfire_grace_time;
  std::string updated_at;
};

} // namespace cronhive::storage::dto

namespace glz {
template <> struct meta<cronhive::storage::dto::JobJson> {
  using T = cronhive::storage::dto::JobJson;
  static constexpr auto value = object(
      "id", &T::id, "command", &T::command, "second", &T::second, "minute",
      &T::minute, "hour", &T::hour, "day", &T::day, "month", &T::month,
      "day_of_week", &T::day_of_week, "timeout", &T::timeout, "coalesce",
      &T::coalesce, "max_instances", &T::max_instances, "misfire_grace_time",
      &T::misfire_grace_time, "updated_at", &T::updated_at);
};
} // namespace glz

namespace cronhive::storage {

auto JobRecord::from_definition(const JobDefinition &def) -> JobRecord {
  const auto &o = def.overrides();
  JobRecord rec{.id = def.id(),
                .command = def.command(),
                .fields = def.fields(),
                .timeout = def.timeout().count(),
                .coalesce = o.coalesce,
                .max_instances = o.max_instances};
  if (o.misfire_grace_time) {
    rec.misfire_grace_time = o.misfire_grace_time->count();
  }
  return rec;
}

auto JobRecord::to_definition(std::string_view timezone) const
    -> Result<JobDefinition> {
  std::optional<std::chrono::seconds> grace;
  if (misfire_grace_time) {
    grace = std::chrono::seconds(*misfire_grace_time);
  }
  return JobDefinition::builder()
      .id(id.str())
      .command(command)
      .fields(fields)
      .timezone(std::string(timezone))
      .timeout(std::chrono::seconds(timeout))
      .coalesce(coalesce)
      .max_instances(max_instances)
      .misfire_grace_time(grace)
      .build();
}

auto to_definitions(const std::vector<JobRecord> &records,
                    std::string_view timezone)
    -> Result<std::vector<JobDefinition>> {
  std::vector<JobDefinition> out;
  out.reserve(records.size());
  for (const auto &rec : records) {
    auto def = rec.to_definition(timezone);
    if (!def) {
      log::error("Job '{}' is invalid: {}", rec.id, def.error().message());
      return fail(def.error());
    }
    out.push_back(std::move(*def));
  }
  return ok(std::move(out));
}

auto records_to_json(const std::vector<JobRecord> &records) -> std::string {
  std::vector<dto::JobJson> rows;
  rows.reserve(records.size());
  for (const auto &rec : records) {
    rows.push_back(dto::JobJson{
        .id = rec.id.str(),
        .command = rec.command,
        .second = rec.fields.second,
        .minute = rec.fields.minute,
        .hour = rec.fields.hour,
        .day = rec.fields.day,
        .month = rec.fields.month,
        .day_of_week = rec.fields.day_of_week,
        .timeout = rec.timeout,
        .coalesce = rec.coalesce,
        .max_instances = rec.max_instances,
        .misfire_grace_time = rec.misfire_grace_time,
        .updated_at = util::format_iso8601(rec.updated_at)});
  }
  return dump_json(rows);
}

} // namespace cronhive::storage
