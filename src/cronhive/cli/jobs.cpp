#include "cronhive/cli/commands.hpp"
#include "cronhive/cli/formatting.hpp"
#include "cronhive/cli/store_client.hpp"
#include "cronhive/scheduler/cron.hpp"
#include "cronhive/scheduler/job.hpp"

#include <algorithm>
#include <chrono>
#include <print>

namespace cronhive::cli {
namespace {

auto apply_edits(storage::JobRecord &rec, const JobEditOptions &opts,
                 std::string_view timezone) -> Result<void> {
  if (opts.command) {
    rec.command = *opts.command;
  }
  if (opts.cron) {
    auto parsed = TriggerSpec::parse(*opts.cron, timezone);
    if (!parsed) {
      return fail(parsed.error());
    }
    rec.fields = parsed->fields();
  }
  auto set = [](std::string &field, const std::optional<std::string> &value) {
    if (value) {
      field = *value;
    }
  };
  set(rec.fields.second, opts.second);
  set(rec.fields.minute, opts.minute);
  set(rec.fields.hour, opts.hour);
  set(rec.fields.day, opts.day);
  set(rec.fields.month, opts.month);
  set(rec.fields.day_of_week, opts.day_of_week);

  if (opts.timeout_sec) {
    rec.timeout = *opts.timeout_sec;
  }
  if (opts.coalesce) {
    rec.coalesce = opts.coalesce;
  }
  if (opts.max_instances) {
    rec.max_instances = opts.max_instances;
  }
  if (opts.misfire_grace_time) {
    rec.misfire_grace_time = *opts.misfire_grace_time;
  }
  return ok();
}

auto save(StoreClient &client, const storage::JobRecord &rec,
          std::string_view verb) -> int {
  const auto &tz = client.config().scheduler.timezone;
  auto def = rec.to_definition(tz);
  if (!def) {
    std::println(stderr, "Error: Job '{}' is invalid: {}", rec.id,
                 def.error().message());
    return 1;
  }
  auto marker = client.store().save_job(*def);
  if (!marker) {
    std::println(stderr, "Error: {}", marker.error().message());
    return 1;
  }
  std::println("Job '{}' {} (update #{}).", rec.id, verb, *marker);
  if (auto next = def->trigger().next_fire(std::chrono::system_clock::now())) {
    std::println("  next fire: {}", fmt::format_timestamp(*next));
  }
  return 0;
}

} // namespace

auto cmd_jobs_list(const JobsListOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  auto jobs = client->store().list_jobs();
  if (!jobs) {
    std::println(stderr, "Error: {}", jobs.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", storage::records_to_json(*jobs));
    return 0;
  }
  if (jobs->empty()) {
    std::println("No jobs.");
    return 0;
  }

  const auto &tz = client->config().scheduler.timezone;
  const auto now = std::chrono::system_clock::now();
  fmt::Table table({{"ID", 24},
                    {"SCHEDULE", 28},
                    {"TIMEOUT", 8, true},
                    {"NEXT FIRE", 23},
                    {"COMMAND", 0}});
  table.print_header();
  for (const auto &rec : *jobs) {
    std::string next = fmt::ansi::red("invalid");
    if (auto def = rec.to_definition(tz)) {
      next = fmt::format_optional(def->trigger().next_fire(now).transform(
          [](auto tp) { return fmt::format_timestamp(tp); }));
    }
    table.print_row({rec.id.str(), rec.fields.to_expression(),
                     std::format("{}s", rec.timeout), next, rec.command});
  }
  return 0;
}

auto cmd_jobs_get(const JobGetOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  auto rec = client->store().get_job(JobId{opts.job_id});
  if (!rec) {
    std::println(stderr, "Error: Job '{}': {}", opts.job_id,
                 rec.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", storage::records_to_json({*rec}));
    return 0;
  }
  std::println("{}", fmt::ansi::bold(rec->id.str()));
  std::println("  command:            {}", rec->command);
  std::println("  schedule:           {}", rec->fields.to_expression());
  std::println("  timeout:            {}s", rec->timeout);
  std::println("  coalesce:           {}", fmt::format_optional(rec->coalesce));
  std::println("  max_instances:      {}",
               fmt::format_optional(rec->max_instances));
  std::println("  misfire_grace_time: {}",
               fmt::format_optional(rec->misfire_grace_time));
  std::println("  created:            {}",
               fmt::format_timestamp(rec->created_at));
  std::println("  updated:            {}",
               fmt::format_timestamp(rec->updated_at));
  if (auto def = rec->to_definition(client->config().scheduler.timezone);
      !def) {
    std::println("  {}: {}", fmt::ansi::red("invalid"), def.error().message());
  }
  return 0;
}

auto cmd_jobs_add(const JobEditOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  if (client->store().get_job(JobId{opts.job_id})) {
    std::println(stderr, "Error: Job '{}' already exists; use `jobs update`.",
                 opts.job_id);
    return 1;
  }
  if (!opts.command) {
    std::println(stderr, "Error: --command is required for a new job");
    return 1;
  }

  storage::JobRecord rec{.id = JobId{opts.job_id},
                         .timeout = client->config().scheduler.default_timeout};
  if (auto r = apply_edits(rec, opts, client->config().scheduler.timezone);
      !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  return save(*client, rec, "added");
}

auto cmd_jobs_update(const JobEditOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  auto rec = client->store().get_job(JobId{opts.job_id});
  if (!rec) {
    std::println(stderr, "Error: Job '{}': {}", opts.job_id,
                 rec.error().message());
    return 1;
  }
  if (auto r = apply_edits(*rec, opts, client->config().scheduler.timezone);
      !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  return save(*client, *rec, "updated");
}

auto cmd_jobs_remove(const JobRemoveOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  auto marker = client->store().remove_job(JobId{opts.job_id});
  if (!marker) {
    std::println(stderr, "Error: Job '{}': {}", opts.job_id,
                 marker.error().message());
    return 1;
  }
  std::println("Job '{}' removed (update #{}).", opts.job_id, *marker);
  return 0;
}

auto cmd_jobs_next(const JobNextOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  const auto &tz = client->config().scheduler.timezone;
  auto def = client->store().get_job(JobId{opts.job_id}).and_then(
      [&](const storage::JobRecord &rec) { return rec.to_definition(tz); });
  if (!def) {
    std::println(stderr, "Error: Job '{}': {}", opts.job_id,
                 def.error().message());
    return 1;
  }
  auto zone = resolve_timezone(tz);
  if (!zone) {
    std::println(stderr, "Error: {}", zone.error().message());
    return 1;
  }

  const auto fires = def->trigger().upcoming(std::chrono::system_clock::now(),
                                             std::max<std::size_t>(1, opts.count));
  if (fires.empty()) {
    std::println("Job '{}' never fires again.", opts.job_id);
    return 0;
  }
  for (const auto &tp : fires) {
    std::println("{}", fmt::format_fire_time(tp, *zone));
  }
  return 0;
}

} // namespace cronhive::cli
