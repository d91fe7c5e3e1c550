#include "cronhive/cli/commands.hpp"
#include "cronhive/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("CRONHIVE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

// -c/--config, required unless CRONHIVE_CONFIG names a file.
auto add_config_option(CLI::App *cmd, std::string &target,
                       const std::string &env_config) -> void {
  target = env_config;
  auto *opt = cmd->add_option("-c,--config", target, "System config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty())
    opt->required();
}

auto add_job_edit_options(CLI::App *cmd,
                          cronhive::cli::JobEditOptions &opts) -> void {
  cmd->add_option("job_id", opts.job_id, "Job ID")->required();
  cmd->add_option("--command", opts.command, "Shell command to run");
  cmd->add_option("--cron", opts.cron,
                  "Cron expression: 6 fields, 5 fields or @daily style");
  cmd->add_option("--second", opts.second, "Second field");
  cmd->add_option("--minute", opts.minute, "Minute field");
  cmd->add_option("--hour", opts.hour, "Hour field");
  cmd->add_option("--day", opts.day, "Day-of-month field");
  cmd->add_option("--month", opts.month, "Month field");
  cmd->add_option("--day-of-week", opts.day_of_week, "Day-of-week field");
  cmd->add_option("--timeout", opts.timeout_sec, "Timeout in seconds");
  cmd->add_option("--coalesce", opts.coalesce,
                  "Collapse missed fires into one run (true|false)");
  cmd->add_option("--max-instances", opts.max_instances,
                  "Concurrent executions allowed")
      ->check(CLI::PositiveNumber);
  cmd->add_option("--misfire-grace-time", opts.misfire_grace_time,
                  "Seconds a late fire may still run")
      ->check(CLI::NonNegativeNumber);
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  cronhive::log::set_output_stderr();
  cronhive::log::set_level(cronhive::log::Level::Warn);

  CLI::App app{"cronhive", "Persistent cron-style job scheduler"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  cronhive serve start -c cronhive.toml\n"
             "  cronhive jobs add -c cronhive.toml backup --cron '0 30 2 * * *' "
             "--command '/usr/local/bin/backup.sh'\n"
             "\nTip: Set CRONHIVE_CONFIG=cronhive.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  auto *serve = app.add_subcommand("serve", "Service lifecycle operations");
  serve->require_subcommand(1);
  serve->footer("\nExamples:\n"
                "  cronhive serve start -c cronhive.toml\n"
                "  cronhive serve start -c cronhive.toml --daemon "
                "--log-file cronhive.log\n"
                "  cronhive serve status -c cronhive.toml\n"
                "  cronhive serve stop -c cronhive.toml");

  cronhive::cli::ServeStartOptions serve_start_opts;
  auto *serve_start = serve->add_subcommand("start", "Start the scheduler");
  add_config_option(serve_start, serve_start_opts.config_file, env_config);
  serve_start->add_option("--log-file", serve_start_opts.log_file,
                          "Log file path (required for --daemon)");
  serve_start->add_option("--log-level", serve_start_opts.log_level,
                          "Log level override: trace|debug|info|warn|error");
  serve_start->add_flag("-d,--daemon", serve_start_opts.daemon,
                        "Run as daemon");
  serve_start->add_option("--shards", serve_start_opts.shards,
                          "Number of shards (default: auto-detect CPU cores)");
  serve_start->callback([&serve_start_opts]() {
    std::exit(cronhive::cli::cmd_serve_start(serve_start_opts));
  });

  cronhive::cli::ServeStatusOptions serve_status_opts;
  auto *serve_status =
      serve->add_subcommand("status", "Show scheduler service status");
  add_config_option(serve_status, serve_status_opts.config_file, env_config);
  serve_status->add_flag("--json", serve_status_opts.json, "Output JSON");
  serve_status->callback([&serve_status_opts]() {
    std::exit(cronhive::cli::cmd_serve_status(serve_status_opts));
  });

  cronhive::cli::ServeStopOptions serve_stop_opts;
  auto *serve_stop = serve->add_subcommand("stop", "Stop the scheduler");
  add_config_option(serve_stop, serve_stop_opts.config_file, env_config);
  serve_stop->add_option("--timeout", serve_stop_opts.timeout_sec,
                         "Seconds to wait before failing or forcing stop");
  serve_stop->add_flag("--force", serve_stop_opts.force,
                       "Send SIGKILL if graceful stop times out");
  serve_stop->callback([&serve_stop_opts]() {
    std::exit(cronhive::cli::cmd_serve_stop(serve_stop_opts));
  });

  auto *jobs = app.add_subcommand("jobs", "Manage stored jobs");
  jobs->require_subcommand(1);
  jobs->footer(
      "\nExamples:\n"
      "  cronhive jobs list -c cronhive.toml\n"
      "  cronhive jobs add -c cronhive.toml ping --cron '*/5 * * * * *' "
      "--command 'echo ping'\n"
      "  cronhive jobs update -c cronhive.toml ping --timeout 10\n"
      "  cronhive jobs next -c cronhive.toml ping -n 10");

  cronhive::cli::JobsListOptions jobs_list_opts;
  auto *jobs_list = jobs->add_subcommand("list", "List all jobs");
  add_config_option(jobs_list, jobs_list_opts.config_file, env_config);
  jobs_list->add_flag("--json", jobs_list_opts.json, "Output JSON");
  jobs_list->callback([&jobs_list_opts]() {
    std::exit(cronhive::cli::cmd_jobs_list(jobs_list_opts));
  });

  cronhive::cli::JobGetOptions jobs_get_opts;
  auto *jobs_get = jobs->add_subcommand("get", "Show one job");
  add_config_option(jobs_get, jobs_get_opts.config_file, env_config);
  jobs_get->add_option("job_id", jobs_get_opts.job_id, "Job ID")->required();
  jobs_get->add_flag("--json", jobs_get_opts.json, "Output JSON");
  jobs_get->callback([&jobs_get_opts]() {
    std::exit(cronhive::cli::cmd_jobs_get(jobs_get_opts));
  });

  cronhive::cli::JobEditOptions jobs_add_opts;
  auto *jobs_add = jobs->add_subcommand("add", "Add a job");
  add_config_option(jobs_add, jobs_add_opts.config_file, env_config);
  add_job_edit_options(jobs_add, jobs_add_opts);
  jobs_add->callback([&jobs_add_opts]() {
    std::exit(cronhive::cli::cmd_jobs_add(jobs_add_opts));
  });

  cronhive::cli::JobEditOptions jobs_update_opts;
  auto *jobs_update = jobs->add_subcommand("update", "Change a job");
  add_config_option(jobs_update, jobs_update_opts.config_file, env_config);
  add_job_edit_options(jobs_update, jobs_update_opts);
  jobs_update->callback([&jobs_update_opts]() {
    std::exit(cronhive::cli::cmd_jobs_update(jobs_update_opts));
  });

  cronhive::cli::JobRemoveOptions jobs_remove_opts;
  auto *jobs_remove = jobs->add_subcommand("remove", "Delete a job");
  add_config_option(jobs_remove, jobs_remove_opts.config_file, env_config);
  jobs_remove->add_option("job_id", jobs_remove_opts.job_id, "Job ID")
      ->required();
  jobs_remove->callback([&jobs_remove_opts]() {
    std::exit(cronhive::cli::cmd_jobs_remove(jobs_remove_opts));
  });

  cronhive::cli::JobNextOptions jobs_next_opts;
  auto *jobs_next = jobs->add_subcommand("next", "Show upcoming fire times");
  add_config_option(jobs_next, jobs_next_opts.config_file, env_config);
  jobs_next->add_option("job_id", jobs_next_opts.job_id, "Job ID")
      ->required();
  jobs_next->add_option("-n,--count", jobs_next_opts.count,
                        "Number of fire times (default: 5)");
  jobs_next->callback([&jobs_next_opts]() {
    std::exit(cronhive::cli::cmd_jobs_next(jobs_next_opts));
  });

  auto *updates = app.add_subcommand("updates", "Inspect update markers");
  updates->require_subcommand(1);

  cronhive::cli::UpdatesListOptions updates_list_opts;
  auto *updates_list =
      updates->add_subcommand("list", "List update markers, newest first");
  add_config_option(updates_list, updates_list_opts.config_file, env_config);
  updates_list->add_option("--limit", updates_list_opts.limit,
                           "Max records to display (default: 20)");
  updates_list->add_flag("--json", updates_list_opts.json, "Output JSON");
  updates_list->callback([&updates_list_opts]() {
    std::exit(cronhive::cli::cmd_updates_list(updates_list_opts));
  });

  cronhive::cli::UpdatesMarkOptions updates_mark_opts;
  auto *updates_mark = updates->add_subcommand(
      "mark", "Mark all pending updates processed without reloading");
  add_config_option(updates_mark, updates_mark_opts.config_file, env_config);
  updates_mark->callback([&updates_mark_opts]() {
    std::exit(cronhive::cli::cmd_updates_mark(updates_mark_opts));
  });

  auto *cron = app.add_subcommand("cron", "Cron expression tools");
  cron->require_subcommand(1);

  cronhive::cli::CronCheckOptions cron_check_opts;
  auto *cron_check = cron->add_subcommand(
      "check", "Validate an expression and print its next fire times");
  cron_check->footer("\nExamples:\n"
                     "  cronhive cron check '0 0 9 * * mon-fri'\n"
                     "  cronhive cron check '@daily' --timezone Europe/Berlin");
  cron_check->add_option("expression", cron_check_opts.expression,
                         "Cron expression")
      ->required();
  cron_check->add_option("--timezone", cron_check_opts.timezone,
                         "IANA time zone (default: UTC)");
  cron_check->add_option("-n,--count", cron_check_opts.count,
                         "Number of fire times (default: 5)");
  cron_check->add_flag("--json", cron_check_opts.json, "Output JSON");
  cron_check->callback([&cron_check_opts]() {
    std::exit(cronhive::cli::cmd_cron_check(cron_check_opts));
  });

  auto *db = app.add_subcommand("db", "Database management");
  db->require_subcommand(1);

  cronhive::cli::DbOptions db_init_opts;
  auto *db_init = db->add_subcommand("init", "Create the database schema");
  add_config_option(db_init, db_init_opts.config_file, env_config);
  db_init->callback([&db_init_opts]() {
    std::exit(cronhive::cli::cmd_db_init(db_init_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
