#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace cronhive::cli {
struct ServeStartOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  bool daemon{false};
  std::optional<int> shards;
};

struct ServeStopOptions {
  std::string config_file;
  int timeout_sec{10};
  bool force{false};
};

struct ServeStatusOptions {
  std::string config_file;
  bool json{false};
};

struct JobsListOptions {
  std::string config_file;
  bool json{false};
};

struct JobGetOptions {
  std::string config_file;
  std::string job_id;
  bool json{false};
};

// Shared by `jobs add` and `jobs update`. Unset fields keep the stored value
// on update and take the defaults on add.
struct JobEditOptions {
  std::string config_file;
  std::string job_id;
  std::optional<std::string> command;
  std::optional<std::string> cron; // "s m h dom mon dow" shorthand
  std::optional<std::string> second;
  std::optional<std::string> minute;
  std::optional<std::string> hour;
  std::optional<std::string> day;
  std::optional<std::string> month;
  std::optional<std::string> day_of_week;
  std::optional<int> timeout_sec;
  std::optional<bool> coalesce;
  std::optional<int> max_instances;
  std::optional<int> misfire_grace_time;
};

struct JobRemoveOptions {
  std::string config_file;
  std::string job_id;
};

struct JobNextOptions {
  std::string config_file;
  std::string job_id;
  std::size_t count{5};
};

struct UpdatesListOptions {
  std::string config_file;
  std::size_t limit{20};
  bool json{false};
};

struct UpdatesMarkOptions {
  std::string config_file;
};

struct CronCheckOptions {
  std::string expression;
  std::string timezone{"UTC"};
  std::size_t count{5};
  bool json{false};
};

struct DbOptions {
  std::string config_file;
};

[[nodiscard]] auto cmd_serve_start(const ServeStartOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_stop(const ServeStopOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_status(const ServeStatusOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_list(const JobsListOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_get(const JobGetOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_add(const JobEditOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_update(const JobEditOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_remove(const JobRemoveOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_next(const JobNextOptions &opts) -> int;
[[nodiscard]] auto cmd_updates_list(const UpdatesListOptions &opts) -> int;
[[nodiscard]] auto cmd_updates_mark(const UpdatesMarkOptions &opts) -> int;
[[nodiscard]] auto cmd_cron_check(const CronCheckOptions &opts) -> int;
[[nodiscard]] auto cmd_db_init(const DbOptions &opts) -> int;

} // namespace cronhive::cli
