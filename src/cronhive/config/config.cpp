#include "cronhive/config/config.hpp"
#include "cronhive/config/toml_util.hpp"

#include "cronhive/core/error.hpp"
#include "cronhive/scheduler/cron.hpp"
#include "cronhive/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace cronhive {
namespace detail {

struct DatabaseToml {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"cronhive"};
  std::string password;
  std::string database{"cronhive"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5};
  std::string table_prefix{"jm_"};
};

struct SchedulerToml {
  std::string timezone{"UTC"};
  int max_workers{10};
  int max_instances{1};
  int misfire_grace_time{30};
  bool coalesce{true};
  int reload_interval{10};
  int tick_interval_ms{1000};
  std::string drain_policy{"wait"};
  int drain_timeout{300};
  int default_timeout{60};
  int shards{0};
};

struct ServiceToml {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  bool syslog_sink{false};
  std::string syslog_level{"warn"};
  std::string syslog_logger_name{"cronhive"};
};

struct SystemToml {
  DatabaseToml database{};
  SchedulerToml scheduler{};
  ServiceToml service{};
};

} // namespace detail
} // namespace cronhive

namespace glz {
template <> struct meta<cronhive::detail::DatabaseToml> {
  using T = cronhive::detail::DatabaseToml;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout,
             "table_prefix", &T::table_prefix);
};

template <> struct meta<cronhive::detail::SchedulerToml> {
  using T = cronhive::detail::SchedulerToml;
  static constexpr auto value = object(
      "timezone", &T::timezone, "max_workers", &T::max_workers,
      "max_instances", &T::max_instances, "misfire_grace_time",
      &T::misfire_grace_time, "coalesce", &T::coalesce, "reload_interval",
      &T::reload_interval, "tick_interval_ms", &T::tick_interval_ms,
      "drain_policy", &T::drain_policy, "drain_timeout", &T::drain_timeout,
      "default_timeout", &T::default_timeout, "shards", &T::shards);
};

template <> struct meta<cronhive::detail::ServiceToml> {
  using T = cronhive::detail::ServiceToml;
  static constexpr auto value =
      object("log_level", &T::log_level, "log_file", &T::log_file, "pid_file",
             &T::pid_file, "syslog_sink", &T::syslog_sink, "syslog_level",
             &T::syslog_level, "syslog_logger_name", &T::syslog_logger_name);
};

template <> struct meta<cronhive::detail::SystemToml> {
  using T = cronhive::detail::SystemToml;
  static constexpr auto value =
      object("database", &T::database, "scheduler", &T::scheduler, "service",
             &T::service);
};
} // namespace glz

namespace cronhive {
namespace {

[[nodiscard]] auto env(const char *name) -> std::optional<std::string_view> {
  if (const char *v = std::getenv(name); v != nullptr) {
    return std::string_view{v};
  }
  return std::nullopt;
}

template <typename T> auto override_from_env(const char *name, T &field) -> void {
  if (auto v = env(name)) {
    field = boost::lexical_cast<T>(*v);
  }
}

auto override_from_env(const char *name, std::string &field) -> void {
  if (auto v = env(name)) {
    field = std::string(*v);
  }
}

auto override_from_env(const char *name, bool &field) -> void {
  if (auto v = env(name)) {
    field = (*v == "1" || *v == "true" || *v == "yes");
  }
}

auto apply_env_overrides(detail::SystemToml &raw) -> void {
  override_from_env("CRONHIVE_DB_HOST", raw.database.host);
  override_from_env("CRONHIVE_DB_PORT", raw.database.port);
  override_from_env("CRONHIVE_DB_USERNAME", raw.database.username);
  override_from_env("CRONHIVE_DB_PASSWORD", raw.database.password);
  override_from_env("CRONHIVE_DB_DATABASE", raw.database.database);
  override_from_env("CRONHIVE_DB_POOL_SIZE", raw.database.pool_size);
  override_from_env("CRONHIVE_DB_CONNECT_TIMEOUT",
                    raw.database.connect_timeout);
  override_from_env("CRONHIVE_DB_TABLE_PREFIX", raw.database.table_prefix);

  override_from_env("CRONHIVE_TIMEZONE", raw.scheduler.timezone);
  override_from_env("CRONHIVE_MAX_WORKERS", raw.scheduler.max_workers);
  override_from_env("CRONHIVE_MAX_INSTANCES", raw.scheduler.max_instances);
  override_from_env("CRONHIVE_MISFIRE_GRACE_TIME",
                    raw.scheduler.misfire_grace_time);
  override_from_env("CRONHIVE_COALESCE", raw.scheduler.coalesce);
  override_from_env("CRONHIVE_RELOAD_INTERVAL", raw.scheduler.reload_interval);
  override_from_env("CRONHIVE_DRAIN_POLICY", raw.scheduler.drain_policy);
  override_from_env("CRONHIVE_SCHEDULER_SHARDS", raw.scheduler.shards);

  override_from_env("CRONHIVE_LOG_LEVEL", raw.service.log_level);
  override_from_env("CRONHIVE_LOG_FILE", raw.service.log_file);
  override_from_env("CRONHIVE_SYSLOG_SINK", raw.service.syslog_sink);
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;
  apply_env_overrides(raw);

  auto drain = util::try_parse_enum<DrainPolicy>(raw.scheduler.drain_policy);
  if (!drain) {
    log::error("Unknown drain_policy '{}'", raw.scheduler.drain_policy);
    return fail(Error::ParseError);
  }

  SystemConfig cfg{};
  cfg.database.host = std::move(raw.database.host);
  cfg.database.port = raw.database.port;
  cfg.database.username = std::move(raw.database.username);
  cfg.database.password = std::move(raw.database.password);
  cfg.database.database = std::move(raw.database.database);
  cfg.database.pool_size = raw.database.pool_size;
  cfg.database.connect_timeout = raw.database.connect_timeout;
  cfg.database.table_prefix = std::move(raw.database.table_prefix);

  cfg.scheduler.timezone = std::move(raw.scheduler.timezone);
  cfg.scheduler.max_workers = raw.scheduler.max_workers;
  cfg.scheduler.max_instances = raw.scheduler.max_instances;
  cfg.scheduler.misfire_grace_time = raw.scheduler.misfire_grace_time;
  cfg.scheduler.coalesce = raw.scheduler.coalesce;
  cfg.scheduler.reload_interval = raw.scheduler.reload_interval;
  cfg.scheduler.tick_interval_ms = raw.scheduler.tick_interval_ms;
  cfg.scheduler.drain_policy = *drain;
  cfg.scheduler.drain_timeout = raw.scheduler.drain_timeout;
  cfg.scheduler.default_timeout = raw.scheduler.default_timeout;
  cfg.scheduler.shards = raw.scheduler.shards;

  cfg.service.log_level = std::move(raw.service.log_level);
  cfg.service.log_file = std::move(raw.service.log_file);
  cfg.service.pid_file = std::move(raw.service.pid_file);
  cfg.service.syslog_sink = raw.service.syslog_sink;
  cfg.service.syslog_level = std::move(raw.service.syslog_level);
  cfg.service.syslog_logger_name = std::move(raw.service.syslog_logger_name);

  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

[[nodiscard]] auto is_identifier_safe(std::string_view s) -> bool {
  return std::ranges::all_of(s, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &cfg) -> Result<void> {
  const auto &s = cfg.scheduler;
  auto reject = [](std::string_view what) -> Result<void> {
    log::error("Invalid configuration: {}", what);
    return fail(Error::ParseError);
  };

  if (s.max_workers <= 0)
    return reject("scheduler.max_workers must be positive");
  if (s.max_instances <= 0)
    return reject("scheduler.max_instances must be positive");
  if (s.misfire_grace_time < 0)
    return reject("scheduler.misfire_grace_time must not be negative");
  if (s.reload_interval <= 0)
    return reject("scheduler.reload_interval must be positive");
  if (s.tick_interval_ms <= 0)
    return reject("scheduler.tick_interval_ms must be positive");
  if (s.drain_timeout <= 0)
    return reject("scheduler.drain_timeout must be positive");
  if (s.default_timeout <= 0)
    return reject("scheduler.default_timeout must be positive");
  if (s.shards < 0)
    return reject("scheduler.shards must not be negative");
  if (!resolve_timezone(s.timezone))
    return reject("scheduler.timezone is not a known time zone");
  if (cfg.database.pool_size == 0)
    return reject("database.pool_size must be positive");
  if (!is_identifier_safe(cfg.database.table_prefix))
    return reject("database.table_prefix may only hold [A-Za-z0-9_]");
  if (!log::parse_level(cfg.service.log_level))
    return reject("service.log_level is not a log level");
  if (!log::parse_level(cfg.service.syslog_level))
    return reject("service.syslog_level is not a log level");
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace cronhive
