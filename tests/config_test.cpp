#include "cronhive/config/config.hpp"
#include "cronhive/scheduler/events.hpp"

#include "test_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace cronhive;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
};

constexpr std::string_view kFullConfig = R"(
[database]
host = "db.internal"
port = 3307
username = "scheduler"
password = "secret"
database = "jobs"
pool_size = 8
connect_timeout = 3
table_prefix = "cron_"

[scheduler]
timezone = "UTC"
max_workers = 4
max_instances = 2
misfire_grace_time = 15
coalesce = false
reload_interval = 5
tick_interval_ms = 250
drain_policy = "immediate"
drain_timeout = 60
default_timeout = 120
shards = 2

[service]
log_level = "debug"
log_file = "/var/log/cronhive.log"
pid_file = "/run/cronhive.pid"
syslog_sink = true
syslog_level = "error"
syslog_logger_name = "cron"
)";

} // namespace

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
  auto cfg = ConfigLoader::load_from_string("");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(*cfg, SystemConfig{});
  EXPECT_EQ(cfg->database.table_prefix, "jm_");
  EXPECT_EQ(cfg->scheduler.max_workers, 10);
  EXPECT_EQ(cfg->scheduler.misfire_grace_time, 30);
  EXPECT_TRUE(cfg->scheduler.coalesce);
  EXPECT_EQ(cfg->scheduler.drain_policy, DrainPolicy::Wait);
}

TEST(ConfigTest, ParsesAllSections) {
  auto cfg = ConfigLoader::load_from_string(kFullConfig);
  ASSERT_TRUE(cfg.has_value());

  EXPECT_EQ(cfg->database.host, "db.internal");
  EXPECT_EQ(cfg->database.port, 3307);
  EXPECT_EQ(cfg->database.username, "scheduler");
  EXPECT_EQ(cfg->database.password, "secret");
  EXPECT_EQ(cfg->database.database, "jobs");
  EXPECT_EQ(cfg->database.pool_size, 8);
  EXPECT_EQ(cfg->database.connect_timeout, 3);
  EXPECT_EQ(cfg->database.table_prefix, "cron_");

  EXPECT_EQ(cfg->scheduler.max_workers, 4);
  EXPECT_EQ(cfg->scheduler.max_instances, 2);
  EXPECT_EQ(cfg->scheduler.misfire_grace_time, 15);
  EXPECT_FALSE(cfg->scheduler.coalesce);
  EXPECT_EQ(cfg->scheduler.reload_interval, 5);
  EXPECT_EQ(cfg->scheduler.tick_interval_ms, 250);
  EXPECT_EQ(cfg->scheduler.drain_policy, DrainPolicy::Immediate);
  EXPECT_EQ(cfg->scheduler.drain_timeout, 60);
  EXPECT_EQ(cfg->scheduler.default_timeout, 120);
  EXPECT_EQ(cfg->scheduler.shards, 2);

  EXPECT_EQ(cfg->service.log_level, "debug");
  EXPECT_EQ(cfg->service.log_file, "/var/log/cronhive.log");
  EXPECT_EQ(cfg->service.pid_file, "/run/cronhive.pid");
  EXPECT_TRUE(cfg->service.syslog_sink);
  EXPECT_EQ(cfg->service.syslog_level, "error");
  EXPECT_EQ(cfg->service.syslog_logger_name, "cron");
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto cfg = ConfigLoader::load_from_string(R"(
[scheduler]
max_workers = 3
future_option = "x"
)");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->scheduler.max_workers, 3);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv host("CRONHIVE_DB_HOST", "override.local");
  ScopedEnv workers("CRONHIVE_MAX_WORKERS", "32");
  ScopedEnv coalesce("CRONHIVE_COALESCE", "true");
  ScopedEnv drain("CRONHIVE_DRAIN_POLICY", "wait");

  auto cfg = ConfigLoader::load_from_string(kFullConfig);
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->database.host, "override.local");
  EXPECT_EQ(cfg->database.port, 3307);
  EXPECT_EQ(cfg->scheduler.max_workers, 32);
  EXPECT_TRUE(cfg->scheduler.coalesce);
  EXPECT_EQ(cfg->scheduler.drain_policy, DrainPolicy::Wait);
}

TEST(ConfigTest, MalformedEnvironmentValueIsParseError) {
  ScopedEnv port("CRONHIVE_DB_PORT", "not-a-port");
  auto cfg = ConfigLoader::load_from_string("");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsInvalidValues) {
  const std::vector<std::string> bad = {
      "[scheduler]\nmax_workers = 0\n",
      "[scheduler]\nmax_instances = -1\n",
      "[scheduler]\nmisfire_grace_time = -5\n",
      "[scheduler]\nreload_interval = 0\n",
      "[scheduler]\ndrain_policy = \"later\"\n",
      "[scheduler]\ntimezone = \"Atlantis/Capital\"\n",
      "[database]\npool_size = 0\n",
      "[database]\ntable_prefix = \"jm; DROP\"\n",
      "[service]\nlog_level = \"chatty\"\n",
      "[scheduler\nmax_workers = 1\n",
  };
  for (const auto &doc : bad) {
    auto cfg = ConfigLoader::load_from_string(doc);
    ASSERT_FALSE(cfg.has_value()) << doc;
    EXPECT_EQ(cfg.error(), make_error_code(Error::ParseError)) << doc;
  }
}

TEST(ConfigTest, LoadsFromFile) {
  const auto path = test::make_temp_path("cronhive_config_");
  ASSERT_FALSE(path.empty());
  {
    std::ofstream out(path);
    out << kFullConfig;
  }
  auto cfg = ConfigLoader::load_from_file(path);
  std::filesystem::remove(path);
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->scheduler.max_workers, 4);
}

TEST(ConfigTest, MissingFileIsFileNotFound) {
  auto cfg = ConfigLoader::load_from_file("/nonexistent/cronhive.toml");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), make_error_code(Error::FileNotFound));
}

TEST(EnumNamesTest, SnakeCaseNamesAndLenientParse) {
  EXPECT_EQ(to_string_view(EventKind::JobTimedOut), "job_timed_out");
  EXPECT_EQ(to_string_view(DrainPolicy::Immediate), "immediate");
  EXPECT_EQ(util::try_parse_enum<EventKind>("job-timed-out"),
            EventKind::JobTimedOut);
  EXPECT_EQ(util::try_parse_enum<DrainPolicy>("WAIT"), DrainPolicy::Wait);
  EXPECT_FALSE(util::try_parse_enum<DrainPolicy>("later").has_value());
}
