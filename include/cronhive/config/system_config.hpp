#pragma once

#include "cronhive/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace cronhive {

/// What shutdown does with executions still running.
enum class DrainPolicy : std::uint8_t { Wait, Immediate };
BOOST_DESCRIBE_ENUM(DrainPolicy, Wait, Immediate)
CRONHIVE_DEFINE_ENUM_NAMES(DrainPolicy)

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"cronhive"};
  std::string password;
  std::string database{"cronhive"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5}; // seconds
  std::string table_prefix{"jm_"};

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct SchedulerConfig {
  std::string timezone{"UTC"};
  int max_workers{10};
  int max_instances{1};
  int misfire_grace_time{30}; // seconds
  bool coalesce{true};
  int reload_interval{10}; // seconds
  int tick_interval_ms{1000};
  DrainPolicy drain_policy{DrainPolicy::Wait};
  int drain_timeout{300}; // seconds
  int default_timeout{60}; // seconds
  int shards{0};          // 0 = auto

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct ServiceConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  bool syslog_sink{false};
  std::string syslog_level{"warn"};
  std::string syslog_logger_name{"cronhive"};

  auto operator==(const ServiceConfig &) const -> bool = default;
};

struct SystemConfig {
  DatabaseConfig database;
  SchedulerConfig scheduler;
  ServiceConfig service;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace cronhive
