#pragma once

#include "cronhive/core/error.hpp"
#include "cronhive/scheduler/cron.hpp"
#include "cronhive/util/id.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace cronhive {

namespace job_defaults {
inline constexpr std::chrono::seconds kTimeout{60};
inline constexpr std::chrono::seconds kMisfireGraceTime{30};
inline constexpr int kMaxInstances{1};
inline constexpr bool kCoalesce{true};
} // namespace job_defaults

/// Misfire and concurrency rules applied when a job becomes due.
struct JobPolicy {
  bool coalesce{job_defaults::kCoalesce};
  int max_instances{job_defaults::kMaxInstances};
  std::chrono::seconds misfire_grace_time{job_defaults::kMisfireGraceTime};

  [[nodiscard]] auto operator==(const JobPolicy &) const -> bool = default;
};

/// Per-job overrides; unset members fall back to the scheduler defaults.
struct JobPolicyOverrides {
  std::optional<bool> coalesce;
  std::optional<int> max_instances;
  std::optional<std::chrono::seconds> misfire_grace_time;

  [[nodiscard]] auto resolve(const JobPolicy &defaults) const -> JobPolicy {
    return {.coalesce = coalesce.value_or(defaults.coalesce),
            .max_instances = max_instances.value_or(defaults.max_instances),
            .misfire_grace_time =
                misfire_grace_time.value_or(defaults.misfire_grace_time)};
  }

  [[nodiscard]] auto operator==(const JobPolicyOverrides &) const
      -> bool = default;
};

/// A validated, immutable job. The only way to obtain one is through
/// Builder::build(), which compiles the trigger.
class JobDefinition {
public:
  struct Builder;
  [[nodiscard]] static auto builder() -> Builder;

  [[nodiscard]] auto id() const noexcept -> const JobId & { return id_; }
  [[nodiscard]] auto command() const noexcept -> const std::string & {
    return command_;
  }
  [[nodiscard]] auto fields() const noexcept -> const CronFields & {
    return trigger_.fields();
  }
  [[nodiscard]] auto trigger() const noexcept -> const TriggerSpec & {
    return trigger_;
  }
  [[nodiscard]] auto timeout() const noexcept -> std::chrono::seconds {
    return timeout_;
  }
  [[nodiscard]] auto overrides() const noexcept -> const JobPolicyOverrides & {
    return overrides_;
  }

  /// Same id, command, fields, timeout and overrides.
  [[nodiscard]] auto same_definition(const JobDefinition &other) const -> bool;

private:
  JobDefinition(JobId id, std::string command, TriggerSpec trigger,
                std::chrono::seconds timeout, JobPolicyOverrides overrides)
      : id_(std::move(id)), command_(std::move(command)),
        trigger_(std::move(trigger)), timeout_(timeout),
        overrides_(overrides) {}

  JobId id_;
  std::string command_;
  TriggerSpec trigger_;
  std::chrono::seconds timeout_;
  JobPolicyOverrides overrides_;
};

struct JobDefinition::Builder {
  std::string id_;
  std::string command_;
  CronFields fields_;
  std::string timezone_;
  std::chrono::seconds timeout_{job_defaults::kTimeout};
  JobPolicyOverrides overrides_;

  auto id(std::string value) -> Builder && {
    id_ = std::move(value);
    return std::move(*this);
  }

  auto command(std::string value) -> Builder && {
    command_ = std::move(value);
    return std::move(*this);
  }

  auto fields(CronFields value) -> Builder && {
    fields_ = std::move(value);
    return std::move(*this);
  }

  auto second(std::string value) -> Builder && {
    fields_.second = std::move(value);
    return std::move(*this);
  }

  auto minute(std::string value) -> Builder && {
    fields_.minute = std::move(value);
    return std::move(*this);
  }

  auto hour(std::string value) -> Builder && {
    fields_.hour = std::move(value);
    return std::move(*this);
  }

  auto day(std::string value) -> Builder && {
    fields_.day = std::move(value);
    return std::move(*this);
  }

  auto month(std::string value) -> Builder && {
    fields_.month = std::move(value);
    return std::move(*this);
  }

  auto day_of_week(std::string value) -> Builder && {
    fields_.day_of_week = std::move(value);
    return std::move(*this);
  }

  auto timezone(std::string value) -> Builder && {
    timezone_ = std::move(value);
    return std::move(*this);
  }

  auto timeout(std::chrono::seconds value) -> Builder && {
    timeout_ = value;
    return std::move(*this);
  }

  auto coalesce(std::optional<bool> value) -> Builder && {
    overrides_.coalesce = value;
    return std::move(*this);
  }

  auto max_instances(std::optional<int> value) -> Builder && {
    overrides_.max_instances = value;
    return std::move(*this);
  }

  auto misfire_grace_time(std::optional<std::chrono::seconds> value)
      -> Builder && {
    overrides_.misfire_grace_time = value;
    return std::move(*this);
  }

  /// InvalidArgument for a bad id, command, timeout or override;
  /// InvalidSchedule when the cron fields do not compile.
  [[nodiscard]] auto build() && -> Result<JobDefinition>;
};

inline auto JobDefinition::builder() -> Builder { return {}; }

} // namespace cronhive
