#include "cronhive/scheduler/job.hpp"

#include "cronhive/util/log.hpp"

namespace cronhive {

auto JobDefinition::Builder::build() && -> Result<JobDefinition> {
  if (!is_valid_id_text(id_)) {
    return fail(Error::InvalidArgument);
  }
  if (command_.find_first_not_of(" \t\r\n") == std::string::npos) {
    return fail(Error::InvalidArgument);
  }
  if (timeout_ <= std::chrono::seconds::zero()) {
    return fail(Error::InvalidArgument);
  }
  if (overrides_.max_instances && *overrides_.max_instances < 1) {
    return fail(Error::InvalidArgument);
  }
  if (overrides_.misfire_grace_time &&
      *overrides_.misfire_grace_time < std::chrono::seconds::zero()) {
    return fail(Error::InvalidArgument);
  }

  auto trigger = TriggerSpec::parse(fields_, timezone_);
  if (!trigger) {
    log::debug("Job '{}' has an invalid schedule '{}'", id_,
               fields_.to_expression());
    return fail(trigger.error());
  }

  return JobDefinition(JobId{std::move(id_)}, std::move(command_),
                       std::move(*trigger), timeout_, overrides_);
}

auto JobDefinition::same_definition(const JobDefinition &other) const -> bool {
  return id_ == other.id_ && command_ == other.command_ &&
         fields() == other.fields() && timeout_ == other.timeout_ &&
         overrides_ == other.overrides_ &&
         trigger_.timezone_name() == other.trigger_.timezone_name();
}

} // namespace cronhive
