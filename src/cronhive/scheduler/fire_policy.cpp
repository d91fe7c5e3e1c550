#include "cronhive/scheduler/fire_policy.hpp"

#include "cronhive/core/constants.hpp"

namespace cronhive {

auto plan_fire(const TriggerSpec &trigger, FirePlan::TimePoint due,
               FirePlan::TimePoint now, const JobPolicy &policy) -> FirePlan {
  FirePlan plan;
  plan.scheduled_for = due;
  plan.next_fire_time = trigger.next_fire(now);

  if (now - due <= policy.misfire_grace_time) {
    return plan;
  }

  plan.misfire = true;
  plan.missed_fires =
      1 + trigger.count_fires(due, now, limits::kMissedFireCountCap);
  if (policy.coalesce && plan.missed_fires > 1) {
    plan.coalesced = true;
    plan.scheduled_for = trigger.last_fire_until(due, now).value_or(due);
  }
  return plan;
}

} // namespace cronhive
