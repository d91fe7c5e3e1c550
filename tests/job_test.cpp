#include "cronhive/scheduler/job.hpp"

#include "gtest/gtest.h"

using namespace cronhive;
using namespace std::chrono_literals;

namespace {

auto valid_builder() -> JobDefinition::Builder {
  return JobDefinition::builder()
      .id("backup")
      .command("tar czf /tmp/backup.tgz /etc")
      .second("0")
      .minute("30")
      .hour("2");
}

auto expect_error(Result<JobDefinition> job, Error expected) -> void {
  ASSERT_FALSE(job.has_value());
  EXPECT_EQ(job.error(), make_error_code(expected));
}

} // namespace

TEST(JobDefinitionTest, BuildsWithDefaults) {
  auto job = valid_builder().build();
  ASSERT_TRUE(job.has_value()) << job.error().message();
  EXPECT_EQ(job->id(), "backup");
  EXPECT_EQ(job->command(), "tar czf /tmp/backup.tgz /etc");
  EXPECT_EQ(job->fields().to_expression(), "0 30 2 * * *");
  EXPECT_EQ(job->timeout(), job_defaults::kTimeout);
  EXPECT_FALSE(job->overrides().coalesce.has_value());
  EXPECT_FALSE(job->overrides().max_instances.has_value());
  EXPECT_EQ(job->trigger().timezone_name(), "UTC");
}

TEST(JobDefinitionTest, OverridesResolveAgainstDefaults) {
  auto job = valid_builder().max_instances(3).coalesce(false).build();
  ASSERT_TRUE(job.has_value());

  JobPolicy defaults{.coalesce = true,
                     .max_instances = 1,
                     .misfire_grace_time = 45s};
  auto policy = job->overrides().resolve(defaults);
  EXPECT_FALSE(policy.coalesce);
  EXPECT_EQ(policy.max_instances, 3);
  EXPECT_EQ(policy.misfire_grace_time, 45s);
}

TEST(JobDefinitionTest, RejectsBadId) {
  expect_error(valid_builder().id("").build(), Error::InvalidArgument);
  expect_error(valid_builder().id("bad\nid").build(), Error::InvalidArgument);
}

TEST(JobDefinitionTest, RejectsBlankCommand) {
  expect_error(valid_builder().command("").build(), Error::InvalidArgument);
  expect_error(valid_builder().command("  \t ").build(), Error::InvalidArgument);
}

TEST(JobDefinitionTest, RejectsNonPositiveTimeout) {
  expect_error(valid_builder().timeout(0s).build(), Error::InvalidArgument);
  expect_error(valid_builder().timeout(-5s).build(), Error::InvalidArgument);
}

TEST(JobDefinitionTest, RejectsBadOverrides) {
  expect_error(valid_builder().max_instances(0).build(), Error::InvalidArgument);
  expect_error(valid_builder().misfire_grace_time(-1s).build(),
               Error::InvalidArgument);
  EXPECT_TRUE(valid_builder().misfire_grace_time(0s).build().has_value());
}

TEST(JobDefinitionTest, RejectsInvalidSchedule) {
  expect_error(valid_builder().hour("25").build(), Error::InvalidSchedule);
  expect_error(valid_builder().day("31").month("2").build(),
               Error::InvalidSchedule);
  expect_error(valid_builder().timezone("Nowhere/Special").build(),
               Error::InvalidSchedule);
}

TEST(JobDefinitionTest, SameDefinitionComparesEveryField) {
  auto a = valid_builder().build();
  auto b = valid_builder().build();
  auto c = valid_builder().command("true").build();
  auto d = valid_builder().timeout(10s).build();
  auto e = valid_builder().coalesce(false).build();
  ASSERT_TRUE(a && b && c && d && e);

  EXPECT_TRUE(a->same_definition(*b));
  EXPECT_FALSE(a->same_definition(*c));
  EXPECT_FALSE(a->same_definition(*d));
  EXPECT_FALSE(a->same_definition(*e));
}
