#include "cronhive/storage/store_service.hpp"

#include "test_utils.hpp"

#include <cstdlib>
#include <format>
#include <memory>
#include <string>

#include "gtest/gtest.h"

using namespace cronhive;
using namespace cronhive::storage;

// Runs against a real server only when CRONHIVE_TEST_MYSQL_HOST is set.
// CRONHIVE_TEST_MYSQL_{PORT,USER,PASSWORD,DATABASE} override the defaults.
class MySQLJobStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    const char *host = std::getenv("CRONHIVE_TEST_MYSQL_HOST");
    if (host == nullptr || *host == '\0') {
      GTEST_SKIP() << "CRONHIVE_TEST_MYSQL_HOST not set";
    }
    DatabaseConfig cfg;
    cfg.host = host;
    if (const char *v = std::getenv("CRONHIVE_TEST_MYSQL_PORT")) {
      cfg.port = static_cast<uint16_t>(std::atoi(v));
    }
    if (const char *v = std::getenv("CRONHIVE_TEST_MYSQL_USER")) {
      cfg.username = v;
    }
    if (const char *v = std::getenv("CRONHIVE_TEST_MYSQL_PASSWORD")) {
      cfg.password = v;
    }
    if (const char *v = std::getenv("CRONHIVE_TEST_MYSQL_DATABASE")) {
      cfg.database = v;
    }
    cfg.pool_size = 2;
    cfg.table_prefix = std::format("t{}_", ::getpid());

    service_ = std::make_unique<JobStoreService>(cfg, 1);
    ASSERT_TRUE(service_->open());
  }

  void TearDown() override {
    if (service_) {
      if (auto jobs = service_->list_jobs()) {
        for (const auto &job : *jobs) {
          (void)service_->remove_job(job.id);
        }
      }
      (void)service_->mark_updates_processed();
      service_->close();
    }
  }

  std::unique_ptr<JobStoreService> service_;
};

TEST_F(MySQLJobStoreTest, JobRoundTripsThroughTable) {
  auto def = *JobDefinition::builder()
                  .id("mysql_job")
                  .command("echo from mysql")
                  .second("*/10")
                  .hour("1-5")
                  .day_of_week("mon")
                  .timeout(std::chrono::seconds(42))
                  .max_instances(3)
                  .coalesce(false)
                  .build();
  auto marker = service_->save_job(def);
  ASSERT_TRUE(marker.has_value()) << marker.error().message();

  auto rec = service_->get_job(JobId("mysql_job"));
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->command, "echo from mysql");
  EXPECT_EQ(rec->fields, def.fields());
  EXPECT_EQ(rec->timeout, 42);
  EXPECT_EQ(rec->max_instances, 3);
  EXPECT_EQ(rec->coalesce, false);
  EXPECT_FALSE(rec->misfire_grace_time.has_value());

  auto snapshot = service_->load_snapshot("UTC");
  ASSERT_TRUE(snapshot.has_value());
  ASSERT_EQ(snapshot->size(), 1u);
  EXPECT_TRUE(snapshot->front().same_definition(def));
}

TEST_F(MySQLJobStoreTest, MarkersTrackPendingChanges) {
  (void)service_->mark_updates_processed();
  EXPECT_FALSE(*service_->pending_update_exists());

  auto first = service_->save_job(test::make_job("a", "* * * * * *"));
  auto second = service_->save_job(test::make_job("b", "* * * * * *"));
  ASSERT_TRUE(first && second);
  EXPECT_LT(*first, *second);
  EXPECT_EQ(*service_->latest_pending_update(), *second);

  EXPECT_EQ(*service_->mark_updates_processed(*first), 1u);
  EXPECT_TRUE(*service_->pending_update_exists());
  EXPECT_EQ(*service_->mark_updates_processed(), 1u);
  EXPECT_FALSE(*service_->pending_update_exists());

  auto updates = service_->list_updates(2);
  ASSERT_TRUE(updates.has_value());
  ASSERT_EQ(updates->size(), 2u);
  EXPECT_EQ(updates->front().id, *second);
  EXPECT_TRUE(updates->front().updated);
}

TEST_F(MySQLJobStoreTest, DeletingUnknownJobIsNotFound) {
  auto r = service_->remove_job(JobId("does_not_exist"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}
