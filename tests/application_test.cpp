#include "cronhive/app/application.hpp"
#include "cronhive/scheduler/scheduler_core.hpp"
#include "cronhive/storage/memory_job_store.hpp"
#include "cronhive/util/daemon.hpp"

#include "test_utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include "gtest/gtest.h"

using namespace cronhive;
using namespace std::chrono_literals;

namespace {

auto test_config() -> Config {
  Config cfg;
  cfg.service.log_level = "warn";
  cfg.scheduler.reload_interval = 1;
  cfg.scheduler.tick_interval_ms = 100;
  cfg.scheduler.max_workers = 2;
  cfg.scheduler.drain_timeout = 5;
  cfg.scheduler.shards = 2;
  cfg.database.pool_size = 1;
  return cfg;
}

auto memory_factory(storage::InMemoryJobStore **out = nullptr)
    -> storage::JobStoreService::StoreFactory {
  return [out](boost::asio::any_io_executor) {
    auto store = std::make_unique<storage::InMemoryJobStore>();
    if (out != nullptr) {
      *out = store.get();
    }
    return store;
  };
}

} // namespace

class ApplicationTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = test::make_temp_dir();
    ASSERT_FALSE(dir_.empty());
  }

  void TearDown() override {
    g_shutdown_requested = false;
    g_reload_requested = false;
    log::stop();
    log::set_level(log::Level::Warn);
    std::filesystem::remove_all(dir_);
  }

  auto touch_command(std::string_view name) const -> std::string {
    return std::format("touch {}/{}", dir_, name);
  }

  std::string dir_;
};

TEST_F(ApplicationTest, RunsStoredJobsUntilStopped) {
  Application app(test_config(), memory_factory());
  ASSERT_TRUE(app.init());
  ASSERT_TRUE(app.store().open());
  ASSERT_TRUE(app.store().save_job(
      test::make_job("marker", "* * * * * *", touch_command("ran"))));

  ASSERT_TRUE(app.start());
  EXPECT_TRUE(app.is_running());
  EXPECT_EQ(app.controller().active()->job_count(), 1u);
  EXPECT_FALSE(*app.store().pending_update_exists());

  EXPECT_TRUE(test::poll_until(
      [&] { return std::filesystem::exists(dir_ + "/ran"); }, 5s));

  app.stop();
  EXPECT_FALSE(app.is_running());
  EXPECT_EQ(app.controller().active()->state(), CoreState::Stopped);
}

TEST_F(ApplicationTest, ReloadLoopPicksUpNewJobs) {
  Application app(test_config(), memory_factory());
  ASSERT_TRUE(app.start());
  EXPECT_EQ(app.controller().active()->job_count(), 0u);

  ASSERT_TRUE(app.store().save_job(
      test::make_job("late", "* * * * * *", touch_command("late"))));
  EXPECT_TRUE(test::poll_until(
      [&] { return app.controller().active()->job_count() == 1; }, 5s));
  EXPECT_TRUE(test::poll_until(
      [&] { return std::filesystem::exists(dir_ + "/late"); }, 5s));
  app.stop();
}

TEST_F(ApplicationTest, ReloadSignalTriggersReload) {
  auto cfg = test_config();
  cfg.scheduler.reload_interval = 3600;
  Application app(std::move(cfg), memory_factory());
  ASSERT_TRUE(app.start());

  ASSERT_TRUE(app.store().save_job(test::make_job("a", "0 0 * * * *")));
  g_reload_requested = true;
  std::thread waiter([&] { app.wait_for_shutdown(); });

  EXPECT_TRUE(test::poll_until(
      [&] { return app.controller().active()->job_count() == 1; }, 5s));
  EXPECT_FALSE(g_reload_requested.load());

  g_shutdown_requested = true;
  waiter.join();
  app.stop();
}

TEST_F(ApplicationTest, StartFailsWhenStoreCannotOpen) {
  storage::InMemoryJobStore *memory = nullptr;
  Application app(test_config(), memory_factory(&memory));
  ASSERT_TRUE(app.init());
  ASSERT_NE(memory, nullptr);
  memory->set_unavailable(true);

  auto r = app.start();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::DatabaseOpenFailed));
  EXPECT_FALSE(app.is_running());
}

TEST_F(ApplicationTest, StartFailsOnInvalidStoredJob) {
  storage::InMemoryJobStore *memory = nullptr;
  Application app(test_config(), memory_factory(&memory));
  ASSERT_TRUE(app.init());
  ASSERT_TRUE(app.store().open());
  storage::JobRecord bad{.id = JobId("bad"),
                         .command = "true",
                         .fields = CronFields{.minute = "61"}};
  ASSERT_TRUE(app.store().sync_wait(memory->upsert_job(bad)));

  auto r = app.start();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidSchedule));
  EXPECT_FALSE(app.is_running());
}

TEST_F(ApplicationTest, InitDbOnlyOpensAndClosesStore) {
  Application app(test_config(), memory_factory());
  ASSERT_TRUE(app.init_db_only());
  EXPECT_FALSE(app.store().is_open());
}

TEST_F(ApplicationTest, LoadConfigReadsFile) {
  const auto path = dir_ + "/cronhive.toml";
  {
    std::ofstream out(path);
    out << "[scheduler]\nmax_workers = 3\n[service]\nlog_level = \"warn\"\n";
  }
  Application app;
  ASSERT_TRUE(app.load_config(path));
  EXPECT_EQ(app.config().scheduler.max_workers, 3);
  EXPECT_FALSE(app.load_config(dir_ + "/missing.toml"));
}
