#include "cronhive/app/application.hpp"

#include "cronhive/core/constants.hpp"
#include "cronhive/scheduler/events.hpp"
#include "cronhive/scheduler/scheduler_core.hpp"
#include "cronhive/storage/syslog_sink.hpp"
#include "cronhive/util/daemon.hpp"
#include "cronhive/util/log.hpp"

#include <algorithm>
#include <thread>

namespace cronhive {

Application::Application() = default;

Application::Application(Config config) : config_(std::move(config)) {}

Application::Application(Config config,
                         storage::JobStoreService::StoreFactory store)
    : config_(std::move(config)), store_factory_(std::move(store)) {}

Application::~Application() { stop(); }

auto Application::load_config(std::string_view path) -> Result<void> {
  return ConfigLoader::load_from_file(path).transform(
      [this](Config cfg) { config_ = std::move(cfg); });
}

auto Application::init() -> Result<void> {
  if (runtime_) {
    return ok();
  }

  const auto &svc = config_.service;
  log::set_level(svc.log_level);
  if (!svc.log_file.empty() && !log::set_output_file(svc.log_file)) {
    log::error("Cannot open log file {}", svc.log_file);
    return fail(Error::FileOpenFailed);
  }

  runtime_ = std::make_unique<Runtime>(
      static_cast<unsigned>(config_.scheduler.shards));
  executor_ = create_shell_executor(*runtime_);

  const auto threads = std::max<std::size_t>(1, config_.database.pool_size);
  if (store_factory_) {
    store_ = std::make_unique<storage::JobStoreService>(
        std::move(store_factory_), threads);
  } else {
    store_ = std::make_unique<storage::JobStoreService>(config_.database,
                                                        threads);
  }

  controller_ = std::make_unique<ReloadController>(
      *store_, make_core_factory(), ReloadOptions::from_config(config_.scheduler),
      default_event_sink());
  return ok();
}

auto Application::make_core_factory() -> ReloadController::CoreFactory {
  auto options = SchedulerOptions::from_config(config_.scheduler);
  return [this, options](std::vector<JobDefinition> snapshot,
                         std::optional<std::chrono::system_clock::time_point>
                             baseline) {
    return SchedulerCore::build(std::move(snapshot), options, *runtime_,
                                *executor_, default_event_sink(), baseline);
  };
}

auto Application::init_db_only() -> Result<void> {
  if (auto r = init(); !r) {
    return r;
  }
  if (auto r = store_->open(); !r) {
    log::error("Failed to open job store: {}", r.error().message());
    return r;
  }
  store_->close();
  log::info("Database schema is ready");
  return ok();
}

auto Application::start() -> Result<void> {
  if (auto r = init(); !r) {
    return r;
  }
  if (running_.exchange(true)) {
    return ok();
  }

  log::start();
  auto started = runtime_->start().and_then([this] {
    return store_->open();
  });
  if (!started) {
    log::error("Startup failed: {}", started.error().message());
    running_.store(false);
    runtime_->stop();
    log::stop();
    return started;
  }

  if (config_.service.syslog_sink) {
    const auto level =
        log::parse_level(config_.service.syslog_level).value_or(log::Level::Warn);
    syslog_sink_ = std::make_shared<storage::SyslogSink>(
        *store_, config_.service.syslog_logger_name);
    log::set_sink(syslog_sink_, level);
  }

  if (auto r = controller_->install_initial(); !r) {
    log::error("Initial schedule failed: {}", r.error().message());
    log::set_sink(nullptr);
    store_->close();
    runtime_->stop();
    running_.store(false);
    log::stop();
    return r;
  }

  reload_thread_ = std::jthread(
      [this](std::stop_token stop) { controller_->run(std::move(stop)); });
  log::info("cronhive started: {} shards, reload every {}s",
            runtime_->shard_count(), config_.scheduler.reload_interval);
  return ok();
}

auto Application::wait_for_shutdown() -> void {
  while (!g_shutdown_requested.load(std::memory_order_acquire)) {
    if (g_reload_requested.exchange(false, std::memory_order_acq_rel)) {
      log::info("SIGHUP received, reloading schedule");
      if (auto r = controller_->reload(); !r) {
        log::warn("Reload failed: {}", r.error().message());
      }
    }
    std::this_thread::sleep_for(timing::kDaemonPollInterval);
  }
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  log::info("Stopping cronhive...");

  if (reload_thread_.joinable()) {
    reload_thread_.request_stop();
    reload_thread_.join();
  }

  controller_->shutdown();

  if (syslog_sink_) {
    log::set_sink(nullptr);
    syslog_sink_.reset();
  }

  store_->close();
  runtime_->stop();

  log::info("cronhive stopped");
  log::stop();
}

auto Application::store() -> storage::JobStoreService & { return *store_; }

auto Application::controller() -> ReloadController & { return *controller_; }

} // namespace cronhive
