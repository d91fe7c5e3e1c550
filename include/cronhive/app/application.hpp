#pragma once

#include "cronhive/config/config.hpp"
#include "cronhive/core/error.hpp"
#include "cronhive/core/runtime.hpp"
#include "cronhive/executor/executor.hpp"
#include "cronhive/scheduler/reload_controller.hpp"
#include "cronhive/storage/store_service.hpp"

#include <atomic>
#include <memory>
#include <string_view>
#include <thread>

namespace cronhive {

namespace storage {
class SyslogSink;
}

// Application facade: owns the runtime, executor, store and the reload
// controller, and runs them in the order the service needs.
class Application {
public:
  Application();
  explicit Application(Config config);
  /// Use a custom store backend instead of MySQL.
  Application(Config config, storage::JobStoreService::StoreFactory store);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto load_config(std::string_view path) -> Result<void>;
  [[nodiscard]] auto config() const noexcept -> const Config & {
    return config_;
  }

  /// Apply logging settings and create the services. No I/O.
  [[nodiscard]] auto init() -> Result<void>;
  /// Open the store, which creates the schema, then close it again.
  [[nodiscard]] auto init_db_only() -> Result<void>;

  /// Open the store and install the first schedule. Failures here are
  /// fatal; everything afterwards degrades instead.
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  /// Block until SIGINT/SIGTERM, serving SIGHUP reload requests meanwhile.
  auto wait_for_shutdown() -> void;

  [[nodiscard]] auto store() -> storage::JobStoreService &;
  [[nodiscard]] auto controller() -> ReloadController &;
  [[nodiscard]] auto runtime() -> Runtime & { return *runtime_; }

private:
  [[nodiscard]] auto make_core_factory() -> ReloadController::CoreFactory;

  std::atomic<bool> running_{false};
  Config config_;
  storage::JobStoreService::StoreFactory store_factory_;

  std::unique_ptr<Runtime> runtime_;
  std::unique_ptr<IExecutor> executor_;
  std::unique_ptr<storage::JobStoreService> store_;
  std::shared_ptr<storage::SyslogSink> syslog_sink_;
  std::unique_ptr<ReloadController> controller_;
  std::jthread reload_thread_;
};

} // namespace cronhive
