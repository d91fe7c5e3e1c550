#pragma once

#include "cronhive/config/system_config.hpp"
#include "cronhive/storage/job_store.hpp"
#include "cronhive/util/log.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

#include <atomic>
#include <string>

namespace cronhive::storage {

class MySQLJobStore final : public JobStore {
public:
  MySQLJobStore(boost::asio::any_io_executor executor,
                const DatabaseConfig &config);
  ~MySQLJobStore() override;

  MySQLJobStore(const MySQLJobStore &) = delete;
  MySQLJobStore &operator=(const MySQLJobStore &) = delete;

  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto list_jobs() -> task<Result<std::vector<JobRecord>>> override;
  auto get_job(const JobId &id) -> task<Result<JobRecord>> override;
  auto upsert_job(const JobRecord &job) -> task<Result<void>> override;
  auto delete_job(const JobId &id) -> task<Result<void>> override;

  auto pending_update_exists() -> task<Result<bool>> override;
  auto latest_pending_update()
      -> task<Result<std::optional<std::int64_t>>> override;
  auto mark_updates_processed(std::optional<std::int64_t> up_to = {})
      -> task<Result<std::size_t>> override;
  auto record_update(std::optional<std::string> before_json,
                     std::optional<std::string> after_json)
      -> task<Result<std::int64_t>> override;
  auto list_updates(std::size_t limit = 50)
      -> task<Result<std::vector<UpdateMarker>>> override;

  auto append_syslog(const SyslogEntry &entry) -> task<Result<void>> override;

private:
  auto ensure_database_exists() -> task<Result<void>>;
  auto get_connection(log::Forwarding forwarding = log::Forwarding::Allowed)
      -> task<Result<boost::mysql::pooled_connection>>;
  auto ensure_schema(boost::mysql::any_connection &conn) -> task<Result<void>>;

  [[nodiscard]] auto table(std::string_view name) const -> std::string {
    return cfg_.table_prefix + std::string(name);
  }

  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  std::atomic<bool> open_{false};
};

} // namespace cronhive::storage
