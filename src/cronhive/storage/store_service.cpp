#include "cronhive/storage/store_service.hpp"

#include "cronhive/storage/mysql_job_store.hpp"
#include "cronhive/util/log.hpp"

#include <boost/asio/detached.hpp>

#include <algorithm>

namespace cronhive::storage {

JobStoreService::JobStoreService(const DatabaseConfig &cfg,
                                 std::size_t threads)
    : pool_(std::max<std::size_t>(1, threads)),
      store_(std::make_unique<MySQLJobStore>(pool_.get_executor(), cfg)) {}

JobStoreService::JobStoreService(StoreFactory make_store, std::size_t threads)
    : pool_(std::max<std::size_t>(1, threads)),
      store_(make_store(pool_.get_executor())) {}

JobStoreService::~JobStoreService() {
  pool_.stop();
  pool_.join();
}

auto JobStoreService::open() -> Result<void> {
  return sync_wait(store_->open());
}

auto JobStoreService::close() -> void { sync_wait(store_->close()); }

auto JobStoreService::is_open() const noexcept -> bool {
  return store_->is_open();
}

auto JobStoreService::list_jobs() -> Result<std::vector<JobRecord>> {
  return sync_wait(store_->list_jobs());
}

auto JobStoreService::get_job(const JobId &id) -> Result<JobRecord> {
  return sync_wait(store_->get_job(id));
}

auto JobStoreService::load_snapshot(std::string_view timezone)
    -> Result<std::vector<JobDefinition>> {
  return list_jobs().and_then([&](const std::vector<JobRecord> &records) {
    return to_definitions(records, timezone);
  });
}

auto JobStoreService::pending_update_exists() -> Result<bool> {
  return sync_wait(store_->pending_update_exists());
}

auto JobStoreService::latest_pending_update()
    -> Result<std::optional<std::int64_t>> {
  return sync_wait(store_->latest_pending_update());
}

auto JobStoreService::mark_updates_processed(std::optional<std::int64_t> up_to)
    -> Result<std::size_t> {
  return sync_wait(store_->mark_updates_processed(up_to));
}

auto JobStoreService::list_updates(std::size_t limit)
    -> Result<std::vector<UpdateMarker>> {
  return sync_wait(store_->list_updates(limit));
}

auto JobStoreService::touch() -> Result<std::int64_t> {
  return sync_wait(store_->record_update(std::nullopt, std::nullopt));
}

auto JobStoreService::edit_with_marker(task<Result<void>> edit)
    -> Result<std::int64_t> {
  auto before = list_jobs();
  if (!before) {
    return fail(before.error());
  }
  if (auto r = sync_wait(std::move(edit)); !r) {
    return fail(r.error());
  }
  auto after = list_jobs();
  if (!after) {
    return fail(after.error());
  }
  return sync_wait(store_->record_update(records_to_json(*before),
                                         records_to_json(*after)));
}

auto JobStoreService::save_job(const JobDefinition &def)
    -> Result<std::int64_t> {
  return edit_with_marker(store_->upsert_job(JobRecord::from_definition(def)));
}

auto JobStoreService::remove_job(const JobId &id) -> Result<std::int64_t> {
  return edit_with_marker(store_->delete_job(id));
}

auto JobStoreService::post_syslog(SyslogEntry entry) -> void {
  auto op = [](JobStore &store, SyslogEntry e) -> task<void> {
    auto r = co_await store.append_syslog(e);
    if (!r) {
      log::write(log::Level::Debug, log::Forwarding::Suppressed,
                 "Dropping syslog entry: {}", r.error().message());
    }
  };
  boost::asio::co_spawn(pool_.get_executor(), op(*store_, std::move(entry)),
                        boost::asio::detached);
}

} // namespace cronhive::storage
