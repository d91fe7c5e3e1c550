#include "cronhive/storage/memory_job_store.hpp"

#include <algorithm>

namespace cronhive::storage {

// Failures are logged like the MySQL backend logs its own, so the syslog
// path sees the same traffic in tests.
auto InMemoryJobStore::check(log::Forwarding forwarding) const
    -> Result<void> {
  if (unavailable_) {
    log::write(log::Level::Error, forwarding, "In-memory store unavailable");
    return fail(Error::StoreUnavailable);
  }
  if (!open_) {
    return fail(Error::SystemNotRunning);
  }
  return ok();
}

auto InMemoryJobStore::open() -> task<Result<void>> {
  std::lock_guard lock(mutex_);
  if (unavailable_) {
    co_return fail(Error::DatabaseOpenFailed);
  }
  open_ = true;
  co_return ok();
}

auto InMemoryJobStore::close() -> task<void> {
  std::lock_guard lock(mutex_);
  open_ = false;
  co_return;
}

auto InMemoryJobStore::is_open() const noexcept -> bool {
  std::lock_guard lock(mutex_);
  return open_;
}

auto InMemoryJobStore::list_jobs() -> task<Result<std::vector<JobRecord>>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  std::vector<JobRecord> out;
  out.reserve(jobs_.size());
  for (const auto &[id, rec] : jobs_) {
    out.push_back(rec);
  }
  co_return ok(std::move(out));
}

auto InMemoryJobStore::get_job(const JobId &id) -> task<Result<JobRecord>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto InMemoryJobStore::upsert_job(const JobRecord &job) -> task<Result<void>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  const auto now = std::chrono::system_clock::now();
  auto [it, inserted] = jobs_.insert_or_assign(job.id, job);
  it->second.updated_at = now;
  if (inserted || it->second.created_at == TimePoint{}) {
    it->second.created_at = now;
  }
  co_return ok();
}

auto InMemoryJobStore::delete_job(const JobId &id) -> task<Result<void>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  if (jobs_.erase(id) == 0) {
    co_return fail(Error::NotFound);
  }
  co_return ok();
}

auto InMemoryJobStore::pending_update_exists() -> task<Result<bool>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  co_return ok(std::ranges::any_of(
      updates_, [](const UpdateMarker &m) { return !m.updated; }));
}

auto InMemoryJobStore::latest_pending_update()
    -> task<Result<std::optional<std::int64_t>>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  std::optional<std::int64_t> latest;
  for (const auto &m : updates_) {
    if (!m.updated) {
      latest = m.id;
    }
  }
  co_return ok(latest);
}

auto InMemoryJobStore::mark_updates_processed(
    std::optional<std::int64_t> up_to) -> task<Result<std::size_t>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  const auto now = std::chrono::system_clock::now();
  std::size_t changed = 0;
  for (auto &m : updates_) {
    if (m.updated || (up_to && m.id > *up_to)) {
      continue;
    }
    m.updated = true;
    m.update_time = now;
    ++changed;
  }
  co_return ok(changed);
}

auto InMemoryJobStore::record_update(std::optional<std::string> before_json,
                                     std::optional<std::string> after_json)
    -> task<Result<std::int64_t>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  const auto now = std::chrono::system_clock::now();
  const auto id = static_cast<std::int64_t>(updates_.size()) + 1;
  updates_.push_back(UpdateMarker{.id = id,
                                  .updated = false,
                                  .insert_time = now,
                                  .update_time = now,
                                  .jobs_before_update = std::move(before_json),
                                  .jobs_after_update = std::move(after_json)});
  co_return ok(id);
}

auto InMemoryJobStore::list_updates(std::size_t limit)
    -> task<Result<std::vector<UpdateMarker>>> {
  std::lock_guard lock(mutex_);
  if (auto r = check(); !r) {
    co_return fail(r.error());
  }
  std::vector<UpdateMarker> out;
  for (auto it = updates_.rbegin(); it != updates_.rend() && out.size() < limit;
       ++it) {
    out.push_back(*it);
  }
  co_return ok(std::move(out));
}

auto InMemoryJobStore::append_syslog(const SyslogEntry &entry)
    -> task<Result<void>> {
  syslog_attempts_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard lock(mutex_);
  if (auto r = check(log::Forwarding::Suppressed); !r) {
    co_return fail(r.error());
  }
  syslog_.push_back(entry);
  co_return ok();
}

auto InMemoryJobStore::set_unavailable(bool unavailable) -> void {
  std::lock_guard lock(mutex_);
  unavailable_ = unavailable;
}

auto InMemoryJobStore::syslog() const -> std::vector<SyslogEntry> {
  std::lock_guard lock(mutex_);
  return syslog_;
}

} // namespace cronhive::storage
