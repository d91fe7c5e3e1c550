#include "cronhive/storage/mysql_job_store.hpp"

#include "cronhive/storage/mysql_schema.hpp"
#include "cronhive/util/log.hpp"
#include "cronhive/util/time.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/constant_string_view.hpp>
#include <boost/mysql/pipeline.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/with_params.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cronhive::schema {

auto render(std::string_view prefix) -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(kTables.size());
  for (auto stmt : kTables) {
    out.push_back(
        boost::algorithm::replace_all_copy(std::string(stmt), "{p}", prefix));
  }
  return out;
}

} // namespace cronhive::schema

namespace cronhive::storage {
namespace {

using boost::asio::use_awaitable;

constexpr std::string_view kJobColumns =
    "id, command, second, minute, hour, day, month, day_of_week, timeout, "
    "`coalesce`, max_instances, misfire_grace_time, "
    "CAST(UNIX_TIMESTAMP(created_at) * 1000 AS SIGNED), "
    "CAST(UNIX_TIMESTAMP(updated_at) * 1000 AS SIGNED)";

// SELECT over the job columns with the table left as a `{:i}` placeholder.
[[nodiscard]] auto job_select(std::string_view tail) -> std::string {
  return std::string("SELECT ") + std::string(kJobColumns) + " FROM {:i} " +
         std::string(tail);
}

[[nodiscard]] auto make_connect_params(const DatabaseConfig &cfg,
                                       bool select_database)
    -> boost::mysql::connect_params {
  boost::mysql::connect_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  if (select_database) {
    params.database = cfg.database;
  }
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

[[nodiscard]] auto make_pool_params(const DatabaseConfig &cfg)
    -> boost::mysql::pool_params {
  boost::mysql::pool_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  params.database = cfg.database;
  params.initial_size = 1;
  params.max_size = std::max<std::size_t>(1, cfg.pool_size);
  params.thread_safe = true;
  params.connect_timeout = std::chrono::seconds(cfg.connect_timeout);
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

[[nodiscard]] auto as_i64(const boost::mysql::field_view &f) -> std::int64_t {
  if (f.is_int64()) {
    return f.as_int64();
  }
  if (f.is_uint64()) {
    return static_cast<std::int64_t>(f.as_uint64());
  }
  if (f.is_string()) {
    return std::stoll(std::string(f.as_string()));
  }
  return 0;
}

[[nodiscard]] auto as_str(const boost::mysql::field_view &f) -> std::string {
  if (f.is_string()) {
    auto s = f.as_string();
    return std::string(s.data(), s.size());
  }
  if (f.is_int64()) {
    return std::to_string(f.as_int64());
  }
  return {};
}

[[nodiscard]] auto as_opt_i64(const boost::mysql::field_view &f)
    -> std::optional<std::int64_t> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return as_i64(f);
}

[[nodiscard]] auto as_opt_str(const boost::mysql::field_view &f)
    -> std::optional<std::string> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return as_str(f);
}

[[nodiscard]] auto to_job_record(const boost::mysql::row_view &row)
    -> JobRecord {
  JobRecord rec{.id = JobId{as_str(row.at(0))},
                .command = as_str(row.at(1)),
                .fields = CronFields{.second = as_str(row.at(2)),
                                     .minute = as_str(row.at(3)),
                                     .hour = as_str(row.at(4)),
                                     .day = as_str(row.at(5)),
                                     .month = as_str(row.at(6)),
                                     .day_of_week = as_str(row.at(7))},
                .timeout = as_i64(row.at(8))};
  if (auto v = as_opt_i64(row.at(9))) {
    rec.coalesce = *v != 0;
  }
  if (auto v = as_opt_i64(row.at(10))) {
    rec.max_instances = static_cast<int>(*v);
  }
  rec.misfire_grace_time = as_opt_i64(row.at(11));
  rec.created_at = util::from_unix_millis(as_i64(row.at(12)));
  rec.updated_at = util::from_unix_millis(as_i64(row.at(13)));
  return rec;
}

template <typename F>
auto mysql_try(std::string_view op, F &&f,
               log::Forwarding forwarding = log::Forwarding::Allowed)
    -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const std::exception &e) {
    log::write(log::Level::Error, forwarding, "MySQL {} failed: {}", op,
               e.what());
    co_return fail(Error::StoreUnavailable);
  }
}

} // namespace

MySQLJobStore::MySQLJobStore(boost::asio::any_io_executor executor,
                             const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySQLJobStore::~MySQLJobStore() { pool_.cancel(); }

auto MySQLJobStore::ensure_database_exists() -> task<Result<void>> {
  const auto timeout = std::chrono::seconds(cfg_.connect_timeout);
  std::string first_error;

  // The normal case needs no CREATE privilege: the database is there.
  for (bool select_database : {true, false}) {
    try {
      boost::mysql::any_connection conn(pool_.get_executor());
      co_await conn.async_connect(
          make_connect_params(cfg_, select_database),
          boost::asio::cancel_after(timeout, use_awaitable));
      if (!select_database) {
        boost::mysql::results res;
        co_await conn.async_execute(
            boost::mysql::with_params("CREATE DATABASE IF NOT EXISTS {:i}",
                                      cfg_.database),
            res, use_awaitable);
        log::info("Created database {}", cfg_.database);
      }
      co_await conn.async_close(use_awaitable);
      co_return ok();
    } catch (const std::exception &e) {
      if (select_database) {
        first_error = e.what();
        continue;
      }
      log::error("Cannot reach database {} on {}:{} ({}); creating it "
                 "failed too: {}",
                 cfg_.database, cfg_.host, cfg_.port, first_error, e.what());
    }
  }
  co_return fail(Error::DatabaseOpenFailed);
}

auto MySQLJobStore::open() -> task<Result<void>> {
  if (open_.load()) {
    co_return ok();
  }

  if (auto db_res = co_await ensure_database_exists(); !db_res) {
    co_return fail(db_res.error());
  }

  open_.store(true);
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_.store(false);
    co_return fail(conn_res.error());
  }

  if (auto schema_res = co_await ensure_schema(conn_res->get()); !schema_res) {
    open_.store(false);
    co_return fail(schema_res.error());
  }
  conn_res->return_without_reset();

  log::info("MySQL job store opened: {}:{} / {} (prefix '{}')", cfg_.host,
            cfg_.port, cfg_.database, cfg_.table_prefix);
  co_return ok();
}

auto MySQLJobStore::close() -> task<void> {
  if (open_.exchange(false)) {
    pool_.cancel();
  }
  co_return;
}

auto MySQLJobStore::is_open() const noexcept -> bool { return open_.load(); }

auto MySQLJobStore::get_connection(log::Forwarding forwarding)
    -> task<Result<boost::mysql::pooled_connection>> {
  if (!open_.load()) {
    co_return fail(Error::SystemNotRunning);
  }
  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_return ok(std::move(conn));
  } catch (const std::exception &e) {
    log::write(log::Level::Error, forwarding,
               "MySQL get connection failed: {}", e.what());
    co_return fail(Error::StoreUnavailable);
  }
}

auto MySQLJobStore::ensure_schema(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    boost::mysql::pipeline_request req;
    for (const auto &stmt : schema::render(cfg_.table_prefix)) {
      req.add_execute(stmt);
    }
    req.add_execute(boost::mysql::with_params(
        "INSERT IGNORE INTO {:i}(version) VALUES ({})",
        table("schema_version"), schema::CURRENT_SCHEMA_VERSION));

    std::vector<boost::mysql::stage_response> responses;
    co_await conn.async_run_pipeline(req, responses, use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema ensure failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLJobStore::list_jobs() -> task<Result<std::vector<JobRecord>>> {
  co_return co_await mysql_try(
      "list_jobs", [&]() -> task<Result<std::vector<JobRecord>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        const auto sql = job_select("ORDER BY id");
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(boost::mysql::runtime(sql),
                table("jobs")),
            res, use_awaitable);

        std::vector<JobRecord> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(to_job_record(row));
        }
        conn_res->return_without_reset();
        co_return ok(std::move(out));
      });
}

auto MySQLJobStore::get_job(const JobId &id) -> task<Result<JobRecord>> {
  co_return co_await mysql_try("get_job", [&]() -> task<Result<JobRecord>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const auto sql = job_select("WHERE id = {}");
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(boost::mysql::runtime(sql), table("jobs"),
                                  id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(to_job_record(res.rows().at(0)));
  });
}

auto MySQLJobStore::upsert_job(const JobRecord &job) -> task<Result<void>> {
  co_return co_await mysql_try("upsert_job", [&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    std::optional<int> coalesce;
    if (job.coalesce) {
      coalesce = *job.coalesce ? 1 : 0;
    }
    const auto &f = job.fields;
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO {:i}(id, command, second, minute, hour, day, month, "
            "day_of_week, timeout, `coalesce`, max_instances, "
            "misfire_grace_time) "
            "VALUES({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE "
            "command=VALUES(command), second=VALUES(second), "
            "minute=VALUES(minute), hour=VALUES(hour), day=VALUES(day), "
            "month=VALUES(month), day_of_week=VALUES(day_of_week), "
            "timeout=VALUES(timeout), `coalesce`=VALUES(`coalesce`), "
            "max_instances=VALUES(max_instances), "
            "misfire_grace_time=VALUES(misfire_grace_time)",
            table("jobs"), job.id.str(), job.command, f.second, f.minute,
            f.hour, f.day, f.month, f.day_of_week, job.timeout, coalesce,
            job.max_instances, job.misfire_grace_time),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLJobStore::delete_job(const JobId &id) -> task<Result<void>> {
  co_return co_await mysql_try("delete_job", [&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("DELETE FROM {:i} WHERE id = {}",
                                  table("jobs"), id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.affected_rows() == 0) {
      co_return fail(Error::NotFound);
    }
    co_return ok();
  });
}

auto MySQLJobStore::pending_update_exists() -> task<Result<bool>> {
  auto latest = co_await latest_pending_update();
  if (!latest) {
    co_return fail(latest.error());
  }
  co_return ok(latest->has_value());
}

auto MySQLJobStore::latest_pending_update()
    -> task<Result<std::optional<std::int64_t>>> {
  co_return co_await mysql_try(
      "latest_pending_update",
      [&]() -> task<Result<std::optional<std::int64_t>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT MAX(id) FROM {:i} WHERE updated = 0",
                table("update_info")),
            res, use_awaitable);
        conn_res->return_without_reset();
        if (res.rows().empty()) {
          co_return ok(std::optional<std::int64_t>{});
        }
        co_return ok(as_opt_i64(res.rows().at(0).at(0)));
      });
}

auto MySQLJobStore::mark_updates_processed(std::optional<std::int64_t> up_to)
    -> task<Result<std::size_t>> {
  co_return co_await mysql_try(
      "mark_updates_processed", [&]() -> task<Result<std::size_t>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        if (up_to) {
          co_await conn_res->get().async_execute(
              boost::mysql::with_params(
                  "UPDATE {:i} SET updated = 1 WHERE updated = 0 AND id <= {}",
                  table("update_info"), *up_to),
              res, use_awaitable);
        } else {
          co_await conn_res->get().async_execute(
              boost::mysql::with_params(
                  "UPDATE {:i} SET updated = 1 WHERE updated = 0",
                  table("update_info")),
              res, use_awaitable);
        }
        conn_res->return_without_reset();
        co_return ok(static_cast<std::size_t>(res.affected_rows()));
      });
}

auto MySQLJobStore::record_update(std::optional<std::string> before_json,
                                  std::optional<std::string> after_json)
    -> task<Result<std::int64_t>> {
  co_return co_await mysql_try(
      "record_update", [&]() -> task<Result<std::int64_t>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "INSERT INTO {:i}(updated, jobs_before_update, "
                "jobs_after_update) VALUES(0, {}, {})",
                table("update_info"), before_json, after_json),
            res, use_awaitable);
        conn_res->return_without_reset();
        co_return ok(static_cast<std::int64_t>(res.last_insert_id()));
      });
}

auto MySQLJobStore::list_updates(std::size_t limit)
    -> task<Result<std::vector<UpdateMarker>>> {
  co_return co_await mysql_try(
      "list_updates", [&]() -> task<Result<std::vector<UpdateMarker>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT id, updated, "
                "CAST(UNIX_TIMESTAMP(insert_time) * 1000 AS SIGNED), "
                "CAST(UNIX_TIMESTAMP(update_time) * 1000 AS SIGNED), "
                "jobs_before_update, jobs_after_update "
                "FROM {:i} ORDER BY id DESC LIMIT {}",
                table("update_info"), limit),
            res, use_awaitable);

        std::vector<UpdateMarker> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(UpdateMarker{
              .id = as_i64(row.at(0)),
              .updated = as_i64(row.at(1)) != 0,
              .insert_time = util::from_unix_millis(as_i64(row.at(2))),
              .update_time = util::from_unix_millis(as_i64(row.at(3))),
              .jobs_before_update = as_opt_str(row.at(4)),
              .jobs_after_update = as_opt_str(row.at(5))});
        }
        conn_res->return_without_reset();
        co_return ok(std::move(out));
      });
}

auto MySQLJobStore::append_syslog(const SyslogEntry &entry)
    -> task<Result<void>> {
  // Runs on behalf of the log sink: its own failures must not be forwarded
  // back into it.
  constexpr auto kLocalOnly = log::Forwarding::Suppressed;
  co_return co_await mysql_try("append_syslog", [&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection(kLocalOnly);
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO {:i}(created_at, level, logger_name, message) "
            "VALUES(FROM_UNIXTIME({} / 1000), {}, {}, {})",
            table("syslog"), util::to_unix_millis(entry.created_at),
            entry.level, entry.logger_name, entry.message),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  }, kLocalOnly);
}

} // namespace cronhive::storage
