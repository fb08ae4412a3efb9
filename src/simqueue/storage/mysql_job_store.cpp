#include "simqueue/storage/mysql_job_store.hpp"

#include "simqueue/storage/mysql_schema.hpp"
#include "simqueue/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/error_with_diagnostics.hpp>
#include <boost/mysql/format_sql.hpp>
#include <boost/mysql/pipeline.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/with_params.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace boost::mysql {

// Described enums are written as their snake_case spelling, matching the
// CHECK constraint on simulation_jobs.status.
template <typename T>
  requires(std::is_enum_v<T> &&
           boost::describe::has_describe_enumerators<T>::value)
struct formatter<T> {
  auto parse(const char *begin, const char *) -> const char * { return begin; }

  auto format(T value, format_context_base &ctx) const -> void {
    boost::mysql::format_sql_to(ctx, "{}",
                                simqueue::util::enum_to_snake_case_view(value));
  }
};

} // namespace boost::mysql

namespace simqueue::storage {
namespace {

using boost::asio::use_awaitable;

#define SIMQUEUE_JOB_COLUMNS                                                   \
  "id, user_id, service_id, llm_provider, prompt_version_id, "                 \
  "current_config, proposed_config, context, options, status, priority, "     \
  "result, error_message, queued_at, started_at, completed_at, created_at, "   \
  "updated_at"

// Shared by list_jobs and its COUNT(*); empty filters match everything.
#define SIMQUEUE_JOB_FILTER                                                    \
  "WHERE ({} IS NULL OR user_id = {}) AND ({} IS NULL OR status = {})"

[[nodiscard]] auto split_sql_statements(std::string_view input)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  bool in_quote = false;

  auto flush = [&] {
    auto first = current.find_first_not_of(" \n\r\t");
    if (first != std::string::npos) {
      auto last = current.find_last_not_of(" \n\r\t");
      out.emplace_back(current.substr(first, last - first + 1));
    }
    current.clear();
  };

  for (char c : input) {
    if (c == '\'') {
      in_quote = !in_quote;
    }
    if (c == ';' && !in_quote) {
      flush();
      continue;
    }
    current.push_back(c);
  }
  flush();
  return out;
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
  return 0;
}

[[nodiscard]] auto as_str(const boost::mysql::field_view &f) -> std::string {
  if (!f.is_string()) {
    return {};
  }
  auto s = f.as_string();
  return std::string(s.data(), s.size());
}

[[nodiscard]] auto as_opt_str(const boost::mysql::field_view &f)
    -> std::optional<std::string> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return as_str(f);
}

[[nodiscard]] auto as_opt_i64(const boost::mysql::field_view &f)
    -> std::optional<std::int64_t> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return as_i64(f);
}

[[nodiscard]] auto as_opt_ts(const boost::mysql::field_view &f)
    -> std::optional<Timestamp> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return util::from_unix_millis(as_i64(f));
}

[[nodiscard]] auto decode_job(const boost::mysql::row_view &row) -> Job {
  Job job;
  job.id = as_i64(row.at(0));
  job.user_id = as_i64(row.at(1));
  job.service_id = as_str(row.at(2));
  job.llm_provider = as_opt_str(row.at(3));
  job.prompt_version_id = as_opt_i64(row.at(4));
  job.current_config = as_str(row.at(5));
  job.proposed_config = as_str(row.at(6));
  job.context = as_opt_str(row.at(7));
  job.options = as_opt_str(row.at(8));
  const auto status_text = as_str(row.at(9));
  if (auto status = parse<JobStatus>(status_text)) {
    job.status = *status;
  } else {
    log::warn("Job {} has unknown status '{}'", job.id, status_text);
  }
  job.priority = static_cast<int>(as_i64(row.at(10)));
  job.result = as_opt_str(row.at(11));
  job.error_message = as_opt_str(row.at(12));
  job.queued_at = util::from_unix_millis(as_i64(row.at(13)));
  job.started_at = as_opt_ts(row.at(14));
  job.completed_at = as_opt_ts(row.at(15));
  job.created_at = util::from_unix_millis(as_i64(row.at(16)));
  job.updated_at = as_opt_ts(row.at(17));
  return job;
}

[[nodiscard]] auto as_opt_millis(const std::optional<Timestamp> &tp)
    -> std::optional<std::int64_t> {
  if (!tp) {
    return std::nullopt;
  }
  return util::to_unix_millis(*tp);
}

template <typename F>
auto mysql_try(std::string_view op, F &&f)
    -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const boost::mysql::error_with_diagnostics &e) {
    log::error("MySQL {} failed: {} ({})", op, e.what(),
               e.get_diagnostics().server_message());
    co_return fail(Error::DatabaseQueryFailed);
  } catch (const std::exception &e) {
    log::error("MySQL {} failed: {}", op, e.what());
    co_return fail(Error::DatabaseQueryFailed);
  }
}

} // namespace

MySQLJobStore::MySQLJobStore(boost::asio::any_io_executor executor,
                             const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySQLJobStore::~MySQLJobStore() { pool_.cancel(); }

auto MySQLJobStore::ensure_database_exists() -> task<Result<void>> {
  auto base_params = [this] {
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.ssl = boost::mysql::ssl_mode::disable;
    return params;
  };
  const auto timeout = std::chrono::seconds(cfg_.connect_timeout);

  std::string direct_connect_error;
  try {
    auto params = base_params();
    params.database = cfg_.database;
    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(timeout, use_awaitable));
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    direct_connect_error = e.what();
  }

  // First run: the schema may not exist yet.
  try {
    auto params = base_params();
    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(timeout, use_awaitable));
    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params("CREATE DATABASE IF NOT EXISTS {:i}",
                                  cfg_.database),
        res, use_awaitable);
    co_await conn.async_close(use_awaitable);
    log::info("Created MySQL database {}", cfg_.database);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL ensure database failed: direct_connect='{}', "
               "create_db='{}'",
               direct_connect_error, e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLJobStore::open() -> task<Result<void>> {
  if (open_) {
    co_return ok();
  }

  if (auto db_res = co_await ensure_database_exists(); !db_res) {
    co_return fail(db_res.error());
  }

  open_ = true;
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_ = false;
    co_return fail(conn_res.error());
  }
  if (auto schema_res = co_await ensure_schema(conn_res->get()); !schema_res) {
    open_ = false;
    co_return fail(schema_res.error());
  }
  conn_res->return_without_reset();

  log::info("MySQL job store opened: {}:{} / {}", cfg_.host, cfg_.port,
            cfg_.database);
  co_return ok();
}

auto MySQLJobStore::close() -> task<void> {
  if (open_.exchange(false)) {
    pool_.cancel();
  }
  co_return;
}

auto MySQLJobStore::is_open() const noexcept -> bool { return open_; }

auto MySQLJobStore::get_connection()
    -> task<Result<boost::mysql::pooled_connection>> {
  if (!open_) {
    co_return fail(Error::SystemNotRunning);
  }
  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_return ok(std::move(conn));
  } catch (const std::exception &e) {
    log::error("MySQL get connection failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLJobStore::ensure_schema(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    boost::mysql::pipeline_request req;
    for (const auto &stmt : split_sql_statements(schema::V1_SCHEMA)) {
      req.add_execute(stmt);
    }
    req.add_execute(boost::mysql::with_params(
        "INSERT IGNORE INTO schema_version(version) VALUES ({})",
        schema::CURRENT_SCHEMA_VERSION));

    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn.async_run_pipeline(req, stage_responses, use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema ensure failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLJobStore::ping() -> task<Result<void>> {
  co_return co_await mysql_try("ping", [&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute("SELECT 1", res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLJobStore::enqueue(EnqueueInput input) -> task<Result<Job>> {
  auto valid = validate_enqueue(std::move(input));
  if (!valid) {
    co_return fail(valid.error());
  }

  co_return co_await mysql_try("enqueue", [&]() -> task<Result<Job>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const auto now = util::now_millis();
    const auto now_ms = util::to_unix_millis(now);
    auto &in = *valid;
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO simulation_jobs(user_id, service_id, llm_provider, "
            "prompt_version_id, current_config, proposed_config, context, "
            "options, status, priority, queued_at, created_at) "
            "VALUES({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
            in.user_id, in.service_id, in.llm_provider, in.prompt_version_id,
            *in.current_config, *in.proposed_config, in.context, in.options,
            JobStatus::Pending, in.priority.value_or(kDefaultPriority), now_ms,
            now_ms),
        res, use_awaitable);
    conn_res->return_without_reset();

    const auto id = static_cast<JobId>(res.last_insert_id());
    co_return ok(make_pending_job(id, std::move(in), now));
  });
}

auto MySQLJobStore::claim_next_ready() -> task<Result<std::optional<Job>>> {
  co_return co_await mysql_try(
      "claim_next_ready", [&]() -> task<Result<std::optional<Job>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }
        auto &conn = conn_res->get();

        boost::mysql::results tx_res;
        co_await conn.async_execute("START TRANSACTION", tx_res,
                                    use_awaitable);

        // Rows locked by a concurrent claimer are skipped, never waited on.
        boost::mysql::results sel_res;
        co_await conn.async_execute(
            boost::mysql::with_params(
                "SELECT id FROM simulation_jobs WHERE status = {} "
                "ORDER BY priority DESC, queued_at ASC, id ASC "
                "LIMIT 1 FOR UPDATE SKIP LOCKED",
                JobStatus::Pending),
            sel_res, use_awaitable);

        if (sel_res.rows().empty()) {
          boost::mysql::results commit_res;
          co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
          conn_res->return_without_reset();
          co_return ok(std::optional<Job>{});
        }

        const auto id = as_i64(sel_res.rows().at(0).at(0));
        const auto now_ms = util::to_unix_millis(util::now_millis());

        boost::mysql::results upd_res;
        co_await conn.async_execute(
            boost::mysql::with_params(
                "UPDATE simulation_jobs SET status = {}, started_at = {}, "
                "updated_at = {} WHERE id = {} AND status = {}",
                JobStatus::Running, now_ms, now_ms, id, JobStatus::Pending),
            upd_res, use_awaitable);

        boost::mysql::results row_res;
        co_await conn.async_execute(
            boost::mysql::with_params("SELECT " SIMQUEUE_JOB_COLUMNS
                                      " FROM simulation_jobs WHERE id = {}",
                                      id),
            row_res, use_awaitable);

        boost::mysql::results commit_res;
        co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
        conn_res->return_without_reset();

        if (upd_res.affected_rows() != 1 || row_res.rows().empty()) {
          log::warn("Claim of job {} lost its row lock; treating as empty",
                    id);
          co_return ok(std::optional<Job>{});
        }
        co_return ok(std::optional<Job>{decode_job(row_res.rows().at(0))});
      });
}

auto MySQLJobStore::finish(JobId id, JobStatus terminal, std::string payload)
    -> task<Result<void>> {
  if (terminal != JobStatus::Completed && terminal != JobStatus::Failed) {
    co_return fail(Error::InvalidArgument);
  }

  co_return co_await mysql_try("finish", [&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();
    const auto now_ms = util::to_unix_millis(util::now_millis());

    std::optional<std::string_view> result;
    std::optional<std::string_view> error_message;
    if (terminal == JobStatus::Completed) {
      result = payload;
    } else {
      error_message = payload;
    }

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE simulation_jobs SET status = {}, result = {}, "
            "error_message = {}, completed_at = {}, updated_at = {} "
            "WHERE id = {} AND status = {}",
            terminal, result, error_message, now_ms, now_ms, id,
            JobStatus::Running),
        res, use_awaitable);

    if (res.affected_rows() == 1) {
      conn_res->return_without_reset();
      co_return ok();
    }

    boost::mysql::results exists_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT EXISTS(SELECT 1 FROM simulation_jobs WHERE id = {})", id),
        exists_res, use_awaitable);
    conn_res->return_without_reset();
    if (as_i64(exists_res.rows().at(0).at(0)) == 0) {
      co_return fail(Error::NotFound);
    }
    co_return fail(Error::InvalidState);
  });
}

auto MySQLJobStore::mark_completed(JobId id, std::string result)
    -> task<Result<void>> {
  co_return co_await finish(id, JobStatus::Completed, std::move(result));
}

auto MySQLJobStore::mark_failed(JobId id, std::string error_message)
    -> task<Result<void>> {
  co_return co_await finish(id, JobStatus::Failed, std::move(error_message));
}

auto MySQLJobStore::cancel_job(JobId id) -> task<Result<void>> {
  co_return co_await mysql_try("cancel_job", [&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    const auto now_ms = util::to_unix_millis(util::now_millis());

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE simulation_jobs SET status = {}, completed_at = {}, "
            "updated_at = {} WHERE id = {} AND status = {}",
            JobStatus::Cancelled, now_ms, now_ms, id, JobStatus::Pending),
        res, use_awaitable);
    conn_res->return_without_reset();

    if (res.affected_rows() == 0) {
      co_return fail(Error::Conflict);
    }
    co_return ok();
  });
}

auto MySQLJobStore::get_job(JobId id) -> task<Result<std::optional<Job>>> {
  co_return co_await mysql_try(
      "get_job", [&]() -> task<Result<std::optional<Job>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params("SELECT " SIMQUEUE_JOB_COLUMNS
                                      " FROM simulation_jobs WHERE id = {}",
                                      id),
            res, use_awaitable);
        conn_res->return_without_reset();

        if (res.rows().empty()) {
          co_return ok(std::optional<Job>{});
        }
        co_return ok(std::optional<Job>{decode_job(res.rows().at(0))});
      });
}

auto MySQLJobStore::list_jobs(JobFilter filter, std::int64_t limit,
                              std::int64_t offset) -> task<Result<JobPage>> {
  if (limit < 0 || offset < 0) {
    co_return fail(Error::InvalidArgument);
  }

  co_return co_await mysql_try("list_jobs", [&]() -> task<Result<JobPage>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    std::optional<std::string_view> status;
    if (filter.status) {
      status = to_string_view(*filter.status);
    }

    boost::mysql::results count_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT COUNT(*) FROM simulation_jobs " SIMQUEUE_JOB_FILTER,
            filter.user_id, filter.user_id, status, status),
        count_res, use_awaitable);

    boost::mysql::results rows_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT " SIMQUEUE_JOB_COLUMNS
            " FROM simulation_jobs " SIMQUEUE_JOB_FILTER
            " ORDER BY priority DESC, queued_at ASC, id ASC LIMIT {} OFFSET {}",
            filter.user_id, filter.user_id, status, status, limit, offset),
        rows_res, use_awaitable);
    conn_res->return_without_reset();

    JobPage page;
    page.total = as_i64(count_res.rows().at(0).at(0));
    page.jobs.reserve(rows_res.rows().size());
    for (auto row : rows_res.rows()) {
      page.jobs.push_back(decode_job(row));
    }
    co_return ok(std::move(page));
  });
}

auto MySQLJobStore::get_queue_stats() -> task<Result<QueueStats>> {
  co_return co_await mysql_try(
      "get_queue_stats", [&]() -> task<Result<QueueStats>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            "SELECT status, COUNT(*) FROM simulation_jobs GROUP BY status", res,
            use_awaitable);
        conn_res->return_without_reset();

        QueueStats stats;
        for (auto row : res.rows()) {
          const auto text = as_str(row.at(0));
          if (auto status = parse<JobStatus>(text)) {
            stats.count_for(*status) = as_i64(row.at(1));
          } else {
            log::warn("Ignoring {} jobs with unknown status '{}'",
                      as_i64(row.at(1)), text);
          }
        }
        co_return ok(stats);
      });
}

#undef SIMQUEUE_JOB_FILTER
#undef SIMQUEUE_JOB_COLUMNS

} // namespace simqueue::storage
