#include "planq/store/mysql_store.hpp"

#include "planq/store/mysql_schema.hpp"
#include "planq/util/json.hpp"
#include "planq/util/log.hpp"
#include "planq/util/time.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/format_sql.hpp>
#include <boost/mysql/pipeline.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/sequence.hpp>
#include <boost/mysql/with_params.hpp>

#include <glaze/json.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace planq {
namespace {

using boost::asio::use_awaitable;

struct TodoItemJson {
  std::string content;
  std::string status;
  std::string activeForm;
};

} // namespace
} // namespace planq

namespace glz {
template <> struct meta<planq::TodoItemJson> {
  using T = planq::TodoItemJson;
  static constexpr auto value = object("content", &T::content, "status",
                                       &T::status, "activeForm", &T::activeForm);
};
} // namespace glz

namespace planq {
namespace {

[[nodiscard]] auto to_millis(TimePoint tp) -> std::int64_t {
  return util::to_unix_millis(tp);
}

[[nodiscard]] auto to_millis(const std::optional<TimePoint> &tp)
    -> std::optional<std::int64_t> {
  if (!tp) {
    return std::nullopt;
  }
  return util::to_unix_millis(*tp);
}

[[nodiscard]] auto split_sql_statements(std::string_view input)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  current.reserve(input.size());

  bool in_single = false;
  bool in_double = false;
  auto flush = [&] {
    auto first = current.find_first_not_of(" \n\r\t");
    if (first != std::string::npos) {
      auto last = current.find_last_not_of(" \n\r\t");
      out.emplace_back(current.substr(first, last - first + 1));
    }
    current.clear();
  };

  for (char c : input) {
    if (c == '\'' && !in_double) {
      in_single = !in_single;
    } else if (c == '"' && !in_single) {
      in_double = !in_double;
    }
    if (c == ';' && !in_single && !in_double) {
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
  if (f.is_string()) {
    return std::stoll(std::string(f.as_string()));
  }
  return 0;
}

[[nodiscard]] auto as_sv(const boost::mysql::field_view &f)
    -> std::string_view {
  if (!f.is_string()) {
    return {};
  }
  auto s = f.as_string();
  return std::string_view(s.data(), s.size());
}

[[nodiscard]] auto as_str(const boost::mysql::field_view &f) -> std::string {
  if (f.is_string()) {
    return std::string(as_sv(f));
  }
  if (f.is_int64()) {
    return std::to_string(f.as_int64());
  }
  if (f.is_uint64()) {
    return std::to_string(f.as_uint64());
  }
  return {};
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

[[nodiscard]] auto as_opt_time(const boost::mysql::field_view &f)
    -> std::optional<TimePoint> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return util::from_unix_millis(as_i64(f));
}

[[nodiscard]] auto as_opt_double(const boost::mysql::field_view &f)
    -> std::optional<double> {
  if (f.is_double()) {
    return f.as_double();
  }
  if (f.is_float()) {
    return static_cast<double>(f.as_float());
  }
  return std::nullopt;
}

[[nodiscard]] auto strings_to_json(const std::vector<std::string> &values)
    -> std::string {
  return write_json_or(values, "[]");
}

[[nodiscard]] auto strings_from_json(std::string_view json)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(out, json); ec) {
    log::warn("Corrupt JSON string list in store: {}", json);
    return {};
  }
  return out;
}

[[nodiscard]] auto todos_from_json(std::string_view json)
    -> std::vector<TodoItem> {
  std::vector<TodoItemJson> raw;
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, json); ec) {
    log::warn("Corrupt todo snapshot JSON in store");
    return {};
  }
  std::vector<TodoItem> out;
  out.reserve(raw.size());
  for (auto &r : raw) {
    out.push_back(TodoItem{.content = std::move(r.content),
                           .status = parse<TodoStatus>(r.status),
                           .active_form = std::move(r.activeForm)});
  }
  return out;
}

// Column order of kRunColumns.
[[nodiscard]] auto to_run(const boost::mysql::row_view &row) -> Run {
  return Run{
      .id = RunId{as_str(row.at(0))},
      .plan_id = PlanId{as_str(row.at(1))},
      .task_id = TaskId{as_str(row.at(2))},
      .status = parse<RunStatus>(as_sv(row.at(3))),
      .session_id = as_opt_str(row.at(4)),
      .retry_count = static_cast<int>(as_i64(row.at(5))),
      .started_at = util::from_unix_millis(as_i64(row.at(6))),
      .ended_at = as_opt_time(row.at(7)),
      .duration_ms = as_opt_i64(row.at(8)),
      .result_text = as_opt_str(row.at(10)),
      .stop_reason = as_opt_str(row.at(11)),
      .cost_usd = as_opt_double(row.at(9)),
      .error_text = as_opt_str(row.at(12)),
  };
}

inline constexpr std::string_view kRunColumns =
    "run_id, plan_id, task_id, status, session_id, retry_count, started_at, "
    "ended_at, duration_ms, total_cost_usd, result_text, stop_reason, "
    "error_text";

[[nodiscard]] auto to_plan(const boost::mysql::row_view &row) -> Plan {
  Plan plan;
  plan.id = PlanId{as_str(row.at(0))};
  plan.summary = as_str(row.at(1));
  plan.project_path = as_str(row.at(2));
  plan.status = parse<PlanStatus>(as_sv(row.at(3)));
  plan.created_at = util::from_unix_millis(as_i64(row.at(4)));
  plan.updated_at = util::from_unix_millis(as_i64(row.at(5)));
  return plan;
}

template <typename F>
auto mysql_try(F &&f) -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const std::exception &e) {
    log::error("MySQL operation failed: {}", e.what());
    co_return fail(Error::DatabaseQueryFailed);
  }
}

} // namespace

MySqlStore::MySqlStore(boost::asio::any_io_executor executor,
                       const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySqlStore::~MySqlStore() { pool_.cancel(); }

auto MySqlStore::ensure_database_exists() -> task<Result<void>> {
  std::string direct_connect_error;
  try {
    // Connecting to the configured database directly avoids requiring the
    // CREATE DATABASE privilege for normal operation.
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.database = cfg_.database;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    direct_connect_error = e.what();
  }

  try {
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params("CREATE DATABASE IF NOT EXISTS {:i}",
                                  cfg_.database),
        res, use_awaitable);
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error(
        "MySQL ensure database failed: direct_connect='{}', create_db='{}'",
        direct_connect_error, e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySqlStore::open() -> task<Result<void>> {
  if (open_) {
    co_return ok();
  }

  auto db_res = co_await ensure_database_exists();
  if (!db_res) {
    co_return fail(db_res.error());
  }

  open_ = true;
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_ = false;
    co_return fail(conn_res.error());
  }

  auto schema_res = co_await ensure_schema(conn_res->get());
  if (!schema_res) {
    open_ = false;
    co_return fail(schema_res.error());
  }
  conn_res->return_without_reset();

  log::info("MySQL store opened: {}:{} / {}", cfg_.host, cfg_.port,
            cfg_.database);
  co_return ok();
}

auto MySqlStore::close() -> task<void> {
  if (open_) {
    pool_.cancel();
    open_ = false;
  }
  co_return;
}

auto MySqlStore::is_open() const noexcept -> bool { return open_; }

auto MySqlStore::get_connection()
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

auto MySqlStore::ensure_schema(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    boost::mysql::pipeline_request req;
    for (const auto &stmt_sql : split_sql_statements(schema::V1_SCHEMA)) {
      req.add_execute(stmt_sql);
    }
    req.add_execute("INSERT IGNORE INTO schema_version(version) VALUES (" +
                    std::to_string(schema::CURRENT_SCHEMA_VERSION) + ")");

    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn.async_run_pipeline(req, stage_responses, use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema ensure failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySqlStore::load_tasks(boost::mysql::any_connection &conn,
                            const PlanId &plan_id) -> task<std::vector<Task>> {
  boost::mysql::results res;
  co_await conn.async_execute(
      boost::mysql::with_params(
          "SELECT task_id, ordinal, title, description, acceptance_criteria, "
          "technical_notes, status, completed_at FROM tasks "
          "WHERE plan_id = {} ORDER BY ordinal ASC",
          plan_id.str()),
      res, use_awaitable);

  std::vector<Task> tasks;
  tasks.reserve(res.rows().size());
  for (auto row : res.rows()) {
    Task t;
    t.plan_id = plan_id;
    t.id = TaskId{as_str(row.at(0))};
    t.ordinal = static_cast<int>(as_i64(row.at(1)));
    t.title = as_str(row.at(2));
    t.description = as_str(row.at(3));
    t.acceptance_criteria = strings_from_json(as_sv(row.at(4)));
    t.technical_notes = strings_from_json(as_sv(row.at(5)));
    t.status = parse<TaskStatus>(as_sv(row.at(6)));
    t.completed_at = as_opt_time(row.at(7));
    tasks.emplace_back(std::move(t));
  }

  boost::mysql::results dep_res;
  co_await conn.async_execute(
      boost::mysql::with_params(
          "SELECT task_id, depends_on_task_id FROM task_dependencies "
          "WHERE plan_id = {}",
          plan_id.str()),
      dep_res, use_awaitable);
  for (auto row : dep_res.rows()) {
    const TaskId task_id{as_str(row.at(0))};
    auto it = std::ranges::find(tasks, task_id, &Task::id);
    if (it != tasks.end()) {
      it->dependencies.emplace_back(as_str(row.at(1)));
    }
  }
  co_return tasks;
}

auto MySqlStore::save_plan(const Plan &plan) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results res;
    co_await conn.async_execute("START TRANSACTION", res, use_awaitable);

    co_await conn.async_execute(
        boost::mysql::with_params(
            "INSERT INTO plans(plan_id, summary, project_path, status, "
            "created_at, updated_at) VALUES({}, {}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE summary=VALUES(summary), "
            "project_path=VALUES(project_path), status=VALUES(status), "
            "updated_at=VALUES(updated_at)",
            plan.id.str(), plan.summary, plan.project_path, plan.status,
            to_millis(plan.created_at), to_millis(plan.updated_at)),
        res, use_awaitable);

    co_await conn.async_execute(
        boost::mysql::with_params("DELETE FROM tasks WHERE plan_id = {}",
                                  plan.id.str()),
        res, use_awaitable);

    if (!plan.tasks.empty()) {
      auto format_task = [&plan](const Task &t,
                                 boost::mysql::format_context_base &ctx) {
        boost::mysql::format_sql_to(
            ctx, "({}, {}, {}, {}, {}, {}, {}, {}, {})", plan.id.str(),
            t.id.str(), t.ordinal, t.title, t.description,
            strings_to_json(t.acceptance_criteria),
            strings_to_json(t.technical_notes), t.status,
            to_millis(t.completed_at));
      };
      co_await conn.async_execute(
          boost::mysql::with_params(
              "INSERT INTO tasks(plan_id, task_id, ordinal, title, "
              "description, acceptance_criteria, technical_notes, status, "
              "completed_at) VALUES {}",
              boost::mysql::sequence(std::cref(plan.tasks), format_task)),
          res, use_awaitable);
    }

    std::vector<std::pair<std::string, std::string>> deps;
    for (const auto &t : plan.tasks) {
      for (const auto &d : t.dependencies) {
        deps.emplace_back(t.id.str(), d.str());
      }
    }
    if (!deps.empty()) {
      auto format_dep = [&plan](const std::pair<std::string, std::string> &d,
                                boost::mysql::format_context_base &ctx) {
        boost::mysql::format_sql_to(ctx, "({}, {}, {})", plan.id.str(),
                                    d.first, d.second);
      };
      co_await conn.async_execute(
          boost::mysql::with_params(
              "INSERT INTO task_dependencies(plan_id, task_id, "
              "depends_on_task_id) VALUES {}",
              boost::mysql::sequence(std::cref(deps), format_dep)),
          res, use_awaitable);
    }

    co_await conn.async_execute("COMMIT", res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySqlStore::get_plan(const PlanId &plan_id) -> task<Result<Plan>> {
  co_return co_await mysql_try([&]() -> task<Result<Plan>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT plan_id, summary, project_path, status, created_at, "
            "updated_at FROM plans WHERE plan_id = {}",
            plan_id.str()),
        res, use_awaitable);
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    auto plan = to_plan(res.rows().at(0));
    plan.tasks = co_await load_tasks(conn, plan_id);

    conn_res->return_without_reset();
    co_return ok(std::move(plan));
  });
}

auto MySqlStore::list_plans() -> task<Result<std::vector<Plan>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Plan>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results res;
    co_await conn.async_execute(
        "SELECT plan_id, summary, project_path, status, created_at, "
        "updated_at FROM plans ORDER BY created_at ASC",
        res, use_awaitable);

    std::vector<Plan> plans;
    plans.reserve(res.rows().size());
    for (auto row : res.rows()) {
      plans.emplace_back(to_plan(row));
    }
    for (auto &plan : plans) {
      plan.tasks = co_await load_tasks(conn, plan.id);
    }

    conn_res->return_without_reset();
    co_return ok(std::move(plans));
  });
}

auto MySqlStore::update_plan_status(const PlanId &plan_id, PlanStatus status)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE plans SET status = {}, updated_at = {} WHERE plan_id = {}",
            status, util::now_millis(), plan_id.str()),
        res, use_awaitable);
    if (res.affected_rows() == 0) {
      boost::mysql::results exists_res;
      co_await conn_res->get().async_execute(
          boost::mysql::with_params(
              "SELECT EXISTS(SELECT 1 FROM plans WHERE plan_id = {})",
              plan_id.str()),
          exists_res, use_awaitable);
      if (as_i64(exists_res.rows().at(0).at(0)) == 0) {
        co_return fail(Error::NotFound);
      }
    }
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySqlStore::get_tasks(const PlanId &plan_id)
    -> task<Result<std::vector<Task>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Task>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto tasks = co_await load_tasks(conn_res->get(), plan_id);
    conn_res->return_without_reset();
    co_return ok(std::move(tasks));
  });
}

auto MySqlStore::update_task_status(const PlanId &plan_id,
                                    const TaskId &task_id, TaskStatus status)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    // completed sets the timestamp, pending clears it, others keep it.
    std::string completed_expr = "completed_at";
    if (status == TaskStatus::Completed) {
      completed_expr = std::to_string(util::now_millis());
    } else if (status == TaskStatus::Pending) {
      completed_expr = "NULL";
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE tasks SET status = {}, completed_at = {:r} "
            "WHERE plan_id = {} AND task_id = {}",
            status, completed_expr, plan_id.str(), task_id.str()),
        res, use_awaitable);

    if (res.affected_rows() == 0) {
      boost::mysql::results exists_res;
      co_await conn_res->get().async_execute(
          boost::mysql::with_params(
              "SELECT EXISTS(SELECT 1 FROM tasks WHERE plan_id = {} AND "
              "task_id = {})",
              plan_id.str(), task_id.str()),
          exists_res, use_awaitable);
      if (as_i64(exists_res.rows().at(0).at(0)) == 0) {
        co_return fail(Error::NotFound);
      }
    }
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySqlStore::create_run(const Run &run) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO runs(run_id, plan_id, task_id, status, session_id, "
            "retry_count, started_at, ended_at, duration_ms, total_cost_usd, "
            "result_text, stop_reason, error_text) "
            "VALUES({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
            run.id.str(), run.plan_id.str(), run.task_id.str(), run.status,
            run.session_id, run.retry_count, to_millis(run.started_at),
            to_millis(run.ended_at), run.duration_ms, run.cost_usd,
            run.result_text, run.stop_reason, run.error_text),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySqlStore::update_run(const RunUpdate &update) -> task<Result<void>> {
  auto applied = co_await write_run(update, false);
  if (!applied) {
    co_return fail(applied.error());
  }
  co_return ok();
}

auto MySqlStore::finish_run(const RunUpdate &update) -> task<Result<bool>> {
  if (!update.status || *update.status == RunStatus::InProgress) {
    co_return fail(Error::InvalidArgument);
  }
  co_return co_await write_run(update, true);
}

auto MySqlStore::write_run(const RunUpdate &update, bool only_in_progress)
    -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    std::optional<std::string_view> status;
    if (update.status) {
      status = to_string_view(*update.status);
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE runs SET status = COALESCE({}, status), "
            "session_id = COALESCE({}, session_id), "
            "ended_at = COALESCE({}, ended_at), "
            "duration_ms = COALESCE({}, duration_ms), "
            "total_cost_usd = COALESCE({}, total_cost_usd), "
            "result_text = COALESCE({}, result_text), "
            "stop_reason = COALESCE({}, stop_reason), "
            "error_text = COALESCE({}, error_text) "
            "WHERE run_id = {} AND ({} = 0 OR status = 'in_progress')",
            status, update.session_id, to_millis(update.ended_at),
            update.duration_ms, update.cost_usd, update.result_text,
            update.stop_reason, update.error_text, update.id.str(),
            only_in_progress ? 1 : 0),
        res, use_awaitable);

    bool applied = res.affected_rows() > 0;
    if (!applied) {
      boost::mysql::results check_res;
      co_await conn_res->get().async_execute(
          boost::mysql::with_params(
              "SELECT status FROM runs WHERE run_id = {}", update.id.str()),
          check_res, use_awaitable);
      if (check_res.rows().empty()) {
        co_return fail(Error::NotFound);
      }
      // Rows whose values already match report zero affected rows.
      applied = !only_in_progress;
    }
    conn_res->return_without_reset();
    co_return ok(applied);
  });
}

auto MySqlStore::get_run(const RunId &run_id) -> task<Result<Run>> {
  co_return co_await mysql_try([&]() -> task<Result<Run>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("SELECT {:r} FROM runs WHERE run_id = {}",
                                  kRunColumns, run_id.str()),
        res, use_awaitable);
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    auto run = to_run(res.rows().at(0));
    conn_res->return_without_reset();
    co_return ok(std::move(run));
  });
}

auto MySqlStore::list_runs(const PlanId &plan_id)
    -> task<Result<std::vector<Run>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Run>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("SELECT {:r} FROM runs WHERE plan_id = {} "
                                  "ORDER BY started_at ASC",
                                  kRunColumns, plan_id.str()),
        res, use_awaitable);
    std::vector<Run> runs;
    runs.reserve(res.rows().size());
    for (auto row : res.rows()) {
      runs.emplace_back(to_run(row));
    }
    conn_res->return_without_reset();
    co_return ok(std::move(runs));
  });
}

auto MySqlStore::list_in_progress_runs(TimePoint older_than)
    -> task<Result<std::vector<Run>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Run>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM runs WHERE status = {} AND started_at < {} "
            "ORDER BY started_at ASC",
            kRunColumns, RunStatus::InProgress, to_millis(older_than)),
        res, use_awaitable);
    std::vector<Run> runs;
    runs.reserve(res.rows().size());
    for (auto row : res.rows()) {
      runs.emplace_back(to_run(row));
    }
    conn_res->return_without_reset();
    co_return ok(std::move(runs));
  });
}

auto MySqlStore::latest_failed_run(const PlanId &plan_id,
                                   const TaskId &task_id)
    -> task<Result<std::optional<Run>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::optional<Run>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM runs WHERE plan_id = {} AND task_id = {} AND "
            "status = {} ORDER BY started_at DESC LIMIT 1",
            kRunColumns, plan_id.str(), task_id.str(), RunStatus::Failed),
        res, use_awaitable);
    std::optional<Run> run;
    if (!res.rows().empty()) {
      run = to_run(res.rows().at(0));
    }
    conn_res->return_without_reset();
    co_return ok(std::move(run));
  });
}

auto MySqlStore::append_event(const RunEvent &event) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO run_events(event_id, run_id, ts, level, event_type, "
            "payload_json) VALUES({}, {}, {}, {}, {}, {})",
            event.id.str(), event.run_id.str(), to_millis(event.ts),
            event.level, event.type, dump_json(event.payload)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySqlStore::list_events(const RunId &run_id, std::size_t limit,
                             std::optional<EventId> after)
    -> task<Result<RunEventPage>> {
  co_return co_await mysql_try([&]() -> task<Result<RunEventPage>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    std::optional<std::int64_t> cursor_ts;
    if (after) {
      boost::mysql::results cursor_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "SELECT ts FROM run_events WHERE event_id = {}", after->str()),
          cursor_res, use_awaitable);
      if (!cursor_res.rows().empty()) {
        cursor_ts = as_i64(cursor_res.rows().at(0).at(0));
      }
    }

    const auto fetch = static_cast<std::uint64_t>(limit) + 1;
    boost::mysql::results res;
    if (cursor_ts) {
      co_await conn.async_execute(
          boost::mysql::with_params(
              "SELECT e.event_id, e.ts, e.level, e.event_type, e.payload_json, "
              "r.plan_id, r.task_id FROM run_events e "
              "JOIN runs r ON r.run_id = e.run_id WHERE e.run_id = {} AND "
              "(e.ts > {} OR (e.ts = {} AND e.event_id > {})) "
              "ORDER BY e.ts ASC, e.event_id ASC LIMIT {}",
              run_id.str(), *cursor_ts, *cursor_ts, after->str(), fetch),
          res, use_awaitable);
    } else {
      co_await conn.async_execute(
          boost::mysql::with_params(
              "SELECT e.event_id, e.ts, e.level, e.event_type, e.payload_json, "
              "r.plan_id, r.task_id FROM run_events e "
              "JOIN runs r ON r.run_id = e.run_id WHERE e.run_id = {} "
              "ORDER BY e.ts ASC, e.event_id ASC LIMIT {}",
              run_id.str(), fetch),
          res, use_awaitable);
    }

    RunEventPage page;
    page.has_more = res.rows().size() > limit;
    const auto count = std::min<std::size_t>(res.rows().size(), limit);
    page.events.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      auto row = res.rows().at(i);
      RunEvent ev;
      ev.id = EventId{as_str(row.at(0))};
      ev.ts = util::from_unix_millis(as_i64(row.at(1)));
      ev.run_id = run_id;
      ev.level = parse<EventLevel>(as_sv(row.at(2)));
      ev.type = parse<EventType>(as_sv(row.at(3)));
      ev.payload = parse_json(as_sv(row.at(4))).value_or(JsonValue{});
      ev.plan_id = PlanId{as_str(row.at(5))};
      ev.task_id = TaskId{as_str(row.at(6))};
      page.events.emplace_back(std::move(ev));
    }
    conn_res->return_without_reset();
    co_return ok(std::move(page));
  });
}

auto MySqlStore::save_todo_snapshot(const TodoSnapshot &snapshot)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO todo_snapshots(run_id, ts, total, pending, "
            "in_progress, completed, todos_json) "
            "VALUES({}, {}, {}, {}, {}, {}, {})",
            snapshot.run_id.str(), to_millis(snapshot.ts), snapshot.total,
            snapshot.pending, snapshot.in_progress, snapshot.completed,
            dump_json(todos_to_json(snapshot.items))),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySqlStore::latest_todo_snapshot(const RunId &run_id)
    -> task<Result<std::optional<TodoSnapshot>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::optional<TodoSnapshot>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT ts, total, pending, in_progress, completed, "
                "todos_json FROM todo_snapshots WHERE run_id = {} "
                "ORDER BY ts DESC, snapshot_rowid DESC LIMIT 1",
                run_id.str()),
            res, use_awaitable);

        std::optional<TodoSnapshot> snap;
        if (!res.rows().empty()) {
          auto row = res.rows().at(0);
          snap = TodoSnapshot{
              .run_id = run_id,
              .ts = util::from_unix_millis(as_i64(row.at(0))),
              .total = static_cast<int>(as_i64(row.at(1))),
              .pending = static_cast<int>(as_i64(row.at(2))),
              .in_progress = static_cast<int>(as_i64(row.at(3))),
              .completed = static_cast<int>(as_i64(row.at(4))),
              .items = todos_from_json(as_sv(row.at(5))),
          };
        }
        conn_res->return_without_reset();
        co_return ok(std::move(snap));
      });
}

auto MySqlStore::get_setting(std::string_view key)
    -> task<Result<std::optional<std::string>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::optional<std::string>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT value FROM app_settings WHERE `key` = {}", key),
            res, use_awaitable);
        std::optional<std::string> value;
        if (!res.rows().empty()) {
          value = as_str(res.rows().at(0).at(0));
        }
        conn_res->return_without_reset();
        co_return ok(std::move(value));
      });
}

auto MySqlStore::set_setting(std::string_view key, std::string_view value)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO app_settings(`key`, value, updated_at) "
            "VALUES({}, {}, {}) ON DUPLICATE KEY UPDATE "
            "value=VALUES(value), updated_at=VALUES(updated_at)",
            key, value, util::now_millis()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySqlStore::clear_all() -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::pipeline_request req;
    req.add_execute("SET FOREIGN_KEY_CHECKS = 0");
    for (const auto *table :
         {"todo_snapshots", "run_events", "runs", "task_dependencies", "tasks",
          "plans", "app_settings"}) {
      req.add_execute(std::string("DELETE FROM ") + table);
    }
    req.add_execute("SET FOREIGN_KEY_CHECKS = 1");

    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn_res->get().async_run_pipeline(req, stage_responses,
                                                use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

} // namespace planq
