#pragma once

#include "planq/config/system_config.hpp"
#include "planq/store/store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

namespace planq {

class MySqlStore final : public Store {
public:
  explicit MySqlStore(boost::asio::any_io_executor executor,
                      const DatabaseConfig &config);
  ~MySqlStore() override;

  MySqlStore(const MySqlStore &) = delete;
  MySqlStore &operator=(const MySqlStore &) = delete;

  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto save_plan(const Plan &plan) -> task<Result<void>> override;
  auto get_plan(const PlanId &plan_id) -> task<Result<Plan>> override;
  auto list_plans() -> task<Result<std::vector<Plan>>> override;
  auto update_plan_status(const PlanId &plan_id, PlanStatus status)
      -> task<Result<void>> override;

  auto get_tasks(const PlanId &plan_id)
      -> task<Result<std::vector<Task>>> override;
  auto update_task_status(const PlanId &plan_id, const TaskId &task_id,
                          TaskStatus status) -> task<Result<void>> override;

  auto create_run(const Run &run) -> task<Result<void>> override;
  auto update_run(const RunUpdate &update) -> task<Result<void>> override;
  auto finish_run(const RunUpdate &update) -> task<Result<bool>> override;
  auto get_run(const RunId &run_id) -> task<Result<Run>> override;
  auto list_runs(const PlanId &plan_id)
      -> task<Result<std::vector<Run>>> override;
  auto list_in_progress_runs(TimePoint older_than)
      -> task<Result<std::vector<Run>>> override;
  auto latest_failed_run(const PlanId &plan_id, const TaskId &task_id)
      -> task<Result<std::optional<Run>>> override;

  auto append_event(const RunEvent &event) -> task<Result<void>> override;
  auto list_events(const RunId &run_id, std::size_t limit,
                   std::optional<EventId> after)
      -> task<Result<RunEventPage>> override;
  auto save_todo_snapshot(const TodoSnapshot &snapshot)
      -> task<Result<void>> override;
  auto latest_todo_snapshot(const RunId &run_id)
      -> task<Result<std::optional<TodoSnapshot>>> override;

  auto get_setting(std::string_view key)
      -> task<Result<std::optional<std::string>>> override;
  auto set_setting(std::string_view key, std::string_view value)
      -> task<Result<void>> override;

  /// Drops every planq row; used by `planq db init --reset` and tests.
  auto clear_all() -> task<Result<void>>;

private:
  auto ensure_database_exists() -> task<Result<void>>;
  auto get_connection() -> task<Result<boost::mysql::pooled_connection>>;
  auto write_run(const RunUpdate &update, bool only_in_progress)
      -> task<Result<bool>>;
  auto ensure_schema(boost::mysql::any_connection &conn) -> task<Result<void>>;
  auto load_tasks(boost::mysql::any_connection &conn, const PlanId &plan_id)
      -> task<std::vector<Task>>;

  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  bool open_{false};
};

} // namespace planq
