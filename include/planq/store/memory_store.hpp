#pragma once

#include "planq/store/store.hpp"

#include <ankerl/unordered_dense.h>

#include <string>
#include <vector>

namespace planq {

/// Non-durable Store used by `planq exec` and the test suite. Not
/// thread-safe; callers stay on one io_context.
class InMemoryStore final : public Store {
public:
  InMemoryStore() = default;

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

private:
  [[nodiscard]] auto find_task(const PlanId &plan_id, const TaskId &task_id)
      -> Task *;

  bool open_{false};
  ankerl::unordered_dense::map<PlanId, Plan> plans_;
  std::vector<PlanId> plan_order_;
  ankerl::unordered_dense::map<RunId, Run> runs_;
  std::vector<RunId> run_order_;
  ankerl::unordered_dense::map<RunId, std::vector<RunEvent>> events_;
  ankerl::unordered_dense::map<RunId, TodoSnapshot> todos_;
  ankerl::unordered_dense::map<std::string, std::string> settings_;
};

} // namespace planq
