#pragma once

#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"
#include "planq/domain/plan.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace planq {

namespace settings {
inline constexpr std::string_view kQueueParallelEnabled =
    "queue_parallel_enabled";
inline constexpr std::string_view kWebhookUrl = "webhook_url";
} // namespace settings

inline constexpr std::size_t kDefaultEventPageSize = 100;

// Abstract async persistence interface.
// Implementations: MySqlStore (durable), InMemoryStore (exec mode and tests).
// All methods are coroutines returning task<Result<T>>; missing rows are
// reported as Error::NotFound.
class Store {
public:
  virtual ~Store() = default;

  // Lifecycle
  virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> task<void> = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  // === Plans ===
  /// Inserts or replaces a plan together with its tasks and dependencies.
  virtual auto save_plan(const Plan &plan) -> task<Result<void>> = 0;
  /// Plan with its tasks ordered by ordinal.
  virtual auto get_plan(const PlanId &plan_id) -> task<Result<Plan>> = 0;
  virtual auto list_plans() -> task<Result<std::vector<Plan>>> = 0;
  virtual auto update_plan_status(const PlanId &plan_id, PlanStatus status)
      -> task<Result<void>> = 0;

  // === Tasks ===
  virtual auto get_tasks(const PlanId &plan_id)
      -> task<Result<std::vector<Task>>> = 0;
  /// Sets `completed_at` when moving to completed, clears it on pending.
  virtual auto update_task_status(const PlanId &plan_id, const TaskId &task_id,
                                  TaskStatus status) -> task<Result<void>> = 0;

  // === Runs ===
  virtual auto create_run(const Run &run) -> task<Result<void>> = 0;
  /// Fields left unset keep their value.
  virtual auto update_run(const RunUpdate &update) -> task<Result<void>> = 0;
  /// Terminal write guarded by the stored status: applies only while the run
  /// is still `in_progress`. Yields false when another writer finalized it
  /// first. `update.status` must be set.
  virtual auto finish_run(const RunUpdate &update) -> task<Result<bool>> = 0;
  virtual auto get_run(const RunId &run_id) -> task<Result<Run>> = 0;
  /// Runs of a plan, oldest first.
  virtual auto list_runs(const PlanId &plan_id)
      -> task<Result<std::vector<Run>>> = 0;
  /// `in_progress` runs started before `older_than`, oldest first.
  virtual auto list_in_progress_runs(TimePoint older_than)
      -> task<Result<std::vector<Run>>> = 0;
  virtual auto latest_failed_run(const PlanId &plan_id, const TaskId &task_id)
      -> task<Result<std::optional<Run>>> = 0;

  // === Events ===
  virtual auto append_event(const RunEvent &event) -> task<Result<void>> = 0;
  /// Events ordered by (ts, id). With `after`, only events strictly after
  /// that cursor event; an unknown cursor restarts from the beginning.
  virtual auto list_events(const RunId &run_id, std::size_t limit,
                           std::optional<EventId> after)
      -> task<Result<RunEventPage>> = 0;
  virtual auto save_todo_snapshot(const TodoSnapshot &snapshot)
      -> task<Result<void>> = 0;
  virtual auto latest_todo_snapshot(const RunId &run_id)
      -> task<Result<std::optional<TodoSnapshot>>> = 0;

  // === Settings ===
  virtual auto get_setting(std::string_view key)
      -> task<Result<std::optional<std::string>>> = 0;
  virtual auto set_setting(std::string_view key, std::string_view value)
      -> task<Result<void>> = 0;
};

} // namespace planq
