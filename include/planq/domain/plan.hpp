#pragma once

#include "planq/util/enum.hpp"
#include "planq/util/id.hpp"
#include "planq/util/json.hpp"
#include "planq/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace planq {

enum class TaskStatus : std::uint8_t {
  Pending,
  InProgress,
  Completed,
  Failed,
  Skipped,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, InProgress, Completed, Failed,
                    Skipped)
PLANQ_DEFINE_ENUM_SERDE(TaskStatus, TaskStatus::Pending)

enum class PlanStatus : std::uint8_t {
  Draft,
  Ready,
  Running,
  Completed,
  Failed,
};
BOOST_DESCRIBE_ENUM(PlanStatus, Draft, Ready, Running, Completed, Failed)
PLANQ_DEFINE_ENUM_SERDE(PlanStatus, PlanStatus::Draft)

enum class RunStatus : std::uint8_t {
  Queued,
  InProgress,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(RunStatus, Queued, InProgress, Completed, Failed,
                    Cancelled)
PLANQ_DEFINE_ENUM_SERDE(RunStatus, RunStatus::Queued)

enum class EventType : std::uint8_t {
  Started,
  Log,
  TodoUpdate,
  TaskStatus,
  Completed,
  Failed,
  Cancelled,
  Info,
};
BOOST_DESCRIBE_ENUM(EventType, Started, Log, TodoUpdate, TaskStatus,
                    Completed, Failed, Cancelled, Info)
PLANQ_DEFINE_ENUM_SERDE(EventType, EventType::Info)

enum class EventLevel : std::uint8_t { Info, Error };
BOOST_DESCRIBE_ENUM(EventLevel, Info, Error)
PLANQ_DEFINE_ENUM_SERDE(EventLevel, EventLevel::Info)

enum class TodoStatus : std::uint8_t { Pending, InProgress, Completed };
BOOST_DESCRIBE_ENUM(TodoStatus, Pending, InProgress, Completed)
PLANQ_DEFINE_ENUM_SERDE(TodoStatus, TodoStatus::Pending)

/// A dependency is satisfied once its task is completed or skipped.
[[nodiscard]] constexpr auto satisfies_dependency(TaskStatus s) noexcept
    -> bool {
  return s == TaskStatus::Completed || s == TaskStatus::Skipped;
}

struct Task {
  PlanId plan_id;
  TaskId id;
  int ordinal{0};
  std::string title;
  std::string description;
  std::vector<TaskId> dependencies;
  std::vector<std::string> acceptance_criteria;
  std::vector<std::string> technical_notes;
  TaskStatus status{TaskStatus::Pending};
  std::optional<TimePoint> completed_at;
};

struct Plan {
  PlanId id;
  std::string summary;
  std::string project_path;
  PlanStatus status{PlanStatus::Draft};
  TimePoint created_at{};
  TimePoint updated_at{};
  std::vector<Task> tasks;

  [[nodiscard]] auto find_task(const TaskId &task_id) const -> const Task * {
    for (const auto &t : tasks) {
      if (t.id == task_id) {
        return &t;
      }
    }
    return nullptr;
  }
};

struct Run {
  RunId id;
  PlanId plan_id;
  TaskId task_id;
  RunStatus status{RunStatus::Queued};
  std::optional<std::string> session_id;
  int retry_count{0};
  TimePoint started_at{};
  std::optional<TimePoint> ended_at;
  std::optional<std::int64_t> duration_ms;
  std::optional<std::string> result_text;
  std::optional<std::string> stop_reason;
  std::optional<double> cost_usd;
  std::optional<std::string> error_text;
};

/// Partial update of a Run; unset fields keep their stored value.
// Unset fields keep their stored value.
struct RunUpdate {
  RunId id;
  std::optional<RunStatus> status;
  std::optional<std::string> session_id;
  std::optional<TimePoint> ended_at;
  std::optional<std::int64_t> duration_ms;
  std::optional<std::string> result_text;
  std::optional<std::string> stop_reason;
  std::optional<double> cost_usd;
  std::optional<std::string> error_text;
};

struct TodoItem {
  std::string content;
  TodoStatus status{TodoStatus::Pending};
  std::string active_form;
};

struct TodoSnapshot {
  RunId run_id;
  TimePoint ts{};
  int total{0};
  int pending{0};
  int in_progress{0};
  int completed{0};
  std::vector<TodoItem> items;
};

[[nodiscard]] auto make_todo_snapshot(const RunId &run_id,
                                      std::vector<TodoItem> items)
    -> TodoSnapshot;

struct RunEvent {
  EventId id;
  TimePoint ts{};
  RunId run_id;
  PlanId plan_id;
  TaskId task_id;
  EventType type{EventType::Info};
  EventLevel level{EventLevel::Info};
  JsonValue payload{};
};

struct RunEventPage {
  std::vector<RunEvent> events;
  bool has_more{false};
};

[[nodiscard]] auto todos_to_json(const std::vector<TodoItem> &todos)
    -> JsonValue;

[[nodiscard]] auto event_to_json(const RunEvent &event) -> std::string;

} // namespace planq
