#include "planq/domain/plan.hpp"

#include <cstdint>
#include <utility>

namespace planq {

auto make_todo_snapshot(const RunId &run_id, std::vector<TodoItem> items)
    -> TodoSnapshot {
  TodoSnapshot snap{.run_id = run_id, .ts = Clock::now()};
  snap.total = static_cast<int>(items.size());
  for (const auto &item : items) {
    switch (item.status) {
    case TodoStatus::Pending:
      ++snap.pending;
      break;
    case TodoStatus::InProgress:
      ++snap.in_progress;
      break;
    case TodoStatus::Completed:
      ++snap.completed;
      break;
    }
  }
  snap.items = std::move(items);
  return snap;
}

auto todos_to_json(const std::vector<TodoItem> &todos) -> JsonValue {
  JsonValue arr = std::vector<JsonValue>{};
  for (const auto &t : todos) {
    JsonValue item{
        {"content", t.content},
        {"status", std::string(to_string_view(t.status))},
    };
    if (!t.active_form.empty()) {
      item.get_object().emplace("activeForm", t.active_form);
    }
    arr.get_array().emplace_back(std::move(item));
  }
  return arr;
}

auto event_to_json(const RunEvent &event) -> std::string {
  JsonValue j{
      {"id", event.id.str()},
      {"ts", util::format_iso8601(event.ts)},
      {"runId", event.run_id.str()},
      {"planId", event.plan_id.str()},
      {"taskId", event.task_id.str()},
      {"type", std::string(to_string_view(event.type))},
      {"level", std::string(to_string_view(event.level))},
      {"payload", event.payload},
  };
  return dump_json(j);
}

} // namespace planq
