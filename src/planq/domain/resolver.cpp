#include "planq/domain/resolver.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <ranges>

namespace planq::resolver {
namespace {

using StatusIndex = ankerl::unordered_dense::map<TaskId, TaskStatus>;

[[nodiscard]] auto index_statuses(std::span<const Task> tasks) -> StatusIndex {
  StatusIndex index;
  index.reserve(tasks.size());
  for (const auto &t : tasks) {
    index.emplace(t.id, t.status);
  }
  return index;
}

[[nodiscard]] auto runnable_in(const Task &task, const StatusIndex &index)
    -> bool {
  if (task.status != TaskStatus::Pending) {
    return false;
  }
  return std::ranges::all_of(task.dependencies, [&](const TaskId &dep) {
    auto it = index.find(dep);
    return it != index.end() && satisfies_dependency(it->second);
  });
}

} // namespace

auto is_runnable(const Task &task, std::span<const Task> tasks) -> bool {
  return runnable_in(task, index_statuses(tasks));
}

auto count_runnable(std::span<const Task> tasks) -> std::size_t {
  const auto index = index_statuses(tasks);
  return static_cast<std::size_t>(std::ranges::count_if(
      tasks, [&](const Task &t) { return runnable_in(t, index); }));
}

auto runnable_tasks(std::span<const Task> tasks) -> std::vector<Task> {
  const auto index = index_statuses(tasks);
  auto out = tasks |
             std::views::filter(
                 [&](const Task &t) { return runnable_in(t, index); }) |
             std::ranges::to<std::vector>();
  std::ranges::stable_sort(out, {}, &Task::ordinal);
  return out;
}

auto next_runnable(std::span<const Task> tasks) -> std::optional<Task> {
  auto runnable = runnable_tasks(tasks);
  if (runnable.empty()) {
    return std::nullopt;
  }
  return std::move(runnable.front());
}

auto all_done(std::span<const Task> tasks) -> bool {
  return std::ranges::all_of(
      tasks, [](const Task &t) { return satisfies_dependency(t.status); });
}

} // namespace planq::resolver
