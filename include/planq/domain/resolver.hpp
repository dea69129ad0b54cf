#pragma once

#include "planq/domain/plan.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace planq::resolver {

// All functions are pure reads over a plan's task list. A task is runnable
// when it is pending and every dependency is completed or skipped; a
// dependency id that names no task in the list never counts as satisfied.

[[nodiscard]] auto is_runnable(const Task &task, std::span<const Task> tasks)
    -> bool;

[[nodiscard]] auto count_runnable(std::span<const Task> tasks) -> std::size_t;

/// Runnable tasks in ascending ordinal order; one queue phase.
[[nodiscard]] auto runnable_tasks(std::span<const Task> tasks)
    -> std::vector<Task>;

/// The runnable task with the lowest ordinal.
[[nodiscard]] auto next_runnable(std::span<const Task> tasks)
    -> std::optional<Task>;

[[nodiscard]] auto all_done(std::span<const Task> tasks) -> bool;

} // namespace planq::resolver
