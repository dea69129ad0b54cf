#include "planq/store/memory_store.hpp"

#include <algorithm>
#include <ranges>
#include <tuple>

namespace planq {

namespace {

[[nodiscard]] auto event_before(const RunEvent &a, const RunEvent &b) -> bool {
  return std::tie(a.ts, a.id) < std::tie(b.ts, b.id);
}

auto apply_update(Run &run, const RunUpdate &update) -> void {
  if (update.status) {
    run.status = *update.status;
  }
  if (update.session_id) {
    run.session_id = update.session_id;
  }
  if (update.ended_at) {
    run.ended_at = update.ended_at;
  }
  if (update.duration_ms) {
    run.duration_ms = update.duration_ms;
  }
  if (update.result_text) {
    run.result_text = update.result_text;
  }
  if (update.stop_reason) {
    run.stop_reason = update.stop_reason;
  }
  if (update.cost_usd) {
    run.cost_usd = update.cost_usd;
  }
  if (update.error_text) {
    run.error_text = update.error_text;
  }
}

} // namespace

auto InMemoryStore::open() -> task<Result<void>> {
  open_ = true;
  co_return ok();
}

auto InMemoryStore::close() -> task<void> {
  open_ = false;
  co_return;
}

auto InMemoryStore::is_open() const noexcept -> bool { return open_; }

auto InMemoryStore::find_task(const PlanId &plan_id, const TaskId &task_id)
    -> Task * {
  auto it = plans_.find(plan_id);
  if (it == plans_.end()) {
    return nullptr;
  }
  auto &tasks = it->second.tasks;
  auto task_it = std::ranges::find(tasks, task_id, &Task::id);
  return task_it == tasks.end() ? nullptr : &*task_it;
}

auto InMemoryStore::save_plan(const Plan &plan) -> task<Result<void>> {
  if (!plans_.contains(plan.id)) {
    plan_order_.push_back(plan.id);
  }
  auto copy = plan;
  for (auto &t : copy.tasks) {
    t.plan_id = plan.id;
  }
  std::ranges::stable_sort(copy.tasks, {}, &Task::ordinal);
  plans_.insert_or_assign(plan.id, std::move(copy));
  co_return ok();
}

auto InMemoryStore::get_plan(const PlanId &plan_id) -> task<Result<Plan>> {
  auto it = plans_.find(plan_id);
  if (it == plans_.end()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto InMemoryStore::list_plans() -> task<Result<std::vector<Plan>>> {
  std::vector<Plan> out;
  out.reserve(plan_order_.size());
  for (const auto &id : plan_order_) {
    out.push_back(plans_.at(id));
  }
  co_return ok(std::move(out));
}

auto InMemoryStore::update_plan_status(const PlanId &plan_id,
                                       PlanStatus status)
    -> task<Result<void>> {
  auto it = plans_.find(plan_id);
  if (it == plans_.end()) {
    co_return fail(Error::NotFound);
  }
  it->second.status = status;
  it->second.updated_at = Clock::now();
  co_return ok();
}

auto InMemoryStore::get_tasks(const PlanId &plan_id)
    -> task<Result<std::vector<Task>>> {
  auto it = plans_.find(plan_id);
  if (it == plans_.end()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second.tasks);
}

auto InMemoryStore::update_task_status(const PlanId &plan_id,
                                       const TaskId &task_id,
                                       TaskStatus status)
    -> task<Result<void>> {
  auto *task = find_task(plan_id, task_id);
  if (task == nullptr) {
    co_return fail(Error::NotFound);
  }
  task->status = status;
  if (status == TaskStatus::Completed) {
    task->completed_at = Clock::now();
  } else if (status == TaskStatus::Pending) {
    task->completed_at.reset();
  }
  co_return ok();
}

auto InMemoryStore::create_run(const Run &run) -> task<Result<void>> {
  if (runs_.contains(run.id)) {
    co_return fail(Error::AlreadyExists);
  }
  runs_.emplace(run.id, run);
  run_order_.push_back(run.id);
  co_return ok();
}

auto InMemoryStore::update_run(const RunUpdate &update) -> task<Result<void>> {
  auto it = runs_.find(update.id);
  if (it == runs_.end()) {
    co_return fail(Error::NotFound);
  }
  apply_update(it->second, update);
  co_return ok();
}

auto InMemoryStore::finish_run(const RunUpdate &update) -> task<Result<bool>> {
  if (!update.status || *update.status == RunStatus::InProgress) {
    co_return fail(Error::InvalidArgument);
  }
  auto it = runs_.find(update.id);
  if (it == runs_.end()) {
    co_return fail(Error::NotFound);
  }
  if (it->second.status != RunStatus::InProgress) {
    co_return ok(false);
  }
  apply_update(it->second, update);
  co_return ok(true);
}

auto InMemoryStore::get_run(const RunId &run_id) -> task<Result<Run>> {
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto InMemoryStore::list_runs(const PlanId &plan_id)
    -> task<Result<std::vector<Run>>> {
  std::vector<Run> out;
  for (const auto &id : run_order_) {
    const auto &run = runs_.at(id);
    if (run.plan_id == plan_id) {
      out.push_back(run);
    }
  }
  std::ranges::stable_sort(out, {}, &Run::started_at);
  co_return ok(std::move(out));
}

auto InMemoryStore::list_in_progress_runs(TimePoint older_than)
    -> task<Result<std::vector<Run>>> {
  std::vector<Run> out;
  for (const auto &id : run_order_) {
    const auto &run = runs_.at(id);
    if (run.status == RunStatus::InProgress && run.started_at < older_than) {
      out.push_back(run);
    }
  }
  std::ranges::stable_sort(out, {}, &Run::started_at);
  co_return ok(std::move(out));
}

auto InMemoryStore::latest_failed_run(const PlanId &plan_id,
                                      const TaskId &task_id)
    -> task<Result<std::optional<Run>>> {
  std::optional<Run> latest;
  for (const auto &id : run_order_) {
    const auto &run = runs_.at(id);
    if (run.plan_id != plan_id || run.task_id != task_id ||
        run.status != RunStatus::Failed) {
      continue;
    }
    if (!latest || run.started_at >= latest->started_at) {
      latest = run;
    }
  }
  co_return ok(std::move(latest));
}

auto InMemoryStore::append_event(const RunEvent &event) -> task<Result<void>> {
  auto &list = events_[event.run_id];
  auto pos = std::ranges::upper_bound(list, event, event_before);
  list.insert(pos, event);
  co_return ok();
}

auto InMemoryStore::list_events(const RunId &run_id, std::size_t limit,
                                std::optional<EventId> after)
    -> task<Result<RunEventPage>> {
  RunEventPage page;
  auto it = events_.find(run_id);
  if (it == events_.end()) {
    co_return ok(std::move(page));
  }
  const auto &list = it->second;

  std::size_t start = 0;
  if (after) {
    auto cursor = std::ranges::find(list, *after, &RunEvent::id);
    if (cursor != list.end()) {
      start = static_cast<std::size_t>(std::distance(list.begin(), cursor)) + 1;
    }
  }

  const std::size_t available = list.size() - std::min(start, list.size());
  page.has_more = available > limit;
  const std::size_t count = std::min(available, limit);
  page.events.assign(list.begin() + static_cast<std::ptrdiff_t>(start),
                     list.begin() + static_cast<std::ptrdiff_t>(start + count));
  co_return ok(std::move(page));
}

auto InMemoryStore::save_todo_snapshot(const TodoSnapshot &snapshot)
    -> task<Result<void>> {
  todos_.insert_or_assign(snapshot.run_id, snapshot);
  co_return ok();
}

auto InMemoryStore::latest_todo_snapshot(const RunId &run_id)
    -> task<Result<std::optional<TodoSnapshot>>> {
  auto it = todos_.find(run_id);
  if (it == todos_.end()) {
    co_return ok(std::optional<TodoSnapshot>{});
  }
  co_return ok(std::optional<TodoSnapshot>{it->second});
}

auto InMemoryStore::get_setting(std::string_view key)
    -> task<Result<std::optional<std::string>>> {
  auto it = settings_.find(std::string(key));
  if (it == settings_.end()) {
    co_return ok(std::optional<std::string>{});
  }
  co_return ok(std::optional<std::string>{it->second});
}

auto InMemoryStore::set_setting(std::string_view key, std::string_view value)
    -> task<Result<void>> {
  settings_.insert_or_assign(std::string(key), std::string(value));
  co_return ok();
}

} // namespace planq
