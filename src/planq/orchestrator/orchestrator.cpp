#include "planq/orchestrator/orchestrator.hpp"

#include "planq/core/asio_awaitable.hpp"
#include "planq/domain/resolver.hpp"
#include "planq/orchestrator/queue_workspace.hpp"
#include "planq/util/log.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/steady_timer.hpp>

#include <format>
#include <utility>

namespace planq {

namespace {

inline constexpr std::string_view kUnknownRunFailure = "Unknown run failure.";
inline constexpr std::string_view kUnknownPreviousError =
    "Unknown error from previous attempt.";

using DoneChannel = boost::asio::experimental::channel<void(
    boost::system::error_code, std::size_t)>;

auto log_if_failed(const Result<void> &r, std::string_view what) -> void {
  if (!r) {
    log::warn("{} failed: {}", what, r.error().message());
  }
}

[[nodiscard]] auto elapsed_since(std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

[[nodiscard]] auto make_event(const RunId &run_id, const PlanId &plan_id,
                              const TaskId &task_id, EventType type,
                              EventLevel level, JsonValue payload)
    -> RunEvent {
  return RunEvent{.id = generate_event_id(),
                  .ts = Clock::now(),
                  .run_id = run_id,
                  .plan_id = plan_id,
                  .task_id = task_id,
                  .type = type,
                  .level = level,
                  .payload = std::move(payload)};
}

[[nodiscard]] auto message_payload(std::string message) -> JsonValue {
  return JsonValue{{"message", std::move(message)}};
}

[[nodiscard]] auto optional_number(std::optional<double> v) -> JsonValue {
  if (!v) {
    return JsonValue{};
  }
  return JsonValue(*v);
}

[[nodiscard]] auto retry_context(std::string_view previous_error, int attempt)
    -> std::string {
  return std::format("\nPrevious attempt failed: {}\nRetry attempt: #{}\n",
                     previous_error, attempt);
}

[[nodiscard]] auto worktree_context(const PhaseWorktree &wt, int phase_no)
    -> std::string {
  return std::format("\nExecution context: cwd={}, branch={}, phase={}\n",
                     wt.path, wt.branch, phase_no);
}

[[nodiscard]] auto setting_disabled(std::string value) -> bool {
  boost::algorithm::to_lower(value);
  return value == "0" || value == "false" || value == "no" || value == "off";
}

auto signal_when_done(std::shared_ptr<CompletionSignal> done,
                      std::size_t index, DoneChannel &channel) -> task<void> {
  co_await done->wait();
  auto [ec] = co_await channel.async_send(boost::system::error_code{}, index,
                                          use_nothrow);
  if (ec) {
    log::debug("phase channel closed before run {} reported", index);
  }
}

} // namespace

Orchestrator::Orchestrator(boost::asio::any_io_executor executor, Store &store,
                           IAgentService &agent, QueueConfig queue,
                           PolicyConfig policy)
    : executor_(std::move(executor)), store_(store), agent_(agent),
      queue_cfg_(std::move(queue)),
      policy_(policy.forbidden_trailer_pattern), tracker_(executor_) {}

Orchestrator::~Orchestrator() = default;

auto Orchestrator::set_event_sink(EventSink sink) -> void {
  event_sink_ = std::move(sink);
}

auto Orchestrator::set_milestone_sink(MilestoneSink sink) -> void {
  milestone_sink_ = std::move(sink);
}

auto Orchestrator::is_tracked(const RunId &run_id) const -> bool {
  return tracker_.contains(run_id);
}

auto Orchestrator::is_queue_running(const PlanId &plan_id) const -> bool {
  return running_queues_.contains(plan_id);
}

auto Orchestrator::aborted(const PlanId &plan_id) const -> bool {
  return aborted_queues_.contains(plan_id);
}

auto Orchestrator::notify(MilestoneKind kind, const PlanId &plan_id,
                          const TaskId &task_id, std::string message) -> void {
  if (milestone_sink_) {
    milestone_sink_(Milestone{.kind = kind,
                              .plan_id = plan_id,
                              .task_id = task_id,
                              .message = std::move(message)});
  }
}

auto Orchestrator::publish(RunEvent event) -> task<void> {
  if (!event.run_id.empty()) {
    log_if_failed(co_await store_.append_event(event), "append_event");
  }
  if (event_sink_) {
    event_sink_(event);
  }
}

auto Orchestrator::emit(const RunId &run_id, const PlanId &plan_id,
                        const TaskId &task_id, EventType type,
                        EventLevel level, JsonValue payload) -> task<void> {
  co_await publish(
      make_event(run_id, plan_id, task_id, type, level, std::move(payload)));
}

auto Orchestrator::load_plan(const PlanId &plan_id) -> task<Outcome<Plan>> {
  auto plan = co_await store_.get_plan(plan_id);
  if (plan) {
    co_return std::move(*plan);
  }
  if (plan.error() == make_error_code(Error::NotFound)) {
    co_return fail_with(Error::NotFound,
                        std::format("Plan not found: {}", plan_id));
  }
  co_return fail_with(plan.error(),
                      std::format("Failed to load plan {}: {}", plan_id,
                                  plan.error().message()));
}

// ---------------------------------------------------------------------------
// Run lifecycle
// ---------------------------------------------------------------------------

auto Orchestrator::run_task(const PlanId &plan_id, const TaskId &task_id)
    -> task<Outcome<RunId>> {
  auto plan = co_await load_plan(plan_id);
  if (!plan) {
    co_return fail_with(std::move(plan.error()));
  }
  const auto *task = plan->find_task(task_id);
  if (!task) {
    co_return fail_with(Error::NotFound,
                        std::format("Task not found: {}", task_id));
  }
  if (task->status == TaskStatus::InProgress) {
    co_return fail_with(
        Error::InvalidState,
        std::format("Task {} already has a run in progress.", task_id));
  }
  auto started =
      co_await start_run(*plan, *task, RunLaunch{.cwd = plan->project_path});
  if (!started) {
    co_return fail_with(std::move(started.error()));
  }
  co_return started->id;
}

auto Orchestrator::start_run(const Plan &plan, const Task &task,
                             RunLaunch launch) -> task<Outcome<StartedRun>> {
  for (const auto &id : tracker_.runs_of(plan.id)) {
    if (const auto *active = tracker_.find(id);
        active && active->task_id == task.id) {
      co_return fail_with(
          Error::InvalidState,
          std::format("Task {} already has a run in progress.", task.id));
    }
  }

  Run run{.id = generate_run_id(),
          .plan_id = plan.id,
          .task_id = task.id,
          .status = RunStatus::InProgress,
          .retry_count = launch.retry_count,
          .started_at = Clock::now()};

  // Tracked before the first suspension so concurrent starts see it.
  (void)tracker_.track(run.id, plan.id, task.id);
  auto done = tracker_.completion(run.id);

  if (auto r = co_await store_.create_run(run); !r) {
    (void)tracker_.claim(run.id);
    tracker_.resolve(run.id);
    co_return fail_with(r.error(),
                        std::format("Failed to create run for task {}: {}",
                                    task.id, r.error().message()));
  }
  log_if_failed(co_await store_.update_task_status(plan.id, task.id,
                                                   TaskStatus::InProgress),
                "update_task_status");
  log_if_failed(co_await store_.update_plan_status(plan.id, PlanStatus::Running),
                "update_plan_status");

  JsonValue started{
      {"message",
       launch.retry_count > 0
           ? std::format("Task retry #{} started.", launch.retry_count)
           : std::string{"Task execution started."}},
      {"taskTitle", task.title},
  };
  if (launch.retry_count > 0) {
    started.get_object().emplace(
        "retryCount", static_cast<std::int64_t>(launch.retry_count));
  }
  co_await emit(run.id, plan.id, task.id, EventType::Started, EventLevel::Info,
                std::move(started));
  co_await emit(run.id, plan.id, task.id, EventType::TaskStatus,
                EventLevel::Info, JsonValue{{"status", "in_progress"}});

  log::info("run {} started: plan={} task={} retry={}", run.id, plan.id,
            task.id, launch.retry_count);
  co_spawn(executor_, execute_run(run.id, plan, task, std::move(launch)),
           detached);
  co_return StartedRun{.id = run.id, .done = std::move(done)};
}

auto Orchestrator::execute_run(RunId run_id, Plan plan, Task task,
                               RunLaunch launch) -> spawn_task {
  auto *active = tracker_.find(run_id);
  if (!active) {
    // Force-cancelled before the agent call started.
    co_return;
  }
  const auto started = std::chrono::steady_clock::now();
  std::optional<std::string> session_id;

  AgentCallbacks cb;
  cb.on_log = [this, run_id, plan_id = plan.id,
               task_id = task.id](std::string_view line) {
    co_spawn(executor_,
             publish(make_event(run_id, plan_id, task_id, EventType::Log,
                                EventLevel::Info,
                                JsonValue{{"line", std::string(line)}})),
             detached);
  };
  cb.on_todo = [this, run_id, plan_id = plan.id,
                task_id = task.id](std::vector<TodoItem> todos) {
    auto event = make_event(run_id, plan_id, task_id, EventType::TodoUpdate,
                            EventLevel::Info,
                            JsonValue{{"todos", todos_to_json(todos)}});
    co_spawn(executor_,
             record_todos(make_todo_snapshot(run_id, std::move(todos)),
                          std::move(event)),
             detached);
  };
  cb.on_session = [this, run_id, &session_id](std::string id) {
    session_id = id;
    co_spawn(executor_, record_session(run_id, std::move(id)), detached);
  };
  cb.on_subagent = [this, run_id, plan_id = plan.id,
                    task_id = task.id](JsonValue data) {
    co_spawn(executor_,
             publish(make_event(
                 run_id, plan_id, task_id, EventType::Info, EventLevel::Info,
                 JsonValue{{"message", "Subagent invocation detected."},
                           {"data", std::move(data)}})),
             detached);
  };
  cb.on_interruptible = [this,
                         run_id](std::shared_ptr<IInterruptible> handle) {
    if (auto *a = tracker_.find(run_id)) {
      a->interrupt = std::move(handle);
    }
  };

  AgentRequest req{.plan_id = plan.id,
                   .plan_summary = plan.summary,
                   .task = task,
                   .context = launch.context,
                   .cwd = launch.cwd,
                   .branch = launch.branch,
                   .retry_count = launch.retry_count,
                   .stop = active->stop.get_token()};
  auto outcome = co_await agent_.run_task(std::move(req), std::move(cb));

  auto claimed = tracker_.claim(run_id);
  if (!claimed) {
    log::debug("run {} was already finalized by a forced cancel", run_id);
    co_return;
  }
  finalizing_.insert(run_id);

  if (outcome && outcome->session_id) {
    session_id = outcome->session_id;
  }
  if (claimed->cancel_requested) {
    co_await finalize_cancelled(run_id, task, session_id,
                                outcome ? &*outcome : nullptr,
                                elapsed_since(started));
  } else if (!outcome) {
    co_await finalize_failed(run_id, task, session_id,
                             outcome.error().message(),
                             elapsed_since(started));
  } else if (auto stored = co_await store_.get_run(run_id);
             stored && stored->status != RunStatus::InProgress) {
    // Another process cancelled the run; its changes are not integrated.
    log::warn("run {} was finalized elsewhere as {}, dropping its result",
              run_id, to_string_view(stored->status));
  } else {
    Outcome<void> post{};
    if (launch.post_run) {
      post = co_await launch.post_run();
    }
    if (post) {
      co_await finalize_completed(run_id, task, session_id, *outcome,
                                  elapsed_since(started));
    } else {
      co_await finalize_failed(run_id, task, session_id, post.error().message(),
                               elapsed_since(started));
    }
  }

  finalizing_.erase(run_id);
  tracker_.resolve(run_id);
}

auto Orchestrator::record_session(RunId run_id, std::string session_id)
    -> task<void> {
  if (!tracker_.contains(run_id)) {
    co_return;
  }
  // Leaves the status alone so a late write cannot reopen a finalized run.
  log_if_failed(co_await store_.update_run(RunUpdate{
                    .id = run_id, .session_id = std::move(session_id)}),
                "update_run");
}

auto Orchestrator::record_todos(TodoSnapshot snapshot, RunEvent event)
    -> task<void> {
  log_if_failed(co_await store_.save_todo_snapshot(snapshot),
                "save_todo_snapshot");
  co_await publish(std::move(event));
}

auto Orchestrator::finish(const RunUpdate &update) -> task<bool> {
  auto applied = co_await store_.finish_run(update);
  if (!applied) {
    log::warn("finalizing run {} failed: {}", update.id,
              applied.error().message());
    co_return false;
  }
  if (!*applied) {
    log::info("run {} was already finalized, keeping the stored status",
              update.id);
  }
  co_return *applied;
}

auto Orchestrator::finalize_cancelled(const RunId &run_id, const Task &task,
                                      std::optional<std::string> session_id,
                                      const AgentResult *result,
                                      std::chrono::milliseconds elapsed)
    -> task<void> {
  RunUpdate upd{.id = run_id,
                .status = RunStatus::Cancelled,
                .session_id = std::move(session_id),
                .ended_at = Clock::now(),
                .duration_ms = elapsed.count()};
  if (result) {
    upd.result_text = result->result_text;
    upd.stop_reason = result->stop_reason;
    upd.cost_usd = result->cost_usd;
  }
  if (!co_await finish(upd)) {
    co_return;
  }
  log_if_failed(co_await store_.update_task_status(task.plan_id, task.id,
                                                   TaskStatus::Pending),
                "update_task_status");
  log_if_failed(
      co_await store_.update_plan_status(task.plan_id, PlanStatus::Ready),
      "update_plan_status");
  co_await emit(run_id, task.plan_id, task.id, EventType::Cancelled,
                EventLevel::Info, message_payload("Run cancelled by user."));
  log::info("run {} cancelled: task={}", run_id, task.id);
}

auto Orchestrator::finalize_completed(const RunId &run_id, const Task &task,
                                      std::optional<std::string> session_id,
                                      const AgentResult &result,
                                      std::chrono::milliseconds elapsed)
    -> task<void> {
  const auto duration =
      result.duration_ms > 0 ? result.duration_ms : elapsed.count();
  if (!co_await finish(RunUpdate{.id = run_id,
                                 .status = RunStatus::Completed,
                                 .session_id = std::move(session_id),
                                 .ended_at = Clock::now(),
                                 .duration_ms = duration,
                                 .result_text = result.result_text,
                                 .stop_reason = result.stop_reason,
                                 .cost_usd = result.cost_usd})) {
    co_return;
  }
  log_if_failed(co_await store_.update_task_status(task.plan_id, task.id,
                                                   TaskStatus::Completed),
                "update_task_status");

  auto tasks = co_await store_.get_tasks(task.plan_id);
  const bool plan_done = tasks && resolver::all_done(*tasks);
  log_if_failed(co_await store_.update_plan_status(
                    task.plan_id,
                    plan_done ? PlanStatus::Completed : PlanStatus::Running),
                "update_plan_status");

  co_await emit(run_id, task.plan_id, task.id, EventType::TaskStatus,
                EventLevel::Info, JsonValue{{"status", "completed"}});
  co_await emit(run_id, task.plan_id, task.id, EventType::Completed,
                EventLevel::Info,
                JsonValue{{"stopReason", result.stop_reason},
                          {"totalCostUsd", optional_number(result.cost_usd)},
                          {"durationMs", duration}});
  log::info("run {} completed: task={} duration_ms={}", run_id, task.id,
            duration);
}

auto Orchestrator::finalize_failed(const RunId &run_id, const Task &task,
                                   std::optional<std::string> session_id,
                                   std::string error,
                                   std::chrono::milliseconds elapsed)
    -> task<void> {
  if (error.empty()) {
    error = kUnknownRunFailure;
  }
  if (!co_await finish(RunUpdate{.id = run_id,
                                 .status = RunStatus::Failed,
                                 .session_id = std::move(session_id),
                                 .ended_at = Clock::now(),
                                 .duration_ms = elapsed.count(),
                                 .error_text = error})) {
    co_return;
  }
  log_if_failed(co_await store_.update_task_status(task.plan_id, task.id,
                                                   TaskStatus::Failed),
                "update_task_status");
  log_if_failed(
      co_await store_.update_plan_status(task.plan_id, PlanStatus::Failed),
      "update_plan_status");
  co_await emit(run_id, task.plan_id, task.id, EventType::TaskStatus,
                EventLevel::Error, JsonValue{{"status", "failed"}});
  co_await emit(run_id, task.plan_id, task.id, EventType::Failed,
                EventLevel::Error, JsonValue{{"error", error}});
  log::error("run {} failed: task={}: {}", run_id, task.id, error);
}

auto Orchestrator::wait_for_run(const RunId &run_id) -> task<void> {
  if (auto done = tracker_.completion(run_id)) {
    co_await done->wait();
  }
}

// ---------------------------------------------------------------------------
// Cancellation
// ---------------------------------------------------------------------------

auto Orchestrator::cancel_run(RunId run_id) -> task<bool> {
  using namespace boost::asio::experimental::awaitable_operators;

  auto *active = tracker_.find(run_id);
  if (!active) {
    co_return false;
  }
  active->cancel_requested = true;
  auto handle = active->interrupt;
  if (!handle) {
    log::info("run {} has no interrupt handle, forcing cancel", run_id);
    co_await force_cancel_run(run_id);
    co_return true;
  }

  log::info("interrupting run {}", run_id);
  boost::asio::steady_timer timer(executor_, queue_cfg_.cancel_timeout);
  auto first = co_await (handle->interrupt() || timer.async_wait(use_nothrow));
  if (first.index() == 0) {
    const auto &interrupted = std::get<0>(first);
    if (interrupted) {
      co_return true;
    }
    // The timeout still decides whether the run is forced.
    log::warn("interrupt of run {} failed: {}", run_id,
              interrupted.error().message());
    auto done = tracker_.completion(run_id);
    if (!done) {
      co_return true;
    }
    auto second = co_await (done->wait() || timer.async_wait(use_nothrow));
    if (second.index() == 0) {
      co_return true;
    }
  }

  log::warn("run {} did not stop within {}ms, forcing cancel", run_id,
            queue_cfg_.cancel_timeout.count());
  co_await force_cancel_run(run_id);
  co_return true;
}

auto Orchestrator::force_cancel_run(RunId run_id) -> task<void> {
  if (auto claimed = tracker_.claim(run_id)) {
    claimed->stop.request_stop();
  }
  if (finalizing_.contains(run_id)) {
    // The agent call already returned; its finalization owns the run.
    co_return;
  }

  auto run = co_await store_.get_run(run_id);
  if (!run) {
    log::warn("force cancel: run {} not readable: {}", run_id,
              run.error().message());
  } else if (run->status == RunStatus::InProgress &&
             co_await finish(RunUpdate{
                 .id = run_id,
                 .status = RunStatus::Cancelled,
                 .ended_at = Clock::now(),
                 .error_text = "Cancelled (forced after timeout)"})) {
    log_if_failed(co_await store_.update_task_status(
                      run->plan_id, run->task_id, TaskStatus::Pending),
                  "update_task_status");
    log_if_failed(
        co_await store_.update_plan_status(run->plan_id, PlanStatus::Ready),
        "update_plan_status");
    co_await emit(run_id, run->plan_id, run->task_id, EventType::Cancelled,
                  EventLevel::Info,
                  message_payload("Run cancelled (forced after timeout)."));
    log::warn("run {} force-cancelled", run_id);
  }
  tracker_.resolve(run_id);
}

auto Orchestrator::abort_queue(const PlanId &plan_id) -> task<void> {
  if (!running_queues_.contains(plan_id)) {
    co_return;
  }
  aborted_queues_.insert(plan_id);

  for (const auto &id : tracker_.runs_of(plan_id)) {
    auto *active = tracker_.find(id);
    if (!active || active->cancel_requested) {
      continue;
    }
    active->cancel_requested = true;
    co_spawn(executor_, cancel_run(id), [id](std::exception_ptr ep, bool) {
      if (ep) {
        log::warn("cancel of run {} threw", id);
      }
    });
  }

  log_if_failed(co_await store_.update_plan_status(plan_id, PlanStatus::Ready),
                "update_plan_status");
  co_await emit(RunId{}, plan_id, TaskId{}, EventType::Info, EventLevel::Info,
                message_payload("Queue execution aborted by user."));
  log::info("queue for plan {} aborted", plan_id);
}

// ---------------------------------------------------------------------------
// Retry and skip
// ---------------------------------------------------------------------------

auto Orchestrator::retry_task(const PlanId &plan_id, const TaskId &task_id)
    -> task<Outcome<RunId>> {
  auto plan = co_await load_plan(plan_id);
  if (!plan) {
    co_return fail_with(std::move(plan.error()));
  }
  const auto *task = plan->find_task(task_id);
  if (!task) {
    co_return fail_with(Error::NotFound,
                        std::format("Task not found: {}", task_id));
  }
  if (task->status != TaskStatus::Failed) {
    co_return fail_with(
        Error::InvalidState,
        std::format("Task {} is not in a failed state (current: {}). Only "
                    "failed tasks can be retried.",
                    task_id, to_string_view(task->status)));
  }

  auto failed_run = co_await store_.latest_failed_run(plan_id, task_id);
  if (!failed_run) {
    co_return fail_with(failed_run.error(),
                        std::format("Failed to read runs of task {}: {}",
                                    task_id, failed_run.error().message()));
  }
  const auto &previous = *failed_run;
  const int attempt = (previous ? previous->retry_count : 0) + 1;
  if (attempt > queue_cfg_.max_retries) {
    co_return fail_with(
        Error::MaxRetriesExceeded,
        std::format("Task {} has reached the maximum retry limit ({}). "
                    "Consider skipping this task or adjusting the approach "
                    "manually.",
                    task_id, queue_cfg_.max_retries));
  }
  const std::string previous_error =
      previous && previous->error_text ? *previous->error_text
                                       : std::string(kUnknownPreviousError);

  auto started = co_await start_run(
      *plan, *task,
      RunLaunch{.cwd = plan->project_path,
                .context = retry_context(previous_error, attempt),
                .retry_count = attempt});
  if (!started) {
    co_return fail_with(std::move(started.error()));
  }
  co_return started->id;
}

auto Orchestrator::skip_task(const PlanId &plan_id, const TaskId &task_id)
    -> task<Outcome<void>> {
  auto plan = co_await load_plan(plan_id);
  if (!plan) {
    co_return fail_with(std::move(plan.error()));
  }
  const auto *task = plan->find_task(task_id);
  if (!task) {
    co_return fail_with(Error::NotFound,
                        std::format("Task not found: {}", task_id));
  }
  if (task->status != TaskStatus::Failed) {
    co_return fail_with(
        Error::InvalidState,
        std::format("Task {} is not in a failed state (current: {}). Only "
                    "failed tasks can be skipped.",
                    task_id, to_string_view(task->status)));
  }

  if (auto r = co_await store_.update_task_status(plan_id, task_id,
                                                  TaskStatus::Skipped);
      !r) {
    co_return fail_with(r.error(), std::format("Failed to skip task {}: {}",
                                               task_id, r.error().message()));
  }
  auto tasks = co_await store_.get_tasks(plan_id);
  const bool plan_done = tasks && resolver::all_done(*tasks);
  log_if_failed(co_await store_.update_plan_status(
                    plan_id, plan_done ? PlanStatus::Completed
                                       : PlanStatus::Ready),
                "update_plan_status");
  co_await emit(
      RunId{}, plan_id, task_id, EventType::TaskStatus, EventLevel::Info,
      JsonValue{{"status", "skipped"},
                {"message", std::format("Task {} skipped by user.", task_id)}});
  log::info("task {} of plan {} skipped", task_id, plan_id);
  co_return Outcome<void>{};
}

// ---------------------------------------------------------------------------
// Stale-run recovery
// ---------------------------------------------------------------------------

auto Orchestrator::cleanup_stale_runs() -> task<Result<std::size_t>> {
  const auto cutoff = Clock::now() - queue_cfg_.stale_threshold;
  auto stale = co_await store_.list_in_progress_runs(cutoff);
  if (!stale) {
    co_return fail(stale.error());
  }

  std::size_t cleaned = 0;
  for (const auto &run : *stale) {
    if (tracker_.contains(run.id)) {
      continue;
    }
    log::warn("cleaning up stale run {} (started {})", run.id,
              util::format_iso8601(run.started_at));
    if (!co_await finish(RunUpdate{
            .id = run.id,
            .status = RunStatus::Cancelled,
            .ended_at = Clock::now(),
            .error_text = "Cancelled (stale run cleaned up on startup)"})) {
      continue;
    }
    log_if_failed(co_await store_.update_task_status(run.plan_id, run.task_id,
                                                     TaskStatus::Pending),
                  "update_task_status");
    log_if_failed(
        co_await store_.update_plan_status(run.plan_id, PlanStatus::Ready),
        "update_plan_status");
    ++cleaned;
  }
  if (cleaned > 0) {
    log::info("cleaned up {} stale run(s) from a previous session", cleaned);
  }
  co_return cleaned;
}

// ---------------------------------------------------------------------------
// Queue
// ---------------------------------------------------------------------------

auto Orchestrator::run_all(const PlanId &plan_id, bool sequential)
    -> task<Outcome<RunAllResult>> {
  auto plan = co_await load_plan(plan_id);
  if (!plan) {
    co_return fail_with(std::move(plan.error()));
  }
  if (running_queues_.contains(plan_id)) {
    co_return RunAllResult{.reason = "Queue is already running for this plan."};
  }
  if (!tracker_.runs_of(plan_id).empty()) {
    co_return RunAllResult{
        .reason = "A run is already in progress for this plan."};
  }

  auto done = std::make_shared<CompletionSignal>(executor_);
  running_queues_.insert_or_assign(plan_id, done);

  if (auto r = co_await reconcile_orphans(plan_id); !r) {
    running_queues_.erase(plan_id);
    done->resolve();
    co_return fail_with(r.error(),
                        std::format("Failed to reconcile runs of plan {}: {}",
                                    plan_id, r.error().message()));
  }
  auto tasks = co_await store_.get_tasks(plan_id);
  const auto queued = tasks ? resolver::count_runnable(*tasks) : 0;
  const bool parallel = co_await parallel_enabled(sequential);

  co_spawn(executor_, run_queue(plan_id, parallel, done), detached);
  co_return RunAllResult{.queued = queued};
}

auto Orchestrator::wait_for_queue(const PlanId &plan_id) -> task<void> {
  auto it = running_queues_.find(plan_id);
  if (it == running_queues_.end()) {
    co_return;
  }
  auto done = it->second;
  co_await done->wait();
}

auto Orchestrator::reconcile_orphans(const PlanId &plan_id)
    -> task<Result<void>> {
  auto runs = co_await store_.list_runs(plan_id);
  if (!runs) {
    co_return fail(runs.error());
  }
  for (const auto &run : *runs) {
    if (run.status != RunStatus::InProgress || tracker_.contains(run.id)) {
      continue;
    }
    log::warn("reconciling orphaned run {} of task {}", run.id, run.task_id);
    if (!co_await finish(RunUpdate{
            .id = run.id,
            .status = RunStatus::Cancelled,
            .ended_at = Clock::now(),
            .error_text =
                "Cancelled (orphaned run reconciled at queue start)"})) {
      continue;
    }
    log_if_failed(co_await store_.update_task_status(plan_id, run.task_id,
                                                     TaskStatus::Pending),
                  "update_task_status");
  }
  co_return ok();
}

auto Orchestrator::parallel_enabled(bool sequential) -> task<bool> {
  if (sequential || !queue_cfg_.parallel) {
    co_return false;
  }
  auto setting = co_await store_.get_setting(settings::kQueueParallelEnabled);
  if (!setting) {
    log::warn("reading setting {} failed: {}", settings::kQueueParallelEnabled,
              setting.error().message());
    co_return true;
  }
  co_return !(*setting && setting_disabled(**setting));
}

auto Orchestrator::run_queue(PlanId plan_id, bool parallel,
                             std::shared_ptr<CompletionSignal> done)
    -> spawn_task {
  log::info("queue started: plan={} mode={}", plan_id,
            parallel ? "parallel" : "sequential");
  notify(MilestoneKind::QueueStarted, plan_id, TaskId{},
         std::format("Queue started in {} mode.",
                     parallel ? "parallel" : "sequential"));

  Outcome<void> outcome{};
  if (parallel) {
    outcome = co_await run_parallel(plan_id);
  } else {
    outcome = co_await run_sequential(plan_id);
  }

  const bool was_aborted = aborted(plan_id);
  std::string summary = "Queue finished.";
  if (was_aborted) {
    summary = "Queue aborted.";
  } else if (!outcome) {
    summary = outcome.error().message();
    log::error("queue for plan {} stopped: {}", plan_id, summary);
    const bool cancelled =
        outcome.error().code == make_error_code(Error::Cancelled);
    log_if_failed(co_await store_.update_plan_status(
                      plan_id, cancelled ? PlanStatus::Ready
                                         : PlanStatus::Failed),
                  "update_plan_status");
    co_await emit(RunId{}, plan_id, TaskId{}, EventType::Info,
                  cancelled ? EventLevel::Info : EventLevel::Error,
                  message_payload(summary));
  }

  aborted_queues_.erase(plan_id);
  running_queues_.erase(plan_id);
  log::info("queue finished: plan={} ({})", plan_id, summary);
  notify(MilestoneKind::QueueFinished, plan_id, TaskId{}, summary);
  done->resolve();
}

auto Orchestrator::run_sequential(const PlanId &plan_id)
    -> task<Outcome<void>> {
  while (!aborted(plan_id)) {
    auto plan = co_await load_plan(plan_id);
    if (!plan) {
      co_return fail_with(std::move(plan.error()));
    }
    auto next = resolver::next_runnable(plan->tasks);
    if (!next) {
      break;
    }
    auto started =
        co_await start_run(*plan, *next, RunLaunch{.cwd = plan->project_path});
    if (!started) {
      co_return fail_with(std::move(started.error()));
    }
    co_await started->done->wait();
    if (aborted(plan_id)) {
      break;
    }
    auto run = co_await store_.get_run(started->id);
    if (!run || run->status != RunStatus::Completed) {
      break;
    }
  }
  co_return Outcome<void>{};
}

auto Orchestrator::run_parallel(const PlanId &plan_id) -> task<Outcome<void>> {
  auto plan = co_await load_plan(plan_id);
  if (!plan) {
    co_return fail_with(std::move(plan.error()));
  }
  auto prepared = co_await QueueWorkspace::prepare(
      executor_, plan->project_path, plan_id, queue_cfg_);
  if (!prepared) {
    co_return fail_with(std::move(prepared.error()));
  }
  auto ws = std::move(*prepared);

  Outcome<void> result{};
  for (int phase_no = 1; !aborted(plan_id); ++phase_no) {
    auto current = co_await load_plan(plan_id);
    if (!current) {
      result = fail_with(std::move(current.error()));
      break;
    }
    auto phase = resolver::runnable_tasks(current->tasks);
    if (phase.empty()) {
      break;
    }
    result = co_await run_phase(*current, std::move(phase), phase_no, ws);
    if (!result) {
      break;
    }
  }

  co_await ws->release();
  co_return result;
}

auto Orchestrator::run_phase(const Plan &plan, std::vector<Task> phase,
                             int phase_no,
                             const std::shared_ptr<QueueWorkspace> &ws)
    -> task<Outcome<void>> {
  log::info("plan {} phase {}: {} task(s)", plan.id, phase_no, phase.size());

  // Every worktree exists before any task starts.
  std::vector<PhaseWorktree> worktrees;
  worktrees.reserve(phase.size());
  for (const auto &t : phase) {
    auto wt = co_await ws->add_worktree(plan.id, t.id);
    if (!wt) {
      for (const auto &created : worktrees) {
        co_await ws->discard(created);
      }
      notify(MilestoneKind::PhaseFailed, plan.id, t.id, wt.error().message());
      co_return fail_with(std::move(wt.error()));
    }
    worktrees.push_back(std::move(*wt));
  }

  DoneChannel finished(executor_, phase.size());
  std::vector<StartedRun> started;
  std::optional<Failure> failure;
  for (std::size_t i = 0; i < phase.size(); ++i) {
    auto s = co_await start_run(
        plan, phase[i],
        RunLaunch{.cwd = worktrees[i].path,
                  .branch = worktrees[i].branch,
                  .context = worktree_context(worktrees[i], phase_no),
                  .post_run = [this, ws, wt = worktrees[i], plan_id = plan.id] {
                    return integrate(ws, wt, plan_id);
                  }});
    if (!s) {
      failure = std::move(s.error());
      break;
    }
    co_spawn(executor_, signal_when_done(s->done, i, finished), detached);
    started.push_back(std::move(*s));
  }

  auto cancel_unfinished = [&](const std::vector<bool> &seen) {
    for (std::size_t i = 0; i < started.size(); ++i) {
      if (!seen[i]) {
        co_spawn(executor_, cancel_run(started[i].id), detached);
      }
    }
  };

  std::vector<bool> seen(started.size(), false);
  std::vector<bool> merged(phase.size(), false);
  if (failure) {
    cancel_unfinished(seen);
  }

  for (std::size_t remaining = started.size(); remaining > 0; --remaining) {
    auto [ec, idx] = co_await finished.async_receive(use_nothrow);
    if (ec) {
      break;
    }
    seen[idx] = true;
    const auto &task_id = phase[idx].id;
    auto run = co_await store_.get_run(started[idx].id);
    if (run && run->status == RunStatus::Completed) {
      merged[idx] = true;
      continue;
    }
    if (failure || aborted(plan.id)) {
      continue;
    }

    if (!run) {
      failure = Failure{.code = run.error(),
                        .reason = std::format("Failed to read run of task {}.",
                                              task_id)};
    } else if (run->status == RunStatus::Cancelled) {
      failure = Failure{
          .code = make_error_code(Error::Cancelled),
          .reason = std::format("Task {} was cancelled in phase {}.", task_id,
                                phase_no)};
    } else {
      failure = Failure{
          .code = make_error_code(Error::AgentFailed),
          .reason = std::format(
              "Task {} failed in phase {}: {}", task_id, phase_no,
              run->error_text.value_or(std::string(kUnknownRunFailure)))};
    }
    log::error("phase {} of plan {} failed: {}", phase_no, plan.id,
               failure->reason);
    cancel_unfinished(seen);
  }

  for (std::size_t i = 0; i < worktrees.size(); ++i) {
    if (!merged[i]) {
      co_await ws->discard(worktrees[i]);
    }
  }

  if (failure) {
    notify(MilestoneKind::PhaseFailed, plan.id, TaskId{}, failure->reason);
    co_return fail_with(std::move(*failure));
  }
  co_return Outcome<void>{};
}

auto Orchestrator::integrate(std::shared_ptr<QueueWorkspace> ws,
                             PhaseWorktree wt, PlanId plan_id)
    -> task<Outcome<void>> {
  if (auto checked = co_await ws->validate(wt, policy_); !checked) {
    log::error("task {} rejected: {}", wt.task_id, checked.error().message());
    co_return checked;
  }
  if (auto merged = co_await ws->merge(wt); !merged) {
    log::error("task {} not merged: {}", wt.task_id, merged.error().message());
    co_return merged;
  }
  notify(MilestoneKind::TaskMerged, plan_id, wt.task_id,
         std::format("Merged {} into {}.", wt.branch,
                     ws->context().target_branch));
  co_return Outcome<void>{};
}

} // namespace planq
