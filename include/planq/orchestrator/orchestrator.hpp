#pragma once

#include "planq/agent/agent.hpp"
#include "planq/config/system_config.hpp"
#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"
#include "planq/domain/plan.hpp"
#include "planq/git/commit_policy.hpp"
#include "planq/notify/milestone.hpp"
#include "planq/orchestrator/run_tracker.hpp"
#include "planq/store/store.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace planq {

class QueueWorkspace;
struct PhaseWorktree;

using EventSink = std::move_only_function<void(const RunEvent &event)>;
using MilestoneSink = std::move_only_function<void(const Milestone &m)>;

struct RunAllResult {
  /// Runnable tasks at the time the queue started.
  std::size_t queued{0};
  /// Set when the queue was refused.
  std::optional<std::string> reason;
};

/// Drives task runs for plans held in a Store. All state lives on one
/// executor; runs overlap only while waiting on the agent, git or timers.
///
/// Runs are started in the background. Every run has exactly one
/// finalizer: the agent-call completion or a forced cancel, whichever claims
/// the ActiveRun first.
class Orchestrator {
public:
  Orchestrator(boost::asio::any_io_executor executor, Store &store,
               IAgentService &agent, QueueConfig queue, PolicyConfig policy);
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  auto operator=(const Orchestrator &) -> Orchestrator & = delete;

  auto set_event_sink(EventSink sink) -> void;
  auto set_milestone_sink(MilestoneSink sink) -> void;

  /// Starts one task in the plan's project directory.
  [[nodiscard]] auto run_task(const PlanId &plan_id, const TaskId &task_id)
      -> task<Outcome<RunId>>;

  /// Starts the queue loop in the background unless refused.
  [[nodiscard]] auto run_all(const PlanId &plan_id, bool sequential = false)
      -> task<Outcome<RunAllResult>>;

  /// Interrupts a tracked run, escalating to force_cancel_run when the
  /// interrupt does not land within the cancel timeout. False when the run
  /// is not tracked.
  auto cancel_run(RunId run_id) -> task<bool>;

  /// Finalizes a still in-progress run as cancelled and abandons its agent
  /// call. Idempotent.
  auto force_cancel_run(RunId run_id) -> task<void>;

  auto abort_queue(const PlanId &plan_id) -> task<void>;

  [[nodiscard]] auto retry_task(const PlanId &plan_id, const TaskId &task_id)
      -> task<Outcome<RunId>>;
  [[nodiscard]] auto skip_task(const PlanId &plan_id, const TaskId &task_id)
      -> task<Outcome<void>>;

  /// Cancels untracked in-progress runs older than the stale threshold.
  /// Returns how many were cleaned up.
  [[nodiscard]] auto cleanup_stale_runs() -> task<Result<std::size_t>>;

  /// Completes once the run is finalized; immediately for unknown runs.
  auto wait_for_run(const RunId &run_id) -> task<void>;
  auto wait_for_queue(const PlanId &plan_id) -> task<void>;

  [[nodiscard]] auto is_tracked(const RunId &run_id) const -> bool;
  [[nodiscard]] auto is_queue_running(const PlanId &plan_id) const -> bool;
  [[nodiscard]] auto active_run_count() const noexcept -> std::size_t {
    return tracker_.size();
  }

private:
  /// Runs after a successful agent call, before the run is finalized. A
  /// failure turns the run into a failed one.
  using PostRunStep = std::move_only_function<task<Outcome<void>>()>;

  struct RunLaunch {
    std::string cwd;
    std::string branch;
    std::string context;
    int retry_count{0};
    PostRunStep post_run;
  };

  struct StartedRun {
    RunId id;
    std::shared_ptr<CompletionSignal> done;
  };

  auto start_run(const Plan &plan, const Task &task, RunLaunch launch)
      -> task<Outcome<StartedRun>>;
  auto execute_run(RunId run_id, Plan plan, Task task, RunLaunch launch)
      -> spawn_task;
  /// Terminal run write; false when the run was finalized elsewhere or the
  /// write failed, in which case no follow-up writes may happen.
  auto finish(const RunUpdate &update) -> task<bool>;
  auto finalize_cancelled(const RunId &run_id, const Task &task,
                          std::optional<std::string> session_id,
                          const AgentResult *result,
                          std::chrono::milliseconds elapsed) -> task<void>;
  auto finalize_completed(const RunId &run_id, const Task &task,
                          std::optional<std::string> session_id,
                          const AgentResult &result,
                          std::chrono::milliseconds elapsed) -> task<void>;
  auto finalize_failed(const RunId &run_id, const Task &task,
                       std::optional<std::string> session_id,
                       std::string error, std::chrono::milliseconds elapsed)
      -> task<void>;

  auto record_session(RunId run_id, std::string session_id) -> task<void>;
  auto record_todos(TodoSnapshot snapshot, RunEvent event) -> task<void>;

  auto run_queue(PlanId plan_id, bool parallel,
                 std::shared_ptr<CompletionSignal> done) -> spawn_task;
  auto run_sequential(const PlanId &plan_id) -> task<Outcome<void>>;
  auto run_parallel(const PlanId &plan_id) -> task<Outcome<void>>;
  auto run_phase(const Plan &plan, std::vector<Task> phase, int phase_no,
                 const std::shared_ptr<QueueWorkspace> &ws)
      -> task<Outcome<void>>;
  auto integrate(std::shared_ptr<QueueWorkspace> ws, PhaseWorktree wt,
                 PlanId plan_id) -> task<Outcome<void>>;
  auto reconcile_orphans(const PlanId &plan_id) -> task<Result<void>>;
  auto parallel_enabled(bool sequential) -> task<bool>;

  auto load_plan(const PlanId &plan_id) -> task<Outcome<Plan>>;

  /// Persists events that belong to a run, then hands every event to the
  /// sink.
  auto publish(RunEvent event) -> task<void>;
  auto emit(const RunId &run_id, const PlanId &plan_id, const TaskId &task_id,
            EventType type, EventLevel level, JsonValue payload) -> task<void>;
  auto notify(MilestoneKind kind, const PlanId &plan_id, const TaskId &task_id,
              std::string message) -> void;
  [[nodiscard]] auto aborted(const PlanId &plan_id) const -> bool;

  boost::asio::any_io_executor executor_;
  Store &store_;
  IAgentService &agent_;
  QueueConfig queue_cfg_;
  git::CommitPolicy policy_;
  EventSink event_sink_;
  MilestoneSink milestone_sink_;

  RunTracker tracker_;
  // Runs whose normal finalization is writing to the store.
  ankerl::unordered_dense::set<RunId> finalizing_;
  ankerl::unordered_dense::map<PlanId, std::shared_ptr<CompletionSignal>>
      running_queues_;
  ankerl::unordered_dense::set<PlanId> aborted_queues_;
};

} // namespace planq
