#include "planq/cli/commands.hpp"
#include "planq/cli/formatting.hpp"
#include "planq/cli/runtime.hpp"
#include "planq/config/plan_file_loader.hpp"
#include "planq/util/log.hpp"

#include <print>

namespace planq::cli {

namespace {

auto print_run_summary(const Run &run) -> void {
  std::println("Run {} {} (duration {})", run.id,
               fmt::colorize_run_status(to_string_view(run.status)),
               fmt::format_duration_ms(run.duration_ms));
  if (run.error_text) {
    std::println("  error: {}", *run.error_text);
  }
  if (run.cost_usd) {
    std::println("  cost:  ${:.4f}", *run.cost_usd);
  }
}

auto start_and_wait(const RunOptions &opts, bool retry) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(); !r) {
    return report_error(r.error());
  }
  rt->follow_events();

  auto &orch = rt->orchestrator();
  const PlanId plan_id{opts.plan_id};
  const TaskId task_id{opts.task_id};
  auto started = rt->block_on(retry ? orch.retry_task(plan_id, task_id)
                                    : orch.run_task(plan_id, task_id));
  if (!started) {
    return report_failure(started.error());
  }
  const RunId run_id = *started;
  std::println("RUN_ID: {}", run_id);

  rt->wait_interruptible(orch.wait_for_run(run_id),
                         [&orch, run_id]() -> task<void> {
                           co_await orch.cancel_run(run_id);
                           co_await orch.wait_for_run(run_id);
                         });

  auto run = rt->block_on(rt->store().get_run(run_id));
  if (!run) {
    return report_error(run.error());
  }
  print_run_summary(*run);
  return run->status == RunStatus::Completed ? 0 : 1;
}

auto drive_queue(Runtime &rt, const PlanId &plan_id, bool sequential) -> int {
  auto &orch = rt.orchestrator();
  auto started = rt.block_on(orch.run_all(plan_id, sequential));
  if (!started) {
    return report_failure(started.error());
  }
  if (started->reason) {
    std::println(stderr, "Error: {}", *started->reason);
    return 1;
  }
  std::println("Queue started for plan '{}': {} task(s) runnable.", plan_id,
               started->queued);

  rt.wait_interruptible(orch.wait_for_queue(plan_id),
                        [&orch, plan_id]() -> task<void> {
                          co_await orch.abort_queue(plan_id);
                          co_await orch.wait_for_queue(plan_id);
                        });

  auto plan = rt.block_on(rt.store().get_plan(plan_id));
  if (!plan) {
    return report_error(plan.error());
  }
  std::println("Plan {} is {}.", plan_id,
               fmt::colorize_plan_status(to_string_view(plan->status)));
  return plan->status == PlanStatus::Completed ? 0 : 1;
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  return start_and_wait(opts, false);
}

auto cmd_retry(const RunOptions &opts) -> int {
  return start_and_wait(opts, true);
}

auto cmd_run_all(const RunAllOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(); !r) {
    return report_error(r.error());
  }
  rt->follow_events();
  return drive_queue(*rt, PlanId{opts.plan_id}, opts.sequential);
}

auto cmd_exec(const ExecOptions &opts) -> int {
  std::string diagnostic;
  auto plan = PlanFileLoader::load_from_file(opts.plan_file, &diagnostic);
  if (!plan) {
    std::println(stderr, "Error: {}: {}", opts.plan_file,
                 diagnostic.empty() ? plan.error().message() : diagnostic);
    return 1;
  }

  auto rt = Runtime::create(opts.common, StoreKind::InMemory);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(); !r) {
    return report_error(r.error());
  }
  if (auto r = rt->block_on(rt->store().save_plan(*plan)); !r) {
    return report_error(r.error());
  }
  rt->follow_events();
  return drive_queue(*rt, plan->id, opts.sequential);
}

auto cmd_cancel(const CancelOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(false); !r) {
    return report_error(r.error());
  }

  const RunId run_id{opts.run_id};
  auto run = rt->block_on(rt->store().get_run(run_id));
  if (!run) {
    if (run.error() == make_error_code(Error::NotFound)) {
      std::println(stderr, "Error: Run not found: {}", opts.run_id);
      return 1;
    }
    return report_error(run.error());
  }
  if (run->status != RunStatus::InProgress) {
    std::println(stderr, "Error: Run {} is not in progress (status: {}).",
                 run_id, to_string_view(run->status));
    return 1;
  }

  // The run belongs to another process; only its stored state can change.
  rt->block_on(rt->orchestrator().force_cancel_run(run_id));
  std::println("{} Run {} marked cancelled; task {} is pending again.",
               fmt::ansi::yellow("■"), run_id, run->task_id);
  log::warn("run {} cancelled from outside its owning process", run_id);
  return 0;
}

} // namespace planq::cli
