#include "planq/cli/commands.hpp"
#include "planq/cli/formatting.hpp"
#include "planq/cli/runtime.hpp"
#include "planq/config/plan_file_loader.hpp"
#include "planq/domain/resolver.hpp"
#include "planq/util/json.hpp"

#include <algorithm>
#include <print>
#include <ranges>

namespace planq::cli {

namespace {

[[nodiscard]] auto count_tasks(const Plan &plan, TaskStatus status)
    -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count(
      plan.tasks, status, [](const Task &t) { return t.status; }));
}

[[nodiscard]] auto join_ids(const std::vector<TaskId> &ids) -> std::string {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += ",";
    }
    out += id.str();
  }
  return out.empty() ? std::string{"-"} : out;
}

[[nodiscard]] auto plan_to_json(const Plan &plan, bool with_tasks)
    -> JsonValue {
  JsonValue j{
      {"id", plan.id.str()},
      {"summary", plan.summary},
      {"projectPath", plan.project_path},
      {"status", std::string(to_string_view(plan.status))},
      {"createdAt", util::format_iso8601(plan.created_at)},
      {"updatedAt", util::format_iso8601(plan.updated_at)},
      {"taskCount", static_cast<std::int64_t>(plan.tasks.size())},
  };
  if (with_tasks) {
    JsonValue tasks_arr = std::vector<JsonValue>{};
    for (const auto &t : plan.tasks) {
      JsonValue deps = std::vector<JsonValue>{};
      for (const auto &d : t.dependencies) {
        deps.get_array().emplace_back(d.str());
      }
      tasks_arr.get_array().emplace_back(JsonValue{
          {"id", t.id.str()},
          {"title", t.title},
          {"status", std::string(to_string_view(t.status))},
          {"dependencies", std::move(deps)},
      });
    }
    j.get_object().emplace("tasks", std::move(tasks_arr));
  }
  return j;
}

} // namespace

auto cmd_plan_import(const PlanImportOptions &opts) -> int {
  std::string diagnostic;
  auto plan = PlanFileLoader::load_from_file(opts.file, &diagnostic);
  if (!plan) {
    std::println(stderr, "Error: {}: {}", opts.file,
                 diagnostic.empty() ? plan.error().message() : diagnostic);
    return 1;
  }

  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(false); !r) {
    return report_error(r.error());
  }
  if (auto r = rt->block_on(rt->store().save_plan(*plan)); !r) {
    return report_error(r.error());
  }

  if (opts.json) {
    std::println("{}", dump_json(plan_to_json(*plan, true)));
  } else {
    std::println("{} Imported plan '{}' with {} task(s).",
                 fmt::ansi::green("✓"), plan->id, plan->tasks.size());
  }
  return 0;
}

auto cmd_plan_list(const PlanListOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(false); !r) {
    return report_error(r.error());
  }
  auto plans = rt->block_on(rt->store().list_plans());
  if (!plans) {
    return report_error(plans.error());
  }

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &p : *plans) {
      arr.get_array().emplace_back(plan_to_json(p, false));
    }
    std::println("{}", dump_json(arr));
    return 0;
  }

  if (plans->empty()) {
    std::println("No plans found.");
    return 0;
  }
  fmt::Table table({{"PLAN", 24},
                    {"STATUS", 10},
                    {"DONE", 9, true},
                    {"UPDATED", 19},
                    {"SUMMARY", 40}});
  table.print_header();
  for (const auto &p : *plans) {
    const auto done = count_tasks(p, TaskStatus::Completed) +
                      count_tasks(p, TaskStatus::Skipped);
    table.print_row({fmt::truncate(p.id.str(), 24),
                     fmt::colorize_plan_status(to_string_view(p.status)),
                     std::format("{}/{}", done, p.tasks.size()),
                     fmt::format_timestamp(p.updated_at),
                     fmt::truncate(p.summary, 40)});
  }
  return 0;
}

auto cmd_plan_show(const PlanShowOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(false); !r) {
    return report_error(r.error());
  }
  const PlanId plan_id{opts.plan_id};
  auto plan = rt->block_on(rt->store().get_plan(plan_id));
  if (!plan) {
    if (plan.error() == make_error_code(Error::NotFound)) {
      std::println(stderr, "Error: Plan not found: {}", opts.plan_id);
      return 1;
    }
    return report_error(plan.error());
  }
  auto runs = rt->block_on(rt->store().list_runs(plan_id));
  if (!runs) {
    return report_error(runs.error());
  }

  if (opts.json) {
    auto j = plan_to_json(*plan, true);
    JsonValue runs_arr = std::vector<JsonValue>{};
    for (const auto &run : *runs) {
      runs_arr.get_array().emplace_back(JsonValue{
          {"id", run.id.str()},
          {"taskId", run.task_id.str()},
          {"status", std::string(to_string_view(run.status))},
          {"retryCount", static_cast<std::int64_t>(run.retry_count)},
          {"startedAt", util::format_iso8601(run.started_at)},
      });
    }
    j.get_object().emplace("runs", std::move(runs_arr));
    std::println("{}", dump_json(j));
    return 0;
  }

  std::println("{} {}", fmt::ansi::bold("Plan:"), plan->id);
  std::println("  Summary:  {}", plan->summary);
  std::println("  Project:  {}", plan->project_path);
  std::println("  Status:   {}",
               fmt::colorize_plan_status(to_string_view(plan->status)));
  std::println("  Runnable: {}", resolver::count_runnable(plan->tasks));
  std::println("");

  fmt::Table tasks({{"#", 3, true},
                    {"TASK", 20},
                    {"STATUS", 12},
                    {"DEPENDS ON", 20},
                    {"TITLE", 40}});
  tasks.print_header();
  for (const auto &t : plan->tasks) {
    tasks.print_row({std::to_string(t.ordinal), fmt::truncate(t.id.str(), 20),
                     fmt::colorize_task_status(to_string_view(t.status)),
                     fmt::truncate(join_ids(t.dependencies), 20),
                     fmt::truncate(t.title, 40)});
  }

  if (runs->empty()) {
    return 0;
  }
  std::println("");
  fmt::Table run_table({{"RUN", 36},
                        {"TASK", 20},
                        {"STATUS", 12},
                        {"RETRY", 5, true},
                        {"STARTED", 19},
                        {"DURATION", 8, true}});
  run_table.print_header();
  for (const auto &run : *runs) {
    run_table.print_row(
        {run.id.str(), fmt::truncate(run.task_id.str(), 20),
         fmt::colorize_run_status(to_string_view(run.status)),
         std::to_string(run.retry_count), fmt::format_timestamp(run.started_at),
         fmt::format_duration_ms(run.duration_ms)});
  }
  return 0;
}

} // namespace planq::cli
