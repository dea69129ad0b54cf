#include "planq/cli/commands.hpp"
#include "planq/util/log.hpp"

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <print>
#include <string>

namespace {

auto default_config() -> std::string {
  if (const char *env = std::getenv("PLANQ_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_common(CLI::App *cmd, planq::cli::CommonOptions &common,
                const std::string &env_config, bool config_required = true)
    -> void {
  common.config_file = env_config;
  auto *cfg = cmd->add_option("-c,--config", common.config_file,
                              "System config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty() && config_required)
    cfg->required();
  cmd->add_option("--log-file", common.log_file, "Log file path");
  cmd->add_option("--log-level", common.log_level,
                  "Log level override: trace|debug|info|warn|error");
}

template <typename Fn> auto guarded(Fn &&fn) -> int {
  try {
    return fn();
  } catch (const std::exception &e) {
    std::println(stderr, "Error: {}", e.what());
    return 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::signal(SIGPIPE, SIG_IGN);
  planq::log::set_output_stderr();
  planq::log::set_level(planq::log::Level::Warn);

  CLI::App app{"planq", "Plan queue runner for coding agents"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  planq plan import -c planq.toml plan.toml\n"
             "  planq run-all -c planq.toml auth-rework\n"
             "  planq exec plan.toml --sequential\n"
             "\nTip: Set PLANQ_CONFIG=planq.toml to skip -c on every command.");

  const std::string env_config = default_config();

  auto *plan = app.add_subcommand("plan", "Plan management");
  plan->require_subcommand(1);

  planq::cli::PlanImportOptions import_opts;
  auto *plan_import =
      plan->add_subcommand("import", "Import or replace a plan from TOML");
  add_common(plan_import, import_opts.common, env_config);
  plan_import->add_option("file", import_opts.file, "Plan file")
      ->required()
      ->check(CLI::ExistingFile);
  plan_import->add_flag("--json", import_opts.json, "Output JSON");
  plan_import->callback([&import_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_plan_import(import_opts); }));
  });

  planq::cli::PlanListOptions list_opts;
  auto *plan_list = plan->add_subcommand("list", "List plans");
  add_common(plan_list, list_opts.common, env_config);
  plan_list->add_flag("--json", list_opts.json, "Output JSON");
  plan_list->callback([&list_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_plan_list(list_opts); }));
  });

  planq::cli::PlanShowOptions show_opts;
  auto *plan_show =
      plan->add_subcommand("show", "Show a plan with its tasks and runs");
  add_common(plan_show, show_opts.common, env_config);
  plan_show->add_option("plan_id", show_opts.plan_id, "Plan ID")->required();
  plan_show->add_flag("--json", show_opts.json, "Output JSON");
  plan_show->callback([&show_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_plan_show(show_opts); }));
  });

  planq::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run one task and wait for it");
  add_common(run, run_opts.common, env_config);
  run->add_option("plan_id", run_opts.plan_id, "Plan ID")->required();
  run->add_option("task_id", run_opts.task_id, "Task ID")->required();
  run->callback([&run_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_run(run_opts); }));
  });

  planq::cli::RunAllOptions run_all_opts;
  auto *run_all =
      app.add_subcommand("run-all", "Run every runnable task of a plan");
  run_all->footer("\nTasks of a phase run side by side in git worktrees and\n"
                  "are merged back once they pass the commit policy.\n"
                  "--sequential runs one task at a time in the project "
                  "directory.");
  add_common(run_all, run_all_opts.common, env_config);
  run_all->add_option("plan_id", run_all_opts.plan_id, "Plan ID")->required();
  run_all->add_flag("--sequential", run_all_opts.sequential,
                    "Disable phase-parallel execution");
  run_all->callback([&run_all_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_run_all(run_all_opts); }));
  });

  planq::cli::RunOptions retry_opts;
  auto *retry = app.add_subcommand("retry", "Retry a failed task");
  add_common(retry, retry_opts.common, env_config);
  retry->add_option("plan_id", retry_opts.plan_id, "Plan ID")->required();
  retry->add_option("task_id", retry_opts.task_id, "Task ID")->required();
  retry->callback([&retry_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_retry(retry_opts); }));
  });

  planq::cli::SkipOptions skip_opts;
  auto *skip = app.add_subcommand("skip", "Skip a failed task");
  add_common(skip, skip_opts.common, env_config);
  skip->add_option("plan_id", skip_opts.plan_id, "Plan ID")->required();
  skip->add_option("task_id", skip_opts.task_id, "Task ID")->required();
  skip->callback([&skip_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_skip(skip_opts); }));
  });

  planq::cli::CancelOptions cancel_opts;
  auto *cancel =
      app.add_subcommand("cancel", "Mark an in-progress run cancelled");
  add_common(cancel, cancel_opts.common, env_config);
  cancel->add_option("run_id", cancel_opts.run_id, "Run ID")->required();
  cancel->callback([&cancel_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_cancel(cancel_opts); }));
  });

  planq::cli::EventsOptions events_opts;
  auto *events = app.add_subcommand("events", "Show the events of a run");
  add_common(events, events_opts.common, env_config);
  events->add_option("run_id", events_opts.run_id, "Run ID")->required();
  events->add_option("--limit", events_opts.limit, "Page size (default 100)");
  events->add_option("--after", events_opts.after,
                     "Only events after this event ID");
  events->add_flag("--json", events_opts.json, "Output JSON");
  events->callback([&events_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_events(events_opts); }));
  });

  planq::cli::RecoverOptions recover_opts;
  auto *recover = app.add_subcommand(
      "recover", "Cancel stale in-progress runs left by a previous process");
  add_common(recover, recover_opts.common, env_config);
  recover->callback([&recover_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_recover(recover_opts); }));
  });

  auto *db = app.add_subcommand("db", "Database operations");
  db->require_subcommand(1);
  planq::cli::DbOptions db_opts;
  auto *db_init = db->add_subcommand("init", "Create the database schema");
  add_common(db_init, db_opts.common, env_config);
  db_init->add_flag("--reset", db_opts.reset, "Delete all existing rows");
  db_init->callback([&db_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_db_init(db_opts); }));
  });

  planq::cli::ExecOptions exec_opts;
  auto *exec = app.add_subcommand(
      "exec", "Run a plan file start to finish without a database");
  add_common(exec, exec_opts.common, env_config, false);
  exec->add_option("plan_file", exec_opts.plan_file, "Plan file")
      ->required()
      ->check(CLI::ExistingFile);
  exec->add_flag("--sequential", exec_opts.sequential,
                 "Disable phase-parallel execution");
  exec->callback([&exec_opts]() {
    std::exit(guarded([&] { return planq::cli::cmd_exec(exec_opts); }));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
