#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace planq::cli {

struct CommonOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
};

struct PlanImportOptions {
  CommonOptions common;
  std::string file;
  bool json{false};
};

struct PlanListOptions {
  CommonOptions common;
  bool json{false};
};

struct PlanShowOptions {
  CommonOptions common;
  std::string plan_id;
  bool json{false};
};

struct RunOptions {
  CommonOptions common;
  std::string plan_id;
  std::string task_id;
};

struct RunAllOptions {
  CommonOptions common;
  std::string plan_id;
  bool sequential{false};
};

struct SkipOptions {
  CommonOptions common;
  std::string plan_id;
  std::string task_id;
};

struct CancelOptions {
  CommonOptions common;
  std::string run_id;
};

struct EventsOptions {
  CommonOptions common;
  std::string run_id;
  std::size_t limit{100};
  std::optional<std::string> after; // Event id cursor
  bool json{false};
};

struct RecoverOptions {
  CommonOptions common;
};

struct DbOptions {
  CommonOptions common;
  bool reset{false};
};

struct ExecOptions {
  CommonOptions common;
  std::string plan_file;
  bool sequential{false};
};

[[nodiscard]] auto cmd_plan_import(const PlanImportOptions &opts) -> int;
[[nodiscard]] auto cmd_plan_list(const PlanListOptions &opts) -> int;
[[nodiscard]] auto cmd_plan_show(const PlanShowOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_run_all(const RunAllOptions &opts) -> int;
[[nodiscard]] auto cmd_retry(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_skip(const SkipOptions &opts) -> int;
[[nodiscard]] auto cmd_cancel(const CancelOptions &opts) -> int;
[[nodiscard]] auto cmd_events(const EventsOptions &opts) -> int;
[[nodiscard]] auto cmd_recover(const RecoverOptions &opts) -> int;
[[nodiscard]] auto cmd_db_init(const DbOptions &opts) -> int;
[[nodiscard]] auto cmd_exec(const ExecOptions &opts) -> int;

} // namespace planq::cli
