#include "planq/cli/commands.hpp"
#include "planq/cli/formatting.hpp"
#include "planq/cli/runtime.hpp"
#include "planq/store/mysql_store.hpp"
#include "planq/util/json.hpp"

#include <print>

namespace planq::cli {

namespace {

[[nodiscard]] auto event_detail(const RunEvent &event) -> std::string {
  if (event.payload.is_object()) {
    const auto &obj = event.payload.get_object();
    for (const auto *key : {"message", "error", "line", "status"}) {
      if (auto it = obj.find(key); it != obj.end() && it->second.is_string()) {
        return it->second.get_string();
      }
    }
  }
  return dump_json(event.payload);
}

} // namespace

auto cmd_skip(const SkipOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(); !r) {
    return report_error(r.error());
  }
  auto skipped = rt->block_on(rt->orchestrator().skip_task(
      PlanId{opts.plan_id}, TaskId{opts.task_id}));
  if (!skipped) {
    return report_failure(skipped.error());
  }
  std::println("{} Task {} skipped.", fmt::ansi::cyan("»"), opts.task_id);
  return 0;
}

auto cmd_events(const EventsOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(false); !r) {
    return report_error(r.error());
  }

  std::optional<EventId> after;
  if (opts.after) {
    after = EventId{*opts.after};
  }
  const auto limit = opts.limit > 0 ? opts.limit : kDefaultEventPageSize;
  auto page = rt->block_on(
      rt->store().list_events(RunId{opts.run_id}, limit, std::move(after)));
  if (!page) {
    return report_error(page.error());
  }

  if (opts.json) {
    std::string events;
    for (const auto &e : page->events) {
      if (!events.empty()) {
        events += ",";
      }
      events += event_to_json(e);
    }
    std::println("{{\"events\":[{}],\"hasMore\":{}}}", events, page->has_more);
    return 0;
  }

  if (page->events.empty()) {
    std::println("No events found for run {}.", opts.run_id);
    return 0;
  }
  fmt::Table table(
      {{"TIME", 19}, {"TYPE", 11}, {"LEVEL", 5}, {"DETAIL", 60}});
  table.print_header();
  for (const auto &e : page->events) {
    const auto level = to_string_view(e.level);
    table.print_row({fmt::format_timestamp(e.ts),
                     std::string(to_string_view(e.type)),
                     e.level == EventLevel::Error ? fmt::ansi::red(level)
                                                  : std::string(level),
                     fmt::truncate(event_detail(e), 60)});
  }
  if (page->has_more) {
    std::println("{}", fmt::ansi::dim(std::format(
                           "More events available: --after {}",
                           page->events.back().id)));
  }
  return 0;
}

auto cmd_recover(const RecoverOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(false); !r) {
    return report_error(r.error());
  }
  auto cleaned = rt->block_on(rt->orchestrator().cleanup_stale_runs());
  if (!cleaned) {
    return report_error(cleaned.error());
  }
  std::println("Cleaned up {} stale run(s).", *cleaned);
  return 0;
}

auto cmd_db_init(const DbOptions &opts) -> int {
  auto rt = Runtime::create(opts.common);
  if (!rt) {
    return 1;
  }
  if (auto r = rt->open(false); !r) {
    return report_error(r.error());
  }
  if (opts.reset) {
    auto &mysql = static_cast<MySqlStore &>(rt->store());
    if (auto r = rt->block_on(mysql.clear_all()); !r) {
      return report_error(r.error());
    }
    std::println("All planq data deleted.");
  }
  std::println("Database schema initialized.");
  return 0;
}

} // namespace planq::cli
