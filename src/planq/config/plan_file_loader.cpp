#include "planq/config/plan_file_loader.hpp"
#include "planq/config/toml_util.hpp"

#include "planq/util/log.hpp"

#include <ankerl/unordered_dense.h>
#include <glaze/toml.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace planq {
namespace detail {

struct TaskToml {
  std::string id;
  std::string title;
  std::string description;
  std::vector<std::string> dependencies;
  std::vector<std::string> acceptance_criteria;
  std::vector<std::string> technical_notes;
};

struct PlanToml {
  std::string id;
  std::string summary;
  std::string project_path;
  std::vector<TaskToml> tasks;
};

} // namespace detail
} // namespace planq

namespace glz {
template <> struct meta<planq::detail::TaskToml> {
  using T = planq::detail::TaskToml;
  static constexpr auto value =
      object("id", &T::id, "title", &T::title, "description", &T::description,
             "dependencies", &T::dependencies, "acceptance_criteria",
             &T::acceptance_criteria, "technical_notes", &T::technical_notes);
};

template <> struct meta<planq::detail::PlanToml> {
  using T = planq::detail::PlanToml;
  static constexpr auto value =
      object("id", &T::id, "summary", &T::summary, "project_path",
             &T::project_path, "tasks", &T::tasks);
};
} // namespace glz

namespace planq {
namespace {

[[nodiscard]] auto join(const std::vector<std::string> &parts)
    -> std::string {
  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      joined += "; ";
    }
    joined += parts[i];
  }
  return joined;
}

[[nodiscard]] auto to_plan(detail::PlanToml &&raw) -> Plan {
  Plan plan;
  plan.id = PlanId{std::move(raw.id)};
  plan.summary = std::move(raw.summary);
  plan.project_path = std::move(raw.project_path);
  plan.status = PlanStatus::Ready;
  plan.created_at = Clock::now();
  plan.updated_at = plan.created_at;
  plan.tasks.reserve(raw.tasks.size());

  int ordinal = 0;
  for (auto &t : raw.tasks) {
    Task task;
    task.plan_id = plan.id;
    task.id = TaskId{std::move(t.id)};
    task.ordinal = ordinal++;
    task.title = std::move(t.title);
    task.description = std::move(t.description);
    task.dependencies.reserve(t.dependencies.size());
    for (auto &dep : t.dependencies) {
      task.dependencies.emplace_back(std::move(dep));
    }
    task.acceptance_criteria = std::move(t.acceptance_criteria);
    task.technical_notes = std::move(t.technical_notes);
    plan.tasks.emplace_back(std::move(task));
  }
  return plan;
}

} // namespace

auto PlanFileLoader::validate(const Plan &plan) -> std::vector<std::string> {
  std::vector<std::string> errors;
  if (!is_valid_id_text(plan.id.value())) {
    errors.emplace_back("plan id must be a non-empty printable string");
  }
  if (plan.project_path.empty()) {
    errors.emplace_back("project_path is required");
  }
  if (plan.tasks.empty()) {
    errors.emplace_back("plan has no tasks");
  }

  ankerl::unordered_dense::set<TaskId> seen;
  for (const auto &t : plan.tasks) {
    if (!is_valid_id_text(t.id.value())) {
      errors.emplace_back(
          std::format("task #{} has an empty or invalid id", t.ordinal));
      continue;
    }
    if (!seen.insert(t.id).second) {
      errors.emplace_back(std::format("duplicate task id '{}'", t.id));
    }
  }

  for (const auto &t : plan.tasks) {
    for (const auto &dep : t.dependencies) {
      if (dep == t.id) {
        errors.emplace_back(
            std::format("task '{}' depends on itself", t.id));
      } else if (!seen.contains(dep)) {
        errors.emplace_back(std::format(
            "task '{}' depends on unknown task '{}'", t.id, dep));
      }
    }
  }
  return errors;
}

auto PlanFileLoader::find_cycle(const std::vector<Task> &tasks)
    -> std::vector<TaskId> {
  ankerl::unordered_dense::map<TaskId, std::size_t> index;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    index.emplace(tasks[i].id, i);
  }

  // 0 = unvisited, 1 = on stack, 2 = done
  std::vector<std::uint8_t> state(tasks.size(), 0);
  std::vector<std::pair<std::size_t, std::size_t>> stack;
  stack.reserve(tasks.size());

  for (std::size_t start = 0; start < tasks.size(); ++start) {
    if (state[start] != 0) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, dep_idx] = stack.back();
      const auto &deps = tasks[node].dependencies;

      if (dep_idx < deps.size()) {
        auto it = index.find(deps[dep_idx++]);
        if (it == index.end()) {
          continue;
        }
        const std::size_t next = it->second;
        if (state[next] == 1) {
          std::vector<TaskId> cycle;
          bool in_cycle = false;
          for (const auto &[n, _] : stack) {
            in_cycle = in_cycle || n == next;
            if (in_cycle) {
              cycle.push_back(tasks[n].id);
            }
          }
          cycle.push_back(tasks[next].id);
          return cycle;
        }
        if (state[next] == 0) {
          state[next] = 1;
          stack.emplace_back(next, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return {};
}

auto PlanFileLoader::load_from_file(std::string_view path,
                                    std::string *diagnostic) -> Result<Plan> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read plan file '{}'", path);
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto PlanFileLoader::load_from_string(std::string_view toml_str,
                                      std::string *diagnostic)
    -> Result<Plan> {
  try {
    auto raw = toml_util::parse_toml<detail::PlanToml>(toml_str, diagnostic);
    if (!raw) {
      return fail(raw.error());
    }
    auto plan = to_plan(std::move(*raw));

    auto errors = validate(plan);
    if (!errors.empty()) {
      for (const auto &err : errors) {
        log::error("Plan validation error: {}", err);
      }
      if (diagnostic) {
        *diagnostic = join(errors);
      }
      return fail(Error::InvalidArgument);
    }

    if (auto cycle = find_cycle(plan.tasks); !cycle.empty()) {
      std::string path;
      for (const auto &id : cycle) {
        if (!path.empty()) {
          path += " -> ";
        }
        path += id.str();
      }
      log::error("Plan '{}' has a dependency cycle: {}", plan.id, path);
      if (diagnostic) {
        *diagnostic = std::format("dependency cycle: {}", path);
      }
      return fail(Error::CycleDetected);
    }
    return ok(std::move(plan));
  } catch (const std::exception &e) {
    log::error("Failed to parse plan file: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

} // namespace planq
