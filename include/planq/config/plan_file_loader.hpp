#pragma once

#include "planq/core/error.hpp"
#include "planq/domain/plan.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace planq {

class PlanFileLoader {
public:
  /// Parses and validates a plan file. Tasks keep file order as ordinals and
  /// the plan starts out `ready`. On failure `diagnostic` (when given)
  /// receives the joined validation messages.
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<Plan>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<Plan>;

  /// Structural checks on an already built plan: ids, unknown and self
  /// dependencies. Cycles are reported by `find_cycle`.
  [[nodiscard]] static auto validate(const Plan &plan)
      -> std::vector<std::string>;

  /// Returns the ids along a dependency cycle, or an empty vector.
  [[nodiscard]] static auto find_cycle(const std::vector<Task> &tasks)
      -> std::vector<TaskId>;
};

} // namespace planq
