#pragma once

#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"
#include "planq/domain/plan.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace planq {

/// Cooperative interrupt for an in-flight agent call. Completes once the
/// call has actually stopped, or fails when it cannot be interrupted.
class IInterruptible {
public:
  virtual ~IInterruptible() = default;

  virtual auto interrupt() -> task<Result<void>> = 0;
};

struct AgentRequest {
  PlanId plan_id;
  std::string plan_summary;
  Task task;
  /// Extra context appended to the task prompt (execution context, previous
  /// failure on retry).
  std::string context;
  std::string cwd;
  std::string branch;
  int retry_count{0};
  /// Stop is requested when the orchestrator abandons the call.
  std::stop_token stop;
};

struct AgentResult {
  std::optional<std::string> session_id;
  std::string result_text;
  std::string stop_reason;
  std::int64_t duration_ms{0};
  std::optional<double> cost_usd;
};

struct AgentCallbacks {
  std::move_only_function<void(std::string_view line)> on_log;
  std::move_only_function<void(std::vector<TodoItem> todos)> on_todo;
  std::move_only_function<void(std::string session_id)> on_session;
  std::move_only_function<void(JsonValue data)> on_subagent;
  std::move_only_function<void(std::shared_ptr<IInterruptible> handle)>
      on_interruptible;
};

/// The external service that performs a task. Failures carry the text that
/// ends up in the run's error column.
class IAgentService {
public:
  virtual ~IAgentService() = default;

  virtual auto run_task(AgentRequest req, AgentCallbacks callbacks)
      -> task<Outcome<AgentResult>> = 0;
};

} // namespace planq
