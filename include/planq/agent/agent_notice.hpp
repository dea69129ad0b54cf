#pragma once

#include "planq/domain/plan.hpp"
#include "planq/util/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace planq {

// Structured lines an agent command writes to stdout, one JSON object per
// line with a "kind" discriminator:
//   {"kind":"session","session_id":"..."}
//   {"kind":"todo","todos":[{"content":"...","status":"pending",
//                            "activeForm":"..."}]}
//   {"kind":"subagent","data":{...}}
//   {"kind":"tool_use","tool":"Bash","command":"git status"}
//   {"kind":"result","result":"...","stop_reason":"end_turn",
//    "cost_usd":0.12,"duration_ms":4200,"is_error":false,"error":""}
// Anything else is a plain log line.

struct SessionNotice {
  std::string session_id;
};

struct TodoNotice {
  std::vector<TodoItem> todos;
};

struct SubagentNotice {
  JsonValue data;
};

struct ToolUseNotice {
  std::string tool;
  std::string command;
};

struct ResultNotice {
  std::string result;
  std::string stop_reason;
  std::optional<double> cost_usd;
  std::optional<std::int64_t> duration_ms;
  bool is_error{false};
  std::string error;
};

using AgentNotice = std::variant<SessionNotice, TodoNotice, SubagentNotice,
                                 ToolUseNotice, ResultNotice>;

/// Returns std::nullopt for lines that are not a recognised notice.
[[nodiscard]] auto parse_agent_notice(std::string_view line)
    -> std::optional<AgentNotice>;

} // namespace planq
