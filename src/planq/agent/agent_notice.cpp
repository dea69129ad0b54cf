#include "planq/agent/agent_notice.hpp"

#include "planq/util/log.hpp"

#include <glaze/json.hpp>

#include <utility>

namespace planq::wire {

struct SessionWire {
  std::string session_id;
};

struct TodoItemWire {
  std::string content;
  std::string status;
  std::string activeForm;
};

struct TodoWire {
  std::vector<TodoItemWire> todos;
};

struct ToolUseWire {
  std::string tool;
  std::string command;
};

struct ResultWire {
  std::string result;
  std::string stop_reason;
  std::optional<double> cost_usd;
  std::optional<std::int64_t> duration_ms;
  bool is_error{false};
  std::string error;
};

} // namespace planq::wire

namespace glz {
template <> struct meta<planq::wire::SessionWire> {
  using T = planq::wire::SessionWire;
  static constexpr auto value = object("session_id", &T::session_id);
};

template <> struct meta<planq::wire::TodoItemWire> {
  using T = planq::wire::TodoItemWire;
  static constexpr auto value = object("content", &T::content, "status",
                                       &T::status, "activeForm", &T::activeForm);
};

template <> struct meta<planq::wire::TodoWire> {
  using T = planq::wire::TodoWire;
  static constexpr auto value = object("todos", &T::todos);
};

template <> struct meta<planq::wire::ToolUseWire> {
  using T = planq::wire::ToolUseWire;
  static constexpr auto value =
      object("tool", &T::tool, "command", &T::command);
};

template <> struct meta<planq::wire::ResultWire> {
  using T = planq::wire::ResultWire;
  static constexpr auto value =
      object("result", &T::result, "stop_reason", &T::stop_reason, "cost_usd",
             &T::cost_usd, "duration_ms", &T::duration_ms, "is_error",
             &T::is_error, "error", &T::error);
};
} // namespace glz

namespace planq {

namespace {

[[nodiscard]] auto notice_kind(const JsonValue &doc) -> std::string {
  if (!doc.is_object()) {
    return {};
  }
  const auto &obj = doc.get_object();
  auto it = obj.find("kind");
  if (it == obj.end() || !it->second.is_string()) {
    return {};
  }
  return it->second.as<std::string>();
}

} // namespace

auto parse_agent_notice(std::string_view line) -> std::optional<AgentNotice> {
  if (line.empty() || line.front() != '{') {
    return std::nullopt;
  }
  auto doc = parse_json(line);
  if (!doc) {
    return std::nullopt;
  }
  const auto kind = notice_kind(*doc);

  if (kind == "session") {
    auto w = read_json_as<wire::SessionWire>(line);
    if (!w || w->session_id.empty()) {
      return std::nullopt;
    }
    return SessionNotice{.session_id = std::move(w->session_id)};
  }
  if (kind == "todo") {
    auto w = read_json_as<wire::TodoWire>(line);
    if (!w) {
      return std::nullopt;
    }
    TodoNotice notice;
    notice.todos.reserve(w->todos.size());
    for (auto &t : w->todos) {
      notice.todos.push_back(TodoItem{.content = std::move(t.content),
                                      .status = parse<TodoStatus>(t.status),
                                      .active_form = std::move(t.activeForm)});
    }
    return notice;
  }
  if (kind == "subagent") {
    SubagentNotice notice;
    const auto &obj = doc->get_object();
    if (auto it = obj.find("data"); it != obj.end()) {
      notice.data = it->second;
    }
    return notice;
  }
  if (kind == "tool_use") {
    auto w = read_json_as<wire::ToolUseWire>(line);
    if (!w) {
      return std::nullopt;
    }
    return ToolUseNotice{.tool = std::move(w->tool),
                         .command = std::move(w->command)};
  }
  if (kind == "result") {
    auto w = read_json_as<wire::ResultWire>(line);
    if (!w) {
      return std::nullopt;
    }
    return ResultNotice{.result = std::move(w->result),
                        .stop_reason = std::move(w->stop_reason),
                        .cost_usd = w->cost_usd,
                        .duration_ms = w->duration_ms,
                        .is_error = w->is_error,
                        .error = std::move(w->error)};
  }
  if (!kind.empty()) {
    log::debug("ignoring agent notice of unknown kind '{}'", kind);
  }
  return std::nullopt;
}

} // namespace planq
