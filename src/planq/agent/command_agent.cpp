#include "planq/agent/command_agent.hpp"

#include "planq/agent/agent_notice.hpp"
#include "planq/core/asio_awaitable.hpp"
#include "planq/git/commit_policy.hpp"
#include "planq/process/process.hpp"
#include "planq/util/log.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <csignal>
#include <format>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace planq {

namespace {

inline constexpr std::size_t kStderrTail = 2000;

[[nodiscard]] auto strings_to_json(const std::vector<std::string> &values)
    -> JsonValue {
  JsonValue arr = std::vector<JsonValue>{};
  for (const auto &v : values) {
    arr.get_array().emplace_back(v);
  }
  return arr;
}

[[nodiscard]] auto tail(std::string_view text, std::size_t max_len)
    -> std::string {
  if (text.size() <= max_len) {
    return std::string(text);
  }
  return std::string(text.substr(text.size() - max_len));
}

class ProcessInterrupt final : public IInterruptible {
public:
  explicit ProcessInterrupt(boost::asio::any_io_executor executor)
      : exited_(executor, boost::asio::steady_timer::time_point::max()) {}

  auto attach(pid_t pid) noexcept -> void { pid_ = pid; }

  auto mark_exited() -> void {
    done_ = true;
    exited_.cancel();
  }

  auto interrupt() -> task<Result<void>> override {
    if (done_) {
      co_return ok();
    }
    // The agent leads its own process group.
    if (pid_ <= 0 || ::kill(-pid_, SIGINT) != 0) {
      co_return fail(Error::InvalidState);
    }
    log::info("sent SIGINT to agent pid={}", pid_);
    auto [ec] = co_await exited_.async_wait(use_nothrow);
    (void)ec;
    if (!done_) {
      co_return fail(Error::Cancelled);
    }
    co_return ok();
  }

private:
  pid_t pid_{-1};
  bool done_{false};
  boost::asio::steady_timer exited_;
};

} // namespace

auto agent_request_to_json(const AgentRequest &req) -> std::string {
  JsonValue task{
      {"id", req.task.id.str()},
      {"title", req.task.title},
      {"description", req.task.description},
      {"acceptance_criteria", strings_to_json(req.task.acceptance_criteria)},
      {"technical_notes", strings_to_json(req.task.technical_notes)},
  };
  JsonValue doc{
      {"plan_id", req.plan_id.str()},
      {"plan_summary", req.plan_summary},
      {"task", std::move(task)},
      {"context", req.context},
      {"cwd", req.cwd},
      {"branch", req.branch},
      {"retry_count", static_cast<std::int64_t>(req.retry_count)},
  };
  return dump_json(doc);
}

CommandAgent::CommandAgent(AgentConfig config) : cfg_(std::move(config)) {}

auto CommandAgent::run_task(AgentRequest req, AgentCallbacks callbacks)
    -> task<Outcome<AgentResult>> {
  auto executor = co_await boost::asio::this_coro::executor;
  auto handle = std::make_shared<ProcessInterrupt>(executor);
  const auto started = std::chrono::steady_clock::now();

  // Stops the process on either an orchestrator stop or a policy violation.
  std::stop_source local_stop;
  std::stop_callback forward_stop(req.stop,
                                  [&local_stop] { local_stop.request_stop(); });

  AgentResult result;
  std::optional<ResultNotice> final_notice;
  std::optional<std::string> violation;

  auto on_notice = [&](AgentNotice notice) {
    std::visit(
        [&](auto &&n) {
          using T = std::decay_t<decltype(n)>;
          if constexpr (std::is_same_v<T, SessionNotice>) {
            result.session_id = n.session_id;
            if (callbacks.on_session) {
              callbacks.on_session(std::move(n.session_id));
            }
          } else if constexpr (std::is_same_v<T, TodoNotice>) {
            if (callbacks.on_todo) {
              callbacks.on_todo(std::move(n.todos));
            }
          } else if constexpr (std::is_same_v<T, SubagentNotice>) {
            if (callbacks.on_subagent) {
              callbacks.on_subagent(std::move(n.data));
            }
          } else if constexpr (std::is_same_v<T, ToolUseNotice>) {
            if (!violation && !git::is_allowed_task_git_command(n.command)) {
              violation = n.command;
              log::error("task {} ran a disallowed git command: {}",
                         req.task.id, n.command);
              local_stop.request_stop();
            }
          } else if constexpr (std::is_same_v<T, ResultNotice>) {
            final_notice = std::move(n);
          }
        },
        std::move(notice));
  };

  ProcessHooks hooks;
  hooks.on_spawn = [&](pid_t pid) {
    handle->attach(pid);
    if (callbacks.on_interruptible) {
      callbacks.on_interruptible(handle);
    }
  };
  hooks.on_stdout_line = [&](std::string_view line) {
    if (auto notice = parse_agent_notice(line)) {
      on_notice(std::move(*notice));
      return;
    }
    if (callbacks.on_log) {
      callbacks.on_log(line);
    }
  };

  ProcessRequest preq{.program = cfg_.command,
                      .args = cfg_.args,
                      .working_dir = req.cwd,
                      .stdin_data = agent_request_to_json(req),
                      .timeout = cfg_.timeout,
                      .stop = local_stop.get_token()};
  log::info("agent start: task={} cwd={} cmd='{}'", req.task.id, req.cwd,
            command_preview(cfg_.command, cfg_.args));

  auto proc = co_await run_process(std::move(preq), std::move(hooks));
  handle->mark_exited();

  if (!proc) {
    co_return fail_with(
        proc.error(),
        std::format("Failed to start agent command '{}'.", cfg_.command));
  }
  if (violation) {
    co_return fail_with(
        Error::PolicyViolation,
        std::format("Runtime policy violation: task {} attempted disallowed "
                    "git command: {}",
                    req.task.id, *violation));
  }
  if (req.stop.stop_requested()) {
    co_return fail_with(Error::Cancelled, "Agent call abandoned.");
  }
  if (proc->timed_out) {
    co_return fail_with(
        Error::Timeout,
        std::format("Agent timed out after {}s.", cfg_.timeout.count()));
  }
  if (final_notice && final_notice->is_error) {
    co_return fail_with(Error::AgentFailed, final_notice->error.empty()
                                                ? final_notice->result
                                                : final_notice->error);
  }
  if (proc->exit_code != 0) {
    auto details = tail(proc->stderr_output, kStderrTail);
    co_return fail_with(
        Error::AgentFailed,
        details.empty()
            ? std::format("Agent exited with code {}.", proc->exit_code)
            : std::format("Agent exited with code {}: {}", proc->exit_code,
                          details));
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - started)
                           .count();
  if (final_notice) {
    result.result_text = std::move(final_notice->result);
    result.stop_reason = std::move(final_notice->stop_reason);
    result.cost_usd = final_notice->cost_usd;
    result.duration_ms = final_notice->duration_ms.value_or(elapsed);
  } else {
    result.stop_reason = "exit";
    result.duration_ms = elapsed;
  }
  log::info("agent finish: task={} duration_ms={} stop_reason={}", req.task.id,
            result.duration_ms, result.stop_reason);
  co_return result;
}

} // namespace planq
