#pragma once

#include "planq/agent/agent.hpp"
#include "planq/core/asio_awaitable.hpp"
#include "planq/core/coroutine.hpp"
#include "planq/domain/plan.hpp"
#include "planq/git/git.hpp"
#include "planq/util/id.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace planq::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Aborts (throws) if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

// Runs `coro` on a shared io_context and returns as soon as it completes,
// leaving other work (background runs) queued on `io`.
template <typename T>
[[nodiscard]] inline auto
run_on(boost::asio::io_context &io, task<T> coro,
       std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  std::exception_ptr eptr;
  std::optional<T> result;
  bool done = false;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result.emplace(co_await std::move(coro));
        co_return;
      },
      [&](std::exception_ptr e) {
        eptr = e;
        done = true;
      });
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done && std::chrono::steady_clock::now() < deadline) {
    if (io.run_one_for(std::chrono::milliseconds(10)) == 0 && io.stopped()) {
      io.restart();
    }
  }
  if (!done)
    throw std::runtime_error("run_on timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

inline auto run_on(boost::asio::io_context &io, task<void> coro,
                   std::chrono::milliseconds timeout = std::chrono::seconds(10))
    -> void {
  (void)run_on(
      io,
      [](task<void> inner) -> task<bool> {
        co_await std::move(inner);
        co_return true;
      }(std::move(coro)),
      timeout);
}

// Drives `io` until `predicate` holds or `timeout` expires.
template <typename Predicate>
[[nodiscard]] inline auto
pump_until(boost::asio::io_context &io, Predicate &&predicate,
           std::chrono::milliseconds timeout = std::chrono::seconds(10))
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(predicate)) {
      return true;
    }
    if (io.run_one_for(std::chrono::milliseconds(10)) == 0 && io.stopped()) {
      io.restart();
    }
  }
  return std::invoke(predicate);
}

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "planq_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

inline auto write_file(const std::filesystem::path &path,
                       std::string_view content) -> void {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

[[nodiscard]] inline auto git_available() -> bool {
  return std::system("git --version > /dev/null 2>&1") == 0;
}

// Runs a shell command in `dir`; returns true on exit status 0.
inline auto sh(const std::string &dir, const std::string &command) -> bool {
  const auto full = "cd '" + dir + "' && " + command + " > /dev/null 2>&1";
  return std::system(full.c_str()) == 0;
}

// Creates a repository on `main` with one initial commit.
[[nodiscard]] inline auto init_git_repo(const std::string &dir) -> bool {
  write_file(std::filesystem::path(dir) / "README.md", "# test\n");
  return sh(dir, "git init -q -b main") &&
         sh(dir, "git config user.email planq@example.com") &&
         sh(dir, "git config user.name 'planq test'") &&
         sh(dir, "git config commit.gpgsign false") &&
         sh(dir, "git add -A") &&
         sh(dir, "git commit -q -m 'chore: initial commit'");
}

[[nodiscard]] inline auto make_task(std::string_view plan_id,
                                   std::string_view id, int ordinal,
                                   std::vector<std::string> deps = {})
    -> Task {
  Task t;
  t.plan_id = PlanId{std::string(plan_id)};
  t.id = TaskId{std::string(id)};
  t.ordinal = ordinal;
  t.title = std::string("Task ") + std::string(id);
  t.description = "Do the thing.";
  for (auto &d : deps) {
    t.dependencies.emplace_back(std::move(d));
  }
  return t;
}

[[nodiscard]] inline auto make_plan(std::string_view id,
                                   std::string project_path,
                                   std::vector<Task> tasks) -> Plan {
  Plan p;
  p.id = PlanId{std::string(id)};
  p.summary = "Test plan";
  p.project_path = std::move(project_path);
  p.status = PlanStatus::Ready;
  p.created_at = Clock::now();
  p.updated_at = p.created_at;
  p.tasks = std::move(tasks);
  return p;
}

// Interrupt handle handed out by ScriptedAgent. A cooperative handle
// releases the pending call; an uncooperative one never completes.
class ScriptedInterrupt final : public IInterruptible {
public:
  ScriptedInterrupt(boost::asio::any_io_executor ex, bool cooperative)
      : released_timer_(ex, boost::asio::steady_timer::time_point::max()),
        stuck_timer_(ex, boost::asio::steady_timer::time_point::max()),
        cooperative_(cooperative) {}

  auto interrupt() -> task<Result<void>> override {
    ++interrupts;
    if (!cooperative_) {
      (void)co_await stuck_timer_.async_wait(use_nothrow);
      co_return fail(Error::Timeout);
    }
    release();
    co_return ok();
  }

  auto release() -> void {
    released_ = true;
    released_timer_.cancel();
  }

  auto wait_released() -> task<void> {
    while (!released_) {
      (void)co_await released_timer_.async_wait(use_nothrow);
    }
  }

  int interrupts{0};

private:
  boost::asio::steady_timer released_timer_;
  boost::asio::steady_timer stuck_timer_;
  bool cooperative_;
  bool released_{false};
};

// Agent double: each task id maps to a behavior; unknown tasks succeed.
class ScriptedAgent final : public IAgentService {
public:
  using Behavior = std::function<task<Outcome<AgentResult>>(
      AgentRequest &req, AgentCallbacks &cb, ScriptedAgent &self)>;

  auto on_task(std::string task_id, Behavior behavior) -> void {
    behaviors_.insert_or_assign(std::move(task_id), std::move(behavior));
  }

  auto run_task(AgentRequest req, AgentCallbacks cb)
      -> task<Outcome<AgentResult>> override {
    requests.push_back(req);
    auto it = behaviors_.find(req.task.id.str());
    if (it == behaviors_.end()) {
      co_return co_await succeed_impl(req, cb, "done");
    }
    co_return co_await it->second(req, cb, *this);
  }

  [[nodiscard]] auto calls_for(std::string_view task_id) const -> int {
    int n = 0;
    for (const auto &r : requests) {
      if (r.task.id == task_id) {
        ++n;
      }
    }
    return n;
  }

  std::vector<AgentRequest> requests;
  std::vector<std::shared_ptr<ScriptedInterrupt>> handles;

  // Reports a session, a todo list and a log line, then succeeds.
  static auto succeed(std::string text = "done") -> Behavior {
    return [text](AgentRequest &req, AgentCallbacks &cb, ScriptedAgent &) {
      return succeed_impl(req, cb, text);
    };
  }

  static auto failing(std::string error) -> Behavior {
    return [error](AgentRequest &, AgentCallbacks &, ScriptedAgent &) {
      return fail_impl(error);
    };
  }

  // Blocks until interrupted or abandoned. Without `hand_out_handle` no
  // interrupt handle is published.
  static auto hang(bool cooperative = true, bool hand_out_handle = true)
      -> Behavior {
    return [cooperative, hand_out_handle](AgentRequest &req, AgentCallbacks &cb,
                                          ScriptedAgent &self) {
      return hang_impl(req, cb, self, cooperative, hand_out_handle);
    };
  }

  // Writes `file` in the working directory and commits it with `message`.
  static auto commit(std::string file, std::string message) -> Behavior {
    return [file, message](AgentRequest &req, AgentCallbacks &cb,
                           ScriptedAgent &) {
      return commit_impl(req, cb, file, message);
    };
  }

private:
  static auto fail_impl(std::string error) -> task<Outcome<AgentResult>> {
    co_return fail_with(Error::AgentFailed, std::move(error));
  }

  static auto succeed_impl(AgentRequest &req, AgentCallbacks &cb,
                           std::string text) -> task<Outcome<AgentResult>> {
    const auto session = "session-" + req.task.id.str();
    if (cb.on_session) {
      cb.on_session(session);
    }
    if (cb.on_todo) {
      cb.on_todo({TodoItem{.content = "write code",
                           .status = TodoStatus::Completed,
                           .active_form = "Writing code"}});
    }
    if (cb.on_log) {
      cb.on_log("working on " + req.task.id.str());
    }
    co_return AgentResult{.session_id = session,
                          .result_text = std::move(text),
                          .stop_reason = "end_turn",
                          .duration_ms = 5,
                          .cost_usd = 0.01};
  }

  static auto hang_impl(AgentRequest &req, AgentCallbacks &cb,
                        ScriptedAgent &self, bool cooperative,
                        bool hand_out_handle) -> task<Outcome<AgentResult>> {
    auto ex = co_await boost::asio::this_coro::executor;
    auto handle = std::make_shared<ScriptedInterrupt>(ex, cooperative);
    self.handles.push_back(handle);
    if (hand_out_handle && cb.on_interruptible) {
      cb.on_interruptible(handle);
    }
    std::stop_callback on_stop(req.stop, [handle] { handle->release(); });
    co_await handle->wait_released();
    if (req.stop.stop_requested()) {
      co_return fail_with(Error::Cancelled, "Agent call abandoned.");
    }
    co_return fail_with(Error::AgentFailed, "Agent exited with code 130");
  }

  static auto commit_impl(AgentRequest &req, AgentCallbacks &cb,
                          std::string file, std::string message)
      -> task<Outcome<AgentResult>> {
    write_file(std::filesystem::path(req.cwd) / file,
               "content of " + file + "\n");
    git::Repo repo(req.cwd);
    if (auto r = co_await repo.commit_all(message); !r) {
      co_return fail_with(std::move(r.error()));
    }
    co_return co_await succeed_impl(req, cb, "committed " + file);
  }

  std::map<std::string, Behavior> behaviors_;
};

} // namespace planq::test
