#include "planq/process/process.hpp"

#include "planq/core/asio_awaitable.hpp"
#include "planq/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <csignal>
#include <format>
#include <optional>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

namespace planq {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;

// Puts the child in its own process group so signals reach its descendants.
struct NewProcessGroup {
  template <typename Launcher, typename CmdLine>
  auto on_exec_setup(Launcher & /*launcher*/,
                     const bp::filesystem::path & /*exe*/,
                     CmdLine & /*cmd_line*/) -> boost::system::error_code {
    (void)::setpgid(0, 0);
    return {};
  }
};

auto kill_group(pid_t pid) -> void {
  if (pid > 0) {
    (void)::kill(-pid, SIGKILL);
    (void)::kill(pid, SIGKILL);
  }
}

// Descendants that outlive the child still hold its pipes open.
auto kill_stragglers(pid_t pgid) -> void {
  if (pgid > 0) {
    (void)::kill(-pgid, SIGKILL);
  }
}

struct WaitProcessResult {
  int exit_code{-1};
  bool timed_out{false};
};

[[nodiscard]] auto resolve_executable(const std::string &program)
    -> bp::filesystem::path {
  if (program.find('/') != std::string::npos) {
    return bp::filesystem::path(program);
  }
  return bp::environment::find_executable(program);
}

auto append_capped(std::string &out, std::string_view chunk) -> void {
  if (out.size() >= kMaxOutputSize) {
    return;
  }
  const auto remaining = kMaxOutputSize - out.size();
  out.append(chunk.substr(0, std::min(remaining, chunk.size())));
}

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 std::string &out,
                                 boost::asio::cancellation_signal &cancel_sig,
                                 ProcessHooks *hooks) -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  std::string pending_line;
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (bytes > 0) {
      std::string_view chunk(buffer.data(), bytes);
      append_capped(out, chunk);
      if (hooks != nullptr && hooks->on_stdout_line) {
        pending_line.append(chunk);
        std::size_t pos = 0;
        while ((pos = pending_line.find('\n')) != std::string::npos) {
          std::string_view line(pending_line.data(), pos);
          if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
          }
          hooks->on_stdout_line(line);
          pending_line.erase(0, pos + 1);
        }
      }
    }
    if (ec) {
      break;
    }
  }
  if (hooks != nullptr && hooks->on_stdout_line && !pending_line.empty()) {
    hooks->on_stdout_line(pending_line);
  }
}

[[nodiscard]] auto write_stdin(boost::asio::writable_pipe &pipe,
                               std::optional<std::string> data)
    -> task<void> {
  if (data && !data->empty()) {
    auto [ec, written] = co_await boost::asio::async_write(
        pipe, boost::asio::buffer(*data), use_nothrow);
    if (ec) {
      log::debug("stdin write ended early: {}", ec.message());
    }
    (void)written;
  }
  boost::system::error_code ignored;
  pipe.close(ignored);
}

[[nodiscard]] auto
wait_process_with_timeout(bp::process &proc, std::chrono::milliseconds timeout,
                          boost::asio::cancellation_signal &cancel_sig)
    -> task<WaitProcessResult> {
  const pid_t pgid = proc.id();
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (!ec) {
    kill_stragglers(pgid);
    co_return WaitProcessResult{.exit_code = exit_code, .timed_out = false};
  }
  if (ec == boost::asio::error::operation_aborted) {
    cancel_sig.emit(boost::asio::cancellation_type::total);
    kill_group(proc.id());
    auto [wait_ec, ignored_exit] = co_await proc.async_wait(use_nothrow);
    (void)wait_ec;
    (void)ignored_exit;
    co_return WaitProcessResult{.exit_code = kExitCodeTimeout,
                                .timed_out = true};
  }
  log::warn("waiting for pid {} failed: {}", pgid, ec.message());
  kill_stragglers(pgid);
  co_return WaitProcessResult{.exit_code = -1, .timed_out = false};
}

} // namespace

auto command_preview(std::string_view program,
                     const std::vector<std::string> &args,
                     std::size_t max_len) -> std::string {
  std::string out(program);
  for (const auto &a : args) {
    out += ' ';
    out += a;
  }
  if (out.size() > max_len) {
    out.resize(max_len);
    out += "...";
  }
  return out;
}

auto run_process(ProcessRequest req, ProcessHooks hooks)
    -> task<Result<ProcessResult>> {
  if (req.stop.stop_requested()) {
    co_return fail(Error::Cancelled);
  }

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::readable_pipe stdout_pipe(executor);
  boost::asio::readable_pipe stderr_pipe(executor);
  boost::asio::writable_pipe stdin_pipe(executor);
  ProcessResult result;

  const auto exe = resolve_executable(req.program);
  if (exe.empty()) {
    log::error("executable not found on PATH: {}", req.program);
    co_return fail(Error::ProcessSpawnFailed);
  }

  std::optional<bp::process> proc;
  try {
    const bool has_dir = !req.working_dir.empty();
    if (req.stdin_data) {
      auto stdio = bp::process_stdio{
          .in = stdin_pipe, .out = stdout_pipe, .err = stderr_pipe};
      if (has_dir) {
        proc.emplace(executor, exe, req.args, std::move(stdio),
                     bp::process_start_dir{req.working_dir},
                     NewProcessGroup{});
      } else {
        proc.emplace(executor, exe, req.args, std::move(stdio),
                     NewProcessGroup{});
      }
    } else {
      auto stdio = bp::process_stdio{
          .in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
      if (has_dir) {
        proc.emplace(executor, exe, req.args, std::move(stdio),
                     bp::process_start_dir{req.working_dir},
                     NewProcessGroup{});
      } else {
        proc.emplace(executor, exe, req.args, std::move(stdio),
                     NewProcessGroup{});
      }
    }
  } catch (const std::exception &ex) {
    log::error("failed to spawn '{}': {}",
               command_preview(req.program, req.args), ex.what());
    co_return fail(Error::ProcessSpawnFailed);
  }

  const auto pid = proc->id();
  log::debug("process started pid={} cmd='{}'", pid,
             command_preview(req.program, req.args));
  if (hooks.on_spawn) {
    hooks.on_spawn(pid);
  }

  std::stop_callback kill_on_stop(req.stop, [pid] { kill_group(pid); });

  boost::asio::cancellation_signal cancel_sig;
  using namespace boost::asio::experimental::awaitable_operators;
  auto wait_result = co_await (
      write_stdin(stdin_pipe, std::move(req.stdin_data)) &&
      read_pipe_all(stdout_pipe, result.stdout_output, cancel_sig, &hooks) &&
      read_pipe_all(stderr_pipe, result.stderr_output, cancel_sig, nullptr) &&
      wait_process_with_timeout(*proc, req.timeout, cancel_sig));

  result.exit_code = wait_result.exit_code;
  result.timed_out = wait_result.timed_out;
  result.stopped = req.stop.stop_requested();
  if (result.stopped && !result.timed_out) {
    result.exit_code = kExitCodeStopped;
  }
  log::debug("process finished pid={} exit_code={} timed_out={} stopped={}",
             pid, result.exit_code, result.timed_out, result.stopped);
  co_return ok(std::move(result));
}

} // namespace planq
