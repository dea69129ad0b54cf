#pragma once

#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace planq {

inline constexpr int kExitCodeTimeout = 124;
inline constexpr int kExitCodeStopped = 137;

struct ProcessRequest {
  std::string program; // looked up on PATH unless it contains a '/'
  std::vector<std::string> args;
  std::string working_dir;
  std::optional<std::string> stdin_data;
  std::chrono::milliseconds timeout{std::chrono::hours(1)};
  std::stop_token stop;
};

struct ProcessResult {
  int exit_code{-1};
  std::string stdout_output;
  std::string stderr_output;
  bool timed_out{false};
  bool stopped{false};

  [[nodiscard]] auto success() const noexcept -> bool {
    return exit_code == 0 && !timed_out && !stopped;
  }
};

struct ProcessHooks {
  /// Called once the child exists.
  std::move_only_function<void(pid_t)> on_spawn;
  /// Called for every complete stdout line, without the trailing newline.
  std::move_only_function<void(std::string_view)> on_stdout_line;
};

/// Spawns `req.program` and awaits its exit while draining both pipes.
/// A stop request on `req.stop` SIGKILLs the child. Spawn failures are
/// returned as Error::ProcessSpawnFailed; a non-zero exit is not an error.
[[nodiscard]] auto run_process(ProcessRequest req, ProcessHooks hooks = {})
    -> task<Result<ProcessResult>>;

[[nodiscard]] auto command_preview(std::string_view program,
                                   const std::vector<std::string> &args,
                                   std::size_t max_len = 120) -> std::string;

} // namespace planq
