#pragma once

#include "planq/agent/agent.hpp"
#include "planq/core/coroutine.hpp"
#include "planq/util/id.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

namespace planq {

/// One-shot latch. Every waiter resumes once resolve() is called; waiting on
/// a resolved signal completes immediately.
class CompletionSignal {
public:
  explicit CompletionSignal(boost::asio::any_io_executor executor);

  auto resolve() -> void;
  [[nodiscard]] auto resolved() const noexcept -> bool { return resolved_; }

  /// Returns early, without resolution, when the awaiting operation is
  /// cancelled.
  auto wait() -> task<void>;

private:
  bool resolved_{false};
  boost::asio::steady_timer timer_;
};

/// In-memory state of a run whose agent call is in flight.
struct ActiveRun {
  PlanId plan_id;
  TaskId task_id;
  std::shared_ptr<IInterruptible> interrupt;
  bool cancel_requested{false};
  /// Requested when the run is abandoned by a forced cancel.
  std::stop_source stop;
};

/// Maps run ids to their ActiveRun and completion signal. The two live
/// independently: claim() hands the ActiveRun to exactly one finalizing path
/// while waiters keep the signal until it resolves.
class RunTracker {
public:
  explicit RunTracker(boost::asio::any_io_executor executor);

  /// Registers a new run and its completion signal.
  auto track(const RunId &run_id, const PlanId &plan_id, const TaskId &task_id)
      -> ActiveRun &;

  [[nodiscard]] auto find(const RunId &run_id) -> ActiveRun *;
  [[nodiscard]] auto contains(const RunId &run_id) const -> bool;

  /// Removes and returns the ActiveRun; std::nullopt when another path
  /// already took it.
  [[nodiscard]] auto claim(const RunId &run_id) -> std::optional<ActiveRun>;

  /// Resolves and forgets the completion signal.
  auto resolve(const RunId &run_id) -> void;

  /// nullptr when the run is unknown or already resolved.
  [[nodiscard]] auto completion(const RunId &run_id) const
      -> std::shared_ptr<CompletionSignal>;

  [[nodiscard]] auto runs_of(const PlanId &plan_id) const -> std::vector<RunId>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return active_.size();
  }

private:
  boost::asio::any_io_executor executor_;
  ankerl::unordered_dense::map<RunId, ActiveRun> active_;
  ankerl::unordered_dense::map<RunId, std::shared_ptr<CompletionSignal>>
      completions_;
};

} // namespace planq
