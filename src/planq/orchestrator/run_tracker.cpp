#include "planq/orchestrator/run_tracker.hpp"

#include "planq/core/asio_awaitable.hpp"

#include <boost/asio/cancellation_type.hpp>
#include <boost/asio/this_coro.hpp>

#include <utility>

namespace planq {

CompletionSignal::CompletionSignal(boost::asio::any_io_executor executor)
    : timer_(std::move(executor), boost::asio::steady_timer::time_point::max()) {
}

auto CompletionSignal::resolve() -> void {
  if (resolved_) {
    return;
  }
  resolved_ = true;
  timer_.cancel();
}

auto CompletionSignal::wait() -> task<void> {
  while (!resolved_) {
    auto [ec] = co_await timer_.async_wait(use_nothrow);
    if (!ec || resolved_) {
      continue;
    }
    auto state = co_await boost::asio::this_coro::cancellation_state;
    if (state.cancelled() != boost::asio::cancellation_type::none) {
      co_return;
    }
  }
}

RunTracker::RunTracker(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)) {}

auto RunTracker::track(const RunId &run_id, const PlanId &plan_id,
                       const TaskId &task_id) -> ActiveRun & {
  completions_.insert_or_assign(run_id,
                                std::make_shared<CompletionSignal>(executor_));
  auto [it, _] = active_.insert_or_assign(
      run_id, ActiveRun{.plan_id = plan_id, .task_id = task_id});
  return it->second;
}

auto RunTracker::find(const RunId &run_id) -> ActiveRun * {
  auto it = active_.find(run_id);
  return it != active_.end() ? &it->second : nullptr;
}

auto RunTracker::contains(const RunId &run_id) const -> bool {
  return active_.contains(run_id);
}

auto RunTracker::claim(const RunId &run_id) -> std::optional<ActiveRun> {
  auto it = active_.find(run_id);
  if (it == active_.end()) {
    return std::nullopt;
  }
  auto out = std::move(it->second);
  active_.erase(it);
  return out;
}

auto RunTracker::resolve(const RunId &run_id) -> void {
  auto it = completions_.find(run_id);
  if (it == completions_.end()) {
    return;
  }
  auto signal = std::move(it->second);
  completions_.erase(it);
  signal->resolve();
}

auto RunTracker::completion(const RunId &run_id) const
    -> std::shared_ptr<CompletionSignal> {
  auto it = completions_.find(run_id);
  return it != completions_.end() ? it->second : nullptr;
}

auto RunTracker::runs_of(const PlanId &plan_id) const -> std::vector<RunId> {
  std::vector<RunId> out;
  for (const auto &[id, run] : active_) {
    if (run.plan_id == plan_id) {
      out.push_back(id);
    }
  }
  return out;
}

} // namespace planq
