#pragma once

#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"
#include "planq/notify/milestone.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace planq {

/// Posts queue milestones as JSON to a webhook. Delivery is best effort:
/// failures are logged and never reach the queue.
class WebhookNotifier {
public:
  WebhookNotifier(boost::asio::any_io_executor executor, std::string url,
                  std::chrono::milliseconds timeout);

  [[nodiscard]] auto enabled() const noexcept -> bool { return !url_.empty(); }
  [[nodiscard]] auto url() const noexcept -> const std::string & {
    return url_;
  }

  /// Fire-and-forget delivery on the notifier's executor.
  auto notify(Milestone milestone) -> void;

  /// Deliveries spawned by notify() that have not completed yet.
  [[nodiscard]] auto pending() const noexcept -> std::size_t {
    return pending_;
  }

  auto deliver(Milestone milestone) -> task<Result<void>>;

private:
  boost::asio::any_io_executor executor_;
  std::string url_;
  std::chrono::milliseconds timeout_;
  std::size_t pending_{0};
};

/// `{"event","planId","taskId","message","ts"}`
[[nodiscard]] auto milestone_to_json(const Milestone &milestone)
    -> std::string;

} // namespace planq
