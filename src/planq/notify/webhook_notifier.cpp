#include "planq/notify/webhook_notifier.hpp"

#include "planq/client/http/http_client.hpp"
#include "planq/util/json.hpp"
#include "planq/util/log.hpp"
#include "planq/util/url.hpp"

#include <utility>

namespace planq {

auto milestone_to_json(const Milestone &milestone) -> std::string {
  JsonValue j{
      {"event", std::string(to_string_view(milestone.kind))},
      {"planId", milestone.plan_id.str()},
      {"taskId", milestone.task_id.str()},
      {"message", milestone.message},
      {"ts", util::format_iso8601(milestone.ts)},
  };
  return dump_json(j);
}

WebhookNotifier::WebhookNotifier(boost::asio::any_io_executor executor,
                                 std::string url,
                                 std::chrono::milliseconds timeout)
    : executor_(std::move(executor)), url_(std::move(url)), timeout_(timeout) {}

auto WebhookNotifier::notify(Milestone milestone) -> void {
  if (!enabled()) {
    return;
  }
  ++pending_;
  co_spawn(executor_, deliver(std::move(milestone)),
           [this, url = url_](std::exception_ptr ep, Result<void> r) {
             --pending_;
             if (ep) {
               log::warn("webhook {} delivery threw", url);
             } else if (!r) {
               log::warn("webhook {} delivery failed: {}", url,
                         r.error().message());
             }
           });
}

auto WebhookNotifier::deliver(Milestone milestone) -> task<Result<void>> {
  auto target = util::parse_http_url(url_);
  if (!target) {
    co_return fail(target.error());
  }

  http::HttpClientConfig cfg{.connect_timeout = timeout_,
                             .read_timeout = timeout_};
  auto client = co_await http::HttpClient::connect_tcp(executor_, target->host,
                                                       target->port, cfg);
  if (!client) {
    co_return fail(client.error());
  }

  auto resp = co_await (*client)->post_json(target->target,
                                            milestone_to_json(milestone));
  (*client)->close();
  if (!resp) {
    co_return fail(resp.error());
  }
  if (!resp->is_success()) {
    log::warn("webhook {} answered HTTP {}", url_, resp->status);
    co_return fail(Error::ProtocolError);
  }
  log::debug("webhook {} notified: {}", url_, to_string_view(milestone.kind));
  co_return ok();
}

} // namespace planq
