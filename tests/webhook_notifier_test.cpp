#include "planq/core/asio_awaitable.hpp"
#include "planq/notify/webhook_notifier.hpp"
#include "planq/util/json.hpp"
#include "planq/util/url.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <format>
#include <string>

using namespace planq;
using namespace planq::test;
using namespace std::chrono_literals;

namespace bhttp = boost::beast::http;
using boost::asio::ip::tcp;

namespace {

struct CapturedRequest {
  std::string target;
  std::string content_type;
  std::string body;
};

// Accepts one connection, records the request and answers with `status`.
auto serve_once(tcp::acceptor &acceptor, unsigned status,
                CapturedRequest &captured) -> task<void> {
  auto [ec, socket] = co_await acceptor.async_accept(use_nothrow);
  if (ec) {
    co_return;
  }
  boost::beast::flat_buffer buffer;
  bhttp::request<bhttp::string_body> req;
  auto [read_ec, n] =
      co_await bhttp::async_read(socket, buffer, req, use_nothrow);
  if (read_ec) {
    co_return;
  }
  captured.target = std::string(req.target());
  captured.content_type = std::string(req[bhttp::field::content_type]);
  captured.body = req.body();

  bhttp::response<bhttp::string_body> res{static_cast<bhttp::status>(status),
                                          req.version()};
  res.keep_alive(false);
  res.body() = "ok";
  res.prepare_payload();
  (void)co_await bhttp::async_write(socket, res, use_nothrow);
}

auto sample_milestone() -> Milestone {
  return Milestone{.kind = MilestoneKind::TaskMerged,
                   .plan_id = PlanId{"auth"},
                   .task_id = TaskId{"api"},
                   .message = "Merged planq/auth/api into main."};
}

auto string_field(const JsonValue &doc, std::string_view key) -> std::string {
  const auto &obj = doc.get_object();
  auto it = obj.find(std::string(key));
  return it != obj.end() && it->second.is_string()
             ? it->second.get_string()
             : std::string{};
}

} // namespace

TEST(HttpUrlTest, ParsesHostPortAndTarget) {
  auto url = util::parse_http_url("http://hooks.local:9000/planq?team=core");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "hooks.local");
  EXPECT_EQ(url->port, 9000);
  EXPECT_EQ(url->target, "/planq?team=core");
}

TEST(HttpUrlTest, DefaultsPortAndPath) {
  auto url = util::parse_http_url("example.com");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "example.com");
  EXPECT_EQ(url->port, 80);
  EXPECT_EQ(url->target, "/");
}

TEST(HttpUrlTest, RejectsUnsupportedUrls) {
  EXPECT_EQ(util::parse_http_url("https://example.com/x").error(),
            make_error_code(Error::InvalidUrl));
  EXPECT_FALSE(util::parse_http_url("http:///nohost").has_value());
  EXPECT_FALSE(util::parse_http_url("http://example.com:0/").has_value());
}

TEST(WebhookNotifierTest, MilestoneJson) {
  auto doc = parse_json(milestone_to_json(sample_milestone()));
  ASSERT_TRUE(doc.has_value());
  ASSERT_TRUE(doc->is_object());
  EXPECT_EQ(string_field(*doc, "event"), "task_merged");
  EXPECT_EQ(string_field(*doc, "planId"), "auth");
  EXPECT_EQ(string_field(*doc, "taskId"), "api");
  EXPECT_EQ(string_field(*doc, "message"), "Merged planq/auth/api into main.");
  EXPECT_FALSE(string_field(*doc, "ts").empty());
}

TEST(WebhookNotifierTest, PostsMilestoneToEndpoint) {
  boost::asio::io_context io;
  tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
  const auto port = acceptor.local_endpoint().port();
  CapturedRequest captured;
  co_spawn(io, serve_once(acceptor, 200, captured), detached);

  WebhookNotifier notifier(io.get_executor(),
                           std::format("http://127.0.0.1:{}/hooks/planq", port),
                           2000ms);
  auto delivered = run_on(io, notifier.deliver(sample_milestone()));
  ASSERT_TRUE(delivered.has_value()) << delivered.error().message();

  EXPECT_EQ(captured.target, "/hooks/planq");
  EXPECT_NE(captured.content_type.find("application/json"), std::string::npos);
  EXPECT_NE(captured.body.find("\"event\":\"task_merged\""), std::string::npos);
}

TEST(WebhookNotifierTest, ErrorStatusIsReported) {
  boost::asio::io_context io;
  tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
  const auto port = acceptor.local_endpoint().port();
  CapturedRequest captured;
  co_spawn(io, serve_once(acceptor, 500, captured), detached);

  WebhookNotifier notifier(io.get_executor(),
                           std::format("http://127.0.0.1:{}/", port), 2000ms);
  auto delivered = run_on(io, notifier.deliver(sample_milestone()));
  ASSERT_FALSE(delivered.has_value());
  EXPECT_EQ(delivered.error(), make_error_code(Error::ProtocolError));
}

TEST(WebhookNotifierTest, NotifyWithoutUrlIsDisabled) {
  boost::asio::io_context io;
  WebhookNotifier notifier(io.get_executor(), "", 1000ms);
  EXPECT_FALSE(notifier.enabled());
  notifier.notify(sample_milestone());
  EXPECT_EQ(notifier.pending(), 0U);
}

TEST(WebhookNotifierTest, FailedDeliveryDoesNotThrow) {
  boost::asio::io_context io;
  // A port nothing listens on.
  std::uint16_t port = 0;
  {
    tcp::acceptor spare(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
    port = spare.local_endpoint().port();
  }
  WebhookNotifier notifier(io.get_executor(),
                           std::format("http://127.0.0.1:{}/", port), 500ms);
  notifier.notify(sample_milestone());
  EXPECT_EQ(notifier.pending(), 1U);
  EXPECT_TRUE(pump_until(io, [&] { return notifier.pending() == 0; }, 5s));
}
