#include "planq/client/http/http_client.hpp"

#include "planq/core/asio_awaitable.hpp"
#include "planq/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <string>
#include <utility>

namespace planq::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;

[[nodiscard]] auto to_error_code(const boost::system::error_code &ec)
    -> std::error_code {
  return {ec.value(), std::system_category()};
}

} // namespace

struct HttpClient::Impl {
  boost::asio::ip::tcp::socket socket;
  std::string host;
  HttpClientConfig config;

  Impl(boost::asio::ip::tcp::socket socket_in, std::string host_in,
       HttpClientConfig cfg)
      : socket(std::move(socket_in)), host(std::move(host_in)), config(cfg) {}
};

HttpClient::HttpClient(boost::asio::ip::tcp::socket socket, std::string host,
                       HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(socket), std::move(host),
                                   config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient &&) noexcept = default;
auto HttpClient::operator=(HttpClient &&) noexcept -> HttpClient & = default;

auto HttpClient::connect_tcp(boost::asio::any_io_executor executor,
                             std::string_view host, std::uint16_t port,
                             HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  boost::asio::ip::tcp::resolver resolver(executor);
  auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
      std::string(host), std::to_string(port),
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{} - {}", host, port,
               resolve_ec.message());
    co_return fail(Error::InvalidUrl);
  }

  boost::asio::ip::tcp::socket socket(executor);
  auto [connect_ec, endpoint] = co_await boost::asio::async_connect(
      socket, endpoints,
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  (void)endpoint;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{} - {}", host, port,
               connect_ec.message());
    co_return fail(to_error_code(connect_ec));
  }

  co_return ok(
      std::make_unique<HttpClient>(std::move(socket), std::string(host), config));
}

auto HttpClient::post_json(std::string_view target, std::string_view json)
    -> task<Result<HttpResponse>> {
  if (!is_connected()) {
    co_return fail(Error::InvalidState);
  }

  beast_http::request<beast_http::string_body> req{
      beast_http::verb::post, std::string(target), 11};
  req.set(beast_http::field::host, impl_->host);
  req.set(beast_http::field::user_agent, "planq");
  req.set(beast_http::field::content_type, "application/json");
  req.set(beast_http::field::connection, "close");
  req.body() = std::string(json);
  req.prepare_payload();

  auto [write_ec, written] = co_await beast_http::async_write(
      impl_->socket, req,
      boost::asio::cancel_after(impl_->config.read_timeout, use_nothrow));
  (void)written;
  if (write_ec) {
    log::debug("Failed to write request: {}", write_ec.message());
    co_return fail(to_error_code(write_ec));
  }

  beast::flat_buffer read_buffer;
  beast_http::response_parser<beast_http::string_body> parser;
  parser.body_limit(impl_->config.max_response_size);
  auto [read_ec, read_n] = co_await beast_http::async_read(
      impl_->socket, read_buffer, parser,
      boost::asio::cancel_after(impl_->config.read_timeout, use_nothrow));
  (void)read_n;
  if (read_ec) {
    log::debug("Failed to read response: {}", read_ec.message());
    co_return fail(to_error_code(read_ec));
  }

  auto msg = parser.release();
  co_return HttpResponse{.status = msg.result_int(),
                         .body = std::move(msg.body())};
}

auto HttpClient::is_connected() const noexcept -> bool {
  return impl_ && impl_->socket.is_open();
}

auto HttpClient::close() -> void {
  boost::system::error_code ec;
  impl_->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  impl_->socket.close(ec);
}

} // namespace planq::http
