#pragma once

#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace planq::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds read_timeout{5000};
  std::size_t max_response_size{1024UL * 1024UL};
};

struct HttpResponse {
  unsigned status{0};
  std::string body;

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return status >= 200 && status < 300;
  }
};

/// HTTP/1.1 client over one TCP connection.
class HttpClient {
public:
  HttpClient(boost::asio::ip::tcp::socket socket, std::string host,
             HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  auto operator=(const HttpClient &) -> HttpClient & = delete;
  HttpClient(HttpClient &&) noexcept;
  auto operator=(HttpClient &&) noexcept -> HttpClient &;

  static auto connect_tcp(boost::asio::any_io_executor executor,
                          std::string_view host, std::uint16_t port,
                          HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  auto post_json(std::string_view target, std::string_view json)
      -> task<Result<HttpResponse>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace planq::http
