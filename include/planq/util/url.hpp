#pragma once

#include "planq/core/error.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace planq::util {

struct ParsedHttpUrl {
  std::string host;
  std::uint16_t port{80};
  std::string target{"/"};
};

// Webhooks are posted over plain HTTP; a scheme-less URL is treated as http.
[[nodiscard]] inline auto parse_http_url(std::string_view url)
    -> Result<ParsedHttpUrl> {
  std::string normalized;
  if (url.find("://") == std::string_view::npos) {
    normalized = "http://";
    normalized.append(url);
    url = normalized;
  }

  auto parsed = boost::urls::parse_uri(url);
  if (!parsed) {
    return fail(Error::InvalidUrl);
  }
  const boost::urls::url_view &uri = *parsed;
  if (uri.scheme() != "http") {
    return fail(Error::InvalidUrl);
  }

  ParsedHttpUrl out;
  out.host = std::string(uri.host());
  if (out.host.empty()) {
    return fail(Error::InvalidUrl);
  }
  if (uri.has_port()) {
    auto port = uri.port_number();
    if (port == 0) {
      return fail(Error::InvalidUrl);
    }
    out.port = port;
  }

  auto target = std::string(uri.encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (uri.has_query()) {
    auto query = uri.encoded_query();
    target.push_back('?');
    target.append(query.data(), query.size());
  }
  out.target = std::move(target);
  return out;
}

} // namespace planq::util
