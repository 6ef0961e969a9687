#pragma once

#include "kubeclient/core/error.hpp"

#include <boost/url/encode.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <boost/url/url_view.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace kubeclient::util {

struct ParsedHttpUrl {
  std::string host;
  std::uint16_t port{80};
  std::string path{"/"};
};

[[nodiscard]] inline auto url_encode(std::string_view input) -> std::string {
  return boost::urls::encode(input, boost::urls::unreserved_chars);
}

/// Append `key=value` to a query string, percent-encoding both parts.
inline auto append_query(std::string &query, std::string_view key,
                         std::string_view value) -> void {
  if (!query.empty()) {
    query.push_back('&');
  }
  query.append(url_encode(key));
  query.push_back('=');
  query.append(url_encode(value));
}

[[nodiscard]] inline auto parse_http_url(std::string_view url)
    -> Result<ParsedHttpUrl> {
  std::string normalized;
  if (url.find("://") == std::string_view::npos) {
    normalized = "http://";
    normalized.append(url);
    url = normalized;
  }

  auto parsed = boost::urls::parse_absolute_uri(url);
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
    out.port = static_cast<std::uint16_t>(port);
  }

  auto path = std::string(uri.encoded_path());
  while (path.size() > 1 && path.ends_with('/')) {
    path.pop_back();
  }
  out.path = path.empty() ? "/" : std::move(path);
  return out;
}

} // namespace kubeclient::util
