#include "kubeclient/client/http/http_types.hpp"

#include <boost/beast/http/status.hpp>

#include <format>
#include <iterator>
#include <utility>

namespace kubeclient::http {

auto find_header(const HttpHeaders &headers, std::string_view key)
    -> std::optional<std::string_view> {
  auto it = headers.find(key);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

auto HttpRequest::target() const -> std::string {
  if (query_string.empty()) {
    return path;
  }
  return std::format("{}?{}", path, query_string);
}

auto HttpRequest::header(std::string_view key) const
    -> std::optional<std::string_view> {
  return find_header(headers, key);
}

auto HttpRequest::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

auto HttpRequest::set_header(std::string key, std::string value)
    -> HttpRequest & {
  headers[std::move(key)] = std::move(value);
  return *this;
}

auto HttpRequest::set_body(std::string_view body_str,
                           std::string_view content_type) -> HttpRequest & {
  body.assign(body_str.begin(), body_str.end());
  headers["Content-Type"] = std::string(content_type);
  return *this;
}

auto HttpRequest::serialize() const -> std::vector<uint8_t> {
  std::vector<uint8_t> result;

  // Request line (~40) + headers (~40 each) + body
  result.reserve(256 + body.size());

  std::format_to(std::back_inserter(result), "{} {} HTTP/1.1\r\n", method,
                 target());

  bool has_content_length = false;
  bool has_host = false;
  for (const auto &[key, value] : headers) {
    std::format_to(std::back_inserter(result), "{}: {}\r\n", key, value);
    if (CaseInsensitiveEqual{}(key, "Content-Length")) {
      has_content_length = true;
    }
    if (CaseInsensitiveEqual{}(key, "Host")) {
      has_host = true;
    }
  }

  if (!has_host) {
    constexpr std::string_view host_header = "Host: localhost\r\n";
    result.insert(result.end(), host_header.begin(), host_header.end());
  }

  // PATCH/PUT/POST always announce their length, even when empty.
  if (!has_content_length &&
      (!body.empty() || method == HttpMethod::PATCH ||
       method == HttpMethod::PUT || method == HttpMethod::POST)) {
    std::format_to(std::back_inserter(result), "Content-Length: {}\r\n",
                   body.size());
  }

  result.emplace_back('\r');
  result.emplace_back('\n');
  result.insert(result.end(), body.begin(), body.end());
  return result;
}

auto HttpResponse::json(HttpStatus status, std::string_view json_str)
    -> HttpResponse {
  HttpResponse resp{.status = status, .headers = {}, .body = {}};
  resp.headers["Content-Type"] = std::string(kJsonMediaType);
  resp.body.assign(json_str.begin(), json_str.end());
  return resp;
}

auto HttpResponse::header(std::string_view key) const
    -> std::optional<std::string_view> {
  return find_header(headers, key);
}

auto HttpResponse::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

auto status_reason_phrase(HttpStatus status) -> std::string_view {
  namespace beast_http = boost::beast::http;
  auto phrase =
      beast_http::obsolete_reason(static_cast<beast_http::status>(status));
  return {phrase.data(), phrase.size()};
}

} // namespace kubeclient::http
