#pragma once

#include "kubeclient/core/error.hpp"
#include "kubeclient/util/string_hash.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kubeclient::http {

enum class HttpMethod : std::uint8_t { GET, POST, PUT, DELETE, PATCH };

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,

  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  Conflict = 409,
  Gone = 410,
  UnsupportedMediaType = 415,
  UnprocessableEntity = 422,
  TooManyRequests = 429,

  InternalServerError = 500,
  BadGateway = 502,
  ServiceUnavailable = 503,
  GatewayTimeout = 504
};

inline constexpr std::string_view kJsonMediaType = "application/json";
inline constexpr std::string_view kJsonPatchMediaType =
    "application/json-patch+json";
inline constexpr std::string_view kMergePatchMediaType =
    "application/merge-patch+json";

using HttpHeaders = std::unordered_map<std::string, std::string,
                                       CaseInsensitiveHash,
                                       CaseInsensitiveEqual>;

[[nodiscard]] constexpr auto is_success(HttpStatus status) noexcept -> bool {
  const auto code = static_cast<std::uint16_t>(status);
  return code >= 200 && code < 300;
}

[[nodiscard]] auto find_header(const HttpHeaders &headers,
                               std::string_view key)
    -> std::optional<std::string_view>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path{"/"};
  std::string query_string;
  HttpHeaders headers;
  std::vector<uint8_t> body;

  [[nodiscard]] auto target() const -> std::string;
  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string_view>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;

  auto set_header(std::string key, std::string value) -> HttpRequest &;
  auto set_body(std::string_view body_str, std::string_view content_type)
      -> HttpRequest &;

  [[nodiscard]] auto serialize() const -> std::vector<uint8_t>;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<uint8_t> body;

  [[nodiscard]] static auto json(HttpStatus status, std::string_view json_str)
      -> HttpResponse;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string_view>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;
};

[[nodiscard]] auto status_reason_phrase(HttpStatus status) -> std::string_view;

} // namespace kubeclient::http

template <>
struct std::formatter<kubeclient::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(kubeclient::http::HttpMethod method, auto &ctx) const {
    using enum kubeclient::http::HttpMethod;
    std::string_view name = [method] {
      switch (method) {
      case GET:
        return "GET";
      case POST:
        return "POST";
      case PUT:
        return "PUT";
      case DELETE:
        return "DELETE";
      case PATCH:
        return "PATCH";
      }
      return "UNKNOWN";
    }();
    return std::formatter<std::string_view>::format(name, ctx);
  }
};

template <>
struct std::formatter<kubeclient::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(kubeclient::http::HttpStatus status, auto &ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
