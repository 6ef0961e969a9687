#include "kubeclient/resource/kube_error.hpp"

#include "kubeclient/util/json.hpp"

#include <format>
#include <iterator>

namespace kubeclient {

auto KubeError::reason() const -> std::string_view {
  if (!status) {
    return {};
  }
  return status->reason;
}

auto KubeError::describe() const -> std::string {
  auto text = std::format("[{}] {}", to_string_view(kind), message);
  if (code && kind != KubeErrorKind::ClientError) {
    std::format_to(std::back_inserter(text), " ({})", code.message());
  }
  return text;
}

auto KubeError::client_error(http::HttpStatus http_status,
                             std::optional<models::StatusV1> status,
                             std::string message) -> KubeError {
  return KubeError{.kind = KubeErrorKind::ClientError,
                   .http_status = http_status,
                   .status = std::move(status),
                   .code = {},
                   .message = std::move(message)};
}

auto KubeError::stream_protocol(std::string message, std::error_code code)
    -> KubeError {
  return KubeError{.kind = KubeErrorKind::StreamProtocol,
                   .http_status = std::nullopt,
                   .status = std::nullopt,
                   .code = code,
                   .message = std::move(message)};
}

auto KubeError::transport(std::error_code code, std::string_view context)
    -> KubeError {
  return KubeError{.kind = KubeErrorKind::Transport,
                   .http_status = std::nullopt,
                   .status = std::nullopt,
                   .code = code,
                   .message = std::format("{} failed", context)};
}

auto KubeError::aborted(std::string_view context) -> KubeError {
  return KubeError{.kind = KubeErrorKind::Aborted,
                   .http_status = std::nullopt,
                   .status = std::nullopt,
                   .code = make_error_code(Error::Cancelled),
                   .message = std::format("{} was aborted", context)};
}

auto try_parse_status(std::span<const std::uint8_t> body)
    -> std::optional<models::StatusV1> {
  if (body.empty()) {
    return std::nullopt;
  }
  auto parsed = read_json<models::StatusV1>(body);
  if (!parsed || parsed->kind != "Status") {
    return std::nullopt;
  }
  return std::move(*parsed);
}

auto map_failure(http::HttpStatus http_status,
                 std::span<const std::uint8_t> body, std::string_view action)
    -> KubeError {
  return map_failure(http_status, try_parse_status(body), action);
}

auto map_failure(http::HttpStatus http_status,
                 std::optional<models::StatusV1> status,
                 std::string_view action) -> KubeError {
  auto message =
      std::format("Failed to {} (HTTP status {} {})", action, http_status,
                  http::status_reason_phrase(http_status));
  if (status && !status->message.empty()) {
    std::format_to(std::back_inserter(message), ": {}", status->message);
  } else {
    message.push_back('.');
  }
  return KubeError::client_error(http_status, std::move(status),
                                 std::move(message));
}

} // namespace kubeclient
