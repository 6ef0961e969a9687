#pragma once

#include "kubeclient/client/http/http_types.hpp"
#include "kubeclient/core/error.hpp"
#include "kubeclient/models/status.hpp"
#include "kubeclient/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace kubeclient {

enum class KubeErrorKind : std::uint8_t {
  /// The server answered with a non-success status.
  ClientError,
  /// The response could not be understood: bad content type, bad JSON.
  StreamProtocol,
  /// No usable response: connect, write or read failed.
  Transport,
  /// An in-flight operation was cancelled without the caller asking for it.
  Aborted,
};
BOOST_DESCRIBE_ENUM(KubeErrorKind, ClientError, StreamProtocol, Transport,
                    Aborted)
KUBECLIENT_DEFINE_ENUM_SERDE(KubeErrorKind, KubeErrorKind::ClientError)

struct KubeError {
  KubeErrorKind kind{KubeErrorKind::ClientError};
  std::optional<http::HttpStatus> http_status;
  std::optional<models::StatusV1> status;
  std::error_code code;
  std::string message;

  /// The server's reason ("NotFound", "Conflict", ...) or empty.
  [[nodiscard]] auto reason() const -> std::string_view;

  /// One line suitable for logs and CLI output.
  [[nodiscard]] auto describe() const -> std::string;

  [[nodiscard]] static auto
  client_error(http::HttpStatus http_status,
               std::optional<models::StatusV1> status, std::string message)
      -> KubeError;
  [[nodiscard]] static auto stream_protocol(std::string message,
                                            std::error_code code)
      -> KubeError;
  [[nodiscard]] static auto transport(std::error_code code,
                                      std::string_view context) -> KubeError;
  [[nodiscard]] static auto aborted(std::string_view context) -> KubeError;
};

template <typename T> using KubeResult = std::expected<T, KubeError>;

/// Parses `body` as a Status, if it is one.
[[nodiscard]] auto try_parse_status(std::span<const std::uint8_t> body)
    -> std::optional<models::StatusV1>;

/// Builds the ClientError for a failed response. `action` reads like
/// "retrieve ConfigMap (v1) resource". Never throws on a malformed body.
[[nodiscard]] auto map_failure(http::HttpStatus http_status,
                               std::span<const std::uint8_t> body,
                               std::string_view action) -> KubeError;

/// Same, for a body that was already parsed (or found not to be a Status).
[[nodiscard]] auto map_failure(http::HttpStatus http_status,
                               std::optional<models::StatusV1> status,
                               std::string_view action) -> KubeError;

} // namespace kubeclient
