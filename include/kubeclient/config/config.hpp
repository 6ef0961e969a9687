#pragma once

#include "kubeclient/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace kubeclient {

struct ApiServerConfig {
  /// `http://host:port[/prefix]` or `unix:///path/to.sock`.
  std::string endpoint{"http://127.0.0.1:8001"};
  std::string default_namespace{"default"};

  auto operator==(const ApiServerConfig &) const -> bool = default;
};

struct TransportConfig {
  int connect_timeout_ms{30000};
  int read_timeout_ms{30000};
  std::size_t max_response_size{10UL * 1024UL * 1024UL};
  std::size_t stream_buffer_size{2048};
  bool keep_alive{true};

  auto operator==(const TransportConfig &) const -> bool = default;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file; // empty = stderr

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct KubeClientConfig {
  ApiServerConfig api_server;
  TransportConfig transport;
  LoggingConfig logging;

  auto operator==(const KubeClientConfig &) const -> bool = default;
};

/// Loads `KubeClientConfig` from TOML. KUBECLIENT_ENDPOINT,
/// KUBECLIENT_NAMESPACE, KUBECLIENT_LOG_LEVEL and
/// KUBECLIENT_STREAM_BUFFER_SIZE override the file.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<KubeClientConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<KubeClientConfig>;
  /// Built-in defaults plus environment overrides.
  [[nodiscard]] static auto load_defaults() -> Result<KubeClientConfig>;
};

} // namespace kubeclient
