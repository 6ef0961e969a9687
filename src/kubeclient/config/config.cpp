#include "kubeclient/config/config.hpp"

#include "kubeclient/core/error.hpp"
#include "kubeclient/util/log.hpp"

#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <glaze/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace kubeclient {
namespace detail {

struct ApiServerToml {
  std::string endpoint{"http://127.0.0.1:8001"};
  std::string default_namespace{"default"};
};

struct TransportToml {
  int connect_timeout_ms{30000};
  int read_timeout_ms{30000};
  std::uint64_t max_response_size{10UL * 1024UL * 1024UL};
  std::uint64_t stream_buffer_size{2048};
  bool keep_alive{true};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct KubeClientToml {
  ApiServerToml api_server{};
  TransportToml transport{};
  LoggingToml logging{};
};

} // namespace detail
} // namespace kubeclient

namespace glz {
template <> struct meta<kubeclient::detail::ApiServerToml> {
  using T = kubeclient::detail::ApiServerToml;
  static constexpr auto value = object("endpoint", &T::endpoint,
                                       "default_namespace",
                                       &T::default_namespace);
};

template <> struct meta<kubeclient::detail::TransportToml> {
  using T = kubeclient::detail::TransportToml;
  static constexpr auto value =
      object("connect_timeout_ms", &T::connect_timeout_ms, "read_timeout_ms",
             &T::read_timeout_ms, "max_response_size", &T::max_response_size,
             "stream_buffer_size", &T::stream_buffer_size, "keep_alive",
             &T::keep_alive);
};

template <> struct meta<kubeclient::detail::LoggingToml> {
  using T = kubeclient::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<kubeclient::detail::KubeClientToml> {
  using T = kubeclient::detail::KubeClientToml;
  static constexpr auto value =
      object("api_server", &T::api_server, "transport", &T::transport,
             "logging", &T::logging);
};
} // namespace glz

namespace kubeclient {
namespace {

// Sections and keys this version does not know are skipped, so newer config
// files still load.
constexpr auto kTomlOpts =
    glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};

constexpr std::size_t kMaxStreamBufferSize = 16UL * 1024UL * 1024UL;

[[nodiscard]] auto parse_config_toml(std::string_view text)
    -> Result<detail::KubeClientToml> {
  detail::KubeClientToml raw{};
  if (auto ec = glz::read<kTomlOpts>(raw, text); ec) {
    log::error("Invalid configuration: {}", glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

// Signed parse so "-1" is rejected instead of wrapping.
[[nodiscard]] auto parse_positive_env(const char *name, const char *text)
    -> Result<std::size_t> {
  std::int64_t value = 0;
  if (!boost::conversion::try_lexical_convert(text, value) || value <= 0) {
    log::error("{} must be a positive integer, got '{}'", name, text);
    return fail(Error::ParseError);
  }
  return ok(static_cast<std::size_t>(value));
}

[[nodiscard]] auto apply_env_overrides(KubeClientConfig &cfg) -> Result<void> {
  if (const char *v = std::getenv("KUBECLIENT_ENDPOINT"); v != nullptr) {
    cfg.api_server.endpoint = v;
  }
  if (const char *v = std::getenv("KUBECLIENT_NAMESPACE"); v != nullptr) {
    cfg.api_server.default_namespace = v;
  }
  if (const char *v = std::getenv("KUBECLIENT_LOG_LEVEL"); v != nullptr) {
    cfg.logging.level = v;
  }
  if (const char *v = std::getenv("KUBECLIENT_STREAM_BUFFER_SIZE");
      v != nullptr) {
    auto size = parse_positive_env("KUBECLIENT_STREAM_BUFFER_SIZE", v);
    if (!size) {
      return fail(size.error());
    }
    cfg.transport.stream_buffer_size = *size;
  }
  return ok();
}

[[nodiscard]] auto validate(KubeClientConfig cfg) -> Result<KubeClientConfig> {
  if (cfg.api_server.endpoint.empty() ||
      cfg.api_server.default_namespace.empty() ||
      cfg.transport.connect_timeout_ms <= 0 ||
      cfg.transport.read_timeout_ms <= 0 ||
      cfg.transport.max_response_size == 0 ||
      cfg.transport.stream_buffer_size == 0 ||
      cfg.transport.stream_buffer_size > kMaxStreamBufferSize) {
    return fail(Error::InvalidArgument);
  }
  return ok(std::move(cfg));
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<KubeClientConfig> {
  auto raw_result = parse_config_toml(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  KubeClientConfig cfg{};
  cfg.api_server.endpoint = std::move(raw.api_server.endpoint);
  cfg.api_server.default_namespace =
      std::move(raw.api_server.default_namespace);

  cfg.transport.connect_timeout_ms = raw.transport.connect_timeout_ms;
  cfg.transport.read_timeout_ms = raw.transport.read_timeout_ms;
  cfg.transport.max_response_size =
      static_cast<std::size_t>(raw.transport.max_response_size);
  cfg.transport.stream_buffer_size =
      static_cast<std::size_t>(raw.transport.stream_buffer_size);
  cfg.transport.keep_alive = raw.transport.keep_alive;

  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);

  if (auto applied = apply_env_overrides(cfg); !applied) {
    return fail(applied.error());
  }
  return validate(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<KubeClientConfig> {
  std::ifstream in{std::string(path)};
  if (!in) {
    log::error("Cannot read configuration file {}", path);
    return fail(Error::FileNotFound);
  }
  std::ostringstream text;
  text << in.rdbuf();
  log::debug("Loading configuration from {}", path);
  return load_from_string(text.str());
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<KubeClientConfig> {
  return convert_toml(toml_str);
}

auto ConfigLoader::load_defaults() -> Result<KubeClientConfig> {
  KubeClientConfig cfg{};
  if (auto applied = apply_env_overrides(cfg); !applied) {
    return fail(applied.error());
  }
  return validate(std::move(cfg));
}

} // namespace kubeclient
