#pragma once

#include "kubeclient/cli/commands.hpp"
#include "kubeclient/config/config.hpp"
#include "kubeclient/core/coroutine.hpp"
#include "kubeclient/core/error.hpp"
#include "kubeclient/resource/kube_api_client.hpp"
#include "kubeclient/resource/kube_error.hpp"
#include "kubeclient/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace kubeclient::cli {

enum class ResourceKind : std::uint8_t { ConfigMap, Deployment };
BOOST_DESCRIBE_ENUM(ResourceKind, ConfigMap, Deployment)

/// Accepts the kind name in any case, its plural and the short names
/// `cm` and `deploy`.
[[nodiscard]] auto parse_kind(std::string_view name)
    -> std::optional<ResourceKind>;

/// One CLI invocation: the resolved configuration, an io_context driven
/// from the calling thread, and the API client bound to it.
class Session {
public:
  explicit Session(KubeClientConfig config) : config_(std::move(config)) {}

  Session(const Session &) = delete;
  auto operator=(const Session &) -> Session & = delete;

  /// Loads the config file (or defaults) and applies command-line overrides.
  [[nodiscard]] static auto open(const GlobalOptions &opts)
      -> Result<std::unique_ptr<Session>>;

  template <typename T> auto run(task<KubeResult<T>> op) -> KubeResult<T> {
    auto fut = boost::asio::co_spawn(io_, std::move(op),
                                     boost::asio::use_future);
    while (fut.wait_for(std::chrono::seconds(0)) !=
           std::future_status::ready) {
      io_.run_one();
    }
    io_.restart();
    try {
      return fut.get();
    } catch (const std::exception &e) {
      log::error("CLI operation failed: {}", e.what());
      return std::unexpected(
          KubeError::transport(make_error_code(Error::Unknown), "CLI operation"));
    }
  }

  [[nodiscard]] auto client() -> KubeApiClient & { return *client_; }
  [[nodiscard]] auto config() const noexcept -> const KubeClientConfig & {
    return config_;
  }

private:
  boost::asio::io_context io_;
  KubeClientConfig config_;
  std::unique_ptr<KubeApiClient> client_;
};

/// Runs `fn` with the per-kind client selected by `kind`.
template <typename Fn>
auto with_resources(ResourceKind kind, KubeApiClient &client, Fn &&fn)
    -> int {
  switch (kind) {
  case ResourceKind::ConfigMap:
    return fn(client.config_maps());
  case ResourceKind::Deployment:
    return fn(client.deployments());
  }
  return 1;
}

auto print_error(const KubeError &error) -> void;

} // namespace kubeclient::cli
