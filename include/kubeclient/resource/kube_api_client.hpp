#pragma once

#include "kubeclient/client/http/http_client.hpp"
#include "kubeclient/client/http/transport.hpp"
#include "kubeclient/config/config.hpp"
#include "kubeclient/core/error.hpp"
#include "kubeclient/models/config_map.hpp"
#include "kubeclient/models/deployment.hpp"
#include "kubeclient/models/kind_registry.hpp"
#include "kubeclient/resource/resource_client.hpp"
#include "kubeclient/resource/resource_gateway.hpp"
#include "kubeclient/resource/watch.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace kubeclient {

using ConfigMapClient = ResourceClient<models::ConfigMapV1,
                                       models::ConfigMapListV1,
                                       http::HttpTransport>;
using DeploymentClient = ResourceClient<models::DeploymentV1,
                                        models::DeploymentListV1,
                                        http::HttpTransport>;

[[nodiscard]] auto config_map_route() -> ResourceRoute;
[[nodiscard]] auto deployment_route() -> ResourceRoute;

/// Entry point for one API server: owns the transport and the gateway and
/// hands out per-kind clients, which must not outlive it.
class KubeApiClient {
public:
  struct Options {
    http::Endpoint endpoint;
    std::string default_namespace{"default"};
    http::HttpClientConfig http;
    WatchOptions watch;
  };

  KubeApiClient(boost::asio::any_io_executor executor, Options options);

  KubeApiClient(const KubeApiClient &) = delete;
  auto operator=(const KubeApiClient &) -> KubeApiClient & = delete;

  [[nodiscard]] static auto from_config(boost::asio::any_io_executor executor,
                                        const KubeClientConfig &config)
      -> Result<std::unique_ptr<KubeApiClient>>;

  [[nodiscard]] auto config_maps() -> ConfigMapClient;
  [[nodiscard]] auto deployments() -> DeploymentClient;

  template <models::KubeResource T, models::KubeResourceList TList>
  [[nodiscard]] auto resources(ResourceRoute route)
      -> ResourceClient<T, TList, http::HttpTransport> {
    return ResourceClient<T, TList, http::HttpTransport>(
        gateway_, std::move(route), options_.default_namespace,
        options_.watch);
  }

  [[nodiscard]] auto gateway() noexcept
      -> ResourceGateway<http::HttpTransport> & {
    return gateway_;
  }

  [[nodiscard]] auto default_namespace() const noexcept -> std::string_view {
    return options_.default_namespace;
  }

private:
  Options options_;
  http::HttpTransport transport_;
  ResourceGateway<http::HttpTransport> gateway_;
};

} // namespace kubeclient
