#include "kubeclient/resource/kube_api_client.hpp"

#include "kubeclient/util/log.hpp"

#include <chrono>

namespace kubeclient {

auto config_map_route() -> ResourceRoute {
  return ResourceRoute{.group_version_path = "api/v1",
                       .plural = "configmaps",
                       .namespaced = true};
}

auto deployment_route() -> ResourceRoute {
  return ResourceRoute{.group_version_path = "apis/apps/v1",
                       .plural = "deployments",
                       .namespaced = true};
}

KubeApiClient::KubeApiClient(boost::asio::any_io_executor executor,
                             Options options)
    : options_(std::move(options)),
      transport_(std::move(executor), options_.endpoint, options_.http),
      gateway_(transport_, models::default_kind_registry()) {}

auto KubeApiClient::from_config(boost::asio::any_io_executor executor,
                                const KubeClientConfig &config)
    -> Result<std::unique_ptr<KubeApiClient>> {
  auto endpoint = http::parse_endpoint(config.api_server.endpoint);
  if (!endpoint) {
    log::error("Invalid API server endpoint '{}'", config.api_server.endpoint);
    return fail(endpoint.error());
  }

  Options options{
      .endpoint = std::move(*endpoint),
      .default_namespace = config.api_server.default_namespace,
      .http = http::HttpClientConfig{
          .connect_timeout =
              std::chrono::milliseconds(config.transport.connect_timeout_ms),
          .read_timeout =
              std::chrono::milliseconds(config.transport.read_timeout_ms),
          .max_response_size = config.transport.max_response_size,
          .keep_alive = config.transport.keep_alive},
      .watch = WatchOptions{.buffer_size = config.transport.stream_buffer_size,
                            .channel_capacity = 64}};
  return ok(std::make_unique<KubeApiClient>(std::move(executor),
                                            std::move(options)));
}

auto KubeApiClient::config_maps() -> ConfigMapClient {
  return resources<models::ConfigMapV1, models::ConfigMapListV1>(
      config_map_route());
}

auto KubeApiClient::deployments() -> DeploymentClient {
  return resources<models::DeploymentV1, models::DeploymentListV1>(
      deployment_route());
}

} // namespace kubeclient
