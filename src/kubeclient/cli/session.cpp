#include "kubeclient/cli/session.hpp"

#include "kubeclient/util/enum.hpp"

#include <print>

namespace kubeclient::cli {

auto parse_kind(std::string_view name) -> std::optional<ResourceKind> {
  if (name == "cm" || name == "configmaps") {
    return ResourceKind::ConfigMap;
  }
  if (name == "deploy" || name == "deployments") {
    return ResourceKind::Deployment;
  }
  return util::try_parse_enum<ResourceKind>(name);
}

auto Session::open(const GlobalOptions &opts)
    -> Result<std::unique_ptr<Session>> {
  auto config = opts.config_file.empty()
                    ? ConfigLoader::load_defaults()
                    : ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    return fail(config.error());
  }
  if (!opts.endpoint.empty()) {
    config->api_server.endpoint = opts.endpoint;
  }
  if (!opts.namespace_.empty()) {
    config->api_server.default_namespace = opts.namespace_;
  }
  if (!opts.log_level.empty()) {
    log::set_level(opts.log_level);
  }

  auto session = std::make_unique<Session>(std::move(*config));
  auto client =
      KubeApiClient::from_config(session->io_.get_executor(), session->config_);
  if (!client) {
    return fail(client.error());
  }
  session->client_ = std::move(*client);
  log::debug("Using API server {} (namespace {})",
             session->config_.api_server.endpoint,
             session->config_.api_server.default_namespace);
  return ok(std::move(session));
}

auto print_error(const KubeError &error) -> void {
  std::println(stderr, "Error: {}", error.describe());
}

} // namespace kubeclient::cli
