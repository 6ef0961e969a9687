#pragma once

#include "kubeclient/client/http/http_types.hpp"
#include "kubeclient/client/http/transport.hpp"
#include "kubeclient/core/coroutine.hpp"
#include "kubeclient/models/kube_object.hpp"
#include "kubeclient/models/resource_event.hpp"
#include "kubeclient/models/status.hpp"
#include "kubeclient/resource/kube_error.hpp"
#include "kubeclient/resource/resource_gateway.hpp"
#include "kubeclient/resource/watch.hpp"

#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace kubeclient {

/// Where a kind lives in the REST tree.
struct ResourceRoute {
  /// "api/v1" for the core group, "apis/<group>/<version>" otherwise.
  std::string group_version_path;
  /// Lower-case plural, e.g. "configmaps".
  std::string plural;
  bool namespaced{true};
};

struct ListOptions {
  std::string label_selector;
  std::string field_selector;
  std::string resource_version;
  std::optional<std::int64_t> limit;
  std::string continue_token;
  /// Server-side watch timeout.
  std::optional<std::int64_t> timeout_seconds;
  bool allow_bookmarks{false};
};

/// `/api/v1/namespaces/<ns>/configmaps`, or `/api/v1/nodes` when the route
/// is cluster-scoped. `ns` is ignored for cluster-scoped routes.
[[nodiscard]] auto collection_path(const ResourceRoute &route,
                                   std::string_view ns) -> std::string;

[[nodiscard]] auto item_path(const ResourceRoute &route, std::string_view ns,
                             std::string_view name) -> std::string;

/// Query string for a list or watch request.
[[nodiscard]] auto list_query(const ListOptions &options, bool watch)
    -> std::string;

/// Operations on one kind, addressed by name and namespace. An empty
/// namespace argument means the client's default namespace.
template <models::KubeResource T, models::KubeResourceList TList,
          http::KubeTransport Transport>
  requires std::same_as<typename TList::item_type, T>
class ResourceClient {
public:
  using resource_type = T;
  using list_type = TList;
  using event_type = models::ResourceEventV1<T>;

  ResourceClient(ResourceGateway<Transport> &gateway, ResourceRoute route,
                 std::string default_namespace, WatchOptions watch_options = {})
      : gateway_(&gateway), route_(std::move(route)),
        default_namespace_(std::move(default_namespace)),
        watch_options_(watch_options) {}

  auto get(std::string_view name, std::string_view ns = {})
      -> task<KubeResult<std::optional<T>>> {
    return gateway_->template get_one<T>(item_request(ns, name));
  }

  auto list(std::string_view ns = {}, const ListOptions &options = {})
      -> task<KubeResult<TList>> {
    auto request = collection_request(ns);
    request.query_string = list_query(options, false);
    return gateway_->template get_list<TList>(std::move(request));
  }

  auto watch(std::string_view ns = {}, const ListOptions &options = {})
      -> task<KubeResult<WatchSubscription<event_type>>> {
    auto request = collection_request(ns);
    request.query_string = list_query(options, true);
    return gateway_->template watch<T>(std::move(request), watch_options_);
  }

  /// Watches a single object through a `metadata.name` field selector.
  auto watch_one(std::string_view name, std::string_view ns = {},
                 ListOptions options = {})
      -> task<KubeResult<WatchSubscription<event_type>>> {
    options.field_selector = std::format("metadata.name={}", name);
    return watch(ns, options);
  }

  /// Creates in the resource's own namespace, else in `ns`.
  auto create(const T &resource, std::string_view ns = {})
      -> task<KubeResult<T>> {
    const std::string_view target_ns = resource.metadata.namespace_.empty()
                                           ? ns
                                           : resource.metadata.namespace_;
    return gateway_->template create<T>(resource,
                                        collection_request(target_ns));
  }

  auto replace(const T &resource) -> task<KubeResult<T>> {
    return gateway_->template replace<T>(
        resource, item_request(resource.metadata.namespace_,
                               resource.metadata.name));
  }

  template <typename Mutator>
  auto patch(std::string_view name, Mutator mutator, std::string_view ns = {})
      -> task<KubeResult<T>> {
    return gateway_->template patch<T>(std::move(mutator),
                                       item_request(ns, name));
  }

  template <typename Mutator>
  auto patch_raw(std::string_view name, Mutator mutator,
                 std::string_view ns = {}) -> task<KubeResult<T>> {
    return gateway_->template patch_raw<T>(std::move(mutator),
                                           item_request(ns, name));
  }

  auto merge_patch(std::string_view name, std::string patch_json,
                   std::string_view ns = {}) -> task<KubeResult<T>> {
    return gateway_->template merge_patch<T>(std::move(patch_json),
                                             item_request(ns, name));
  }

  auto remove(std::string_view name, std::string_view ns = {})
      -> task<KubeResult<models::StatusV1>> {
    return gateway_->template remove<T>(item_request(ns, name));
  }

  [[nodiscard]] auto route() const noexcept -> const ResourceRoute & {
    return route_;
  }

  [[nodiscard]] auto resolve_namespace(std::string_view ns) const
      -> std::string_view {
    return ns.empty() ? std::string_view{default_namespace_} : ns;
  }

private:
  [[nodiscard]] auto collection_request(std::string_view ns) const
      -> http::HttpRequest {
    http::HttpRequest request;
    request.path = collection_path(route_, resolve_namespace(ns));
    return request;
  }

  [[nodiscard]] auto item_request(std::string_view ns,
                                  std::string_view name) const
      -> http::HttpRequest {
    http::HttpRequest request;
    request.path = item_path(route_, resolve_namespace(ns), name);
    return request;
  }

  ResourceGateway<Transport> *gateway_;
  ResourceRoute route_;
  std::string default_namespace_;
  WatchOptions watch_options_;
};

} // namespace kubeclient
