#include "kubeclient/resource/resource_client.hpp"

#include "kubeclient/util/url.hpp"

#include <boost/lexical_cast.hpp>

namespace kubeclient {

auto collection_path(const ResourceRoute &route, std::string_view ns)
    -> std::string {
  std::string path = "/";
  path.append(route.group_version_path);
  if (route.namespaced) {
    path.append("/namespaces/");
    path.append(util::url_encode(ns));
  }
  path.push_back('/');
  path.append(route.plural);
  return path;
}

auto item_path(const ResourceRoute &route, std::string_view ns,
               std::string_view name) -> std::string {
  auto path = collection_path(route, ns);
  path.push_back('/');
  path.append(util::url_encode(name));
  return path;
}

auto list_query(const ListOptions &options, bool watch) -> std::string {
  std::string query;
  if (watch) {
    util::append_query(query, "watch", "true");
  }
  if (!options.label_selector.empty()) {
    util::append_query(query, "labelSelector", options.label_selector);
  }
  if (!options.field_selector.empty()) {
    util::append_query(query, "fieldSelector", options.field_selector);
  }
  if (!options.resource_version.empty()) {
    util::append_query(query, "resourceVersion", options.resource_version);
  }
  if (options.limit) {
    util::append_query(query, "limit",
                       boost::lexical_cast<std::string>(*options.limit));
  }
  if (!options.continue_token.empty()) {
    util::append_query(query, "continue", options.continue_token);
  }
  if (watch && options.timeout_seconds) {
    util::append_query(
        query, "timeoutSeconds",
        boost::lexical_cast<std::string>(*options.timeout_seconds));
  }
  if (watch && options.allow_bookmarks) {
    util::append_query(query, "allowWatchBookmarks", "true");
  }
  return query;
}

} // namespace kubeclient
