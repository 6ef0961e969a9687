#include "kubeclient/models/config_map.hpp"
#include "kubeclient/models/deployment.hpp"
#include "kubeclient/resource/kube_api_client.hpp"
#include "kubeclient/resource/resource_client.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace kubeclient;
using kubeclient::http::HttpMethod;
using kubeclient::http::HttpStatus;
using kubeclient::models::ConfigMapListV1;
using kubeclient::models::ConfigMapV1;
using kubeclient::models::DeploymentListV1;
using kubeclient::models::DeploymentV1;
using kubeclient::test::FakeResponseStream;
using kubeclient::test::FakeTransport;
using kubeclient::test::run_coro;

namespace {

constexpr std::string_view kConfigMap =
    R"({"apiVersion":"v1","kind":"ConfigMap","metadata":{"name":"settings"}})";

using ConfigMaps = ResourceClient<ConfigMapV1, ConfigMapListV1, FakeTransport>;
using Deployments =
    ResourceClient<DeploymentV1, DeploymentListV1, FakeTransport>;

class ResourceClientTest : public ::testing::Test {
protected:
  FakeTransport transport;
  ResourceGateway<FakeTransport> gateway{transport};
  ConfigMaps config_maps{gateway, config_map_route(), "team-a"};
  Deployments deployments{gateway, deployment_route(), "team-a"};
};

} // namespace

TEST(ResourcePathTest, CollectionAndItemPaths) {
  EXPECT_EQ(collection_path(config_map_route(), "default"),
            "/api/v1/namespaces/default/configmaps");
  EXPECT_EQ(item_path(deployment_route(), "prod", "web"),
            "/apis/apps/v1/namespaces/prod/deployments/web");
}

TEST(ResourcePathTest, ClusterScopedRouteIgnoresNamespace) {
  ResourceRoute nodes{.group_version_path = "api/v1",
                      .plural = "nodes",
                      .namespaced = false};
  EXPECT_EQ(collection_path(nodes, "ignored"), "/api/v1/nodes");
  EXPECT_EQ(item_path(nodes, "", "node-1"), "/api/v1/nodes/node-1");
}

TEST(ResourcePathTest, NamesArePercentEncoded) {
  EXPECT_EQ(item_path(config_map_route(), "default", "a b/c"),
            "/api/v1/namespaces/default/configmaps/a%20b%2Fc");
}

TEST(ListQueryTest, EmptyOptionsGiveEmptyQuery) {
  EXPECT_EQ(list_query({}, false), "");
  EXPECT_EQ(list_query({}, true), "watch=true");
}

TEST(ListQueryTest, ListParametersInOrder) {
  ListOptions opts{.label_selector = "app=web",
                   .field_selector = "metadata.name=x",
                   .resource_version = "100",
                   .limit = 50,
                   .continue_token = "tok",
                   .timeout_seconds = 30,
                   .allow_bookmarks = true};
  EXPECT_EQ(list_query(opts, false),
            "labelSelector=app%3Dweb&fieldSelector=metadata.name%3Dx&"
            "resourceVersion=100&limit=50&continue=tok");
}

TEST(ListQueryTest, WatchOnlyParameters) {
  ListOptions opts{.timeout_seconds = 60, .allow_bookmarks = true};
  EXPECT_EQ(list_query(opts, true),
            "watch=true&timeoutSeconds=60&allowWatchBookmarks=true");
}

TEST_F(ResourceClientTest, GetUsesDefaultNamespace) {
  transport.respond(HttpStatus::Ok, kConfigMap);
  auto result = run_coro(config_maps.get("settings"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(transport.last_request().target(),
            "/api/v1/namespaces/team-a/configmaps/settings");
}

TEST_F(ResourceClientTest, ExplicitNamespaceWins) {
  transport.respond(HttpStatus::Ok, kConfigMap);
  auto result = run_coro(config_maps.get("settings", "team-b"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(transport.last_request().path,
            "/api/v1/namespaces/team-b/configmaps/settings");
  EXPECT_EQ(config_maps.resolve_namespace(""), "team-a");
}

TEST_F(ResourceClientTest, ListSendsSelectors) {
  transport.respond(HttpStatus::Ok, R"({"kind":"ConfigMapList","items":[]})");
  auto result = run_coro(
      config_maps.list({}, ListOptions{.label_selector = "tier=backend"}));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->items.empty());
  EXPECT_EQ(transport.last_request().target(),
            "/api/v1/namespaces/team-a/configmaps?labelSelector=tier%3Dbackend");
}

TEST_F(ResourceClientTest, CreatePrefersResourceNamespace) {
  transport.respond(HttpStatus::Created, kConfigMap);
  ConfigMapV1 cm;
  cm.metadata.name = "settings";
  cm.metadata.namespace_ = "team-c";
  auto result = run_coro(config_maps.create(cm, "team-b"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(transport.last_request().path,
            "/api/v1/namespaces/team-c/configmaps");
  EXPECT_EQ(transport.last_request().method, HttpMethod::POST);
}

TEST_F(ResourceClientTest, ReplaceTargetsTheObject) {
  transport.respond(HttpStatus::Ok, kConfigMap);
  ConfigMapV1 cm;
  cm.metadata.name = "settings";
  auto result = run_coro(config_maps.replace(cm));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(transport.last_request().path,
            "/api/v1/namespaces/team-a/configmaps/settings");
  EXPECT_EQ(transport.last_request().method, HttpMethod::PUT);
}

TEST_F(ResourceClientTest, ScaleDeploymentThroughTypedPatch) {
  transport.respond(
      HttpStatus::Ok,
      R"({"kind":"Deployment","metadata":{"name":"web"},"spec":{"replicas":4}})");
  auto result = run_coro(deployments.patch(
      "web", [](TypedPatchDocument<DeploymentV1> &p) { p.set_replicas(4); }));
  ASSERT_TRUE(result.has_value()) << result.error().describe();
  EXPECT_EQ(result->spec.replicas, 4);
  EXPECT_EQ(transport.last_request().path,
            "/apis/apps/v1/namespaces/team-a/deployments/web");
}

TEST_F(ResourceClientTest, MergePatchAndRemove) {
  transport.respond(HttpStatus::Ok, kConfigMap);
  transport.respond(HttpStatus::Ok, R"({"kind":"Status","status":"Success"})");
  auto patched = run_coro(
      config_maps.merge_patch("settings", R"({"data":{"k":"v"}})"));
  ASSERT_TRUE(patched.has_value());
  auto removed = run_coro(config_maps.remove("settings"));
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->status, "Success");
  EXPECT_EQ(transport.requests.at(1).method, HttpMethod::DELETE);
}

TEST_F(ResourceClientTest, WatchOneFiltersByName) {
  transport.stream(std::make_unique<FakeResponseStream>(
      HttpStatus::Ok, test::json_headers(), std::vector<std::string>{}));
  auto count = run_coro([this]() -> task<int> {
    auto watch = co_await config_maps.watch_one(
        "settings", "", ListOptions{.allow_bookmarks = true});
    if (!watch) {
      co_return -1;
    }
    int n = 0;
    while (true) {
      auto next = co_await watch->next();
      if (!next || !next->has_value()) {
        break;
      }
      ++n;
    }
    co_return n;
  }());
  EXPECT_EQ(count, 0);
  EXPECT_EQ(transport.last_request().target(),
            "/api/v1/namespaces/team-a/configmaps?watch=true&"
            "fieldSelector=metadata.name%3Dsettings&allowWatchBookmarks=true");
}
