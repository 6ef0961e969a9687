#include "kubeclient/models/config_map.hpp"
#include "kubeclient/models/deployment.hpp"
#include "kubeclient/resource/event_mapper.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace kubeclient;
using kubeclient::models::ConfigMapV1;
using kubeclient::models::DeploymentV1;
using kubeclient::models::ResourceEventType;

namespace {

constexpr std::string_view kAdded =
    R"({"type":"ADDED","object":{"apiVersion":"v1","kind":"ConfigMap",)"
    R"("metadata":{"name":"settings","namespace":"default",)"
    R"("resourceVersion":"101"},"data":{"mode":"fast"}}})";

} // namespace

TEST(EventMapperTest, MapsTypedEvent) {
  EventMapper<ConfigMapV1> map;
  auto event = map(kAdded);
  ASSERT_TRUE(event.has_value()) << event.error().describe();
  EXPECT_EQ(event->type, ResourceEventType::Added);
  EXPECT_EQ(event->object.metadata.name, "settings");
  EXPECT_EQ(event->object.metadata.resource_version, "101");
  EXPECT_EQ(event->object.data.at("mode"), "fast");
}

TEST(EventMapperTest, MapsEveryEventType) {
  EventMapper<ConfigMapV1> map;
  for (auto [wire, type] :
       {std::pair{"MODIFIED", ResourceEventType::Modified},
        std::pair{"DELETED", ResourceEventType::Deleted},
        std::pair{"BOOKMARK", ResourceEventType::Bookmark}}) {
    auto line = std::format(
        R"({{"type":"{}","object":{{"metadata":{{"name":"a"}}}}}})", wire);
    auto event = map(line);
    ASSERT_TRUE(event.has_value()) << wire;
    EXPECT_EQ(event->type, type);
    EXPECT_EQ(models::to_wire_name(event->type), wire);
  }
}

TEST(EventMapperTest, IgnoresUnknownFields) {
  EventMapper<DeploymentV1> map;
  auto event = map(
      R"({"type":"MODIFIED","extra":1,"object":{"kind":"Deployment",)"
      R"("metadata":{"name":"web","managedFields":[{"x":1}]},)"
      R"("spec":{"replicas":2,"template":{"spec":{"containers":[]}}},)"
      R"("status":{"readyReplicas":1}}})");
  ASSERT_TRUE(event.has_value()) << event.error().describe();
  EXPECT_EQ(event->object.spec.replicas, 2);
  ASSERT_TRUE(event->object.status.has_value());
  EXPECT_EQ(event->object.status->ready_replicas, 1);
}

TEST(EventMapperTest, BlankLineIsProtocolError) {
  EventMapper<ConfigMapV1> map;
  auto event = map("   ");
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error().kind, KubeErrorKind::StreamProtocol);
}

TEST(EventMapperTest, MalformedJsonIsProtocolError) {
  EventMapper<ConfigMapV1> map;
  auto event = map(R"({"type":"ADDED","object":)");
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error().kind, KubeErrorKind::StreamProtocol);
  EXPECT_TRUE(event.error().message.starts_with(
      "Malformed watch event for ConfigMap (v1)"));
}

TEST(EventMapperTest, UnknownTypeIsProtocolError) {
  EventMapper<ConfigMapV1> map;
  auto event = map(R"({"type":"RENAMED","object":{}})");
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error().kind, KubeErrorKind::StreamProtocol);
  EXPECT_EQ(event.error().message, "Unknown watch event type 'RENAMED'");
}

TEST(EventMapperTest, ObjectOfWrongShapeIsProtocolError) {
  EventMapper<ConfigMapV1> map;
  auto event = map(R"({"type":"ADDED","object":{"data":["not","a","map"]}})");
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error().kind, KubeErrorKind::StreamProtocol);
}

TEST(EventMapperTest, ErrorEventBecomesClientError) {
  EventMapper<ConfigMapV1> map;
  auto line = std::format(
      R"({{"type":"ERROR","object":{}}})",
      test::status_json(410, "Expired", "too old resource version: 5 (90)"));
  auto event = map(line);
  ASSERT_FALSE(event.has_value());
  const auto &error = event.error();
  EXPECT_EQ(error.kind, KubeErrorKind::ClientError);
  EXPECT_EQ(error.http_status, http::HttpStatus::Gone);
  EXPECT_EQ(error.reason(), "Expired");
  EXPECT_EQ(error.message,
            "Failed to watch ConfigMap (v1) resources (HTTP status 410 Gone): "
            "too old resource version: 5 (90)");
}

TEST(EventMapperTest, ErrorEventWithoutCodeDefaultsTo500) {
  EventMapper<ConfigMapV1> map;
  auto event = map(
      R"({"type":"ERROR","object":{"kind":"Status","message":"boom"}})");
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error().http_status, http::HttpStatus::InternalServerError);
}

TEST(EventMapperTest, ErrorEventWithNonStatusObjectIsProtocolError) {
  EventMapper<ConfigMapV1> map;
  auto event = map(R"({"type":"ERROR","object":"oops"})");
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error().kind, KubeErrorKind::StreamProtocol);
}
