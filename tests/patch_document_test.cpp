#include "kubeclient/models/config_map.hpp"
#include "kubeclient/models/deployment.hpp"
#include "kubeclient/resource/patch_document.hpp"

#include "gtest/gtest.h"

#include <map>
#include <string>

using namespace kubeclient;

TEST(PatchDocumentTest, EscapesPointerTokens) {
  EXPECT_EQ(escape_pointer_token("app.kubernetes.io/name"),
            "app.kubernetes.io~1name");
  EXPECT_EQ(escape_pointer_token("a~b"), "a~0b");
  EXPECT_EQ(json_pointer({"metadata", "labels", "team/owner"}),
            "/metadata/labels/team~1owner");
}

TEST(PatchDocumentTest, EmptyDocumentSerializesToEmptyArray) {
  PatchDocument doc;
  EXPECT_TRUE(doc.empty());
  auto body = doc.serialize();
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, "[]");
}

TEST(PatchDocumentTest, SerializesOperationsInOrder) {
  PatchDocument doc;
  doc.add("/data/mode", std::string("fast"))
      .replace("/spec/replicas", 3)
      .remove("/data/old")
      .move("/data/a", "/data/b")
      .copy("/data/b", "/data/c")
      .test("/metadata/resourceVersion", std::string("42"));
  ASSERT_EQ(doc.size(), 6U);

  auto body = doc.serialize();
  ASSERT_TRUE(body.has_value()) << body.error().message();
  EXPECT_EQ(*body,
            R"([{"op":"add","path":"/data/mode","value":"fast"},)"
            R"({"op":"replace","path":"/spec/replicas","value":3},)"
            R"({"op":"remove","path":"/data/old"},)"
            R"({"op":"move","path":"/data/b","from":"/data/a"},)"
            R"({"op":"copy","path":"/data/c","from":"/data/b"},)"
            R"({"op":"test","path":"/metadata/resourceVersion","value":"42"}])");
}

TEST(PatchDocumentTest, StructuredValuesAreEmbeddedAsJson) {
  PatchDocument doc;
  std::map<std::string, std::string> data{{"k", "v"}};
  doc.add("/data", data);
  auto body = doc.serialize();
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, R"([{"op":"add","path":"/data","value":{"k":"v"}}])");
}

TEST(PatchDocumentTest, RawJsonValuesAreKeptVerbatim) {
  PatchDocument doc;
  doc.add_json("/data", R"({"a":"1"})").test_json("/spec/paused", "false");
  auto body = doc.serialize();
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, R"([{"op":"add","path":"/data","value":{"a":"1"}},)"
                   R"({"op":"test","path":"/spec/paused","value":false}])");
}

TEST(PatchDocumentTest, InvalidRawJsonPoisonsTheDocument) {
  PatchDocument doc;
  doc.replace_json("/data", "{not json").remove("/data/x");
  EXPECT_EQ(doc.size(), 1U);
  auto body = doc.serialize();
  ASSERT_FALSE(body.has_value());
  EXPECT_EQ(body.error(), make_error_code(Error::InvalidArgument));
}

TEST(PatchDocumentTest, TypedHelpersTargetMetadata) {
  PatchDocument doc;
  TypedPatchDocument<models::ConfigMapV1> typed(doc);
  typed.require_resource_version("7")
      .set_label("app.kubernetes.io/name", "web")
      .set_annotation("note", "hi")
      .remove_label("stale");

  const auto &ops = doc.operations();
  ASSERT_EQ(ops.size(), 4U);
  EXPECT_EQ(ops[0].op, PatchOp::Test);
  EXPECT_EQ(ops[0].path, "/metadata/resourceVersion");
  EXPECT_EQ(ops[0].value_json, std::optional<std::string>(R"("7")"));
  EXPECT_EQ(ops[1].op, PatchOp::Add);
  EXPECT_EQ(ops[1].path, "/metadata/labels/app.kubernetes.io~1name");
  EXPECT_EQ(ops[2].path, "/metadata/annotations/note");
  EXPECT_EQ(ops[3].op, PatchOp::Remove);
  EXPECT_EQ(ops[3].path, "/metadata/labels/stale");
}

TEST(PatchDocumentTest, SetReplicasOnDeployment) {
  PatchDocument doc;
  TypedPatchDocument<models::DeploymentV1> typed(doc);
  typed.set_replicas(5);
  auto body = doc.serialize();
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, R"([{"op":"replace","path":"/spec/replicas","value":5}])");
}

TEST(PatchDocumentTest, OperationNamesRoundTripThroughEnumSerde) {
  EXPECT_EQ(to_string_view(PatchOp::Replace), "replace");
  EXPECT_EQ(parse<PatchOp>("copy"), PatchOp::Copy);
}
