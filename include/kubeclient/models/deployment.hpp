#pragma once

#include <glaze/json.hpp>

#include "kubeclient/models/object_meta.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kubeclient::models {

struct LabelSelectorV1 {
  std::map<std::string, std::string> match_labels;

  auto operator==(const LabelSelectorV1 &) const -> bool = default;
};

struct DeploymentSpecV1 {
  std::optional<std::int32_t> replicas;
  LabelSelectorV1 selector;
  /// Pod template, kept verbatim so a read-modify-replace does not lose it.
  std::optional<glz::raw_json> pod_template;
  std::optional<std::int32_t> min_ready_seconds;
  std::optional<bool> paused;

  auto operator==(const DeploymentSpecV1 &other) const -> bool {
    auto template_text =
        [](const DeploymentSpecV1 &spec) -> std::optional<std::string> {
      if (!spec.pod_template) {
        return std::nullopt;
      }
      return spec.pod_template->str;
    };
    return replicas == other.replicas && selector == other.selector &&
           template_text(*this) == template_text(other) &&
           min_ready_seconds == other.min_ready_seconds &&
           paused == other.paused;
  }
};

struct DeploymentConditionV1 {
  std::string type;
  std::string status;
  std::string reason;
  std::string message;
  std::string last_update_time;

  auto operator==(const DeploymentConditionV1 &) const -> bool = default;
};

struct DeploymentStatusV1 {
  std::optional<std::int64_t> observed_generation;
  std::int32_t replicas{0};
  std::int32_t updated_replicas{0};
  std::int32_t ready_replicas{0};
  std::int32_t available_replicas{0};
  std::int32_t unavailable_replicas{0};
  std::vector<DeploymentConditionV1> conditions;

  auto operator==(const DeploymentStatusV1 &) const -> bool = default;
};

struct DeploymentV1 {
  std::string api_version{"apps/v1"};
  std::string kind{"Deployment"};
  ObjectMetaV1 metadata;
  DeploymentSpecV1 spec;
  std::optional<DeploymentStatusV1> status;

  auto operator==(const DeploymentV1 &) const -> bool = default;
};

struct DeploymentListV1 {
  using item_type = DeploymentV1;

  std::string api_version{"apps/v1"};
  std::string kind{"DeploymentList"};
  ListMetaV1 metadata;
  std::vector<DeploymentV1> items;

  auto operator==(const DeploymentListV1 &) const -> bool = default;
};

} // namespace kubeclient::models

namespace glz {

template <> struct meta<kubeclient::models::LabelSelectorV1> {
  using T = kubeclient::models::LabelSelectorV1;
  static constexpr auto value = object("matchLabels", &T::match_labels);
};

template <> struct meta<kubeclient::models::DeploymentSpecV1> {
  using T = kubeclient::models::DeploymentSpecV1;
  static constexpr auto value =
      object("replicas", &T::replicas, "selector", &T::selector, "template",
             &T::pod_template, "minReadySeconds", &T::min_ready_seconds,
             "paused", &T::paused);
};

template <> struct meta<kubeclient::models::DeploymentConditionV1> {
  using T = kubeclient::models::DeploymentConditionV1;
  static constexpr auto value =
      object("type", &T::type, "status", &T::status, "reason", &T::reason,
             "message", &T::message, "lastUpdateTime", &T::last_update_time);
};

template <> struct meta<kubeclient::models::DeploymentStatusV1> {
  using T = kubeclient::models::DeploymentStatusV1;
  static constexpr auto value =
      object("observedGeneration", &T::observed_generation, "replicas",
             &T::replicas, "updatedReplicas", &T::updated_replicas,
             "readyReplicas", &T::ready_replicas, "availableReplicas",
             &T::available_replicas, "unavailableReplicas",
             &T::unavailable_replicas, "conditions", &T::conditions);
};

template <> struct meta<kubeclient::models::DeploymentV1> {
  using T = kubeclient::models::DeploymentV1;
  static constexpr auto value =
      object("apiVersion", &T::api_version, "kind", &T::kind, "metadata",
             &T::metadata, "spec", &T::spec, "status", &T::status);
};

template <> struct meta<kubeclient::models::DeploymentListV1> {
  using T = kubeclient::models::DeploymentListV1;
  static constexpr auto value =
      object("apiVersion", &T::api_version, "kind", &T::kind, "metadata",
             &T::metadata, "items", &T::items);
};

} // namespace glz
