#pragma once

#include <glaze/json.hpp>

#include "kubeclient/models/object_meta.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kubeclient::models {

struct ConfigMapV1 {
  std::string api_version{"v1"};
  std::string kind{"ConfigMap"};
  ObjectMetaV1 metadata;
  std::map<std::string, std::string> data;
  std::map<std::string, std::string> binary_data;
  std::optional<bool> immutable;

  auto operator==(const ConfigMapV1 &) const -> bool = default;
};

struct ConfigMapListV1 {
  using item_type = ConfigMapV1;

  std::string api_version{"v1"};
  std::string kind{"ConfigMapList"};
  ListMetaV1 metadata;
  std::vector<ConfigMapV1> items;

  auto operator==(const ConfigMapListV1 &) const -> bool = default;
};

} // namespace kubeclient::models

namespace glz {

template <> struct meta<kubeclient::models::ConfigMapV1> {
  using T = kubeclient::models::ConfigMapV1;
  static constexpr auto value =
      object("apiVersion", &T::api_version, "kind", &T::kind, "metadata",
             &T::metadata, "data", &T::data, "binaryData", &T::binary_data,
             "immutable", &T::immutable);
};

template <> struct meta<kubeclient::models::ConfigMapListV1> {
  using T = kubeclient::models::ConfigMapListV1;
  static constexpr auto value =
      object("apiVersion", &T::api_version, "kind", &T::kind, "metadata",
             &T::metadata, "items", &T::items);
};

} // namespace glz
