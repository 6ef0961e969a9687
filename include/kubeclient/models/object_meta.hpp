#pragma once

#include <glaze/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace kubeclient::models {

struct ObjectMetaV1 {
  std::string name;
  std::string namespace_;
  std::string uid;
  std::string resource_version;
  std::optional<std::int64_t> generation;
  std::map<std::string, std::string> labels;
  std::map<std::string, std::string> annotations;
  std::string creation_timestamp;

  auto operator==(const ObjectMetaV1 &) const -> bool = default;
};

struct ListMetaV1 {
  std::string resource_version;
  std::string continue_;
  std::optional<std::int64_t> remaining_item_count;

  auto operator==(const ListMetaV1 &) const -> bool = default;
};

} // namespace kubeclient::models

namespace glz {

template <> struct meta<kubeclient::models::ObjectMetaV1> {
  using T = kubeclient::models::ObjectMetaV1;
  static constexpr auto value =
      object("name", &T::name, "namespace", &T::namespace_, "uid", &T::uid,
             "resourceVersion", &T::resource_version, "generation",
             &T::generation, "labels", &T::labels, "annotations",
             &T::annotations, "creationTimestamp", &T::creation_timestamp);
};

template <> struct meta<kubeclient::models::ListMetaV1> {
  using T = kubeclient::models::ListMetaV1;
  static constexpr auto value =
      object("resourceVersion", &T::resource_version, "continue",
             &T::continue_, "remainingItemCount", &T::remaining_item_count);
};

} // namespace glz
