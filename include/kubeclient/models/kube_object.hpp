#pragma once

#include "kubeclient/models/object_meta.hpp"

#include <concepts>
#include <string>
#include <vector>

namespace kubeclient::models {

template <typename T>
concept KubeResource = std::default_initializable<T> && requires(const T &t) {
  { t.api_version } -> std::convertible_to<std::string>;
  { t.kind } -> std::convertible_to<std::string>;
  { t.metadata } -> std::convertible_to<const ObjectMetaV1 &>;
};

template <typename T>
concept KubeResourceList =
    std::default_initializable<T> && KubeResource<typename T::item_type> &&
    requires(const T &t) {
      { t.metadata } -> std::convertible_to<const ListMetaV1 &>;
      {
        t.items
      } -> std::convertible_to<const std::vector<typename T::item_type> &>;
    };

} // namespace kubeclient::models
