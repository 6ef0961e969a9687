#pragma once

#include "kubeclient/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string_view>

namespace kubeclient::models {

enum class ResourceEventType : std::uint8_t {
  Added,
  Modified,
  Deleted,
  Bookmark
};
BOOST_DESCRIBE_ENUM(ResourceEventType, Added, Modified, Deleted, Bookmark)

/// Wire spelling used by watch streams.
[[nodiscard]] constexpr auto to_wire_name(ResourceEventType type) noexcept
    -> std::string_view {
  switch (type) {
  case ResourceEventType::Added:
    return "ADDED";
  case ResourceEventType::Modified:
    return "MODIFIED";
  case ResourceEventType::Deleted:
    return "DELETED";
  case ResourceEventType::Bookmark:
    return "BOOKMARK";
  }
  return "UNKNOWN";
}

/// One change observed on a watched collection.
template <typename T> struct ResourceEventV1 {
  ResourceEventType type{ResourceEventType::Added};
  T object;

  auto operator==(const ResourceEventV1 &) const -> bool = default;
};

} // namespace kubeclient::models
