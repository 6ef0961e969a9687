#pragma once

#include <glaze/json.hpp>

#include "kubeclient/models/object_meta.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kubeclient::models {

struct StatusCauseV1 {
  std::string reason;
  std::string message;
  std::string field;

  auto operator==(const StatusCauseV1 &) const -> bool = default;
};

struct StatusDetailsV1 {
  std::string name;
  std::string group;
  std::string kind;
  std::string uid;
  std::vector<StatusCauseV1> causes;
  std::optional<std::int32_t> retry_after_seconds;

  auto operator==(const StatusDetailsV1 &) const -> bool = default;
};

/// Outcome document the API server returns for failures and for DELETE.
struct StatusV1 {
  std::string api_version{"v1"};
  std::string kind{"Status"};
  ListMetaV1 metadata;
  std::string status;
  std::string message;
  /// Machine-readable cause, e.g. "NotFound" or "AlreadyExists".
  std::string reason;
  std::optional<StatusDetailsV1> details;
  std::int32_t code{0};

  auto operator==(const StatusV1 &) const -> bool = default;
};

} // namespace kubeclient::models

namespace glz {

template <> struct meta<kubeclient::models::StatusCauseV1> {
  using T = kubeclient::models::StatusCauseV1;
  static constexpr auto value = object("reason", &T::reason, "message",
                                       &T::message, "field", &T::field);
};

template <> struct meta<kubeclient::models::StatusDetailsV1> {
  using T = kubeclient::models::StatusDetailsV1;
  static constexpr auto value =
      object("name", &T::name, "group", &T::group, "kind", &T::kind, "uid",
             &T::uid, "causes", &T::causes, "retryAfterSeconds",
             &T::retry_after_seconds);
};

template <> struct meta<kubeclient::models::StatusV1> {
  using T = kubeclient::models::StatusV1;
  static constexpr auto value =
      object("apiVersion", &T::api_version, "kind", &T::kind, "metadata",
             &T::metadata, "status", &T::status, "message", &T::message,
             "reason", &T::reason, "details", &T::details, "code", &T::code);
};

} // namespace glz
