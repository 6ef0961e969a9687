#pragma once

#include "kubeclient/models/kind_registry.hpp"
#include "kubeclient/models/kube_object.hpp"
#include "kubeclient/models/resource_event.hpp"
#include "kubeclient/models/status.hpp"
#include "kubeclient/resource/kube_error.hpp"
#include "kubeclient/util/enum.hpp"
#include "kubeclient/util/json.hpp"

#include <glaze/json.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <format>
#include <string>
#include <string_view>

namespace kubeclient {

namespace detail {

struct WatchEventJson {
  std::string type;
  glz::raw_json object;
};

} // namespace detail

} // namespace kubeclient

namespace glz {

template <> struct meta<kubeclient::detail::WatchEventJson> {
  using T = kubeclient::detail::WatchEventJson;
  static constexpr auto value = object("type", &T::type, "object", &T::object);
};

} // namespace glz

namespace kubeclient {

/// Turns one watch line into a typed event.
///
/// Every line must be a complete `{"type": ..., "object": ...}` document.
/// `ERROR` events carry a Status and come back as a ClientError; anything
/// that does not parse is a StreamProtocol error.
template <models::KubeResource T> class EventMapper {
public:
  using event_type = models::ResourceEventV1<T>;

  explicit EventMapper(
      const models::KindRegistry &registry = models::default_kind_registry())
      : registry_(&registry) {}

  [[nodiscard]] auto operator()(std::string_view line) const
      -> KubeResult<event_type> {
    if (boost::algorithm::trim_copy(std::string(line)).empty()) {
      return std::unexpected(KubeError::stream_protocol(
          "Received a blank line on a watch stream",
          make_error_code(Error::ParseError)));
    }

    std::string diagnostic;
    auto raw = read_json<detail::WatchEventJson>(line, &diagnostic);
    if (!raw) {
      return std::unexpected(KubeError::stream_protocol(
          std::format("Malformed watch event for {}: {}",
                      registry_->describe<T>(), diagnostic),
          raw.error()));
    }

    if (boost::algorithm::iequals(raw->type, "ERROR")) {
      return std::unexpected(error_event(raw->object.str));
    }

    auto type = util::try_parse_enum<models::ResourceEventType>(raw->type);
    if (!type) {
      return std::unexpected(KubeError::stream_protocol(
          std::format("Unknown watch event type '{}'", raw->type),
          make_error_code(Error::ParseError)));
    }

    auto object = read_json<T>(raw->object.str, &diagnostic);
    if (!object) {
      return std::unexpected(KubeError::stream_protocol(
          std::format("Watch event object is not a valid {}: {}",
                      registry_->describe<T>(), diagnostic),
          object.error()));
    }
    return event_type{.type = *type, .object = std::move(*object)};
  }

private:
  [[nodiscard]] auto error_event(std::string_view object_json) const
      -> KubeError {
    auto status = read_json<models::StatusV1>(object_json);
    if (!status) {
      return KubeError::stream_protocol(
          "Watch ERROR event does not carry a Status", status.error());
    }
    const auto http_status = status->code != 0
                                 ? static_cast<http::HttpStatus>(status->code)
                                 : http::HttpStatus::InternalServerError;
    return map_failure(
        http_status, std::move(*status),
        std::format("watch {} resources", registry_->describe<T>()));
  }

  const models::KindRegistry *registry_;
};

} // namespace kubeclient
