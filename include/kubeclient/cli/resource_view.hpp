#pragma once

#include "kubeclient/cli/formatting.hpp"
#include "kubeclient/models/config_map.hpp"
#include "kubeclient/models/deployment.hpp"
#include "kubeclient/models/resource_event.hpp"
#include "kubeclient/util/json.hpp"

#include <format>
#include <print>
#include <string>
#include <vector>

namespace kubeclient::cli {

/// Table columns for one kind.
template <typename T> struct ResourceView;

template <> struct ResourceView<models::ConfigMapV1> {
  static auto headers() -> std::vector<std::string> {
    return {"NAMESPACE", "NAME", "DATA", "CREATED"};
  }

  static auto row(const models::ConfigMapV1 &cm) -> std::vector<std::string> {
    return {cm.metadata.namespace_, cm.metadata.name,
            std::to_string(cm.data.size() + cm.binary_data.size()),
            cm.metadata.creation_timestamp};
  }
};

template <> struct ResourceView<models::DeploymentV1> {
  static auto headers() -> std::vector<std::string> {
    return {"NAMESPACE", "NAME", "READY", "UP-TO-DATE", "AVAILABLE",
            "CREATED"};
  }

  static auto row(const models::DeploymentV1 &d) -> std::vector<std::string> {
    const auto desired = d.spec.replicas.value_or(1);
    const models::DeploymentStatusV1 status =
        d.status.value_or(models::DeploymentStatusV1{});
    return {d.metadata.namespace_,
            d.metadata.name,
            fmt::colorize_ready(status.ready_replicas, desired),
            std::to_string(status.updated_replicas),
            std::to_string(status.available_replicas),
            d.metadata.creation_timestamp};
  }
};

template <typename T> auto print_json(const T &value) -> bool {
  auto json = write_json(value);
  if (!json) {
    std::println(stderr, "Error: {}", json.error().message());
    return false;
  }
  std::println("{}", *json);
  return true;
}

template <typename T> auto print_table(const std::vector<T> &items) -> void {
  fmt::Table table(ResourceView<T>::headers());
  for (const auto &item : items) {
    table.add_row(ResourceView<T>::row(item));
  }
  table.print();
}

/// One watch event per line: a JSON object in `--json` mode, otherwise the
/// event type followed by the table row.
template <typename T>
auto print_event(const models::ResourceEventV1<T> &event, bool json) -> bool {
  if (json) {
    auto object = write_json(event.object);
    if (!object) {
      std::println(stderr, "Error: {}", object.error().message());
      return false;
    }
    std::println(R"({{"type":"{}","object":{}}})",
                 models::to_wire_name(event.type), *object);
    return true;
  }
  std::string row;
  for (const auto &cell : ResourceView<T>::row(event.object)) {
    if (!row.empty())
      row += "  ";
    row += cell;
  }
  std::println("{:<8} {}  {}", fmt::colorize_event_type(event.type), row,
               fmt::ansi::dim(std::format("rv={}",
                                          event.object.metadata
                                              .resource_version)));
  return true;
}

} // namespace kubeclient::cli
