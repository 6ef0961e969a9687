#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kubeclient::cli {

struct GlobalOptions {
  std::string config_file;
  std::string endpoint;
  std::string namespace_;
  std::string log_level;
  bool json{false};
};

struct GetOptions {
  GlobalOptions global;
  std::string kind;
  std::string name;
};

struct ListResourcesOptions {
  GlobalOptions global;
  std::string kind;
  std::string label_selector;
  std::string field_selector;
  std::optional<std::int64_t> limit;
};

struct WatchResourcesOptions {
  GlobalOptions global;
  std::string kind;
  std::string name;
  std::string label_selector;
  std::string resource_version;
  std::optional<std::int64_t> timeout_seconds;
  /// Stop after this many events; 0 means until interrupted.
  std::size_t max_events{0};
  bool bookmarks{false};
};

struct PatchResourceOptions {
  GlobalOptions global;
  std::string kind;
  std::string name;
  /// JSON patch array, or a merge patch object with `merge`.
  std::string patch;
  bool merge{false};
};

struct ScaleOptions {
  GlobalOptions global;
  std::string name;
  std::int32_t replicas{0};
  std::string expected_resource_version;
};

auto cmd_get(const GetOptions &opts) -> int;
auto cmd_list(const ListResourcesOptions &opts) -> int;
auto cmd_watch(const WatchResourcesOptions &opts) -> int;
auto cmd_patch(const PatchResourceOptions &opts) -> int;
auto cmd_scale(const ScaleOptions &opts) -> int;

} // namespace kubeclient::cli
