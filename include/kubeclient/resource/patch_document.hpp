#pragma once

#include "kubeclient/core/error.hpp"
#include "kubeclient/models/kube_object.hpp"
#include "kubeclient/util/enum.hpp"
#include "kubeclient/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kubeclient {

enum class PatchOp : std::uint8_t { Add, Remove, Replace, Move, Copy, Test };
BOOST_DESCRIBE_ENUM(PatchOp, Add, Remove, Replace, Move, Copy, Test)
KUBECLIENT_DEFINE_ENUM_SERDE(PatchOp, PatchOp::Add)

/// One RFC 6902 operation. `value_json` holds already-serialized JSON.
struct PatchOperation {
  PatchOp op{PatchOp::Add};
  std::string path;
  std::optional<std::string> from;
  std::optional<std::string> value_json;

  auto operator==(const PatchOperation &) const -> bool = default;
};

/// Escapes one reference token: "~" becomes "~0" and "/" becomes "~1".
[[nodiscard]] auto escape_pointer_token(std::string_view token) -> std::string;

/// Joins tokens into a JSON pointer, e.g. {"metadata", "labels", "a/b"} gives
/// "/metadata/labels/a~1b".
[[nodiscard]] auto json_pointer(std::initializer_list<std::string_view> tokens)
    -> std::string;

/// Untyped JSON-Patch operation list.
///
/// The first value that fails to serialize (or raw JSON text that does not
/// parse) is remembered and reported by serialize().
class PatchDocument {
public:
  template <typename V>
  auto add(std::string path, const V &value) -> PatchDocument & {
    return push_value(PatchOp::Add, std::move(path), write_json(value));
  }

  template <typename V>
  auto replace(std::string path, const V &value) -> PatchDocument & {
    return push_value(PatchOp::Replace, std::move(path), write_json(value));
  }

  template <typename V>
  auto test(std::string path, const V &value) -> PatchDocument & {
    return push_value(PatchOp::Test, std::move(path), write_json(value));
  }

  auto add_json(std::string path, std::string value_json) -> PatchDocument &;
  auto replace_json(std::string path, std::string value_json)
      -> PatchDocument &;
  auto test_json(std::string path, std::string value_json) -> PatchDocument &;
  auto remove(std::string path) -> PatchDocument &;
  auto move(std::string from, std::string path) -> PatchDocument &;
  auto copy(std::string from, std::string path) -> PatchDocument &;

  [[nodiscard]] auto operations() const noexcept
      -> const std::vector<PatchOperation> & {
    return operations_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return operations_.empty();
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return operations_.size();
  }

  /// JSON array body for `application/json-patch+json`.
  [[nodiscard]] auto serialize() const -> Result<std::string>;

private:
  auto push_value(PatchOp op, std::string path, Result<std::string> value)
      -> PatchDocument &;
  auto push_raw(PatchOp op, std::string path, std::string value_json)
      -> PatchDocument &;

  std::vector<PatchOperation> operations_;
  std::error_code error_;
};

/// JSON-Patch builder bound to resource type `T`, with helpers for the
/// fields every resource shares. Operations land in the wrapped document.
template <models::KubeResource T> class TypedPatchDocument {
public:
  using resource_type = T;

  explicit TypedPatchDocument(PatchDocument &document) : document_(document) {}

  /// Requires the object to already have a labels map.
  auto set_label(std::string_view key, std::string_view value)
      -> TypedPatchDocument & {
    document_.add(json_pointer({"metadata", "labels", key}),
                  std::string(value));
    return *this;
  }

  auto remove_label(std::string_view key) -> TypedPatchDocument & {
    document_.remove(json_pointer({"metadata", "labels", key}));
    return *this;
  }

  /// Requires the object to already have an annotations map.
  auto set_annotation(std::string_view key, std::string_view value)
      -> TypedPatchDocument & {
    document_.add(json_pointer({"metadata", "annotations", key}),
                  std::string(value));
    return *this;
  }

  auto remove_annotation(std::string_view key) -> TypedPatchDocument & {
    document_.remove(json_pointer({"metadata", "annotations", key}));
    return *this;
  }

  /// Makes the patch fail with 422 unless the object is still at `version`.
  auto require_resource_version(std::string_view version)
      -> TypedPatchDocument & {
    document_.test(json_pointer({"metadata", "resourceVersion"}),
                   std::string(version));
    return *this;
  }

  auto set_replicas(std::int32_t replicas) -> TypedPatchDocument &
    requires requires(T t) { t.spec.replicas; }
  {
    document_.replace(json_pointer({"spec", "replicas"}), replicas);
    return *this;
  }

  template <typename V>
  auto add(std::string path, const V &value) -> TypedPatchDocument & {
    document_.add(std::move(path), value);
    return *this;
  }

  template <typename V>
  auto replace(std::string path, const V &value) -> TypedPatchDocument & {
    document_.replace(std::move(path), value);
    return *this;
  }

  auto remove(std::string path) -> TypedPatchDocument & {
    document_.remove(std::move(path));
    return *this;
  }

  [[nodiscard]] auto document() noexcept -> PatchDocument & {
    return document_;
  }

private:
  PatchDocument &document_;
};

} // namespace kubeclient
