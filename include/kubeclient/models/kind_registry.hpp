#pragma once

#include "kubeclient/models/kube_object.hpp"

#include <ankerl/unordered_dense.h>

#include <boost/core/demangle.hpp>

#include <functional>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace kubeclient::models {

struct KubeKind {
  std::string kind;
  std::string api_version;

  auto operator==(const KubeKind &) const -> bool = default;
};

/// Maps C++ model types to the kind and apiVersion they represent. Lookups
/// only feed error messages; nothing branches on them.
class KindRegistry {
public:
  template <KubeResource T>
  auto add(std::string kind, std::string api_version) -> KindRegistry & {
    kinds_.insert_or_assign(std::type_index(typeid(T)),
                            KubeKind{std::move(kind), std::move(api_version)});
    return *this;
  }

  /// Registers a list type under the kind of its `item_type`, which must have
  /// been added first.
  template <KubeResourceList TList> auto add_list() -> KindRegistry & {
    if (auto item = kind_of<typename TList::item_type>()) {
      list_items_.insert_or_assign(std::type_index(typeid(TList)),
                                   std::move(*item));
    }
    return *this;
  }

  template <typename T>
  [[nodiscard]] auto kind_of() const -> std::optional<KubeKind> {
    return find(kinds_, std::type_index(typeid(T)));
  }

  template <typename TList>
  [[nodiscard]] auto list_item_kind_of() const -> std::optional<KubeKind> {
    return find(list_items_, std::type_index(typeid(TList)));
  }

  /// "ConfigMap (v1)", or the C++ type name when `T` is unregistered.
  template <typename T>
  [[nodiscard]] auto describe() const -> std::string {
    return describe_or_type_name(kind_of<T>(), typeid(T));
  }

  template <typename TList>
  [[nodiscard]] auto describe_list_item() const -> std::string {
    return describe_or_type_name(list_item_kind_of<TList>(), typeid(TList));
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return kinds_.size();
  }

private:
  using Table = ankerl::unordered_dense::map<std::type_index, KubeKind,
                                             std::hash<std::type_index>>;

  [[nodiscard]] static auto find(const Table &table, std::type_index key)
      -> std::optional<KubeKind>;

  [[nodiscard]] static auto
  describe_or_type_name(const std::optional<KubeKind> &kind,
                        const std::type_info &type) -> std::string;

  Table kinds_;
  Table list_items_;
};

/// Adds every model shipped with the library.
auto register_builtin_kinds(KindRegistry &registry) -> void;

/// Process-wide registry with the built-in kinds, filled on first use.
[[nodiscard]] auto default_kind_registry() -> const KindRegistry &;

} // namespace kubeclient::models
