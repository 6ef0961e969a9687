#include "kubeclient/models/kind_registry.hpp"

#include "kubeclient/models/config_map.hpp"
#include "kubeclient/models/deployment.hpp"

#include <format>

namespace kubeclient::models {

auto KindRegistry::find(const Table &table, std::type_index key)
    -> std::optional<KubeKind> {
  auto it = table.find(key);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto KindRegistry::describe_or_type_name(const std::optional<KubeKind> &kind,
                                         const std::type_info &type)
    -> std::string {
  if (kind) {
    return std::format("{} ({})", kind->kind, kind->api_version);
  }
  return boost::core::demangle(type.name());
}

auto register_builtin_kinds(KindRegistry &registry) -> void {
  registry.add<ConfigMapV1>("ConfigMap", "v1")
      .add<DeploymentV1>("Deployment", "apps/v1")
      .add_list<ConfigMapListV1>()
      .add_list<DeploymentListV1>();
}

auto default_kind_registry() -> const KindRegistry & {
  static const KindRegistry instance = [] {
    KindRegistry registry;
    register_builtin_kinds(registry);
    return registry;
  }();
  return instance;
}

} // namespace kubeclient::models
