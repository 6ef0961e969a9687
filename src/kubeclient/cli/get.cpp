#include "kubeclient/cli/commands.hpp"
#include "kubeclient/cli/resource_view.hpp"
#include "kubeclient/cli/session.hpp"
#include "kubeclient/models/kind_registry.hpp"

#include <print>
#include <vector>

namespace kubeclient::cli {

auto cmd_get(const GetOptions &opts) -> int {
  auto kind = parse_kind(opts.kind);
  if (!kind) {
    std::println(stderr, "Error: unknown resource kind '{}'", opts.kind);
    return 1;
  }
  auto session_res = Session::open(opts.global);
  if (!session_res) {
    std::println(stderr, "Error: {}", session_res.error().message());
    return 1;
  }
  auto &session = **session_res;

  return with_resources(*kind, session.client(), [&](auto resources) -> int {
    using T = typename decltype(resources)::resource_type;
    auto result = session.run(resources.get(opts.name));
    if (!result) {
      print_error(result.error());
      return 1;
    }
    if (!*result) {
      std::println(stderr, "Error: {} '{}' not found in namespace '{}'",
                   models::default_kind_registry().describe<T>(), opts.name,
                   resources.resolve_namespace({}));
      return 1;
    }
    if (opts.global.json) {
      return print_json(**result) ? 0 : 1;
    }
    print_table(std::vector<T>{std::move(**result)});
    return 0;
  });
}

} // namespace kubeclient::cli
