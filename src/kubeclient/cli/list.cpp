#include "kubeclient/cli/commands.hpp"
#include "kubeclient/cli/resource_view.hpp"
#include "kubeclient/cli/session.hpp"
#include "kubeclient/resource/resource_client.hpp"

#include <print>

namespace kubeclient::cli {

auto cmd_list(const ListResourcesOptions &opts) -> int {
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

  const ListOptions list_opts{.label_selector = opts.label_selector,
                              .field_selector = opts.field_selector,
                              .limit = opts.limit};

  return with_resources(*kind, session.client(), [&](auto resources) -> int {
    auto result = session.run(resources.list({}, list_opts));
    if (!result) {
      print_error(result.error());
      return 1;
    }
    if (opts.global.json) {
      return print_json(*result) ? 0 : 1;
    }
    if (result->items.empty()) {
      std::println("No resources found in namespace '{}'.",
                   resources.resolve_namespace({}));
      return 0;
    }
    print_table(result->items);
    if (!result->metadata.continue_.empty()) {
      std::println("\n{}",
                   fmt::ansi::dim(std::format(
                       "More results available (continue token: {})",
                       result->metadata.continue_)));
    }
    return 0;
  });
}

} // namespace kubeclient::cli
