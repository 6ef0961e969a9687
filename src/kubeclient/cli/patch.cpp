#include "kubeclient/cli/commands.hpp"
#include "kubeclient/cli/resource_view.hpp"
#include "kubeclient/cli/session.hpp"
#include "kubeclient/resource/patch_document.hpp"
#include "kubeclient/util/enum.hpp"
#include "kubeclient/util/json.hpp"

#include <glaze/json.hpp>

#include <optional>
#include <print>
#include <string>
#include <vector>

namespace kubeclient::cli::detail {

struct PatchOperationInput {
  std::string op;
  std::string path;
  std::optional<std::string> from;
  std::optional<glz::raw_json> value;
};

} // namespace kubeclient::cli::detail

namespace glz {
template <> struct meta<kubeclient::cli::detail::PatchOperationInput> {
  using T = kubeclient::cli::detail::PatchOperationInput;
  static constexpr auto value = object("op", &T::op, "path", &T::path, "from",
                                       &T::from, "value", &T::value);
};
} // namespace glz

namespace kubeclient::cli {
namespace {

// Replays a JSON patch array given on the command line into a document so
// operation names and values are checked before anything is sent.
auto build_patch(std::string_view text) -> Result<PatchDocument> {
  std::string diagnostic;
  auto parsed =
      read_json<std::vector<detail::PatchOperationInput>>(text, &diagnostic);
  if (!parsed) {
    std::println(stderr, "Error: invalid JSON patch: {}", diagnostic);
    return fail(parsed.error());
  }

  PatchDocument document;
  for (auto &input : *parsed) {
    auto op = util::try_parse_enum<PatchOp>(input.op);
    if (!op) {
      std::println(stderr, "Error: unknown patch operation '{}'", input.op);
      return fail(Error::InvalidArgument);
    }
    const bool needs_value =
        *op == PatchOp::Add || *op == PatchOp::Replace || *op == PatchOp::Test;
    const bool needs_from = *op == PatchOp::Move || *op == PatchOp::Copy;
    if ((needs_value && !input.value) || (needs_from && !input.from)) {
      std::println(stderr, "Error: '{}' at '{}' is missing '{}'", input.op,
                   input.path, needs_value ? "value" : "from");
      return fail(Error::InvalidArgument);
    }

    switch (*op) {
    case PatchOp::Add:
      document.add_json(std::move(input.path), std::move(input.value->str));
      break;
    case PatchOp::Replace:
      document.replace_json(std::move(input.path),
                            std::move(input.value->str));
      break;
    case PatchOp::Test:
      document.test_json(std::move(input.path), std::move(input.value->str));
      break;
    case PatchOp::Remove:
      document.remove(std::move(input.path));
      break;
    case PatchOp::Move:
      document.move(std::move(*input.from), std::move(input.path));
      break;
    case PatchOp::Copy:
      document.copy(std::move(*input.from), std::move(input.path));
      break;
    }
  }
  if (document.empty()) {
    std::println(stderr, "Error: patch contains no operations");
    return fail(Error::InvalidArgument);
  }
  return ok(std::move(document));
}

template <typename T>
auto report(const KubeResult<T> &result, bool json) -> int {
  if (!result) {
    print_error(result.error());
    return 1;
  }
  if (json) {
    return print_json(*result) ? 0 : 1;
  }
  print_table(std::vector<T>{*result});
  return 0;
}

} // namespace

auto cmd_patch(const PatchResourceOptions &opts) -> int {
  auto kind = parse_kind(opts.kind);
  if (!kind) {
    std::println(stderr, "Error: unknown resource kind '{}'", opts.kind);
    return 1;
  }

  std::optional<PatchDocument> document;
  if (!opts.merge) {
    auto built = build_patch(opts.patch);
    if (!built) {
      return 1;
    }
    document = std::move(*built);
  } else if (auto object = parse_json(opts.patch);
             !object || !object->is_object()) {
    std::println(stderr, "Error: merge patch must be a JSON object");
    return 1;
  }

  auto session_res = Session::open(opts.global);
  if (!session_res) {
    std::println(stderr, "Error: {}", session_res.error().message());
    return 1;
  }
  auto &session = **session_res;

  return with_resources(*kind, session.client(), [&](auto resources) -> int {
    if (opts.merge) {
      return report(session.run(resources.merge_patch(opts.name, opts.patch)),
                    opts.global.json);
    }
    return report(
        session.run(resources.patch_raw(
            opts.name, [&document](PatchDocument &doc) { doc = *document; })),
        opts.global.json);
  });
}

auto cmd_scale(const ScaleOptions &opts) -> int {
  if (opts.replicas < 0) {
    std::println(stderr, "Error: replicas must not be negative");
    return 1;
  }
  auto session_res = Session::open(opts.global);
  if (!session_res) {
    std::println(stderr, "Error: {}", session_res.error().message());
    return 1;
  }
  auto &session = **session_res;

  auto result = session.run(session.client().deployments().patch(
      opts.name, [&opts](TypedPatchDocument<models::DeploymentV1> &patch) {
        if (!opts.expected_resource_version.empty()) {
          patch.require_resource_version(opts.expected_resource_version);
        }
        patch.set_replicas(opts.replicas);
      }));
  if (!result) {
    print_error(result.error());
    return 1;
  }
  if (opts.global.json) {
    return print_json(*result) ? 0 : 1;
  }
  std::println("deployment '{}' scaled to {} (resourceVersion {})",
               result->metadata.name, opts.replicas,
               result->metadata.resource_version);
  return 0;
}

} // namespace kubeclient::cli
