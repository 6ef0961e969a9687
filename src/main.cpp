#include "kubeclient/cli/commands.hpp"
#include "kubeclient/util/log.hpp"

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdlib>
#include <string>

namespace {

auto default_config() -> std::string {
  if (const char *env = std::getenv("KUBECLIENT_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_global_options(CLI::App *cmd, kubeclient::cli::GlobalOptions &opts,
                        const std::string &env_config) -> void {
  opts.config_file = env_config;
  cmd->add_option("-c,--config", opts.config_file, "Client config file (TOML)")
      ->check(CLI::ExistingFile);
  cmd->add_option("-s,--server", opts.endpoint,
                  "API server endpoint: http://host:port or unix:///path");
  cmd->add_option("-n,--namespace", opts.namespace_, "Namespace override");
  cmd->add_option("--log-level", opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
  cmd->add_flag("--json", opts.json, "Output JSON");
}

} // namespace

int main(int argc, char *argv[]) {
  std::signal(SIGPIPE, SIG_IGN);
  kubeclient::log::set_output_stderr();
  kubeclient::log::set_level(kubeclient::log::Level::Warn);

  CLI::App app{"kubeclient", "Typed client for Kubernetes-style resources"};
  app.require_subcommand(1);
  app.footer("\nKinds: configmap (cm), deployment (deploy)\n"
             "\nExamples:\n"
             "  kubeclient get cm app-settings -n staging\n"
             "  kubeclient list deploy -l app=web\n"
             "  kubeclient watch cm --bookmarks --max-events 10\n"
             "  kubeclient patch cm app-settings --merge "
             "'{\"data\":{\"mode\":\"fast\"}}'\n"
             "  kubeclient scale web 3\n"
             "\nTip: Set KUBECLIENT_CONFIG=client.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  kubeclient::cli::GetOptions get_opts;
  auto *get = app.add_subcommand("get", "Fetch one resource by name");
  add_global_options(get, get_opts.global, env_config);
  get->add_option("kind", get_opts.kind, "Resource kind")->required();
  get->add_option("name", get_opts.name, "Resource name")->required();
  get->callback(
      [&get_opts]() { std::exit(kubeclient::cli::cmd_get(get_opts)); });

  kubeclient::cli::ListResourcesOptions list_opts;
  auto *list = app.add_subcommand("list", "List resources in a namespace");
  add_global_options(list, list_opts.global, env_config);
  list->add_option("kind", list_opts.kind, "Resource kind")->required();
  list->add_option("-l,--selector", list_opts.label_selector,
                   "Label selector, e.g. app=web");
  list->add_option("--field-selector", list_opts.field_selector,
                   "Field selector, e.g. metadata.name=web");
  list->add_option("--limit", list_opts.limit, "Maximum items per page")
      ->check(CLI::PositiveNumber);
  list->callback(
      [&list_opts]() { std::exit(kubeclient::cli::cmd_list(list_opts)); });

  kubeclient::cli::WatchResourcesOptions watch_opts;
  auto *watch = app.add_subcommand(
      "watch", "Stream change events until interrupted (Ctrl-C)");
  add_global_options(watch, watch_opts.global, env_config);
  watch->add_option("kind", watch_opts.kind, "Resource kind")->required();
  watch->add_option("name", watch_opts.name, "Watch only this object");
  watch->add_option("-l,--selector", watch_opts.label_selector,
                    "Label selector");
  watch->add_option("--resource-version", watch_opts.resource_version,
                    "Start after this resource version");
  watch->add_option("--timeout", watch_opts.timeout_seconds,
                    "Server-side watch timeout in seconds")
      ->check(CLI::PositiveNumber);
  watch->add_option("--max-events", watch_opts.max_events,
                    "Stop after N events (0 = unlimited)");
  watch->add_flag("--bookmarks", watch_opts.bookmarks,
                  "Request BOOKMARK events");
  watch->callback(
      [&watch_opts]() { std::exit(kubeclient::cli::cmd_watch(watch_opts)); });

  kubeclient::cli::PatchResourceOptions patch_opts;
  auto *patch = app.add_subcommand("patch", "Patch a resource");
  add_global_options(patch, patch_opts.global, env_config);
  patch->add_option("kind", patch_opts.kind, "Resource kind")->required();
  patch->add_option("name", patch_opts.name, "Resource name")->required();
  patch->add_option("patch", patch_opts.patch,
                    "JSON patch array, or a JSON object with --merge")
      ->required();
  patch->add_flag("--merge", patch_opts.merge,
                  "Send a JSON merge patch instead of a JSON patch");
  patch->callback(
      [&patch_opts]() { std::exit(kubeclient::cli::cmd_patch(patch_opts)); });

  kubeclient::cli::ScaleOptions scale_opts;
  auto *scale = app.add_subcommand("scale", "Set a deployment's replicas");
  add_global_options(scale, scale_opts.global, env_config);
  scale->add_option("name", scale_opts.name, "Deployment name")->required();
  scale->add_option("replicas", scale_opts.replicas, "Desired replicas")
      ->required()
      ->check(CLI::NonNegativeNumber);
  scale->add_option("--resource-version", scale_opts.expected_resource_version,
                    "Fail unless the deployment is at this version");
  scale->callback(
      [&scale_opts]() { std::exit(kubeclient::cli::cmd_scale(scale_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
