#include "kubeclient/cli/commands.hpp"
#include "kubeclient/cli/resource_view.hpp"
#include "kubeclient/cli/session.hpp"
#include "kubeclient/resource/resource_client.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>

#include <csignal>
#include <print>

namespace kubeclient::cli {
namespace {

// SIGINT and SIGTERM cancel the subscription, which ends the loop normally.
template <typename Client>
auto stream_events(Client resources, const WatchResourcesOptions &opts,
                   ListOptions list_opts) -> task<KubeResult<std::size_t>> {
  auto opening = opts.name.empty()
                     ? resources.watch({}, list_opts)
                     : resources.watch_one(opts.name, {}, list_opts);
  auto subscription = co_await std::move(opening);
  if (!subscription) {
    co_return std::unexpected(std::move(subscription.error()));
  }
  auto &events = *subscription;

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::signal_set signals(executor, SIGINT, SIGTERM);
  signals.async_wait([&events](const boost::system::error_code &ec, int sig) {
    if (!ec) {
      log::info("Received signal {}, stopping watch", sig);
      events.cancel();
    }
  });

  std::size_t count = 0;
  while (true) {
    auto message = co_await events.next();
    if (!message) {
      signals.cancel();
      co_return std::unexpected(std::move(message.error()));
    }
    if (!message->has_value()) {
      break;
    }
    if (!print_event(**message, opts.global.json)) {
      events.cancel();
      break;
    }
    ++count;
    if (opts.max_events != 0 && count >= opts.max_events) {
      events.cancel();
      break;
    }
  }
  signals.cancel();
  co_return count;
}

} // namespace

auto cmd_watch(const WatchResourcesOptions &opts) -> int {
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
                              .resource_version = opts.resource_version,
                              .timeout_seconds = opts.timeout_seconds,
                              .allow_bookmarks = opts.bookmarks};

  return with_resources(*kind, session.client(), [&](auto resources) -> int {
    auto result =
        session.run(stream_events(std::move(resources), opts, list_opts));
    if (!result) {
      print_error(result.error());
      return 1;
    }
    if (!opts.global.json) {
      std::println(stderr, "{}",
                   fmt::ansi::dim(std::format("{} events", *result)));
    }
    return 0;
  });
}

} // namespace kubeclient::cli
