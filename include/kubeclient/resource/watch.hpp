#pragma once

#include "kubeclient/client/http/response_stream.hpp"
#include "kubeclient/core/asio_awaitable.hpp"
#include "kubeclient/core/coroutine.hpp"
#include "kubeclient/resource/kube_error.hpp"
#include "kubeclient/text/line_decoder.hpp"
#include "kubeclient/util/log.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kubeclient {

struct WatchOptions {
  /// Bytes requested from the response per read. Zero ends the watch with
  /// `Error::InvalidArgument`.
  std::size_t buffer_size{2048};
  /// Items the producer may run ahead of the consumer.
  std::size_t channel_capacity{64};
};

/// Consumer end of a streamed watch.
///
/// A producer coroutine reads the response, splits it into lines and maps
/// each line to an `Item`, pushing results through a bounded channel.
/// `next()` yields items in wire order, then `std::nullopt` once the stream
/// is over. A failure is yielded once as an error and ends the sequence.
///
/// `cancel()` stops the producer and ends the sequence as a normal
/// completion. Destroying the subscription also stops the producer, which
/// then delivers nothing more. Producer and consumer must share one
/// single-threaded executor.
template <typename Item> class WatchSubscription {
public:
  using value_type = Item;
  using Message = KubeResult<std::optional<Item>>;
  using Channel = boost::asio::experimental::channel<void(
      boost::system::error_code, Message)>;

  struct State {
    State(boost::asio::any_io_executor executor, std::size_t capacity)
        : channel(std::move(executor), capacity) {}

    Channel channel;
    boost::asio::cancellation_signal cancel;
    bool cancel_requested{false};
    bool detached{false};
  };

  explicit WatchSubscription(std::shared_ptr<State> state)
      : state_(std::move(state)) {}

  ~WatchSubscription() {
    if (state_) {
      state_->detached = true;
      stop();
    }
  }

  WatchSubscription(const WatchSubscription &) = delete;
  auto operator=(const WatchSubscription &) -> WatchSubscription & = delete;

  WatchSubscription(WatchSubscription &&other) noexcept
      : state_(std::move(other.state_)), finished_(other.finished_) {}

  auto operator=(WatchSubscription &&other) noexcept -> WatchSubscription & {
    if (this != &other) {
      if (state_) {
        state_->detached = true;
        stop();
      }
      state_ = std::move(other.state_);
      finished_ = other.finished_;
    }
    return *this;
  }

  /// Next item, `std::nullopt` at the end, or the error that ended the
  /// stream. Calls after the end keep returning `std::nullopt`.
  auto next() -> task<Message> {
    if (!state_ || finished_) {
      co_return Message{std::nullopt};
    }
    auto [ec, message] = co_await state_->channel.async_receive(use_nothrow);
    if (ec) {
      // Only cancel() closes the channel.
      finished_ = true;
      co_return Message{std::nullopt};
    }
    if (!message || !message->has_value()) {
      finished_ = true;
    }
    co_return std::move(message);
  }

  /// Stops the watch. A pending or later `next()` reports completion.
  auto cancel() -> void {
    if (state_) {
      stop();
    }
  }

  [[nodiscard]] auto finished() const noexcept -> bool { return finished_; }

private:
  auto stop() -> void {
    if (state_->cancel_requested) {
      return;
    }
    state_->cancel_requested = true;
    state_->cancel.emit(boost::asio::cancellation_type::terminal);
    state_->channel.close();
  }

  std::shared_ptr<State> state_;
  bool finished_{false};
};

namespace detail {

template <typename Item>
auto deliver(typename WatchSubscription<Item>::State &state,
             typename WatchSubscription<Item>::Message message) -> task<bool> {
  if (state.cancel_requested) {
    co_return false;
  }
  auto [ec] = co_await state.channel.async_send(boost::system::error_code{},
                                                std::move(message),
                                                use_nothrow);
  co_return !ec;
}

struct ForwardOutcome {
  bool keep_reading{true};
  std::optional<KubeError> error;
};

template <typename Item, typename Mapper>
auto forward_lines(typename WatchSubscription<Item>::State &state,
                   std::vector<std::string> lines, Mapper &map)
    -> task<ForwardOutcome> {
  using Message = typename WatchSubscription<Item>::Message;
  for (auto &line : lines) {
    auto item = map(line);
    if (!item) {
      co_return ForwardOutcome{.keep_reading = false,
                               .error = std::move(item.error())};
    }
    if (!co_await deliver<Item>(
            state, Message{std::optional<Item>{std::move(*item)}})) {
      co_return ForwardOutcome{.keep_reading = false, .error = std::nullopt};
    }
  }
  co_return ForwardOutcome{};
}

/// Reads `stream` to its end. Returns the error that stopped it, or nullopt
/// for a clean end (including a requested cancel).
template <typename Item, typename Mapper>
auto pump_stream(typename WatchSubscription<Item>::State &state,
                 http::ResponseStream &stream, text::LineDecoder &decoder,
                 Mapper &map, std::size_t buffer_size)
    -> task<std::optional<KubeError>> {
  if (buffer_size == 0) {
    co_return KubeError::transport(make_error_code(Error::InvalidArgument),
                                   "Watch read");
  }
  std::vector<std::uint8_t> buffer(buffer_size);
  while (!state.cancel_requested) {
    auto n = co_await stream.read_some(std::span(buffer));
    if (!n) {
      if (state.cancel_requested) {
        co_return std::nullopt;
      }
      if (n.error() == Error::Cancelled) {
        co_return KubeError::aborted("Watch read");
      }
      co_return KubeError::transport(n.error(), "Watch read");
    }
    if (*n == 0) {
      break;
    }
    auto outcome = co_await forward_lines<Item>(
        state,
        decoder.decode(std::span<const std::uint8_t>(buffer.data(), *n)),
        map);
    if (!outcome.keep_reading) {
      co_return std::move(outcome.error);
    }
  }
  if (state.cancel_requested) {
    co_return std::nullopt;
  }

  // A last line without a terminator.
  std::vector<std::string> tail;
  if (auto last = decoder.flush()) {
    tail.push_back(std::move(*last));
  }
  auto outcome = co_await forward_lines<Item>(state, std::move(tail), map);
  co_return std::move(outcome.error);
}

template <typename Item, typename Mapper>
auto run_producer(std::shared_ptr<typename WatchSubscription<Item>::State> state,
                  std::unique_ptr<http::ResponseStream> stream,
                  text::LineDecoder decoder, Mapper map,
                  std::size_t buffer_size) -> task<void> {
  using Message = typename WatchSubscription<Item>::Message;

  co_await boost::asio::this_coro::throw_if_cancelled(false);

  std::optional<KubeError> failure;
  try {
    failure = co_await pump_stream<Item>(*state, *stream, decoder, map,
                                         buffer_size);
  } catch (const std::exception &e) {
    if (!state->cancel_requested) {
      log::debug("Watch producer interrupted: {}", e.what());
      failure = KubeError::aborted("Watch read");
    }
  }
  stream.reset();

  if (state->detached || state->cancel_requested) {
    log::debug("Watch stopped by subscriber");
    co_return;
  }
  if (failure) {
    log::debug("Watch ended with error: {}", failure->describe());
    if (!co_await deliver<Item>(
            *state, Message{std::unexpected(std::move(*failure))})) {
      log::debug("Watch subscriber left before the error was delivered");
    }
    co_return;
  }
  log::debug("Watch stream completed");
  if (!co_await deliver<Item>(*state, Message{std::optional<Item>{}})) {
    log::debug("Watch subscriber left before completion was delivered");
  }
}

} // namespace detail

/// Starts the producer for an already-opened response. `map` turns one line
/// into `KubeResult<Item>`.
template <typename Item, typename Mapper>
[[nodiscard]] auto start_watch(boost::asio::any_io_executor executor,
                               std::unique_ptr<http::ResponseStream> stream,
                               text::LineDecoder decoder, Mapper map,
                               WatchOptions options = {})
    -> WatchSubscription<Item> {
  using State = typename WatchSubscription<Item>::State;
  auto state = std::make_shared<State>(executor, options.channel_capacity);

  co_spawn(executor,
           detail::run_producer<Item>(state, std::move(stream),
                                      std::move(decoder), std::move(map),
                                      options.buffer_size),
           boost::asio::bind_cancellation_slot(
               state->cancel.slot(), [](std::exception_ptr ep) {
                 if (!ep) {
                   return;
                 }
                 try {
                   std::rethrow_exception(ep);
                 } catch (const std::exception &e) {
                   log::error("Watch producer terminated: {}", e.what());
                 }
               }));
  return WatchSubscription<Item>(std::move(state));
}

} // namespace kubeclient
