#include "kubeclient/resource/watch.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace kubeclient;
using namespace std::chrono_literals;
using kubeclient::http::HttpStatus;
using kubeclient::test::FakeResponseStream;
using kubeclient::test::run_coro;
using AtEnd = kubeclient::test::FakeResponseStream::AtEnd;

namespace {

auto utf8() -> text::LineDecoder {
  return std::move(*text::LineDecoder::for_charset("utf-8"));
}

auto identity = [](std::string &line) -> KubeResult<std::string> {
  return std::move(line);
};

auto reject_bad = [](std::string &line) -> KubeResult<std::string> {
  if (line == "bad") {
    return std::unexpected(KubeError::stream_protocol(
        "bad line", make_error_code(Error::ParseError)));
  }
  return std::move(line);
};

auto make_stream(std::vector<std::string> chunks, AtEnd at_end = AtEnd::Finish)
    -> std::unique_ptr<FakeResponseStream> {
  return std::make_unique<FakeResponseStream>(
      HttpStatus::Ok, test::json_headers(), std::move(chunks), at_end);
}

struct Drained {
  std::vector<std::string> items;
  std::optional<KubeError> error;
  bool finished{false};
};

auto drain(WatchSubscription<std::string> &sub) -> task<Drained> {
  Drained out;
  while (true) {
    auto next = co_await sub.next();
    if (!next) {
      out.error = std::move(next.error());
      break;
    }
    if (!next->has_value()) {
      break;
    }
    out.items.push_back(std::move(**next));
  }
  out.finished = sub.finished();
  co_return out;
}

} // namespace

TEST(WatchTest, DeliversLinesInOrderThenCompletes) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(
        executor, make_stream({"one\ntw", "o\nthree\n"}), utf8(), identity);
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"one", "two", "three"}));
  EXPECT_FALSE(drained.error.has_value());
  EXPECT_TRUE(drained.finished);
}

TEST(WatchTest, FlushesUnterminatedLastLine) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(executor, make_stream({"a\nlast"}),
                                        utf8(), identity);
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"a", "last"}));
}

TEST(WatchTest, SmallReadBufferSplitsLinesAcrossReads) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(
        executor, make_stream({"alpha\nbeta\ngamma\n"}), utf8(), identity,
        WatchOptions{.buffer_size = 3, .channel_capacity = 64});
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items,
            (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

TEST(WatchTest, BoundedChannelStillDeliversEverything) {
  std::string body;
  std::vector<std::string> expected;
  for (int i = 0; i < 50; ++i) {
    expected.push_back(std::to_string(i));
    body += std::to_string(i) + "\n";
  }
  auto drained = run_coro([&]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(
        executor, make_stream({body}), utf8(), identity,
        WatchOptions{.buffer_size = 2048, .channel_capacity = 1});
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items, expected);
}

TEST(WatchTest, MappingErrorEndsTheStream) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(
        executor, make_stream({"ok\nbad\nnever\n"}), utf8(), reject_bad);
    auto out = co_await drain(sub);
    // The end is sticky.
    auto again = co_await sub.next();
    if (!again || again->has_value()) {
      out.items.push_back("unexpected");
    }
    co_return out;
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"ok"}));
  ASSERT_TRUE(drained.error.has_value());
  EXPECT_EQ(drained.error->kind, KubeErrorKind::StreamProtocol);
  EXPECT_TRUE(drained.finished);
}

TEST(WatchTest, ReadFailureIsTransportError) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(
        executor, make_stream({"x\n"}, AtEnd::Fail), utf8(), identity);
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"x"}));
  ASSERT_TRUE(drained.error.has_value());
  EXPECT_EQ(drained.error->kind, KubeErrorKind::Transport);
  EXPECT_EQ(drained.error->code, make_error_code(Error::ConnectionClosed));
  EXPECT_EQ(drained.error->message, "Watch read failed");
}

TEST(WatchTest, CancelWhileWaitingCompletesNormally) {
  auto released = std::make_shared<bool>(false);
  auto drained = run_coro([&]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto stream = make_stream({"first\n"}, AtEnd::Hang);
    stream->watch_release(released);
    auto sub = start_watch<std::string>(executor, std::move(stream), utf8(),
                                        identity);

    boost::asio::co_spawn(
        executor,
        [&sub]() -> task<void> {
          auto ex = co_await boost::asio::this_coro::executor;
          boost::asio::steady_timer timer(ex, 20ms);
          co_await timer.async_wait(use_awaitable);
          sub.cancel();
        },
        boost::asio::detached);
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"first"}));
  EXPECT_FALSE(drained.error.has_value());
  EXPECT_TRUE(drained.finished);
  EXPECT_TRUE(*released);
}

TEST(WatchTest, CancelBeforeFirstReadDeliversNothing) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(executor, make_stream({"a\nb\n"}),
                                        utf8(), identity);
    sub.cancel();
    sub.cancel();
    co_return co_await drain(sub);
  }());
  EXPECT_TRUE(drained.items.empty());
  EXPECT_FALSE(drained.error.has_value());
}

TEST(WatchTest, DroppingSubscriptionReleasesStream) {
  auto released = std::make_shared<bool>(false);
  run_coro([&]() -> task<void> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto stream = make_stream({"a\n"}, AtEnd::Hang);
    stream->watch_release(released);
    {
      auto sub = start_watch<std::string>(executor, std::move(stream), utf8(),
                                          identity);
      auto first = co_await sub.next();
      EXPECT_TRUE(first.has_value());
    }
    co_return;
  }());
  EXPECT_TRUE(*released);
}

TEST(WatchTest, MovedSubscriptionKeepsReceiving) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto original = start_watch<std::string>(
        executor, make_stream({"a\nb\n"}), utf8(), identity);
    WatchSubscription<std::string> moved = std::move(original);
    co_return co_await drain(moved);
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"a", "b"}));
}

TEST(WatchTest, EmptyBodyCompletesWithoutItems) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(executor, make_stream({}), utf8(),
                                        identity);
    co_return co_await drain(sub);
  }());
  EXPECT_TRUE(drained.items.empty());
  EXPECT_FALSE(drained.error.has_value());
  EXPECT_TRUE(drained.finished);
}

TEST(WatchTest, UnrequestedCancellationIsAborted) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto stream = make_stream({"x\n"}, AtEnd::Fail);
    stream->fail_with = make_error_code(Error::Cancelled);
    auto sub = start_watch<std::string>(executor, std::move(stream), utf8(),
                                        identity);
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"x"}));
  ASSERT_TRUE(drained.error.has_value());
  EXPECT_EQ(drained.error->kind, KubeErrorKind::Aborted);
  EXPECT_TRUE(drained.finished);
}

TEST(WatchTest, ThrowingStreamIsAborted) {
  auto released = std::make_shared<bool>(false);
  auto drained = run_coro([&]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto stream = make_stream({"x\n"}, AtEnd::Throw);
    stream->watch_release(released);
    auto sub = start_watch<std::string>(executor, std::move(stream), utf8(),
                                        identity);
    co_return co_await drain(sub);
  }());
  EXPECT_EQ(drained.items, (std::vector<std::string>{"x"}));
  ASSERT_TRUE(drained.error.has_value());
  EXPECT_EQ(drained.error->kind, KubeErrorKind::Aborted);
  EXPECT_TRUE(*released);
}

TEST(WatchTest, ZeroBufferSizeIsRejected) {
  auto drained = run_coro([]() -> task<Drained> {
    auto executor = co_await boost::asio::this_coro::executor;
    auto sub = start_watch<std::string>(
        executor, make_stream({"never\n"}), utf8(), identity,
        WatchOptions{.buffer_size = 0, .channel_capacity = 8});
    co_return co_await drain(sub);
  }());
  EXPECT_TRUE(drained.items.empty());
  ASSERT_TRUE(drained.error.has_value());
  EXPECT_EQ(drained.error->kind, KubeErrorKind::Transport);
  EXPECT_EQ(drained.error->code, make_error_code(Error::InvalidArgument));
}
