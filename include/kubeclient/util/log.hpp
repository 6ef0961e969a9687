#pragma once

#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>

namespace kubeclient::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m",
    "\o{33}[33m", "\o{33}[31m", "\o{33}[0m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name,
                                      Level fallback = Level::Info) -> Level {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return fallback;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Formatted lines are handed to a writer thread through a concurrent channel.
// An empty line is the shutdown marker, so everything queued before stop() is
// written before the writer exits.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<FILE *> output_{stderr};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  std::mutex sync_write_mutex_;
  boost::asio::io_context writer_ctx_{1};
  std::shared_ptr<LineChannel> queue_;
  std::jthread writer_;

  auto write_now(std::string_view line) -> void {
    std::lock_guard lock(sync_write_mutex_);
    auto *out = output_.load(std::memory_order_acquire);
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }

  auto receive_next(std::shared_ptr<LineChannel> queue) -> void {
    auto &channel = *queue;
    channel.async_receive(
        [this, queue = std::move(queue)](boost::system::error_code ec,
                                         std::string line) mutable {
          if (ec || line.empty()) {
            return;
          }
          write_now(line);
          receive_next(std::move(queue));
        });
  }

  [[nodiscard]] auto colorize() const noexcept -> bool {
    auto *out = output_.load(std::memory_order_acquire);
    return file_ == nullptr && ::isatty(::fileno(out)) != 0;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    writer_ctx_.restart();
    queue_ = std::make_shared<LineChannel>(writer_ctx_.get_executor(),
                                           kQueueCapacity);
    receive_next(queue_);
    writer_ = std::jthread([this] { writer_ctx_.run(); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    queue_->async_send(boost::system::error_code{}, std::string{},
                       boost::asio::detached);
    if (writer_.joinable()) {
      writer_.join();
    }
    queue_->close();
    queue_.reset();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  // Only safe before start(); the writer thread owns the stream afterwards.
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    if (path.empty()) {
      output_.store(stderr, std::memory_order_release);
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    output_.store(f, std::memory_order_release);
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    std::string line;
    if (colorize()) {
      std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] ",
                     now, level_colors.at(std::to_underlying(level)),
                     level_name(level), "\o{33}[0m");
    } else {
      std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}] ",
                     now, level_name(level));
    }
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    if (!running_.load(std::memory_order_acquire)) {
      write_now(line);
      return;
    }
    if (!queue_->try_send(boost::system::error_code{}, std::move(line))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace kubeclient::log
