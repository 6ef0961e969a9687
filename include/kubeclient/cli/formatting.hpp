#pragma once

#include "kubeclient/models/resource_event.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace kubeclient::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kCyan = "\033[36m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}

inline auto dim(std::string_view text) -> std::string {
  return colorize(text, kDim);
}

inline auto visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto colorize_event_type(models::ResourceEventType type)
    -> std::string {
  const auto name = models::to_wire_name(type);
  switch (type) {
  case models::ResourceEventType::Added:
    return ansi::colorize(name, ansi::kGreen);
  case models::ResourceEventType::Modified:
    return ansi::colorize(name, ansi::kYellow);
  case models::ResourceEventType::Deleted:
    return ansi::colorize(name, ansi::kRed);
  case models::ResourceEventType::Bookmark:
    return ansi::colorize(name, ansi::kCyan);
  }
  return std::string(name);
}

inline auto colorize_ready(std::int32_t ready, std::int32_t desired)
    -> std::string {
  auto text = std::format("{}/{}", ready, desired);
  return ansi::colorize(text, ready >= desired ? ansi::kGreen : ansi::kYellow);
}

/// Column widths grow to fit the rows, so rows are buffered until print().
class Table {
public:
  explicit Table(std::vector<std::string> headers)
      : headers_(std::move(headers)), widths_(headers_.size(), 0) {
    for (std::size_t i = 0; i < headers_.size(); ++i) {
      widths_[i] = headers_[i].size();
    }
  }

  auto add_row(std::vector<std::string> values) -> void {
    for (std::size_t i = 0; i < widths_.size() && i < values.size(); ++i) {
      widths_[i] = std::max(widths_[i], ansi::visible_width(values[i]));
    }
    rows_.push_back(std::move(values));
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty(); }

  auto print() const -> void {
    std::vector<std::string> bold_headers;
    bold_headers.reserve(headers_.size());
    for (const auto &h : headers_) {
      bold_headers.push_back(ansi::bold(h));
    }
    print_row(bold_headers);
    for (const auto &row : rows_) {
      print_row(row);
    }
  }

private:
  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < widths_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print("   ");
      const auto &val = values[i];
      auto visible = ansi::visible_width(val);
      auto pad = visible < widths_[i] ? widths_[i] - visible : 0;
      if (i + 1 == widths_.size()) {
        std::print("{}", val);
      } else {
        std::print("{}{}", val, std::string(pad, ' '));
      }
    }
    std::println("");
  }

  std::vector<std::string> headers_;
  std::vector<std::size_t> widths_;
  std::vector<std::vector<std::string>> rows_;
};

} // namespace kubeclient::cli::fmt
