#pragma once

#include "kubeclient/core/error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kubeclient::text {

/// Incremental conversion of a named character set to UTF-8.
///
/// Bytes that end in the middle of a character are held back until the next
/// call. Invalid sequences decode to U+FFFD and decoding resumes at the next
/// byte.
class CharsetDecoder {
public:
  /// Fails with Error::UnsupportedCharset when iconv does not know `charset`.
  [[nodiscard]] static auto create(std::string_view charset)
      -> Result<CharsetDecoder>;

  ~CharsetDecoder();

  CharsetDecoder(const CharsetDecoder &) = delete;
  auto operator=(const CharsetDecoder &) -> CharsetDecoder & = delete;
  CharsetDecoder(CharsetDecoder &&other) noexcept;
  auto operator=(CharsetDecoder &&other) noexcept -> CharsetDecoder &;

  /// Appends the UTF-8 form of every complete character in `bytes` to `out`.
  auto decode(std::span<const std::uint8_t> bytes, std::string &out) -> void;

  /// Ends the input. Held-back bytes become one U+FFFD.
  auto finish(std::string &out) -> void;

  [[nodiscard]] auto charset() const noexcept -> std::string_view {
    return charset_;
  }

  [[nodiscard]] auto pending_bytes() const noexcept -> std::size_t {
    return pending_.size();
  }

private:
  CharsetDecoder(void *handle, std::string charset);

  auto convert(std::string &out) -> void;

  void *handle_{nullptr}; // iconv_t
  std::string charset_;
  std::vector<std::uint8_t> pending_;
};

} // namespace kubeclient::text
