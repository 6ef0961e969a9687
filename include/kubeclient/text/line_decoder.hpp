#pragma once

#include "kubeclient/core/error.hpp"
#include "kubeclient/text/charset_decoder.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kubeclient::text {

/// Splits a chunked byte stream into text lines.
///
/// LF, CR and CRLF each end one line, and a CRLF split across two chunks
/// still counts once. Chunk boundaries never affect the resulting lines.
/// One decoder serves one stream; it is not thread-safe.
class LineDecoder {
public:
  explicit LineDecoder(CharsetDecoder charset);

  /// Decoder for the given charset name; UTF-8 when `charset` is empty.
  [[nodiscard]] static auto for_charset(std::string_view charset)
      -> Result<LineDecoder>;

  /// Lines completed by `chunk`, in order. Partial trailing text is kept.
  [[nodiscard]] auto decode(std::span<const std::uint8_t> chunk)
      -> std::vector<std::string>;

  [[nodiscard]] auto decode(std::string_view chunk) -> std::vector<std::string>;

  /// Ends the stream. Returns the unterminated last line, if any, exactly
  /// once.
  [[nodiscard]] auto flush() -> std::optional<std::string>;

  [[nodiscard]] auto pending() const noexcept -> std::string_view {
    return line_;
  }

private:
  auto split(std::vector<std::string> &lines) -> void;

  CharsetDecoder charset_;
  std::string decoded_;
  std::string line_;
  bool after_cr_{false};
};

} // namespace kubeclient::text
