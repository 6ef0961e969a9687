#include "kubeclient/text/line_decoder.hpp"

#include <utility>

namespace kubeclient::text {

LineDecoder::LineDecoder(CharsetDecoder charset)
    : charset_(std::move(charset)) {}

auto LineDecoder::for_charset(std::string_view charset) -> Result<LineDecoder> {
  auto decoder = CharsetDecoder::create(charset);
  if (!decoder) {
    return fail(decoder.error());
  }
  return LineDecoder(std::move(*decoder));
}

auto LineDecoder::decode(std::span<const std::uint8_t> chunk)
    -> std::vector<std::string> {
  std::vector<std::string> lines;
  decoded_.clear();
  charset_.decode(chunk, decoded_);
  split(lines);
  return lines;
}

auto LineDecoder::decode(std::string_view chunk) -> std::vector<std::string> {
  return decode(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t *>(chunk.data()), chunk.size()));
}

auto LineDecoder::split(std::vector<std::string> &lines) -> void {
  for (char c : decoded_) {
    if (after_cr_) {
      after_cr_ = false;
      if (c == '\n') {
        continue;
      }
    }
    if (c == '\r') {
      lines.emplace_back(std::move(line_));
      line_.clear();
      after_cr_ = true;
    } else if (c == '\n') {
      lines.emplace_back(std::move(line_));
      line_.clear();
    } else {
      line_.push_back(c);
    }
  }
}

auto LineDecoder::flush() -> std::optional<std::string> {
  decoded_.clear();
  // Only replacement characters come out of finish(), never terminators.
  charset_.finish(decoded_);
  line_.append(decoded_);
  after_cr_ = false;

  if (line_.empty()) {
    return std::nullopt;
  }
  std::string last = std::move(line_);
  line_.clear();
  return last;
}

} // namespace kubeclient::text
