#include "kubeclient/text/charset_decoder.hpp"

#include "kubeclient/util/log.hpp"

#include <iconv.h>

#include <array>
#include <cerrno>
#include <utility>

namespace kubeclient::text {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

auto as_iconv(void *handle) -> iconv_t { return static_cast<iconv_t>(handle); }

} // namespace

CharsetDecoder::CharsetDecoder(void *handle, std::string charset)
    : handle_(handle), charset_(std::move(charset)) {}

auto CharsetDecoder::create(std::string_view charset)
    -> Result<CharsetDecoder> {
  std::string name(charset.empty() ? std::string_view{"UTF-8"} : charset);
  iconv_t cd = ::iconv_open("UTF-8", name.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    log::debug("iconv has no converter for charset '{}'", name);
    return fail(Error::UnsupportedCharset);
  }
  return CharsetDecoder(static_cast<void *>(cd), std::move(name));
}

CharsetDecoder::~CharsetDecoder() {
  if (handle_ != nullptr) {
    ::iconv_close(as_iconv(handle_));
  }
}

CharsetDecoder::CharsetDecoder(CharsetDecoder &&other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)),
      charset_(std::move(other.charset_)),
      pending_(std::move(other.pending_)) {}

auto CharsetDecoder::operator=(CharsetDecoder &&other) noexcept
    -> CharsetDecoder & {
  if (this != &other) {
    if (handle_ != nullptr) {
      ::iconv_close(as_iconv(handle_));
    }
    handle_ = std::exchange(other.handle_, nullptr);
    charset_ = std::move(other.charset_);
    pending_ = std::move(other.pending_);
  }
  return *this;
}

auto CharsetDecoder::decode(std::span<const std::uint8_t> bytes,
                            std::string &out) -> void {
  pending_.insert(pending_.end(), bytes.begin(), bytes.end());
  convert(out);
}

auto CharsetDecoder::convert(std::string &out) -> void {
  std::array<char, 4096> buffer{};
  auto *in = reinterpret_cast<char *>(pending_.data());
  std::size_t in_left = pending_.size();

  while (in_left > 0) {
    char *dst = buffer.data();
    std::size_t dst_left = buffer.size();
    const auto rc = ::iconv(as_iconv(handle_), &in, &in_left, &dst, &dst_left);
    const int err = errno;
    out.append(buffer.data(), static_cast<std::size_t>(dst - buffer.data()));
    if (rc != static_cast<std::size_t>(-1)) {
      continue;
    }
    if (err == E2BIG) {
      continue;
    }
    if (err == EINVAL) {
      // Incomplete character at the end of the input; wait for more bytes.
      break;
    }
    out.append(kReplacementChar);
    ++in;
    --in_left;
  }

  pending_.erase(pending_.begin(),
                 pending_.end() - static_cast<std::ptrdiff_t>(in_left));
}

auto CharsetDecoder::finish(std::string &out) -> void {
  if (!pending_.empty()) {
    out.append(kReplacementChar);
    pending_.clear();
  }
  std::array<char, 64> buffer{};
  char *dst = buffer.data();
  std::size_t dst_left = buffer.size();
  // Resets the shift state; stateless charsets write nothing here.
  (void)::iconv(as_iconv(handle_), nullptr, nullptr, &dst, &dst_left);
  out.append(buffer.data(), static_cast<std::size_t>(dst - buffer.data()));
}

} // namespace kubeclient::text
