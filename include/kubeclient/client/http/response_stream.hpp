#pragma once

#include "kubeclient/client/http/http_types.hpp"
#include "kubeclient/core/coroutine.hpp"
#include "kubeclient/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kubeclient::http {

/// Response whose head has been read but whose body is pulled on demand.
/// Watch subscriptions keep one of these open for the life of the stream.
class ResponseStream {
public:
  virtual ~ResponseStream() = default;

  [[nodiscard]] virtual auto status() const noexcept -> HttpStatus = 0;
  [[nodiscard]] virtual auto headers() const noexcept -> const HttpHeaders & = 0;

  /// Reads up to `buffer.size()` body bytes. Zero means the body is complete.
  virtual auto read_some(std::span<std::uint8_t> buffer)
      -> task<Result<std::size_t>> = 0;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string_view> {
    return find_header(headers(), key);
  }
};

/// Drains the rest of the body, failing once it grows beyond `limit` bytes.
inline auto read_to_end(ResponseStream &stream, std::size_t limit)
    -> task<Result<std::vector<std::uint8_t>>> {
  std::vector<std::uint8_t> body;
  std::vector<std::uint8_t> chunk(4096);
  while (true) {
    auto n = co_await stream.read_some(chunk);
    if (!n) {
      co_return fail(n.error());
    }
    if (*n == 0) {
      break;
    }
    if (body.size() + *n > limit) {
      co_return fail(Error::ResponseTooLarge);
    }
    body.insert(body.end(), chunk.begin(),
                chunk.begin() + static_cast<std::ptrdiff_t>(*n));
  }
  co_return ok(std::move(body));
}

} // namespace kubeclient::http
