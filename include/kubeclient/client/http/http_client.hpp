#pragma once

#include "kubeclient/client/http/http_types.hpp"
#include "kubeclient/client/http/response_stream.hpp"
#include "kubeclient/core/coroutine.hpp"
#include "kubeclient/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <variant>

namespace kubeclient::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds read_timeout{30000};
  std::size_t max_response_size{10UL * 1024UL * 1024UL};
  bool keep_alive{true};
};

namespace detail {
class SocketResponseStream;
}

/// One HTTP/1.1 connection over TCP or a unix domain socket.
class HttpClient {
public:
  using SocketVariant =
      std::variant<boost::asio::ip::tcp::socket,
                   boost::asio::local::stream_protocol::socket>;

  HttpClient(SocketVariant socket, HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  auto operator=(const HttpClient &) -> HttpClient & = delete;
  HttpClient(HttpClient &&) noexcept;
  auto operator=(HttpClient &&) noexcept -> HttpClient &;

  static auto connect_tcp(boost::asio::any_io_executor executor,
                          std::string_view host, std::uint16_t port,
                          HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  static auto connect_unix(boost::asio::any_io_executor executor,
                           std::string_view socket_path,
                           HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  /// Sends `req` and buffers the whole response, bounded by
  /// `max_response_size`.
  auto request(HttpRequest req) -> task<Result<HttpResponse>>;

  /// Sends `req` and returns once the response head is read. The stream takes
  /// the connection with it; body reads have no timeout and end only when the
  /// server finishes the body or the read is cancelled.
  static auto open_stream(std::unique_ptr<HttpClient> client, HttpRequest req)
      -> task<Result<std::unique_ptr<ResponseStream>>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  friend class detail::SocketResponseStream;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace kubeclient::http
