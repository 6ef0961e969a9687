#include "kubeclient/client/http/http_client.hpp"

#include "kubeclient/core/asio_awaitable.hpp"
#include "kubeclient/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <format>
#include <limits>
#include <string>

namespace kubeclient::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;

// A peer that hung up, which on a reused keep-alive connection usually means
// the server closed it while idle.
[[nodiscard]] auto exchange_error(const boost::system::error_code &ec)
    -> std::error_code {
  if (ec == beast_http::error::end_of_stream ||
      ec == boost::asio::error::eof ||
      ec == boost::asio::error::connection_reset ||
      ec == boost::asio::error::broken_pipe) {
    return make_error_code(Error::ConnectionClosed);
  }
  return to_error_code(ec);
}

template <typename Fields>
auto copy_headers(const Fields &fields) -> HttpHeaders {
  HttpHeaders out;
  out.reserve(static_cast<std::size_t>(
      std::distance(fields.begin(), fields.end())));
  for (const auto &field : fields) {
    auto name = field.name_string();
    auto value = field.value();
    out.emplace(std::string(name.data(), name.size()),
                std::string(value.data(), value.size()));
  }
  return out;
}

auto to_response(
    const beast_http::response<beast_http::vector_body<std::uint8_t>> &msg)
    -> HttpResponse {
  HttpResponse out;
  out.status = static_cast<HttpStatus>(msg.result_int());
  out.headers = copy_headers(msg.base());
  out.body = msg.body();
  return out;
}

template <typename Stream>
auto write_request(Stream &stream, HttpRequest &req,
                   const HttpClientConfig &config, const std::string &host)
    -> task<Result<void>> {
  if (!req.headers.contains("Host")) {
    req.headers["Host"] = host;
  }
  if (!req.headers.contains("Connection")) {
    req.headers["Connection"] = config.keep_alive ? "keep-alive" : "close";
  }

  auto request_data = req.serialize();
  auto [write_ec, written] = co_await boost::asio::async_write(
      stream, boost::asio::buffer(request_data),
      boost::asio::cancel_after(config.read_timeout, use_nothrow));
  (void)written;
  if (write_ec) {
    log::error("Failed to write {} {}: {}", req.method, req.path,
               write_ec.message());
    co_return fail(exchange_error(write_ec));
  }
  co_return ok();
}

template <typename Stream>
auto request_over_stream(Stream &stream, HttpRequest req,
                         HttpClientConfig config, const std::string &host)
    -> task<Result<HttpResponse>> {
  if (auto written = co_await write_request(stream, req, config, host);
      !written) {
    co_return fail(written.error());
  }

  beast::flat_buffer read_buffer;
  beast_http::response_parser<beast_http::vector_body<std::uint8_t>> parser;
  parser.header_limit(256 * 1024);
  parser.body_limit(config.max_response_size);

  auto [read_ec, read_n] = co_await beast_http::async_read(
      stream, read_buffer, parser,
      boost::asio::cancel_after(config.read_timeout, use_nothrow));
  (void)read_n;
  if (read_ec == beast_http::error::body_limit) {
    log::error("Response to {} {} exceeds {} bytes", req.method, req.path,
               config.max_response_size);
    co_return fail(Error::ResponseTooLarge);
  }
  if (read_ec) {
    log::error("Failed to read response to {} {}: {}", req.method, req.path,
               read_ec.message());
    co_return fail(exchange_error(read_ec));
  }

  co_return ok(to_response(parser.release()));
}

} // namespace

struct HttpClient::Impl {
  SocketVariant socket;
  HttpClientConfig config;
  std::string host;

  Impl(SocketVariant socket_in, HttpClientConfig cfg)
      : socket(std::move(socket_in)), config(cfg) {}
};

namespace detail {

// Owns the connection it reads from; the connection is closed when the stream
// is destroyed.
class SocketResponseStream final : public ResponseStream {
public:
  explicit SocketResponseStream(std::unique_ptr<HttpClient> client)
      : client_(std::move(client)) {
    parser_.header_limit(256 * 1024);
    parser_.body_limit(std::numeric_limits<std::uint64_t>::max());
  }

  ~SocketResponseStream() override { client_->close(); }

  SocketResponseStream(const SocketResponseStream &) = delete;
  auto operator=(const SocketResponseStream &)
      -> SocketResponseStream & = delete;

  auto start(HttpRequest req) -> task<Result<void>> {
    auto &impl = *client_->impl_;
    if (auto *tcp = std::get_if<boost::asio::ip::tcp::socket>(&impl.socket)) {
      co_return co_await start_on(*tcp, std::move(req));
    }
    auto &unix_socket =
        std::get<boost::asio::local::stream_protocol::socket>(impl.socket);
    co_return co_await start_on(unix_socket, std::move(req));
  }

  [[nodiscard]] auto status() const noexcept -> HttpStatus override {
    return status_;
  }

  [[nodiscard]] auto headers() const noexcept -> const HttpHeaders & override {
    return headers_;
  }

  auto read_some(std::span<std::uint8_t> out)
      -> task<Result<std::size_t>> override {
    // Beast makes no progress on a body without room.
    if (out.empty()) {
      co_return fail(Error::InvalidArgument);
    }
    while (!parser_.is_done()) {
      auto &body = parser_.get().body();
      body.data = out.data();
      body.size = out.size();

      Result<void> step;
      auto &impl = *client_->impl_;
      if (auto *tcp =
              std::get_if<boost::asio::ip::tcp::socket>(&impl.socket)) {
        step = co_await read_body_on(*tcp);
      } else {
        step = co_await read_body_on(
            std::get<boost::asio::local::stream_protocol::socket>(
                impl.socket));
      }
      if (!step) {
        co_return fail(step.error());
      }

      // Chunk headers and trailers advance the parser without body bytes.
      const auto produced = out.size() - parser_.get().body().size;
      if (produced > 0) {
        co_return ok(produced);
      }
    }
    co_return ok(std::size_t{0});
  }

private:
  template <typename Stream>
  auto start_on(Stream &stream, HttpRequest req) -> task<Result<void>> {
    const auto &config = client_->impl_->config;
    if (auto written =
            co_await write_request(stream, req, config, client_->impl_->host);
        !written) {
      co_return fail(written.error());
    }

    auto [ec, n] = co_await beast_http::async_read_header(
        stream, buffer_, parser_,
        boost::asio::cancel_after(config.read_timeout, use_nothrow));
    (void)n;
    if (ec) {
      log::error("Failed to read response head for {} {}: {}", req.method,
                 req.path, ec.message());
      co_return fail(exchange_error(ec));
    }

    status_ = static_cast<HttpStatus>(parser_.get().result_int());
    headers_ = copy_headers(parser_.get().base());
    co_return ok();
  }

  template <typename Stream>
  auto read_body_on(Stream &stream) -> task<Result<void>> {
    auto [ec, n] = co_await beast_http::async_read_some(stream, buffer_,
                                                        parser_, use_nothrow);
    (void)n;
    if (ec == beast_http::error::need_buffer) {
      co_return ok();
    }
    if (ec == beast_http::error::end_of_stream && parser_.is_done()) {
      co_return ok();
    }
    if (ec) {
      co_return fail(exchange_error(ec));
    }
    co_return ok();
  }

  std::unique_ptr<HttpClient> client_;
  beast::flat_buffer buffer_;
  beast_http::response_parser<beast_http::buffer_body> parser_;
  HttpStatus status_{HttpStatus::Ok};
  HttpHeaders headers_;
};

} // namespace detail

HttpClient::HttpClient(SocketVariant socket, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(socket), config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient &&) noexcept = default;
auto HttpClient::operator=(HttpClient &&) noexcept -> HttpClient & = default;

auto HttpClient::connect_tcp(boost::asio::any_io_executor executor,
                             std::string_view host, std::uint16_t port,
                             HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  boost::asio::ip::tcp::resolver resolver(executor);
  std::string host_str(host);
  std::string port_str = std::to_string(port);
  auto [resolve_ec, endpoints] =
      co_await resolver.async_resolve(host_str, port_str, use_nothrow);
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{} - {}", host, port,
               resolve_ec.message());
    co_return fail(Error::InvalidUrl);
  }

  boost::asio::ip::tcp::socket socket(executor);
  auto [connect_ec, endpoint] = co_await boost::asio::async_connect(
      socket, endpoints,
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  (void)endpoint;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{} - {}", host, port,
               connect_ec.message());
    co_return fail(Error::ConnectionFailed);
  }

  auto client = std::make_unique<HttpClient>(std::move(socket), config);
  client->impl_->host = std::format("{}:{}", host, port);
  co_return ok(std::move(client));
}

auto HttpClient::connect_unix(boost::asio::any_io_executor executor,
                              std::string_view socket_path,
                              HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  boost::system::error_code ec;
  boost::asio::local::stream_protocol::socket socket(executor);
  socket.open(boost::asio::local::stream_protocol(), ec);
  if (ec) {
    log::debug("Failed to open unix socket {} - {}", socket_path, ec.message());
    co_return fail(Error::ConnectionFailed);
  }
  auto [connect_ec] = co_await socket.async_connect(
      boost::asio::local::stream_protocol::endpoint(std::string(socket_path)),
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  if (connect_ec) {
    log::debug("Failed to connect to {} - {}", socket_path,
               connect_ec.message());
    co_return fail(Error::ConnectionFailed);
  }

  auto client = std::make_unique<HttpClient>(std::move(socket), config);
  client->impl_->host = "localhost";
  co_return ok(std::move(client));
}

auto HttpClient::request(HttpRequest req) -> task<Result<HttpResponse>> {
  if (!is_connected()) {
    co_return fail(Error::ConnectionClosed);
  }

  if (auto *tcp = std::get_if<boost::asio::ip::tcp::socket>(&impl_->socket)) {
    co_return co_await request_over_stream(*tcp, std::move(req), impl_->config,
                                           impl_->host);
  }
  auto *unix_socket =
      std::get_if<boost::asio::local::stream_protocol::socket>(&impl_->socket);
  co_return co_await request_over_stream(*unix_socket, std::move(req),
                                         impl_->config, impl_->host);
}

auto HttpClient::open_stream(std::unique_ptr<HttpClient> client,
                             HttpRequest req)
    -> task<Result<std::unique_ptr<ResponseStream>>> {
  if (!client || !client->is_connected()) {
    co_return fail(Error::ConnectionClosed);
  }
  auto stream =
      std::make_unique<detail::SocketResponseStream>(std::move(client));
  if (auto started = co_await stream->start(std::move(req)); !started) {
    co_return fail(started.error());
  }
  co_return ok(std::unique_ptr<ResponseStream>(std::move(stream)));
}

auto HttpClient::is_connected() const noexcept -> bool {
  if (auto *tcp = std::get_if<boost::asio::ip::tcp::socket>(&impl_->socket)) {
    return tcp->is_open();
  }
  if (auto *unix_socket =
          std::get_if<boost::asio::local::stream_protocol::socket>(
              &impl_->socket)) {
    return unix_socket->is_open();
  }
  return false;
}

auto HttpClient::close() -> void {
  boost::system::error_code ec;
  if (auto *tcp = std::get_if<boost::asio::ip::tcp::socket>(&impl_->socket)) {
    tcp->close(ec);
    return;
  }
  if (auto *unix_socket =
          std::get_if<boost::asio::local::stream_protocol::socket>(
              &impl_->socket)) {
    unix_socket->close(ec);
  }
}

} // namespace kubeclient::http
