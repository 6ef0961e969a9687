#pragma once

#include "kubeclient/client/http/http_client.hpp"
#include "kubeclient/client/http/http_types.hpp"
#include "kubeclient/client/http/response_stream.hpp"
#include "kubeclient/core/coroutine.hpp"
#include "kubeclient/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace kubeclient::http {

/// What the resource layer needs from an HTTP stack: one buffered exchange
/// and one streamed exchange.
template <typename T>
concept KubeTransport = requires(T t, HttpRequest req) {
  { t.send(std::move(req)) } -> std::same_as<task<Result<HttpResponse>>>;
  {
    t.open_stream(std::move(req))
  } -> std::same_as<task<Result<std::unique_ptr<ResponseStream>>>>;
};

struct Endpoint {
  enum class Kind : std::uint8_t { Tcp, Unix };

  Kind kind{Kind::Tcp};
  std::string host{"127.0.0.1"};
  std::uint16_t port{8001};
  std::string socket_path;
  /// Prepended to every request path, e.g. "/k8s" behind a path-routing proxy.
  std::string path_prefix;
};

/// Accepts `http://host[:port][/prefix]`, a bare `host:port`, or
/// `unix:///path/to.sock`.
[[nodiscard]] auto parse_endpoint(std::string_view url) -> Result<Endpoint>;

/// Plain HTTP/1.1 transport. Buffered requests reuse one idle keep-alive
/// connection; each stream gets a dedicated connection that it closes when
/// released. Failed requests are not retried, with one exception: a GET, PUT
/// or DELETE whose reused idle connection turns out to be closed by the
/// server is sent once more on a fresh connection. POST and PATCH on such a
/// connection fail with `Error::ConnectionClosed` and the caller decides.
class HttpTransport {
public:
  HttpTransport(boost::asio::any_io_executor executor, Endpoint endpoint,
                HttpClientConfig config = {});

  auto send(HttpRequest req) -> task<Result<HttpResponse>>;
  auto open_stream(HttpRequest req)
      -> task<Result<std::unique_ptr<ResponseStream>>>;

  [[nodiscard]] auto endpoint() const noexcept -> const Endpoint & {
    return endpoint_;
  }

private:
  auto connect() -> task<Result<std::unique_ptr<HttpClient>>>;
  auto prepare(HttpRequest &req) const -> void;

  boost::asio::any_io_executor executor_;
  Endpoint endpoint_;
  HttpClientConfig config_;
  std::unique_ptr<HttpClient> idle_;
};

static_assert(KubeTransport<HttpTransport>);

} // namespace kubeclient::http
