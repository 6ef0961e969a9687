#include "kubeclient/client/http/transport.hpp"

#include "kubeclient/util/log.hpp"
#include "kubeclient/util/url.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace kubeclient::http {

auto parse_endpoint(std::string_view url) -> Result<Endpoint> {
  constexpr std::string_view kUnixScheme = "unix://";
  Endpoint out;
  if (boost::algorithm::istarts_with(url, kUnixScheme)) {
    out.kind = Endpoint::Kind::Unix;
    out.socket_path = std::string(url.substr(kUnixScheme.size()));
    if (out.socket_path.empty() || out.socket_path.front() != '/') {
      return fail(Error::InvalidUrl);
    }
    return ok(std::move(out));
  }

  auto parsed = util::parse_http_url(url);
  if (!parsed) {
    return fail(parsed.error());
  }
  out.host = std::move(parsed->host);
  out.port = parsed->port;
  if (parsed->path != "/") {
    out.path_prefix = std::move(parsed->path);
  }
  return ok(std::move(out));
}

HttpTransport::HttpTransport(boost::asio::any_io_executor executor,
                             Endpoint endpoint, HttpClientConfig config)
    : executor_(std::move(executor)), endpoint_(std::move(endpoint)),
      config_(config) {}

auto HttpTransport::connect() -> task<Result<std::unique_ptr<HttpClient>>> {
  if (endpoint_.kind == Endpoint::Kind::Unix) {
    co_return co_await HttpClient::connect_unix(executor_,
                                                endpoint_.socket_path, config_);
  }
  co_return co_await HttpClient::connect_tcp(executor_, endpoint_.host,
                                             endpoint_.port, config_);
}

auto HttpTransport::prepare(HttpRequest &req) const -> void {
  if (!endpoint_.path_prefix.empty()) {
    req.path = endpoint_.path_prefix + req.path;
  }
  if (!req.headers.contains("Accept")) {
    req.headers["Accept"] = std::string(kJsonMediaType);
  }
}

namespace {

// Methods whose request may be sent a second time without changing the
// outcome on the server.
[[nodiscard]] constexpr auto is_idempotent(HttpMethod method) noexcept
    -> bool {
  return method == HttpMethod::GET || method == HttpMethod::PUT ||
         method == HttpMethod::DELETE;
}

} // namespace

auto HttpTransport::send(HttpRequest req) -> task<Result<HttpResponse>> {
  prepare(req);

  // The idle connection is taken for the duration of the exchange, so
  // overlapping sends each get their own connection.
  auto client = std::move(idle_);
  const bool reused = client && client->is_connected();
  if (!reused) {
    auto connected = co_await connect();
    if (!connected) {
      co_return fail(connected.error());
    }
    client = std::move(*connected);
  }

  const auto method = req.method;
  const auto path = req.path;
  auto response = co_await client->request(req);
  if (!response && reused && is_idempotent(method) &&
      response.error() == Error::ConnectionClosed) {
    // The server dropped the idle connection before our request reached it.
    log::debug("{} {}: idle connection was closed, reconnecting", method,
               path);
    auto connected = co_await connect();
    if (!connected) {
      co_return fail(connected.error());
    }
    client = std::move(*connected);
    response = co_await client->request(std::move(req));
  }
  if (!response) {
    log::debug("{} {} failed: {}", method, path, response.error().message());
    co_return fail(response.error());
  }
  log::debug("{} {} -> {}", method, path, response->status);

  auto connection = response->header("Connection");
  const bool reusable =
      config_.keep_alive &&
      !(connection && boost::algorithm::iequals(*connection, "close"));
  if (reusable && !idle_) {
    idle_ = std::move(client);
  }
  co_return response;
}

auto HttpTransport::open_stream(HttpRequest req)
    -> task<Result<std::unique_ptr<ResponseStream>>> {
  prepare(req);
  auto connected = co_await connect();
  if (!connected) {
    co_return fail(connected.error());
  }
  log::debug("Opening stream {} {}", req.method, req.target());
  co_return co_await HttpClient::open_stream(std::move(*connected),
                                             std::move(req));
}

} // namespace kubeclient::http
