#pragma once

#include "kubeclient/client/http/http_types.hpp"
#include "kubeclient/client/http/media_type.hpp"
#include "kubeclient/client/http/transport.hpp"
#include "kubeclient/core/coroutine.hpp"
#include "kubeclient/models/kind_registry.hpp"
#include "kubeclient/models/kube_object.hpp"
#include "kubeclient/models/resource_event.hpp"
#include "kubeclient/models/status.hpp"
#include "kubeclient/resource/event_mapper.hpp"
#include "kubeclient/resource/kube_error.hpp"
#include "kubeclient/resource/patch_document.hpp"
#include "kubeclient/resource/watch.hpp"
#include "kubeclient/text/line_decoder.hpp"
#include "kubeclient/util/json.hpp"
#include "kubeclient/util/log.hpp"

#include <boost/asio/this_coro.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace kubeclient {

struct GatewayOptions {
  /// Upper bound on an error body read from a failed watch response.
  std::size_t max_error_body{64UL * 1024UL};
};

/// Typed requests over a transport.
///
/// Callers supply the request path and query; the gateway sets method, body
/// and content type, then maps the response to `T` or a KubeError. Every
/// non-success status becomes a ClientError carrying the server's Status
/// when the body holds one. Nothing is retried. The transport and registry
/// must outlive the gateway and any watch it starts.
template <http::KubeTransport Transport> class ResourceGateway {
public:
  explicit ResourceGateway(
      Transport &transport,
      const models::KindRegistry &registry = models::default_kind_registry(),
      GatewayOptions options = {})
      : transport_(transport), registry_(registry), options_(options) {}

  /// The resource, or nullopt when the server says it does not exist. Only a
  /// 404 whose Status reason is exactly "NotFound" counts as absent.
  template <models::KubeResource T>
  auto get_one(http::HttpRequest request)
      -> task<KubeResult<std::optional<T>>> {
    const auto action =
        std::format("retrieve {} resource", registry_.describe<T>());
    request.method = http::HttpMethod::GET;
    auto response = co_await exchange(std::move(request), action);
    if (!response) {
      co_return std::unexpected(std::move(response.error()));
    }

    if (http::is_success(response->status)) {
      auto decoded = decode<T>(*response, action);
      if (!decoded) {
        co_return std::unexpected(std::move(decoded.error()));
      }
      co_return std::optional<T>{std::move(*decoded)};
    }

    auto status = try_parse_status(response->body);
    if (response->status == http::HttpStatus::NotFound && status &&
        status->reason == "NotFound") {
      co_return std::optional<T>{};
    }
    co_return std::unexpected(
        map_failure(response->status, std::move(status), action));
  }

  template <models::KubeResourceList TList>
  auto get_list(http::HttpRequest request) -> task<KubeResult<TList>> {
    const auto action = std::format(
        "list {} resources", registry_.describe_list_item<TList>());
    request.method = http::HttpMethod::GET;
    co_return co_await send_expecting<TList>(std::move(request), action);
  }

  /// JSON-Patch built through the typed helpers of TypedPatchDocument<T>.
  template <models::KubeResource T, typename Mutator>
    requires std::invocable<Mutator &, TypedPatchDocument<T> &>
  auto patch(Mutator mutator, http::HttpRequest request)
      -> task<KubeResult<T>> {
    PatchDocument document;
    TypedPatchDocument<T> typed(document);
    mutator(typed);
    co_return co_await send_patch<T>(document, std::move(request));
  }

  /// JSON-Patch built from untyped operations.
  template <models::KubeResource T, typename Mutator>
    requires std::invocable<Mutator &, PatchDocument &>
  auto patch_raw(Mutator mutator, http::HttpRequest request)
      -> task<KubeResult<T>> {
    PatchDocument document;
    mutator(document);
    co_return co_await send_patch<T>(document, std::move(request));
  }

  /// RFC 7386 merge patch; `patch_json` is the partial document.
  template <models::KubeResource T>
  auto merge_patch(std::string patch_json, http::HttpRequest request)
      -> task<KubeResult<T>> {
    const auto action =
        std::format("patch {} resource", registry_.describe<T>());
    if (!parse_json(patch_json)) {
      co_return std::unexpected(KubeError::stream_protocol(
          std::format("Failed to {}: merge patch is not valid JSON", action),
          make_error_code(Error::InvalidArgument)));
    }
    request.method = http::HttpMethod::PATCH;
    request.set_body(patch_json, http::kMergePatchMediaType);
    co_return co_await send_expecting<T>(std::move(request), action);
  }

  template <models::KubeResource T>
  auto create(T resource, http::HttpRequest request)
      -> task<KubeResult<T>> {
    const auto action =
        std::format("create {} resource", registry_.describe<T>());
    co_return co_await send_resource(resource, http::HttpMethod::POST,
                                     std::move(request), action);
  }

  template <models::KubeResource T>
  auto replace(T resource, http::HttpRequest request)
      -> task<KubeResult<T>> {
    const auto action =
        std::format("replace {} resource", registry_.describe<T>());
    co_return co_await send_resource(resource, http::HttpMethod::PUT,
                                     std::move(request), action);
  }

  /// Deletes and returns the server's Status. Servers that answer with the
  /// deleted object instead get a synthesized "Success" Status.
  template <models::KubeResource T>
  auto remove(http::HttpRequest request)
      -> task<KubeResult<models::StatusV1>> {
    const auto action =
        std::format("delete {} resource", registry_.describe<T>());
    request.method = http::HttpMethod::DELETE;
    auto response = co_await exchange(std::move(request), action);
    if (!response) {
      co_return std::unexpected(std::move(response.error()));
    }
    if (!http::is_success(response->status)) {
      co_return std::unexpected(
          map_failure(response->status, response->body, action));
    }
    if (auto status = try_parse_status(response->body)) {
      co_return std::move(*status);
    }
    models::StatusV1 synthesized;
    synthesized.status = "Success";
    synthesized.code = static_cast<std::int32_t>(response->status);
    co_return synthesized;
  }

  /// Opens a watch stream of typed change events. A failed response head is
  /// returned directly; later failures end the subscription.
  template <models::KubeResource T>
  auto watch(http::HttpRequest request, WatchOptions options = {})
      -> task<KubeResult<WatchSubscription<models::ResourceEventV1<T>>>> {
    const auto action =
        std::format("watch {} resources", registry_.describe<T>());
    auto opened = co_await open_watch(std::move(request), action);
    if (!opened) {
      co_return std::unexpected(std::move(opened.error()));
    }
    auto executor = co_await boost::asio::this_coro::executor;
    co_return start_watch<models::ResourceEventV1<T>>(
        executor, std::move(opened->stream), std::move(opened->decoder),
        EventMapper<T>(registry_), options);
  }

  /// Opens a stream and yields its raw decoded lines.
  auto watch_lines(http::HttpRequest request, WatchOptions options = {})
      -> task<KubeResult<WatchSubscription<std::string>>> {
    auto opened =
        co_await open_watch(std::move(request), "stream response lines");
    if (!opened) {
      co_return std::unexpected(std::move(opened.error()));
    }
    auto executor = co_await boost::asio::this_coro::executor;
    co_return start_watch<std::string>(
        executor, std::move(opened->stream), std::move(opened->decoder),
        [](std::string &line) -> KubeResult<std::string> {
          return std::move(line);
        },
        options);
  }

  [[nodiscard]] auto registry() const noexcept -> const models::KindRegistry & {
    return registry_;
  }

private:
  struct OpenedStream {
    std::unique_ptr<http::ResponseStream> stream;
    text::LineDecoder decoder;
  };

  auto exchange(http::HttpRequest request, std::string_view action)
      -> task<KubeResult<http::HttpResponse>> {
    const auto method = request.method;
    const auto target = request.target();
    auto response = co_await transport_.send(std::move(request));
    if (!response) {
      log::debug("{} {} failed: {}", method, target,
                 response.error().message());
      co_return std::unexpected(KubeError::transport(
          response.error(), std::format("Request to {}", action)));
    }
    co_return std::move(*response);
  }

  template <typename T>
  auto decode(const http::HttpResponse &response, std::string_view action)
      -> KubeResult<T> {
    std::string diagnostic;
    auto decoded = read_json<T>(response.body, &diagnostic);
    if (!decoded) {
      return std::unexpected(KubeError::stream_protocol(
          std::format("Failed to {}: response body is not valid JSON: {}",
                      action, diagnostic),
          decoded.error()));
    }
    return std::move(*decoded);
  }

  template <typename T>
  auto send_expecting(http::HttpRequest request, std::string_view action)
      -> task<KubeResult<T>> {
    auto response = co_await exchange(std::move(request), action);
    if (!response) {
      co_return std::unexpected(std::move(response.error()));
    }
    if (!http::is_success(response->status)) {
      co_return std::unexpected(
          map_failure(response->status, response->body, action));
    }
    co_return decode<T>(*response, action);
  }

  template <typename T>
  auto send_patch(const PatchDocument &document, http::HttpRequest request)
      -> task<KubeResult<T>> {
    const auto action =
        std::format("patch {} resource", registry_.describe<T>());
    auto body = document.serialize();
    if (!body) {
      co_return std::unexpected(KubeError::stream_protocol(
          std::format("Failed to {}: patch document could not be serialized",
                      action),
          body.error()));
    }
    request.method = http::HttpMethod::PATCH;
    request.set_body(*body, http::kJsonPatchMediaType);
    co_return co_await send_expecting<T>(std::move(request), action);
  }

  template <typename T>
  auto send_resource(const T &resource, http::HttpMethod method,
                     http::HttpRequest request, std::string action)
      -> task<KubeResult<T>> {
    auto body = write_json(resource);
    if (!body) {
      co_return std::unexpected(KubeError::stream_protocol(
          std::format("Failed to {}: resource could not be serialized",
                      action),
          body.error()));
    }
    request.method = method;
    request.set_body(*body, http::kJsonMediaType);
    co_return co_await send_expecting<T>(std::move(request), action);
  }

  auto open_watch(http::HttpRequest request, std::string action)
      -> task<KubeResult<OpenedStream>> {
    request.method = http::HttpMethod::GET;
    const auto target = request.target();
    auto opened = co_await transport_.open_stream(std::move(request));
    if (!opened) {
      co_return std::unexpected(KubeError::transport(
          opened.error(), std::format("Request to {}", action)));
    }
    auto stream = std::move(*opened);

    if (!http::is_success(stream->status())) {
      auto body = co_await http::read_to_end(*stream, options_.max_error_body);
      if (!body) {
        log::debug("Could not read error body of {}: {}", target,
                   body.error().message());
        co_return std::unexpected(map_failure(
            stream->status(), std::optional<models::StatusV1>{}, action));
      }
      co_return std::unexpected(map_failure(stream->status(), *body, action));
    }

    auto content_type = stream->header("Content-Type");
    if (!content_type) {
      co_return std::unexpected(KubeError::stream_protocol(
          std::format("Failed to {}: response has no Content-Type header",
                      action),
          make_error_code(Error::MissingContentType)));
    }
    auto media = http::parse_media_type(*content_type);
    if (!media) {
      co_return std::unexpected(KubeError::stream_protocol(
          std::format("Failed to {}: cannot parse Content-Type '{}'", action,
                      *content_type),
          media.error()));
    }
    const auto charset = http::charset_or_default(*media);
    auto decoder = text::LineDecoder::for_charset(charset);
    if (!decoder) {
      co_return std::unexpected(KubeError::stream_protocol(
          std::format("Failed to {}: unsupported charset '{}'", action,
                      charset),
          decoder.error()));
    }

    log::debug("Watching {} ({})", target, media->type);
    co_return OpenedStream{.stream = std::move(stream),
                           .decoder = std::move(*decoder)};
  }

  Transport &transport_;
  const models::KindRegistry &registry_;
  GatewayOptions options_;
};

} // namespace kubeclient
