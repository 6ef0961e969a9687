#pragma once

#include "kubeclient/core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kubeclient::http {

struct MediaType {
  std::string type; // lower-cased "type/subtype"
  std::optional<std::string> charset;

  auto operator==(const MediaType &) const -> bool = default;
};

/// Parses a Content-Type value such as `application/json; charset="UTF-8"`.
/// Parameter names and the type are case-insensitive; the charset value keeps
/// its spelling with surrounding quotes removed.
[[nodiscard]] auto parse_media_type(std::string_view value) -> Result<MediaType>;

/// Charset used to decode a body: the declared one, or UTF-8.
[[nodiscard]] auto charset_or_default(const MediaType &media) -> std::string;

} // namespace kubeclient::http
