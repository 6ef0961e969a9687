#pragma once

#include "kubeclient/core/error.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace kubeclient {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

// API servers add fields faster than models are regenerated, so unknown keys
// are skipped instead of failing the read.
inline constexpr auto kJsonReadOpts =
    glz::opts{.null_terminated = false, .error_on_unknown_keys = false};

[[nodiscard]] inline auto as_text(std::span<const std::uint8_t> bytes)
    -> std::string_view {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  if (auto ec = glz::read<kJsonReadOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// Read a glaze-described type from JSON text. On failure `diagnostic`, when
/// given, receives glaze's formatted error location.
template <typename T>
[[nodiscard]] auto read_json(std::string_view text,
                             std::string *diagnostic = nullptr) -> Result<T> {
  T out{};
  if (auto ec = glz::read<kJsonReadOpts>(out, text); ec) {
    if (diagnostic) {
      *diagnostic = glz::format_error(ec, text);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(out));
}

template <typename T>
[[nodiscard]] auto read_json(std::span<const std::uint8_t> body,
                             std::string *diagnostic = nullptr) -> Result<T> {
  return read_json<T>(as_text(body), diagnostic);
}

template <typename T>
[[nodiscard]] auto write_json(const T &value) -> Result<std::string> {
  auto out = glz::write_json(value);
  if (!out) {
    return fail(Error::SerializationError);
  }
  return ok(std::move(*out));
}

} // namespace kubeclient
