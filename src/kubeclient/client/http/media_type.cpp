#include "kubeclient/client/http/media_type.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <ranges>

namespace kubeclient::http {

namespace {

auto trimmed(std::string_view s) -> std::string {
  return boost::algorithm::trim_copy(std::string(s));
}

auto unquote(std::string value) -> std::string {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

} // namespace

auto parse_media_type(std::string_view value) -> Result<MediaType> {
  MediaType out;
  bool first = true;
  for (auto part : value | std::views::split(';')) {
    std::string_view piece(part.begin(), part.end());
    if (first) {
      first = false;
      out.type = boost::algorithm::to_lower_copy(trimmed(piece));
      if (out.type.empty() || out.type.find('/') == std::string::npos) {
        return fail(Error::ParseError);
      }
      continue;
    }

    auto eq = piece.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    auto name = trimmed(piece.substr(0, eq));
    if (boost::algorithm::iequals(name, "charset")) {
      auto charset = unquote(trimmed(piece.substr(eq + 1)));
      if (!charset.empty()) {
        out.charset = std::move(charset);
      }
    }
  }
  if (first) {
    return fail(Error::ParseError);
  }
  return ok(std::move(out));
}

auto charset_or_default(const MediaType &media) -> std::string {
  return media.charset.value_or("utf-8");
}

} // namespace kubeclient::http
