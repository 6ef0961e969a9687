#pragma once

#include <boost/algorithm/string/predicate.hpp>

#include <cctype>
#include <cstddef>
#include <string_view>

namespace kubeclient {

// HTTP field names compare case-insensitively (RFC 9110 section 5.1).
struct CaseInsensitiveHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    std::size_t h = 14695981039346656037ULL;
    for (char c : sv) {
      h ^= static_cast<std::size_t>(
          std::tolower(static_cast<unsigned char>(c)));
      h *= 1099511628211ULL;
    }
    return h;
  }
};

struct CaseInsensitiveEqual {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view lhs,
                                std::string_view rhs) const noexcept -> bool {
    return boost::algorithm::iequals(lhs, rhs);
  }
};

} // namespace kubeclient
