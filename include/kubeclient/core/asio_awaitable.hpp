#pragma once

#include "kubeclient/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <system_error>
#include <tuple>

namespace kubeclient {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

// operation_aborted is folded into Error::Cancelled so callers can tell a
// cancelled read apart from a broken connection without touching Asio.
[[nodiscard]] inline auto to_error_code(const boost::system::error_code &ec)
    -> std::error_code {
  if (ec == boost::asio::error::operation_aborted) {
    return make_error_code(Error::Cancelled);
  }
  if (ec == boost::asio::error::timed_out) {
    return make_error_code(Error::Timeout);
  }
  return ec;
}

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(to_error_code(ec));
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(to_error_code(ec));
  }
  return ok();
}

} // namespace kubeclient
