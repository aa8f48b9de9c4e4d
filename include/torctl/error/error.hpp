#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <torctl/common/api_macro.hpp>

namespace torctl::error {

enum class TORCTL_API Error {
  kSucceeded = 0,
  kMalformedReply,
  kMissingCookieFile,
  kInvalidCookieSize,
  kCookieReadFailure,
  kAuthenticationRejected,
  kNoAuthMethod,
  kInvalidVersion,
  kSocketClosed,
  kTimeoutExpired,
  kInternalError,
};

TORCTL_API boost::system::error_code make_error_code(Error err) noexcept;

}  // namespace torctl::error

namespace boost::system {

template <>
struct is_error_code_enum<torctl::error::Error> : std::true_type {};

}  // namespace boost::system
