#pragma once

#include <string_view>
#include <torctl/auth/auth_options.hpp>
#include <torctl/common/api_macro.hpp>
#include <torctl/common/asio.hpp>
#include <torctl/net/control_socket.hpp>
#include <torctl/protocol/protocol_info.hpp>

namespace torctl::auth {

// Exact size of a valid authentication cookie.
constexpr size_t kCookieSize{32};

/**
 * @brief Authenticate to a control socket that requires no credentials.
 *
 * @param socket connected control socket.
 * @return ErrorAwait asio::awaitable with Error::kAuthenticationRejected
 * carrying the reply if it isn't "OK", or a transport error.
 */
[[nodiscard]] TORCTL_API ErrorAwait
AuthenticateNone(net::ControlSocket& socket) noexcept;

/**
 * @brief Authenticate with the password the daemon's hashed control password
 * was made from. Quotes in the password are escaped.
 *
 * @param socket connected control socket.
 * @param password plaintext password.
 * @return ErrorAwait asio::awaitable with Error::kAuthenticationRejected
 * carrying the reply if it isn't "OK", or a transport error.
 */
[[nodiscard]] TORCTL_API ErrorAwait AuthenticatePassword(
    net::ControlSocket& socket, std::string_view password) noexcept;

/**
 * @brief Authenticate with the contents of the daemon's cookie file. Nothing
 * is sent if the file is missing or isn't exactly kCookieSize bytes.
 *
 * @param socket connected control socket.
 * @param cookie_path path to the authentication cookie.
 * @return ErrorAwait asio::awaitable with Error::kMissingCookieFile,
 * Error::kInvalidCookieSize, Error::kCookieReadFailure,
 * Error::kAuthenticationRejected or a transport error.
 */
[[nodiscard]] TORCTL_API ErrorAwait AuthenticateCookie(
    net::ControlSocket& socket, std::string_view cookie_path) noexcept;

/**
 * @brief Authenticate with the first method the daemon advertises that the
 * options can satisfy, trying none, cookie, then password. A cookie attempt
 * needs a cookie path, either from the options or from PROTOCOLINFO.
 *
 * @param socket connected control socket.
 * @param info reply to PROTOCOLINFO received on the same socket.
 * @param auth_options methods the caller accepts and their credentials.
 * @return ErrorAwait asio::awaitable with Error::kNoAuthMethod if no method
 * qualifies, or the error of the selected handshake.
 */
[[nodiscard]] TORCTL_API ErrorAwait
Authenticate(net::ControlSocket& socket, const protocol::ProtocolInfo& info,
             const AuthOptions& auth_options) noexcept;

}  // namespace torctl::auth
