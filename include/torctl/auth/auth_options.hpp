#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <torctl/common/api_macro.hpp>
#include <torctl/protocol/protocol_info.hpp>

namespace torctl::auth {

using protocol::AuthMethod;

struct TORCTL_API NoneAuthOptions final {};

/**
 * @brief Parameters for AuthMethod::kPassword authentication.
 */
struct TORCTL_API PasswordAuthOptions final {
  std::string password;
};

/**
 * @brief Parameters for AuthMethod::kCookie authentication.
 */
struct TORCTL_API CookieAuthOptions final {
  // Cookie file to use instead of the one reported by PROTOCOLINFO.
  std::optional<std::string> cookie_path;
};

using NoneAuthOptionsOpt = std::optional<NoneAuthOptions>;
using PasswordAuthOptionsOpt = std::optional<PasswordAuthOptions>;
using CookieAuthOptionsOpt = std::optional<CookieAuthOptions>;

namespace detail {

template <AuthMethod>
inline constexpr bool kUnsupportedMethod{false};

}  // namespace detail

/**
 * @brief Authentication methods the controller is willing to use, with their
 * credentials.
 */
class TORCTL_API AuthOptions final {
 public:
  /**
   * @brief Add authentication method and its parameters.
   *
   * @tparam Method authentication method type.
   * @tparam Args parameters for selected authentication method.
   * @param args parameters for selected authentication method. The password
   * for auth by password, an optional cookie path overriding the one the
   * daemon reports for auth by cookie, 0 arguments if no authentication. For
   * example:
   * AddAuthMethod<AuthMethod::kPassword>("password");
   * AddAuthMethod<AuthMethod::kCookie>();
   * AddAuthMethod<AuthMethod::kNone>();
   * @return AuthOptions&
   */
  template <AuthMethod Method, typename... Args>
  AuthOptions& AddAuthMethod(Args&&... args) {
    if constexpr (Method == AuthMethod::kNone) {
      static_assert(sizeof...(args) == 0, "Incorrect number of arguments");
      if (!none_auth_) {
        ++size_;
      }
      none_auth_ = NoneAuthOptions{};
    } else if constexpr (Method == AuthMethod::kPassword) {
      static_assert(sizeof...(args) == 1, "Incorrect number of arguments");
      if (!password_auth_) {
        ++size_;
      }
      password_auth_ = PasswordAuthOptions{std::string{args...}};
    } else if constexpr (Method == AuthMethod::kCookie) {
      static_assert(sizeof...(args) <= 1, "Incorrect number of arguments");
      if (!cookie_auth_) {
        ++size_;
      }
      if constexpr (sizeof...(args) == 0) {
        cookie_auth_ = CookieAuthOptions{};
      } else {
        cookie_auth_ = CookieAuthOptions{std::string{args...}};
      }
    } else {
      static_assert(detail::kUnsupportedMethod<Method>,
                    "Unknown auth method");
    }
    return *this;
  }

  /**
   * @brief AuthMethod::kNone parameters if AuthMethod::kNone is added.
   */
  const NoneAuthOptionsOpt& NoneAuth() const noexcept { return none_auth_; }

  /**
   * @brief AuthMethod::kPassword parameters if AuthMethod::kPassword is
   * added.
   */
  const PasswordAuthOptionsOpt& PasswordAuth() const noexcept {
    return password_auth_;
  }

  /**
   * @brief AuthMethod::kCookie parameters if AuthMethod::kCookie is added.
   */
  const CookieAuthOptionsOpt& CookieAuth() const noexcept {
    return cookie_auth_;
  }

  /**
   * @brief Number of added authentication methods.
   */
  uint8_t Size() const noexcept { return size_; }

 private:
  uint8_t size_{};
  NoneAuthOptionsOpt none_auth_;
  PasswordAuthOptionsOpt password_auth_;
  CookieAuthOptionsOpt cookie_auth_;
};

/**
 * @brief AuthOptions accepting the methods that need no credentials from the
 * caller: none and cookie.
 */
[[nodiscard]] TORCTL_API AuthOptions MakeAuthOptions() noexcept;

}  // namespace torctl::auth
