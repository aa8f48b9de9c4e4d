#include <torctl/auth/authenticate.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <torctl/error/error.hpp>
#include <utils/string_utils.hpp>

namespace torctl::auth {

namespace {

constexpr std::string_view kAuthenticateCommand{"AUTHENTICATE"};
constexpr std::string_view kAuthenticateSuccess{"OK"};

namespace fs = std::filesystem;

using CookieOrError = utils::ErrorOr<std::string>;

ErrorAwait SendAuthenticate(net::ControlSocket& socket,
                            std::string command) noexcept {
  if (auto err = co_await socket.Send(command)) {
    co_return err;
  }
  const auto [err, reply] = co_await socket.Recv();
  if (err) {
    co_return err;
  }
  try {
    auto text = reply->ToString();
    if (!reply->IsOk() || text != kAuthenticateSuccess) {
      co_return error::MakeError(error::Error::kAuthenticationRejected,
                                 std::move(text));
    }
  } catch (const std::exception& ex) {
    co_return error::MakeError(error::Error::kAuthenticationRejected,
                               ex.what());
  }
  co_return std::nullopt;
}

CookieOrError ReadCookie(const std::string& cookie_path) noexcept {
  std::error_code ec;
  if (!fs::exists(cookie_path, ec)) {
    return {error::FormatError(error::Error::kMissingCookieFile,
                               "Authentication failed: '{}' doesn't exist",
                               cookie_path),
            std::string{}};
  }
  const auto cookie_size = fs::file_size(cookie_path, ec);
  if (ec) {
    return {error::FormatError(error::Error::kCookieReadFailure,
                               "Unable to read '{}' ({})", cookie_path,
                               ec.message()),
            std::string{}};
  }
  if (cookie_size != kCookieSize) {
    return {error::FormatError(error::Error::kInvalidCookieSize,
                               "Authentication failed: authentication cookie "
                               "'{}' is the wrong size ({} bytes instead of "
                               "{})",
                               cookie_path, cookie_size, kCookieSize),
            std::string{}};
  }
  try {
    std::ifstream cookie_file{cookie_path, std::ios::binary};
    std::string cookie(kCookieSize, '\0');
    if (!cookie_file.read(cookie.data(), kCookieSize)) {
      return {error::FormatError(error::Error::kCookieReadFailure,
                                 "Unable to read '{}'", cookie_path),
              std::string{}};
    }
    return {std::nullopt, std::move(cookie)};
  } catch (const std::exception& ex) {
    return {error::FormatError(error::Error::kCookieReadFailure,
                               "Unable to read '{}' ({})", cookie_path,
                               ex.what()),
            std::string{}};
  }
}

}  // namespace

ErrorAwait AuthenticateNone(net::ControlSocket& socket) noexcept {
  co_return co_await SendAuthenticate(socket,
                                      std::string{kAuthenticateCommand});
}

ErrorAwait AuthenticatePassword(net::ControlSocket& socket,
                                std::string_view password) noexcept {
  std::string command;
  try {
    command = fmt::format("{} \"{}\"", kAuthenticateCommand,
                          utils::EscapeQuotes(password));
  } catch (const std::exception& ex) {
    co_return error::MakeError(error::Error::kAuthenticationRejected,
                               ex.what());
  }
  co_return co_await SendAuthenticate(socket, std::move(command));
}

ErrorAwait AuthenticateCookie(net::ControlSocket& socket,
                              std::string_view cookie_path) noexcept {
  auto [err, cookie] = ReadCookie(std::string{cookie_path});
  if (err) {
    co_return err;
  }
  std::string command;
  try {
    command =
        fmt::format("{} {}", kAuthenticateCommand, utils::HexEncode(cookie));
  } catch (const std::exception& ex) {
    co_return error::MakeError(error::Error::kCookieReadFailure, ex.what());
  }
  co_return co_await SendAuthenticate(socket, std::move(command));
}

ErrorAwait Authenticate(net::ControlSocket& socket,
                        const protocol::ProtocolInfo& info,
                        const AuthOptions& auth_options) noexcept {
  if (auth_options.NoneAuth() && info.HasAuthMethod(AuthMethod::kNone)) {
    co_return co_await AuthenticateNone(socket);
  }
  if (const auto& cookie_auth = auth_options.CookieAuth();
      cookie_auth && info.HasAuthMethod(AuthMethod::kCookie)) {
    const auto& cookie_path =
        cookie_auth->cookie_path ? cookie_auth->cookie_path : info.CookiePath();
    if (cookie_path) {
      co_return co_await AuthenticateCookie(socket, *cookie_path);
    }
  }
  if (const auto& password_auth = auth_options.PasswordAuth();
      password_auth && info.HasAuthMethod(AuthMethod::kPassword)) {
    co_return co_await AuthenticatePassword(socket, password_auth->password);
  }
  co_return error::MakeError(error::Error::kNoAuthMethod);
}

}  // namespace torctl::auth
