#include <utility>

#include <boost/asio.hpp>
#include <torctl/auth/authenticate.hpp>
#include <torctl/client/client.hpp>
#include <torctl/utils/logger_fwd.hpp>
#include <iostream>

namespace asio = boost::asio;

constexpr std::string_view kControlAddress{"127.0.0.1"};
constexpr unsigned short kControlPort{9051};
constexpr size_t kTimeout{10000};

asio::awaitable<void> Authenticate(std::string password) noexcept {
  torctl::client::QueryOptions options;
  options.keep_socket = true;
  options.timeout_ms = kTimeout;
  options.logger = torctl::logger::MakeStdoutLogger(torctl::logger::info);

  // Ask the daemon which methods it accepts, keeping the connection open.
  const auto [err, result] = co_await torctl::client::GetProtocolInfoByPort(
      std::string{kControlAddress}, kControlPort, std::move(options));
  if (err) {
    std::cerr << err->Msg() << std::endl;
    co_return;
  }

  // No authentication or the cookie file are tried first.
  auto auth_options = torctl::auth::MakeAuthOptions();
  if (!password.empty()) {
    auth_options.AddAuthMethod<torctl::auth::AuthMethod::kPassword>(password);
  }
  // or
  // auth_options.AddAuthMethod<torctl::auth::AuthMethod::kCookie>(
  // "/var/lib/tor/control_auth_cookie"); to override the cookie path.

  if (const auto auth_err = co_await torctl::auth::Authenticate(
          *result->socket, result->info, auth_options)) {
    std::cerr << auth_err->Msg() << std::endl;
    co_return;
  }
  std::cout << "Authenticated to " << result->socket->Describe() << std::endl;
}

// Usage: authenticate [password]
int main(int argc, char* argv[]) {
  try {
    asio::io_context io_context{1};
    co_spawn(io_context, Authenticate(argc > 1 ? argv[1] : ""),
             asio::detached);
    io_context.run();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Exception: " << ex.what() << std::endl;
    return 1;
  }
}
