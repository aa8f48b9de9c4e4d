#include <utility>

#include <boost/asio.hpp>
#include <torctl/client/client.hpp>
#include <torctl/utils/logger_fwd.hpp>
#include <cstdlib>
#include <iostream>

namespace asio = boost::asio;

constexpr std::string_view kControlAddress{"127.0.0.1"};
constexpr unsigned short kControlPort{9051};

void Print(const torctl::protocol::ProtocolInfo& info) {
  std::cout << "protocol version: " << info.ProtocolVersion() << std::endl;
  if (info.TorVersion()) {
    std::cout << "tor version: " << info.TorVersion()->ToString() << std::endl;
  }
  std::cout << "auth methods:";
  for (const auto method : info.AuthMethods()) {
    std::cout << ' ' << torctl::protocol::ToString(method);
  }
  for (const auto& method : info.UnknownAuthMethods()) {
    std::cout << ' ' << method << "(unknown)";
  }
  std::cout << std::endl;
  if (info.CookiePath()) {
    std::cout << "cookie file: " << *info.CookiePath() << std::endl;
  }
}

asio::awaitable<void> Query(std::string address, unsigned short port) {
  torctl::client::QueryOptions options;
  options.logger = torctl::logger::MakeStdoutLogger(torctl::logger::debug);
  const auto [err, result] = co_await torctl::client::GetProtocolInfoByPort(
      std::move(address), port, std::move(options));
  if (err) {
    std::cerr << err->Msg() << std::endl;
    co_return;
  }
  Print(result->info);
}

// Usage: protocolinfo_by_port [address] [port]
int main(int argc, char* argv[]) {
  try {
    std::string address{argc > 1 ? argv[1] : kControlAddress};
    const auto port = argc > 2
                          ? static_cast<unsigned short>(std::atoi(argv[2]))
                          : kControlPort;
    asio::io_context io_context{1};
    co_spawn(io_context, Query(std::move(address), port), asio::detached);
    io_context.run();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Exception: " << ex.what() << std::endl;
    return 1;
  }
}
