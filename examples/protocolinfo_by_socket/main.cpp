#include <utility>

#include <boost/asio.hpp>
#include <torctl/client/client.hpp>
#include <torctl/utils/logger_fwd.hpp>
#include <iostream>

namespace asio = boost::asio;

constexpr std::string_view kControlSocketPath{"/var/run/tor/control"};

// Usage: protocolinfo_by_socket [path]
int main(int argc, char* argv[]) {
  try {
    std::string path{argc > 1 ? argv[1] : kControlSocketPath};
    torctl::client::QueryOptions options;
    options.logger = torctl::logger::MakeStdoutLogger(torctl::logger::info);

    asio::io_context io_context{1};
    // Callback flavor of the query.
    torctl::client::AsyncGetProtocolInfoBySocket(
        io_context.get_executor(), std::move(path), std::move(options),
        [](const torctl::error::ControlErrorOpt& err,
           torctl::client::ProtocolInfoResultOpt result) {
          if (err) {
            std::cerr << err->Msg() << std::endl;
            return;
          }
          const auto& info = result->info;
          std::cout << "protocol version: " << info.ProtocolVersion()
                    << std::endl;
          if (info.TorVersion()) {
            std::cout << "tor version: " << info.TorVersion()->ToString()
                      << std::endl;
          }
          for (const auto method : info.AuthMethods()) {
            std::cout << "auth method: " << torctl::protocol::ToString(method)
                      << std::endl;
          }
          if (info.CookiePath()) {
            std::cout << "cookie file: " << *info.CookiePath() << std::endl;
          }
        });
    io_context.run();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Exception: " << ex.what() << std::endl;
    return 1;
  }
}
