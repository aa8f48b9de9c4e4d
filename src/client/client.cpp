#include <torctl/client/client.hpp>
#include <client/query.hpp>

namespace torctl::client {

namespace {

VoidAwait RunWithHandler(ProtocolInfoResultOrErrorAwait query,
                         ProtocolInfoHandler handler) {
  auto [err, result] = co_await std::move(query);
  handler(err, std::move(result));
}

}  // namespace

ProtocolInfoResultOrErrorAwait GetProtocolInfoByPort(
    std::string address, unsigned short port, QueryOptions options) noexcept {
  try {
    const auto executor = co_await asio::this_coro::executor;
    CookiePathLookupOpt lookup;
    if (address == kDefaultAddress) {
      lookup = CookiePathLookup{protocol::PidResolver::kByPort, port};
    }
    auto socket = std::make_unique<net::ControlPort>(
        executor, std::move(address), port, options.timeout_ms);
    co_return co_await RunQuery(std::move(socket), std::move(lookup), options);
  } catch (const std::exception& ex) {
    co_return std::make_pair(
        error::MakeError(error::Error::kInternalError, ex.what()),
        std::nullopt);
  }
}

ProtocolInfoResultOrErrorAwait GetProtocolInfoBySocket(
    std::string path, QueryOptions options) noexcept {
  try {
    const auto executor = co_await asio::this_coro::executor;
    CookiePathLookupOpt lookup{
        CookiePathLookup{protocol::PidResolver::kBySocketFile, path}};
    auto socket = std::make_unique<net::ControlSocketFile>(
        executor, std::move(path), options.timeout_ms);
    co_return co_await RunQuery(std::move(socket), std::move(lookup), options);
  } catch (const std::exception& ex) {
    co_return std::make_pair(
        error::MakeError(error::Error::kInternalError, ex.what()),
        std::nullopt);
  }
}

void AsyncGetProtocolInfoByPort(const asio::any_io_executor& executor,
                                std::string address, unsigned short port,
                                QueryOptions options,
                                ProtocolInfoHandler handler) {
  asio::co_spawn(
      executor,
      RunWithHandler(
          GetProtocolInfoByPort(std::move(address), port, std::move(options)),
          std::move(handler)),
      asio::detached);
}

void AsyncGetProtocolInfoBySocket(const asio::any_io_executor& executor,
                                  std::string path, QueryOptions options,
                                  ProtocolInfoHandler handler) {
  asio::co_spawn(
      executor,
      RunWithHandler(GetProtocolInfoBySocket(std::move(path), std::move(options)),
                     std::move(handler)),
      asio::detached);
}

}  // namespace torctl::client
