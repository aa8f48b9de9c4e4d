#include <client/query.hpp>
#include <torctl/protocol/protocol_info.hpp>
#include <utils/logger.hpp>

namespace torctl::client {

namespace {

ProtocolInfoResultOrError Fail(net::ControlSocket& socket,
                               error::ControlError err) noexcept {
  socket.Close();
  return std::make_pair(std::move(err), std::nullopt);
}

}  // namespace

ProtocolInfoResultOrErrorAwait RunQuery(net::ControlSocketPtr socket,
                                        CookiePathLookupOpt lookup,
                                        const QueryOptions& options) noexcept {
  if (auto err = co_await socket->Connect()) {
    co_return Fail(*socket, std::move(*err));
  }
  if (auto err = co_await socket->Send(protocol::kProtocolInfoCommand)) {
    co_return Fail(*socket, std::move(*err));
  }
  auto [recv_err, reply] = co_await socket->Recv();
  if (recv_err) {
    co_return Fail(*socket, std::move(*recv_err));
  }
  auto [parse_err, info] = protocol::ParseProtocolInfo(
      std::move(*reply), protocol::ParseContext{options.logger, options.resolver});
  if (parse_err) {
    co_return Fail(*socket, std::move(*parse_err));
  }
  if (lookup) {
    protocol::ExpandCookiePath(*info, lookup->pid_resolver, lookup->key,
                               options.resolver.get(), options.logger);
  }
  TORCTL_LOG(options.logger, debug, "PROTOCOLINFO received from {}",
             socket->Describe());
  ProtocolInfoResult result{std::move(*info), nullptr};
  if (options.keep_socket) {
    result.socket = std::move(socket);
  } else {
    socket->Close();
  }
  co_return std::make_pair(std::nullopt, std::move(result));
}

}  // namespace torctl::client
