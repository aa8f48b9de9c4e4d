#pragma once

#include <optional>
#include <torctl/client/defs.hpp>
#include <torctl/net/control_socket.hpp>
#include <torctl/protocol/cookie_path.hpp>

namespace torctl::client {

/**
 * @brief How the daemon's pid is found once the reply is parsed. Unset if
 * the cookie path can't be expanded for this transport.
 */
struct CookiePathLookup final {
  protocol::PidResolver pid_resolver;
  protocol::PidResolverKey key;
};

using CookiePathLookupOpt = std::optional<CookiePathLookup>;

/**
 * @brief Connect the socket, send PROTOCOLINFO, parse the reply and expand
 * the cookie path.
 */
ProtocolInfoResultOrErrorAwait RunQuery(net::ControlSocketPtr socket,
                                        CookiePathLookupOpt lookup,
                                        const QueryOptions& options) noexcept;

}  // namespace torctl::client
