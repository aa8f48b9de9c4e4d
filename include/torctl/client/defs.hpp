#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <torctl/common/api_macro.hpp>
#include <torctl/common/asio.hpp>
#include <torctl/net/control_socket.hpp>
#include <torctl/protocol/protocol_info.hpp>
#include <torctl/system/process.hpp>
#include <torctl/utils/logger_fwd.hpp>

namespace torctl::client {

constexpr std::string_view kDefaultAddress{"127.0.0.1"};
constexpr unsigned short kDefaultPort{9051};
constexpr std::string_view kDefaultSocketPath{"/var/run/tor/control"};

/**
 * @brief Settings of a PROTOCOLINFO query.
 */
struct TORCTL_API QueryOptions final {
  // Hand the connected socket back with the result instead of closing it, so
  // that it can be used to authenticate.
  bool keep_socket{false};
  // Timeout in milliseconds for each connect, send and receive. 0 disables
  // it.
  size_t timeout_ms{net::kDefaultTimeout};
  // Receives the non-fatal events of the query.
  logger::Logger logger;
  // Source of pid and working directory information for cookie path
  // expansion.
  std::reference_wrapper<const system::ProcessResolver> resolver{
      system::GetSystemProcessResolver()};
};

/**
 * @brief Result of a PROTOCOLINFO query. The socket is set only if
 * QueryOptions::keep_socket was requested.
 */
struct TORCTL_API ProtocolInfoResult final {
  protocol::ProtocolInfo info;
  net::ControlSocketPtr socket;
};

using ProtocolInfoResultOpt = std::optional<ProtocolInfoResult>;
using ProtocolInfoResultOrError = utils::ErrorOr<ProtocolInfoResultOpt>;
using ProtocolInfoResultOrErrorAwait =
    asio::awaitable<ProtocolInfoResultOrError>;

using ProtocolInfoHandler = std::function<void(
    const error::ControlErrorOpt& err, ProtocolInfoResultOpt result)>;

}  // namespace torctl::client
