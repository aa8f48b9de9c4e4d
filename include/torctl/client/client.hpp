#pragma once

#include <string>
#include <torctl/client/defs.hpp>
#include <torctl/common/api_macro.hpp>
#include <torctl/common/asio.hpp>

namespace torctl::client {

/**
 * @brief Query PROTOCOLINFO over a control port. A relative cookie path is
 * expanded by the pid listening on the port, if the address is 127.0.0.1.
 * The socket is closed on any error.
 *
 * @param address address of the control port.
 * @param port control port.
 * @param options query settings.
 * @return ProtocolInfoResultOrErrorAwait asio::awaitable with the parsed
 * reply, or a transport or parse error.
 */
[[nodiscard]] TORCTL_API ProtocolInfoResultOrErrorAwait GetProtocolInfoByPort(
    std::string address = std::string{kDefaultAddress},
    unsigned short port = kDefaultPort, QueryOptions options = {}) noexcept;

/**
 * @brief Query PROTOCOLINFO over a control socket file. A relative cookie
 * path is expanded by the pid holding the socket file open. The socket is
 * closed on any error.
 *
 * @param path path of the control socket file.
 * @param options query settings.
 * @return ProtocolInfoResultOrErrorAwait asio::awaitable with the parsed
 * reply, or a transport or parse error.
 */
[[nodiscard]] TORCTL_API ProtocolInfoResultOrErrorAwait
GetProtocolInfoBySocket(std::string path = std::string{kDefaultSocketPath},
                        QueryOptions options = {}) noexcept;

/**
 * @brief Start an asynchronous PROTOCOLINFO query over a control port.
 *
 * @param executor executor the query runs on.
 * @param address address of the control port.
 * @param port control port.
 * @param options query settings.
 * @param handler the handler to be called when the query completes.
 * @throws std::exception
 */
TORCTL_API void AsyncGetProtocolInfoByPort(
    const asio::any_io_executor& executor, std::string address,
    unsigned short port, QueryOptions options, ProtocolInfoHandler handler);

/**
 * @brief Start an asynchronous PROTOCOLINFO query over a control socket file.
 *
 * @param executor executor the query runs on.
 * @param path path of the control socket file.
 * @param options query settings.
 * @param handler the handler to be called when the query completes.
 * @throws std::exception
 */
TORCTL_API void AsyncGetProtocolInfoBySocket(
    const asio::any_io_executor& executor, std::string path,
    QueryOptions options, ProtocolInfoHandler handler);

}  // namespace torctl::client
