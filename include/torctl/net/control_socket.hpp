#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <torctl/common/api_macro.hpp>
#include <torctl/common/asio.hpp>
#include <torctl/protocol/control_message.hpp>
#include <torctl/utils/non_copyable.hpp>

namespace torctl::net {

using MessageOpt = std::optional<protocol::ControlMessage>;
using MessageOrError = utils::ErrorOr<MessageOpt>;
using MessageOrErrorAwait = asio::awaitable<MessageOrError>;

// Default timeout in milliseconds for a single connect, send or receive.
constexpr size_t kDefaultTimeout{5000};

/**
 * @brief Connection to the daemon's control interface. Speaks whole
 * commands and replies, not reentrant: a command must not be sent before the
 * reply to the previous one has been received.
 */
class TORCTL_API ControlSocket : utils::NonCopyable {
 public:
  virtual ~ControlSocket() = default;

  /**
   * @brief Connect to the control interface.
   *
   * @return ErrorAwait asio::awaitable with an error if the connection
   * can't be established.
   */
  virtual ErrorAwait Connect() noexcept = 0;

  /**
   * @brief Send a command. CRLF is appended.
   *
   * @param command command without line terminator, e.g. "PROTOCOLINFO 1".
   * @return ErrorAwait asio::awaitable with an error if sending failed.
   */
  virtual ErrorAwait Send(std::string_view command) noexcept = 0;

  /**
   * @brief Receive one complete reply.
   *
   * @return MessageOrErrorAwait asio::awaitable with the reply, or
   * Error::kSocketClosed if the daemon closed the connection,
   * Error::kMalformedReply if the reply isn't properly framed,
   * Error::kTimeoutExpired if it didn't arrive in time.
   */
  virtual MessageOrErrorAwait Recv() noexcept = 0;

  virtual void Close() noexcept = 0;

  /**
   * @brief Check if the socket is connected and hasn't been closed by either
   * side.
   */
  virtual bool IsAlive() const noexcept = 0;

  /**
   * @brief Address of the control interface, for diagnostics.
   */
  virtual std::string Describe() const = 0;
};

using ControlSocketPtr = std::unique_ptr<ControlSocket>;

/**
 * @brief Control interface reached over TCP.
 */
class TORCTL_API ControlPort final : public ControlSocket {
 public:
  /**
   * @param executor executor the socket runs on.
   * @param address IPv4 or IPv6 address of the control port.
   * @param port control port.
   * @param timeout timeout in milliseconds for each operation, 0 to disable.
   */
  ControlPort(const asio::any_io_executor& executor, std::string address,
              unsigned short port, size_t timeout = kDefaultTimeout) noexcept;
  ~ControlPort() override;

  ErrorAwait Connect() noexcept override;
  ErrorAwait Send(std::string_view command) noexcept override;
  MessageOrErrorAwait Recv() noexcept override;
  void Close() noexcept override;
  bool IsAlive() const noexcept override;
  std::string Describe() const override;

  const std::string& Address() const noexcept { return address_; }
  unsigned short Port() const noexcept { return port_; }

 private:
  std::string address_;
  unsigned short port_;
  size_t timeout_;
  tcp::socket socket_;
  asio::streambuf buf_;
  bool alive_{false};
};

/**
 * @brief Control interface reached over a unix domain socket.
 */
class TORCTL_API ControlSocketFile final : public ControlSocket {
 public:
  /**
   * @param executor executor the socket runs on.
   * @param path path of the control socket file.
   * @param timeout timeout in milliseconds for each operation, 0 to disable.
   */
  ControlSocketFile(const asio::any_io_executor& executor, std::string path,
                    size_t timeout = kDefaultTimeout) noexcept;
  ~ControlSocketFile() override;

  ErrorAwait Connect() noexcept override;
  ErrorAwait Send(std::string_view command) noexcept override;
  MessageOrErrorAwait Recv() noexcept override;
  void Close() noexcept override;
  bool IsAlive() const noexcept override;
  std::string Describe() const override;

  const std::string& Path() const noexcept { return path_; }

 private:
  std::string path_;
  size_t timeout_;
  local::socket socket_;
  asio::streambuf buf_;
  bool alive_{false};
};

}  // namespace torctl::net
