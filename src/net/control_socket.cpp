#include <torctl/net/control_socket.hpp>
#include <fmt/core.h>
#include <net/io.hpp>

namespace torctl::net {

error::ControlError MakeIoError(const ErrorCode& err, bool timeout_expired,
                                std::string hdr) noexcept {
  if (timeout_expired) {
    return error::MakeError(error::Error::kTimeoutExpired, std::move(hdr));
  }
  if (err == asio::error::eof || err == asio::error::connection_reset) {
    return error::MakeError(error::Error::kSocketClosed, std::move(hdr));
  }
  return error::MakeError(err, std::move(hdr));
}

namespace {

bool IsClosedByPeer(const error::ControlErrorOpt& err) noexcept {
  return err && (err->Is(error::Error::kSocketClosed) ||
                 err->Is(error::Error::kTimeoutExpired));
}

}  // namespace

ControlPort::ControlPort(const asio::any_io_executor& executor,
                         std::string address, unsigned short port,
                         size_t timeout) noexcept
    : address_{std::move(address)},
      port_{port},
      timeout_{timeout},
      socket_{executor},
      buf_{kMaxLineLength + kCrlf.size()} {}

ControlPort::~ControlPort() { Close(); }

ErrorAwait ControlPort::Connect() noexcept {
  ErrorCode err;
  const auto addr = asio::ip::make_address(address_, err);
  if (err) {
    co_return error::MakeError(err, "Invalid control port address " + address_);
  }
  if (auto connect_err =
          co_await net::Connect(socket_, tcp::endpoint{addr, port_}, timeout_,
                                Describe())) {
    co_return connect_err;
  }
  alive_ = true;
  co_return std::nullopt;
}

ErrorAwait ControlPort::Send(std::string_view command) noexcept {
  auto err = co_await net::Send(socket_, command, timeout_);
  if (IsClosedByPeer(err)) {
    alive_ = false;
  }
  co_return err;
}

MessageOrErrorAwait ControlPort::Recv() noexcept {
  auto res = co_await net::Recv(socket_, buf_, timeout_);
  if (IsClosedByPeer(res.first)) {
    alive_ = false;
  }
  co_return res;
}

void ControlPort::Close() noexcept {
  alive_ = false;
  net::Stop(socket_);
}

bool ControlPort::IsAlive() const noexcept {
  return alive_ && socket_.is_open();
}

std::string ControlPort::Describe() const {
  if (address_.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", address_, port_);
  }
  return fmt::format("{}:{}", address_, port_);
}

ControlSocketFile::ControlSocketFile(const asio::any_io_executor& executor,
                                     std::string path, size_t timeout) noexcept
    : path_{std::move(path)},
      timeout_{timeout},
      socket_{executor},
      buf_{kMaxLineLength + kCrlf.size()} {}

ControlSocketFile::~ControlSocketFile() { Close(); }

ErrorAwait ControlSocketFile::Connect() noexcept {
  if (auto connect_err = co_await net::Connect(
          socket_, local::endpoint{path_}, timeout_, Describe())) {
    co_return connect_err;
  }
  alive_ = true;
  co_return std::nullopt;
}

ErrorAwait ControlSocketFile::Send(std::string_view command) noexcept {
  auto err = co_await net::Send(socket_, command, timeout_);
  if (IsClosedByPeer(err)) {
    alive_ = false;
  }
  co_return err;
}

MessageOrErrorAwait ControlSocketFile::Recv() noexcept {
  auto res = co_await net::Recv(socket_, buf_, timeout_);
  if (IsClosedByPeer(res.first)) {
    alive_ = false;
  }
  co_return res;
}

void ControlSocketFile::Close() noexcept {
  alive_ = false;
  net::Stop(socket_);
}

bool ControlSocketFile::IsAlive() const noexcept {
  return alive_ && socket_.is_open();
}

std::string ControlSocketFile::Describe() const { return path_; }

}  // namespace torctl::net
