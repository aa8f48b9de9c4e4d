#pragma once

#include <string>
#include <string_view>
#include <torctl/common/asio.hpp>
#include <torctl/error/control_error.hpp>
#include <torctl/net/control_socket.hpp>
#include <net/reply_assembler.hpp>
#include <utils/timeout.hpp>

namespace torctl::net {

constexpr std::string_view kCrlf{"\r\n"};

error::ControlError MakeIoError(const ErrorCode& err, bool timeout_expired,
                                std::string hdr) noexcept;

template <typename Socket>
void Stop(Socket& socket) noexcept {
  try {
    ErrorCode ec;
    socket.shutdown(Socket::shutdown_both, ec);
    socket.close(ec);
  } catch (const std::exception&) {
  }
}

template <typename Socket>
ErrorAwait Connect(Socket& socket, const typename Socket::endpoint_type& ep,
                   size_t timeout, std::string description) noexcept {
  try {
    ErrorCode err;
    utils::Deadline deadline{socket, timeout};
    co_await socket.async_connect(
        ep, asio::redirect_error(asio::use_awaitable, err));
    if (err) {
      co_return MakeIoError(err, deadline.Expired(),
                            "Error connecting to " + description);
    }
    co_return std::nullopt;
  } catch (const std::exception& ex) {
    co_return error::MakeError(error::Error::kInternalError, ex.what());
  }
}

template <typename Socket>
ErrorAwait Send(Socket& socket, std::string_view command,
                size_t timeout) noexcept {
  try {
    std::string data{command};
    data.append(kCrlf);
    ErrorCode err;
    utils::Deadline deadline{socket, timeout};
    co_await asio::async_write(socket, asio::buffer(data),
                               asio::redirect_error(asio::use_awaitable, err));
    if (err) {
      co_return MakeIoError(err, deadline.Expired(),
                            "Error writing to control socket");
    }
    co_return std::nullopt;
  } catch (const std::exception& ex) {
    co_return error::MakeError(error::Error::kInternalError, ex.what());
  }
}

template <typename Socket>
MessageOrErrorAwait Recv(Socket& socket, asio::streambuf& buf,
                         size_t timeout) noexcept {
  try {
    ReplyAssembler assembler;
    utils::Deadline deadline{socket, timeout};
    for (;;) {
      ErrorCode err;
      const auto size = co_await asio::async_read_until(
          socket, buf, kCrlf, asio::redirect_error(asio::use_awaitable, err));
      if (err == asio::error::not_found) {
        co_return std::make_pair(
            error::FormatError(error::Error::kMalformedReply,
                               "Reply line exceeds {} bytes", kMaxLineLength),
            std::nullopt);
      }
      if (err) {
        co_return std::make_pair(
            MakeIoError(err, deadline.Expired(),
                        "Error reading from control socket"),
            std::nullopt);
      }
      const auto begin = asio::buffers_begin(buf.data());
      const std::string line{begin, begin + (size - kCrlf.size())};
      buf.consume(size);
      const auto [feed_err, completed] = assembler.Feed(line);
      if (feed_err) {
        co_return std::make_pair(feed_err, std::nullopt);
      }
      if (completed) {
        co_return std::make_pair(std::nullopt, assembler.Release());
      }
    }
  } catch (const std::exception& ex) {
    co_return std::make_pair(
        error::MakeError(error::Error::kInternalError, ex.what()),
        std::nullopt);
  }
}

}  // namespace torctl::net
