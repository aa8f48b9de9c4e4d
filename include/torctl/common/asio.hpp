#pragma once

#include <memory>
#include <utility>

#include <boost/asio.hpp>
#include <torctl/utils/status.hpp>

namespace torctl {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using local = asio::local::stream_protocol;

using IoContextPtr = std::shared_ptr<asio::io_context>;

using ErrorCode = boost::system::error_code;

using VoidAwait = asio::awaitable<void>;
using BoolAwait = asio::awaitable<bool>;
using ErrorAwait = asio::awaitable<error::ControlErrorOpt>;

template <typename T>
using ErrorOrAwait = asio::awaitable<utils::ErrorOr<T>>;

}  // namespace torctl
