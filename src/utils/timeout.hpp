#pragma once

#include <chrono>
#include <memory>
#include <torctl/common/asio.hpp>
#include <torctl/utils/non_copyable.hpp>

namespace torctl::utils {

/**
 * @brief Cancels the pending operations of a socket if they don't complete
 * within the timeout. Disarmed on destruction. A zero timeout never expires.
 */
template <typename Socket>
class Deadline final : NonCopyable {
 public:
  Deadline(Socket& socket, size_t timeout) noexcept
      : timer_{socket.get_executor()}, state_{std::make_shared<State>()} {
    if (timeout == 0) {
      return;
    }
    timer_.expires_after(std::chrono::milliseconds{timeout});
    timer_.async_wait([&socket, state = state_](const ErrorCode& err) {
      if (err || !state->armed) {
        return;
      }
      state->expired = true;
      ErrorCode ec;
      socket.cancel(ec);
    });
  }

  ~Deadline() {
    state_->armed = false;
    try {
      timer_.cancel();
    } catch (const std::exception&) {
    }
  }

  bool Expired() const noexcept { return state_->expired; }

 private:
  struct State {
    bool armed{true};
    bool expired{false};
  };

  asio::steady_timer timer_;
  std::shared_ptr<State> state_;
};

}  // namespace torctl::utils
