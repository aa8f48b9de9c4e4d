#pragma once

#include <torctl/common/api_macro.hpp>

namespace torctl::utils {

// Neither copyable nor movable: sockets and their deadlines are referenced by
// pending asio handlers and must stay where they were constructed.
class TORCTL_API NonCopyable {
 protected:
  NonCopyable() = default;
  ~NonCopyable() = default;
  NonCopyable(const NonCopyable&) = delete;
  NonCopyable& operator=(const NonCopyable&) = delete;
  NonCopyable(NonCopyable&&) = delete;
  NonCopyable& operator=(NonCopyable&&) = delete;
};

}  // namespace torctl::utils
