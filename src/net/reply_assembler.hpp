#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <torctl/protocol/control_message.hpp>
#include <torctl/utils/non_copyable.hpp>
#include <torctl/utils/status.hpp>

namespace torctl::net {

using CompletionOrError = utils::ErrorOr<bool>;

// Longest reply line accepted from the control socket. The control protocol
// doesn't bound line length.
constexpr size_t kMaxLineLength{100000};

/**
 * @brief Collects the lines of one reply, each received without its CRLF:
 * "<status><divider><content>", where a '+' divider starts a data block that
 * ends with a line holding a single '.'.
 */
class ReplyAssembler final : utils::NonCopyable {
 public:
  /**
   * @brief Consume one line.
   *
   * @return CompletionOrError true once the final line of the reply has been
   * consumed, Error::kMalformedReply if the line isn't a reply line.
   */
  CompletionOrError Feed(std::string_view line) noexcept;

  /**
   * @brief Hand over the collected reply and reset for the next one.
   */
  protocol::ControlMessage Release() noexcept;

 private:
  std::vector<protocol::ReplyEntry> entries_;
  std::string raw_;
  std::optional<protocol::ReplyEntry> data_entry_;
};

}  // namespace torctl::net
