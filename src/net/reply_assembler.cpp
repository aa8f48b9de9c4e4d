#include <net/reply_assembler.hpp>
#include <utils/string_utils.hpp>

namespace torctl::net {

namespace {

constexpr size_t kStatusSize{3};
constexpr std::string_view kDataTerminator{"."};
constexpr std::string_view kEscapedDot{".."};

}  // namespace

CompletionOrError ReplyAssembler::Feed(std::string_view line) noexcept {
  try {
    raw_.append(line).append("\r\n");

    if (data_entry_) {
      if (line == kDataTerminator) {
        entries_.push_back(std::move(*data_entry_));
        data_entry_.reset();
        return std::make_pair(std::nullopt, false);
      }
      if (line.starts_with(kEscapedDot)) {
        line.remove_prefix(1);
      }
      data_entry_->content.append("\n").append(line);
      return std::make_pair(std::nullopt, false);
    }

    if (line.size() <= kStatusSize) {
      return std::make_pair(
          error::FormatError(error::Error::kMalformedReply,
                             "Badly formatted reply line: too short: '{}'",
                             line),
          false);
    }
    const auto status = line.substr(0, kStatusSize);
    if (!utils::IsDigits(status)) {
      return std::make_pair(
          error::FormatError(
              error::Error::kMalformedReply,
              "Badly formatted reply line: status code isn't numeric: '{}'",
              line),
          false);
    }
    protocol::ReplyEntry entry{std::string{status}, line[kStatusSize],
                               std::string{line.substr(kStatusSize + 1)}};
    switch (entry.divider) {
      case '-': {
        entries_.push_back(std::move(entry));
        return std::make_pair(std::nullopt, false);
      }
      case '+': {
        data_entry_ = std::move(entry);
        return std::make_pair(std::nullopt, false);
      }
      case ' ': {
        entries_.push_back(std::move(entry));
        return std::make_pair(std::nullopt, true);
      }
      default: {
        return std::make_pair(
            error::FormatError(
                error::Error::kMalformedReply,
                "Badly formatted reply line: unrecognized divider: '{}'",
                line),
            false);
      }
    }
  } catch (const std::exception& ex) {
    return std::make_pair(
        error::MakeError(error::Error::kMalformedReply, ex.what()), false);
  }
}

protocol::ControlMessage ReplyAssembler::Release() noexcept {
  protocol::ControlMessage message{std::move(entries_), std::move(raw_)};
  entries_.clear();
  raw_.clear();
  data_entry_.reset();
  return message;
}

}  // namespace torctl::net
