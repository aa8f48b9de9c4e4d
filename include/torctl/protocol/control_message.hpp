#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <torctl/common/api_macro.hpp>
#include <torctl/utils/status.hpp>

namespace torctl::protocol {

using Entry = std::string;
using EntryOpt = std::optional<Entry>;
using EntryOrError = utils::ErrorOr<EntryOpt>;

using Mapping = std::pair<std::string, std::string>;
using MappingOpt = std::optional<Mapping>;
using MappingOrError = utils::ErrorOr<MappingOpt>;

/**
 * @brief Cursor over the content of one reply line. Entries are consumed
 * from the left: bare whitespace-delimited tokens, quoted strings, or
 * KEY=VALUE mappings whose value may itself be quoted and escaped.
 */
class TORCTL_API ControlLine final {
 public:
  explicit ControlLine(std::string line) noexcept;

  /**
   * @brief The whole line, including already consumed entries.
   */
  const std::string& Str() const noexcept;

  /**
   * @brief Unconsumed part of the line.
   */
  std::string_view Remainder() const noexcept;

  bool IsEmpty() const noexcept;

  /**
   * @brief Check if the next entry is a complete quoted string.
   *
   * @param escaped treat backslash as an escape character when looking for
   * the closing quote.
   */
  bool IsNextQuoted(bool escaped = false) const noexcept;

  /**
   * @brief Check if the next entry is a KEY=VALUE mapping.
   *
   * @param key expected key, any key if empty.
   * @param quoted the value must be a complete quoted string.
   * @param escaped the quoted value may contain backslash escapes.
   */
  bool IsNextMapping(std::string_view key = {}, bool quoted = false,
                     bool escaped = false) const noexcept;

  /**
   * @brief Next entry without consuming it, std::nullopt if the line is
   * empty.
   */
  EntryOpt Peek() const noexcept;

  /**
   * @brief Consume the next entry.
   *
   * @param quoted the entry is a quoted string, the quotes are stripped.
   * @param escaped decode backslash escapes in the entry.
   * @return EntryOrError Error::kMalformedReply if the line is empty or the
   * quoting is unbalanced.
   */
  EntryOrError Pop(bool quoted = false, bool escaped = false) noexcept;

  /**
   * @brief Consume the next KEY=VALUE mapping.
   *
   * @return MappingOrError Error::kMalformedReply if the next entry isn't a
   * mapping or the quoting is unbalanced.
   */
  MappingOrError PopMapping(bool quoted = false, bool escaped = false) noexcept;

  bool operator==(std::string_view rhs) const noexcept { return line_ == rhs; }

 private:
  std::string line_;
  size_t pos_{};
};

/**
 * @brief One line of a reply: three digit status code, divider ('-' for a
 * mid-reply line, ' ' for the final line, '+' for a data line) and content.
 * The content of a data line includes its data block.
 */
struct TORCTL_API ReplyEntry final {
  std::string status;
  char divider{' '};
  std::string content;
};

/**
 * @brief Complete reply received from the control socket.
 */
class TORCTL_API ControlMessage final {
 public:
  ControlMessage(std::vector<ReplyEntry> entries, std::string raw) noexcept;

  /**
   * @brief Build a "250" reply from already split content lines.
   *
   * @param lines content of each line, without status code and divider.
   * @return ControlMessage
   */
  static ControlMessage FromLines(const std::vector<std::string>& lines);

  /**
   * @brief Content of each reply line as a fresh ControlLine cursor.
   */
  std::vector<ControlLine> Lines() const;

  const std::vector<ReplyEntry>& Content() const noexcept;
  const std::string& Raw() const noexcept;

  /**
   * @brief Check if every line has a 250 status code.
   */
  bool IsOk() const noexcept;

  bool IsEmpty() const noexcept;

  /**
   * @brief Line contents joined by '\n'. A plain "250 OK" reply renders as
   * "OK".
   */
  std::string ToString() const;

 private:
  std::vector<ReplyEntry> entries_;
  std::string raw_;
};

}  // namespace torctl::protocol
