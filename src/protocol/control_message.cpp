#include <torctl/protocol/control_message.hpp>

namespace torctl::protocol {

namespace {

constexpr char kQuote{'"'};
constexpr char kEscape{'\\'};
constexpr std::string_view kOkStatus{"250"};

struct ParsedEntry {
  std::string value;
  size_t size;
};

using ParsedEntryOpt = std::optional<ParsedEntry>;

bool IsSpace(char c) noexcept { return c == ' ' || c == '\t'; }

size_t SkipSpaces(std::string_view sv, size_t pos) noexcept {
  while (pos < sv.size() && IsSpace(sv[pos])) {
    ++pos;
  }
  return pos;
}

size_t FindSpace(std::string_view sv) noexcept {
  for (size_t i = 0; i < sv.size(); ++i) {
    if (IsSpace(sv[i])) {
      return i;
    }
  }
  return sv.size();
}

bool IsOctal(char c) noexcept { return c >= '0' && c <= '7'; }

// Index of the quote closing the quoted string at the start of sv.
std::optional<size_t> FindClosingQuote(std::string_view sv,
                                       bool escaped) noexcept {
  if (sv.empty() || sv.front() != kQuote) {
    return std::nullopt;
  }
  for (size_t i = 1; i < sv.size(); ++i) {
    if (escaped && sv[i] == kEscape) {
      ++i;
      continue;
    }
    if (sv[i] == kQuote) {
      return i;
    }
  }
  return std::nullopt;
}

std::string Unescape(std::string_view sv) {
  std::string value;
  value.reserve(sv.size());
  for (size_t i = 0; i < sv.size(); ++i) {
    if (sv[i] != kEscape || i + 1 == sv.size()) {
      value.push_back(sv[i]);
      continue;
    }
    const auto next = sv[i + 1];
    switch (next) {
      case '\\':
      case '"':
      case '\'': {
        value.push_back(next);
        ++i;
        break;
      }
      case 'n': {
        value.push_back('\n');
        ++i;
        break;
      }
      case 'r': {
        value.push_back('\r');
        ++i;
        break;
      }
      case 't': {
        value.push_back('\t');
        ++i;
        break;
      }
      default: {
        if (!IsOctal(next)) {
          value.push_back(sv[i]);
          break;
        }
        int code{0};
        size_t digits{0};
        while (digits < 3 && i + 1 + digits < sv.size() &&
               IsOctal(sv[i + 1 + digits])) {
          code = code * 8 + (sv[i + 1 + digits] - '0');
          ++digits;
        }
        value.push_back(static_cast<char>(code & 0xff));
        i += digits;
        break;
      }
    }
  }
  return value;
}

ParsedEntryOpt ParseEntry(std::string_view sv, bool quoted, bool escaped) {
  if (sv.empty()) {
    return std::nullopt;
  }
  if (quoted) {
    const auto closing = FindClosingQuote(sv, escaped);
    if (!closing) {
      return std::nullopt;
    }
    const auto inner = sv.substr(1, *closing - 1);
    return ParsedEntry{escaped ? Unescape(inner) : std::string{inner},
                       *closing + 1};
  }
  const auto end = FindSpace(sv);
  const auto token = sv.substr(0, end);
  return ParsedEntry{escaped ? Unescape(token) : std::string{token}, end};
}

// Key of the KEY=VALUE mapping at the start of sv.
std::optional<std::string_view> MappingKey(std::string_view sv) noexcept {
  const auto word = sv.substr(0, FindSpace(sv));
  const auto eq = word.find('=');
  if (eq == std::string_view::npos || eq == 0) {
    return std::nullopt;
  }
  return word.substr(0, eq);
}

}  // namespace

ControlLine::ControlLine(std::string line) noexcept : line_{std::move(line)} {
  pos_ = SkipSpaces(line_, 0);
}

const std::string& ControlLine::Str() const noexcept { return line_; }

std::string_view ControlLine::Remainder() const noexcept {
  return std::string_view{line_}.substr(pos_);
}

bool ControlLine::IsEmpty() const noexcept { return Remainder().empty(); }

bool ControlLine::IsNextQuoted(bool escaped) const noexcept {
  return FindClosingQuote(Remainder(), escaped).has_value();
}

bool ControlLine::IsNextMapping(std::string_view key, bool quoted,
                                bool escaped) const noexcept {
  const auto rem = Remainder();
  const auto next_key = MappingKey(rem);
  if (!next_key) {
    return false;
  }
  if (!key.empty() && *next_key != key) {
    return false;
  }
  if (quoted) {
    return FindClosingQuote(rem.substr(next_key->size() + 1), escaped)
        .has_value();
  }
  return true;
}

EntryOpt ControlLine::Peek() const noexcept {
  try {
    auto entry = ParseEntry(Remainder(), false, false);
    if (!entry) {
      return std::nullopt;
    }
    return std::move(entry->value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

EntryOrError ControlLine::Pop(bool quoted, bool escaped) noexcept {
  try {
    auto entry = ParseEntry(Remainder(), quoted, escaped);
    if (!entry && IsEmpty()) {
      return std::make_pair(
          error::FormatError(error::Error::kMalformedReply,
                             "no remaining content to parse: {}", line_),
          std::nullopt);
    }
    if (!entry) {
      return std::make_pair(
          error::FormatError(error::Error::kMalformedReply,
                             "unterminated quoted entry: {}", line_),
          std::nullopt);
    }
    pos_ = SkipSpaces(line_, pos_ + entry->size);
    return std::make_pair(std::nullopt, std::move(entry->value));
  } catch (const std::exception& ex) {
    return std::make_pair(
        error::MakeError(error::Error::kMalformedReply, ex.what()),
        std::nullopt);
  }
}

MappingOrError ControlLine::PopMapping(bool quoted, bool escaped) noexcept {
  try {
    const auto rem = Remainder();
    const auto key = MappingKey(rem);
    if (!key) {
      return std::make_pair(
          error::FormatError(error::Error::kMalformedReply,
                             "the next entry isn't a KEY=VALUE mapping: {}",
                             line_),
          std::nullopt);
    }
    const auto value_offset = key->size() + 1;
    auto entry = ParseEntry(rem.substr(value_offset), quoted, escaped);
    if (!entry) {
      return std::make_pair(
          error::FormatError(error::Error::kMalformedReply,
                             "the '{}' mapping has a malformed value: {}",
                             *key, line_),
          std::nullopt);
    }
    Mapping mapping{std::string{*key}, std::move(entry->value)};
    pos_ = SkipSpaces(line_, pos_ + value_offset + entry->size);
    return std::make_pair(std::nullopt, std::move(mapping));
  } catch (const std::exception& ex) {
    return std::make_pair(
        error::MakeError(error::Error::kMalformedReply, ex.what()),
        std::nullopt);
  }
}

ControlMessage::ControlMessage(std::vector<ReplyEntry> entries,
                               std::string raw) noexcept
    : entries_{std::move(entries)}, raw_{std::move(raw)} {}

ControlMessage ControlMessage::FromLines(const std::vector<std::string>& lines) {
  std::vector<ReplyEntry> entries;
  std::string raw;
  entries.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    const char divider = i + 1 == lines.size() ? ' ' : '-';
    entries.push_back(
        ReplyEntry{std::string{kOkStatus}, divider, lines[i]});
    raw.append(kOkStatus).append(1, divider).append(lines[i]).append("\r\n");
  }
  return ControlMessage{std::move(entries), std::move(raw)};
}

std::vector<ControlLine> ControlMessage::Lines() const {
  std::vector<ControlLine> lines;
  lines.reserve(entries_.size());
  for (const auto& entry : entries_) {
    lines.emplace_back(entry.content);
  }
  return lines;
}

const std::vector<ReplyEntry>& ControlMessage::Content() const noexcept {
  return entries_;
}

const std::string& ControlMessage::Raw() const noexcept { return raw_; }

bool ControlMessage::IsOk() const noexcept {
  if (entries_.empty()) {
    return false;
  }
  for (const auto& entry : entries_) {
    if (entry.status != kOkStatus) {
      return false;
    }
  }
  return true;
}

bool ControlMessage::IsEmpty() const noexcept { return entries_.empty(); }

std::string ControlMessage::ToString() const {
  std::string str;
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (i != 0) {
      str.push_back('\n');
    }
    str.append(entries_[i].content);
  }
  return str;
}

}  // namespace torctl::protocol
