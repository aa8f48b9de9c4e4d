#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>

namespace torctl::utils {

inline bool IsDigits(std::string_view sv) noexcept {
  return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
    return c >= '0' && c <= '9';
  });
}

inline std::vector<std::string> Split(std::string_view sv, char delim) {
  std::vector<std::string> parts;
  size_t begin{0};
  for (;;) {
    const auto end = sv.find(delim, begin);
    if (end == std::string_view::npos) {
      parts.emplace_back(sv.substr(begin));
      return parts;
    }
    parts.emplace_back(sv.substr(begin, end - begin));
    begin = end + 1;
  }
}

template <typename Bytes>
std::string HexEncode(const Bytes& bytes) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    const auto b = static_cast<unsigned char>(byte);
    hex.push_back(kHexDigits[b >> 4]);
    hex.push_back(kHexDigits[b & 0x0f]);
  }
  return hex;
}

// The daemon may include quotes in its password hash and expects them
// escaped by the controller.
inline std::string EscapeQuotes(std::string_view sv) {
  std::string escaped;
  escaped.reserve(sv.size());
  for (const auto c : sv) {
    if (c == '"') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

}  // namespace torctl::utils
