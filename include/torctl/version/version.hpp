#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <torctl/common/api_macro.hpp>
#include <torctl/utils/status.hpp>

namespace torctl::version {

/**
 * @brief Daemon version of the form major.minor.micro[.patch][-status], for
 * example "0.2.1.30" or "0.2.3.0-alpha-dev".
 */
class TORCTL_API Version final {
 public:
  uint32_t Major() const noexcept { return major_; }
  uint32_t Minor() const noexcept { return minor_; }
  uint32_t Micro() const noexcept { return micro_; }
  const std::optional<uint32_t>& Patch() const noexcept { return patch_; }
  const std::optional<std::string>& Status() const noexcept {
    return status_;
  }

  /**
   * @brief The string this version was parsed from.
   */
  const std::string& ToString() const noexcept { return str_; }

  // Missing patch sorts before any patch, a tagged release sorts before the
  // untagged release with the same numbers.
  std::strong_ordering operator<=>(const Version& rhs) const noexcept;
  bool operator==(const Version& rhs) const noexcept;

 private:
  friend utils::ErrorOr<std::optional<Version>> ParseVersion(
      std::string_view str) noexcept;

  Version() = default;

  uint32_t major_{};
  uint32_t minor_{};
  uint32_t micro_{};
  std::optional<uint32_t> patch_;
  std::optional<std::string> status_;
  std::string str_;
};

using VersionOpt = std::optional<Version>;
using VersionOrError = utils::ErrorOr<VersionOpt>;

/**
 * @brief Parse a version string. Fails with Error::kInvalidVersion if the
 * string is not of the form major.minor.micro[.patch][-status].
 *
 * @param str version string.
 * @return VersionOrError
 */
[[nodiscard]] TORCTL_API VersionOrError ParseVersion(
    std::string_view str) noexcept;

}  // namespace torctl::version
