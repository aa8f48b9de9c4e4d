#include <torctl/version/version.hpp>
#include <array>
#include <charconv>
#include <utils/string_utils.hpp>

namespace torctl::version {

namespace {

constexpr size_t kMinComponents{3};
constexpr size_t kMaxComponents{4};

std::optional<uint32_t> ParseComponent(std::string_view sv) noexcept {
  if (!utils::IsDigits(sv)) {
    return std::nullopt;
  }
  uint32_t value{};
  const auto [ptr, ec] =
      std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
    return std::nullopt;
  }
  return value;
}

bool HasWhitespace(std::string_view sv) noexcept {
  return sv.find_first_of(" \t\r\n") != std::string_view::npos;
}

VersionOrError MakeInvalid(std::string_view str) noexcept {
  return std::make_pair(
      error::FormatError(error::Error::kInvalidVersion,
                         "'{}' isn't a properly formatted tor version", str),
      std::nullopt);
}

}  // namespace

std::strong_ordering Version::operator<=>(const Version& rhs) const noexcept {
  if (const auto cmp = major_ <=> rhs.major_; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = minor_ <=> rhs.minor_; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = micro_ <=> rhs.micro_; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = patch_ <=> rhs.patch_; cmp != 0) {
    return cmp;
  }
  if (status_.has_value() != rhs.status_.has_value()) {
    return status_ ? std::strong_ordering::less
                   : std::strong_ordering::greater;
  }
  if (status_) {
    return *status_ <=> *rhs.status_;
  }
  return std::strong_ordering::equal;
}

bool Version::operator==(const Version& rhs) const noexcept {
  return (*this <=> rhs) == 0;
}

VersionOrError ParseVersion(std::string_view str) noexcept {
  try {
    if (str.empty() || HasWhitespace(str)) {
      return MakeInvalid(str);
    }
    auto numbers = str;
    std::optional<std::string> status;
    if (const auto dash = str.find('-'); dash != std::string_view::npos) {
      numbers = str.substr(0, dash);
      status = std::string{str.substr(dash + 1)};
    }
    const auto components = utils::Split(numbers, '.');
    if (components.size() < kMinComponents ||
        components.size() > kMaxComponents) {
      return MakeInvalid(str);
    }
    std::array<uint32_t, kMaxComponents> values{};
    for (size_t i = 0; i < components.size(); ++i) {
      const auto value = ParseComponent(components[i]);
      if (!value) {
        return MakeInvalid(str);
      }
      values[i] = *value;
    }
    Version version;
    version.major_ = values[0];
    version.minor_ = values[1];
    version.micro_ = values[2];
    if (components.size() == kMaxComponents) {
      version.patch_ = values[3];
    }
    version.status_ = std::move(status);
    version.str_ = std::string{str};
    return std::make_pair(std::nullopt, std::move(version));
  } catch (const std::exception& ex) {
    return std::make_pair(
        error::MakeError(error::Error::kInvalidVersion, ex.what()),
        std::nullopt);
  }
}

}  // namespace torctl::version
