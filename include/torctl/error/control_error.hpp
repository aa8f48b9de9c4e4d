#pragma once

#include <optional>
#include <string>
#include <fmt/core.h>
#include <torctl/common/api_macro.hpp>
#include <torctl/error/error.hpp>

namespace torctl::error {

/**
 * @brief Error returned by the fallible torctl operations. Carries the error
 * code and, where the failure has one, a detail text: the rejected reply, the
 * offending cookie path, the malformed line.
 */
class TORCTL_API ControlError final {
 public:
  explicit ControlError(boost::system::error_code code) noexcept;
  ControlError(boost::system::error_code code, std::string detail) noexcept;

  const boost::system::error_code& Code() const noexcept;
  const std::string& Detail() const noexcept;

  /**
   * @brief Human-readable message: the code message followed by the detail
   * text, if any.
   */
  std::string Msg() const noexcept;

  bool Is(Error err) const noexcept;

 private:
  boost::system::error_code code_;
  std::string detail_;
};

using ControlErrorOpt = std::optional<ControlError>;

TORCTL_API ControlError MakeError(boost::system::error_code code) noexcept;
TORCTL_API ControlError MakeError(boost::system::error_code code,
                                  std::string detail) noexcept;

template <typename... Args>
ControlError FormatError(Error err, fmt::format_string<Args...> fmt,
                         Args&&... args) noexcept {
  try {
    return ControlError{err, fmt::format(fmt, std::forward<Args>(args)...)};
  } catch (const std::exception& ex) {
    return ControlError{err, ex.what()};
  }
}

}  // namespace torctl::error
