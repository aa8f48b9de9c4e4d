#include <torctl/error/control_error.hpp>

namespace torctl::error {

ControlError::ControlError(boost::system::error_code code) noexcept
    : code_{std::move(code)} {}

ControlError::ControlError(boost::system::error_code code,
                           std::string detail) noexcept
    : code_{std::move(code)}, detail_{std::move(detail)} {}

const boost::system::error_code& ControlError::Code() const noexcept {
  return code_;
}

const std::string& ControlError::Detail() const noexcept { return detail_; }

std::string ControlError::Msg() const noexcept {
  try {
    if (detail_.empty()) {
      return code_.message();
    }
    return fmt::format("{}. msg={}", code_.message(), detail_);
  } catch (const std::exception& ex) {
    return ex.what();
  }
}

bool ControlError::Is(Error err) const noexcept {
  return code_ == make_error_code(err);
}

ControlError MakeError(boost::system::error_code code) noexcept {
  return ControlError{std::move(code)};
}

ControlError MakeError(boost::system::error_code code,
                       std::string detail) noexcept {
  return ControlError{std::move(code), std::move(detail)};
}

}  // namespace torctl::error
