#include <torctl/error/error.hpp>

namespace torctl::error {

namespace {

class ErrorCategory : public boost::system::error_category {
 public:
  const char* name() const noexcept override;
  std::string message(int ev) const override;
};

const char* ErrorCategory::name() const noexcept { return "torctl_error"; }

std::string ErrorCategory::message(int ev) const {
  switch (static_cast<Error>(ev)) {
    case Error::kSucceeded: {
      return "Succeeded";
    }
    case Error::kMalformedReply: {
      return "Malformed control reply";
    }
    case Error::kMissingCookieFile: {
      return "Authentication cookie file is missing";
    }
    case Error::kInvalidCookieSize: {
      return "Authentication cookie has invalid size";
    }
    case Error::kCookieReadFailure: {
      return "Unable to read authentication cookie";
    }
    case Error::kAuthenticationRejected: {
      return "Authentication rejected";
    }
    case Error::kNoAuthMethod: {
      return "No usable authentication method";
    }
    case Error::kInvalidVersion: {
      return "Invalid version string";
    }
    case Error::kSocketClosed: {
      return "Control socket closed";
    }
    case Error::kTimeoutExpired: {
      return "Timeout expired";
    }
    case Error::kInternalError: {
      return "Internal error";
    }
  }
  return "Unrecognized error";
}

const ErrorCategory kErrorCategory{};

}  // namespace

boost::system::error_code make_error_code(Error err) noexcept {
  return {static_cast<int>(err), kErrorCategory};
}

}  // namespace torctl::error
