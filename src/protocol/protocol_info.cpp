#include <torctl/protocol/protocol_info.hpp>
#include <algorithm>
#include <charconv>
#include <torctl/protocol/cookie_path.hpp>
#include <utils/logger.hpp>
#include <utils/string_utils.hpp>

namespace torctl::protocol {

namespace {

constexpr std::string_view kProtocolInfoLine{"PROTOCOLINFO"};
constexpr std::string_view kAuthLine{"AUTH"};
constexpr std::string_view kVersionLine{"VERSION"};
constexpr std::string_view kOkLine{"OK"};

constexpr std::string_view kMethodsKey{"METHODS"};
constexpr std::string_view kCookieFileKey{"COOKIEFILE"};
constexpr std::string_view kTorVersionKey{"Tor"};

constexpr std::string_view kNullMethod{"NULL"};
constexpr std::string_view kHashedPasswordMethod{"HASHEDPASSWORD"};
constexpr std::string_view kCookieMethod{"COOKIE"};

using ParseErrorOpt = error::ControlErrorOpt;

class ProtocolInfoParser final {
 public:
  ProtocolInfoParser(ProtocolInfo& info, std::vector<AuthMethod>& auth_methods,
                     std::vector<std::string>& unknown_auth_methods,
                     const ParseContext& ctx) noexcept
      : info_{info},
        auth_methods_{auth_methods},
        unknown_auth_methods_{unknown_auth_methods},
        ctx_{ctx} {}

  // FirstLine = "PROTOCOLINFO" SP PIVERSION CRLF
  // PIVERSION = 1*DIGIT
  ParseErrorOpt ParseProtocolInfoLine(ControlLine& line,
                                      unsigned int& protocol_version) {
    if (line.IsEmpty()) {
      return error::FormatError(error::Error::kMalformedReply,
                                "PROTOCOLINFO response's initial line is "
                                "missing the protocol version: {}",
                                line.Str());
    }
    const auto [err, piversion] = line.Pop();
    if (err) {
      return err;
    }
    unsigned int value{};
    const auto end = piversion->data() + piversion->size();
    if (!utils::IsDigits(*piversion)) {
      return error::FormatError(
          error::Error::kMalformedReply,
          "PROTOCOLINFO response version is non-numeric: {}", line.Str());
    }
    const auto [ptr, ec] = std::from_chars(piversion->data(), end, value);
    if (ec != std::errc{} || ptr != end) {
      return error::FormatError(
          error::Error::kMalformedReply,
          "PROTOCOLINFO response version is out of range: {}", *piversion);
    }
    protocol_version = value;
    // The daemon doesn't have to answer with the version we asked for. Keep
    // parsing it as a v1 reply.
    if (protocol_version != kProtocolInfoVersion) {
      TORCTL_LOG(ctx_.logger, warn,
                 "We made a PROTOCOLINFO v{} query but got a version {} "
                 "response instead. We'll still try to use it, but this may "
                 "cause problems.",
                 kProtocolInfoVersion, protocol_version);
    }
    return std::nullopt;
  }

  // AuthLine = "250-AUTH" SP "METHODS=" AuthMethod *("," AuthMethod)
  //            *(SP "COOKIEFILE=" AuthCookieFile) CRLF
  // AuthMethod = "NULL" / "HASHEDPASSWORD" / "COOKIE"
  // AuthCookieFile = QuotedString
  ParseErrorOpt ParseAuthLine(ControlLine& line,
                              std::optional<std::string>& cookie_path) {
    if (!line.IsNextMapping(kMethodsKey)) {
      return error::FormatError(error::Error::kMalformedReply,
                                "PROTOCOLINFO response's AUTH line is missing "
                                "its mandatory 'METHODS' mapping: {}",
                                line.Str());
    }
    const auto [methods_err, methods] = line.PopMapping();
    if (methods_err) {
      return methods_err;
    }
    for (auto& method : utils::Split(methods->second, ',')) {
      AddAuthMethod(std::move(method));
    }
    if (line.IsNextMapping(kCookieFileKey, true, true)) {
      const auto [cookie_err, cookie_file] = line.PopMapping(true, true);
      if (cookie_err) {
        return cookie_err;
      }
      cookie_path = cookie_file->second;
      ExpandCookiePath(info_, PidResolver::kByName,
                       std::string{kDaemonProcessName},
                       ctx_.process_resolver.get(), ctx_.logger);
    }
    return std::nullopt;
  }

  // VersionLine = "250-VERSION" SP "Tor=" TorVersion OptArguments CRLF
  // TorVersion = QuotedString
  ParseErrorOpt ParseVersionLine(ControlLine& line,
                                 version::VersionOpt& tor_version) {
    if (!line.IsNextMapping(kTorVersionKey, true)) {
      return error::FormatError(error::Error::kMalformedReply,
                                "PROTOCOLINFO response's VERSION line is "
                                "missing its mandatory tor version mapping: {}",
                                line.Str());
    }
    const auto [mapping_err, mapping] = line.PopMapping(true);
    if (mapping_err) {
      return mapping_err;
    }
    auto [version_err, version] = version::ParseVersion(mapping->second);
    if (version_err) {
      return error::MakeError(error::Error::kMalformedReply,
                              version_err->Msg());
    }
    tor_version = std::move(version);
    return std::nullopt;
  }

 private:
  void AddAuthMethod(std::string method) {
    if (method == kNullMethod) {
      auth_methods_.push_back(AuthMethod::kNone);
    } else if (method == kHashedPasswordMethod) {
      auth_methods_.push_back(AuthMethod::kPassword);
    } else if (method == kCookieMethod) {
      auth_methods_.push_back(AuthMethod::kCookie);
    } else {
      TORCTL_LOG(ctx_.logger, info,
                 "PROTOCOLINFO response had an unrecognized authentication "
                 "method: {}",
                 method);
      unknown_auth_methods_.push_back(std::move(method));
      if (std::find(auth_methods_.begin(), auth_methods_.end(),
                    AuthMethod::kUnknown) == auth_methods_.end()) {
        auth_methods_.push_back(AuthMethod::kUnknown);
      }
    }
  }

  ProtocolInfo& info_;
  std::vector<AuthMethod>& auth_methods_;
  std::vector<std::string>& unknown_auth_methods_;
  const ParseContext& ctx_;
};

}  // namespace

std::string_view ToString(AuthMethod method) noexcept {
  switch (method) {
    case AuthMethod::kNone: {
      return "NONE";
    }
    case AuthMethod::kPassword: {
      return "PASSWORD";
    }
    case AuthMethod::kCookie: {
      return "COOKIE";
    }
    case AuthMethod::kUnknown: {
      return "UNKNOWN";
    }
  }
  return "UNKNOWN";
}

ProtocolInfo::ProtocolInfo(ControlMessage message) noexcept
    : message_{std::move(message)} {}

bool ProtocolInfo::HasAuthMethod(AuthMethod method) const noexcept {
  return std::find(auth_methods_.begin(), auth_methods_.end(), method) !=
         auth_methods_.end();
}

// Example:
//   250-PROTOCOLINFO 1
//   250-AUTH METHODS=COOKIE COOKIEFILE="/home/user/.tor/control_auth_cookie"
//   250-VERSION Tor="0.2.1.30"
//   250 OK
ProtocolInfoOrError ParseProtocolInfo(ControlMessage message,
                                      const ParseContext& ctx) noexcept {
  try {
    auto lines = message.Lines();
    if (lines.empty() || lines.front().Peek() != kProtocolInfoLine) {
      return std::make_pair(
          error::MakeError(error::Error::kMalformedReply,
                           "Message is not a PROTOCOLINFO response"),
          std::nullopt);
    }

    ProtocolInfo info{std::move(message)};
    std::vector<AuthMethod> auth_methods;
    std::vector<std::string> unknown_auth_methods;
    ProtocolInfoParser parser{info, auth_methods, unknown_auth_methods, ctx};

    for (auto& line : lines) {
      if (line == kOkLine) {
        break;
      }
      if (line.IsEmpty()) {
        continue;
      }
      const auto [type_err, line_type] = line.Pop();
      if (type_err) {
        return std::make_pair(type_err, std::nullopt);
      }
      ParseErrorOpt err;
      if (*line_type == kProtocolInfoLine) {
        err = parser.ParseProtocolInfoLine(line, info.protocol_version_);
      } else if (*line_type == kAuthLine) {
        err = parser.ParseAuthLine(line, info.cookie_path_);
      } else if (*line_type == kVersionLine) {
        err = parser.ParseVersionLine(line, info.tor_version_);
      } else {
        TORCTL_LOG(ctx.logger, debug,
                   "unrecognized PROTOCOLINFO line type '{}', ignoring entry: "
                   "{}",
                   *line_type, line.Str());
      }
      if (err) {
        return std::make_pair(std::move(err), std::nullopt);
      }
    }

    info.auth_methods_ = std::move(auth_methods);
    info.unknown_auth_methods_ = std::move(unknown_auth_methods);
    return std::make_pair(std::nullopt, std::move(info));
  } catch (const std::exception& ex) {
    return std::make_pair(
        error::MakeError(error::Error::kMalformedReply, ex.what()),
        std::nullopt);
  }
}

}  // namespace torctl::protocol
