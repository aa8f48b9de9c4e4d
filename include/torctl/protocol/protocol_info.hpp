#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <torctl/common/api_macro.hpp>
#include <torctl/protocol/control_message.hpp>
#include <torctl/system/process.hpp>
#include <torctl/utils/logger_fwd.hpp>
#include <torctl/utils/status.hpp>
#include <torctl/version/version.hpp>

namespace torctl::protocol {

// PROTOCOLINFO version requested by this library.
constexpr unsigned int kProtocolInfoVersion{1};
constexpr std::string_view kProtocolInfoCommand{"PROTOCOLINFO 1"};
// Name of the daemon process, used to resolve relative cookie paths while
// parsing.
constexpr std::string_view kDaemonProcessName{"tor"};

/**
 * @brief Methods by which a controller can authenticate to the control port.
 */
enum class TORCTL_API AuthMethod {
  // No authentication required.
  kNone,
  // Hashed password (HashedControlPassword). The controller provides the
  // password the hash was made from.
  kPassword,
  // Authentication cookie (CookieAuthentication). The controller provides
  // the contents of the cookie file.
  kCookie,
  // The daemon advertised one or more methods this library doesn't know.
  kUnknown,
};

TORCTL_API std::string_view ToString(AuthMethod method) noexcept;

enum class PidResolver;
using PidResolverKey = std::variant<std::string, unsigned short>;

class ProtocolInfo;
struct ParseContext;
using ProtocolInfoOpt = std::optional<ProtocolInfo>;
using ProtocolInfoOrError = utils::ErrorOr<ProtocolInfoOpt>;

/**
 * @brief Reply to a version one PROTOCOLINFO query. The protocol version is
 * the only mandatory field; the other fields are empty when the reply leaves
 * them out.
 */
class TORCTL_API ProtocolInfo final {
 public:
  unsigned int ProtocolVersion() const noexcept { return protocol_version_; }

  const version::VersionOpt& TorVersion() const noexcept {
    return tor_version_;
  }

  /**
   * @brief Methods the daemon will accept, in reply order. Contains
   * AuthMethod::kUnknown at most once.
   */
  const std::vector<AuthMethod>& AuthMethods() const noexcept {
    return auth_methods_;
  }

  /**
   * @brief Raw names of the advertised methods that aren't recognized.
   */
  const std::vector<std::string>& UnknownAuthMethods() const noexcept {
    return unknown_auth_methods_;
  }

  /**
   * @brief Path of the daemon's authentication cookie. The control protocol
   * says it's absolute, but daemons in the wild report relative paths; those
   * are expanded against the daemon's working directory when it can be
   * found.
   */
  const std::optional<std::string>& CookiePath() const noexcept {
    return cookie_path_;
  }

  bool HasAuthMethod(AuthMethod method) const noexcept;

  /**
   * @brief The reply this record was parsed from.
   */
  const ControlMessage& Message() const noexcept { return message_; }

 private:
  friend ProtocolInfoOrError ParseProtocolInfo(ControlMessage message,
                                               const ParseContext& ctx) noexcept;
  friend void ExpandCookiePath(ProtocolInfo& info, PidResolver pid_resolver,
                               const PidResolverKey& key,
                               const system::ProcessResolver& process_resolver,
                               const logger::Logger& logger) noexcept;

  explicit ProtocolInfo(ControlMessage message) noexcept;

  unsigned int protocol_version_{};
  version::VersionOpt tor_version_;
  std::vector<AuthMethod> auth_methods_;
  std::vector<std::string> unknown_auth_methods_;
  std::optional<std::string> cookie_path_;
  ControlMessage message_;
};

/**
 * @brief Collaborators of the PROTOCOLINFO parser.
 */
struct TORCTL_API ParseContext final {
  // Receives the non-fatal parse events.
  logger::Logger logger;
  // Used to expand a relative cookie path by the daemon's process name.
  std::reference_wrapper<const system::ProcessResolver> process_resolver{
      system::GetSystemProcessResolver()};
};

/**
 * @brief Parse a reply to PROTOCOLINFO. Unknown line types and unknown
 * authentication methods are tolerated, a missing or malformed mandatory
 * field fails the whole parse with Error::kMalformedReply.
 *
 * @param message the reply received from the control socket.
 * @param ctx logger and process resolver.
 * @return ProtocolInfoOrError
 */
[[nodiscard]] TORCTL_API ProtocolInfoOrError ParseProtocolInfo(
    ControlMessage message, const ParseContext& ctx = {}) noexcept;

}  // namespace torctl::protocol
