#pragma once

#include <string_view>
#include <torctl/common/api_macro.hpp>
#include <torctl/protocol/protocol_info.hpp>
#include <torctl/system/process.hpp>
#include <torctl/utils/logger_fwd.hpp>

namespace torctl::protocol {

/**
 * @brief Strategy used to find the daemon's pid.
 */
enum class TORCTL_API PidResolver {
  // Key is the daemon's process name.
  kByName,
  // Key is the control port.
  kByPort,
  // Key is the path of the control socket file.
  kBySocketFile,
};

/**
 * @brief Label of the strategy for diagnostic messages, e.g. " by port".
 */
TORCTL_API std::string_view ToLabel(PidResolver pid_resolver) noexcept;

/**
 * @brief Expand a relative cookie path against the daemon's working
 * directory. Best effort: if the pid or its working directory can't be
 * found the failure is logged and the path is left unchanged. Absent or
 * absolute paths are left unchanged. Can be called repeatedly, the last call
 * wins.
 *
 * @param info reply whose cookie path is expanded in place.
 * @param pid_resolver how to find the daemon's pid.
 * @param key process name for PidResolver::kByName, port for
 * PidResolver::kByPort, socket path for PidResolver::kBySocketFile.
 * @param process_resolver source of pid and working directory information.
 * @param logger receives the resolution failures.
 */
TORCTL_API void ExpandCookiePath(
    ProtocolInfo& info, PidResolver pid_resolver, const PidResolverKey& key,
    const system::ProcessResolver& process_resolver,
    const logger::Logger& logger) noexcept;

}  // namespace torctl::protocol
