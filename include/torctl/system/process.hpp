#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <torctl/common/api_macro.hpp>

namespace torctl::system {

using Pid = pid_t;
using PidOpt = std::optional<Pid>;
using PathOpt = std::optional<std::string>;

/**
 * @brief Pid of the process with the given name. std::nullopt if there is no
 * such process or more than one.
 */
TORCTL_API PidOpt PidByName(std::string_view process_name) noexcept;

/**
 * @brief Pid of the process listening on the given TCP port. std::nullopt if
 * no process, or more than one, is listening on it.
 */
TORCTL_API PidOpt PidByPort(unsigned short port) noexcept;

/**
 * @brief Pid of the process holding the given file open, either as a bound
 * unix socket or as a regular open file. std::nullopt if no process, or more
 * than one, holds it.
 */
TORCTL_API PidOpt PidByOpenFile(std::string_view path) noexcept;

/**
 * @brief Current working directory of a process.
 */
TORCTL_API PathOpt Cwd(Pid pid) noexcept;

TORCTL_API bool IsRelativePath(std::string_view path) noexcept;

/**
 * @brief Join a relative path onto a directory and normalize the result.
 * Absolute paths are only normalized.
 */
TORCTL_API std::string ExpandPath(std::string_view path,
                                  std::string_view cwd);

/**
 * @brief Source of process information for cookie path resolution.
 */
class TORCTL_API ProcessResolver {
 public:
  virtual ~ProcessResolver() = default;

  virtual PidOpt PidByName(std::string_view process_name) const noexcept = 0;
  virtual PidOpt PidByPort(unsigned short port) const noexcept = 0;
  virtual PidOpt PidByOpenFile(std::string_view path) const noexcept = 0;
  virtual PathOpt Cwd(Pid pid) const noexcept = 0;
};

/**
 * @brief ProcessResolver backed by the /proc filesystem of this host.
 */
class TORCTL_API SystemProcessResolver final : public ProcessResolver {
 public:
  PidOpt PidByName(std::string_view process_name) const noexcept override;
  PidOpt PidByPort(unsigned short port) const noexcept override;
  PidOpt PidByOpenFile(std::string_view path) const noexcept override;
  PathOpt Cwd(Pid pid) const noexcept override;
};

/**
 * @brief Shared SystemProcessResolver instance.
 */
TORCTL_API const ProcessResolver& GetSystemProcessResolver() noexcept;

}  // namespace torctl::system
