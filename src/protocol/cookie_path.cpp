#include <torctl/protocol/cookie_path.hpp>
#include <utils/logger.hpp>

namespace torctl::protocol {

namespace {

system::PidOpt ResolvePid(PidResolver pid_resolver, const PidResolverKey& key,
                          const system::ProcessResolver& process_resolver) {
  switch (pid_resolver) {
    case PidResolver::kByName: {
      if (const auto name = std::get_if<std::string>(&key)) {
        return process_resolver.PidByName(*name);
      }
      return std::nullopt;
    }
    case PidResolver::kByPort: {
      if (const auto port = std::get_if<unsigned short>(&key)) {
        return process_resolver.PidByPort(*port);
      }
      return std::nullopt;
    }
    case PidResolver::kBySocketFile: {
      if (const auto path = std::get_if<std::string>(&key)) {
        return process_resolver.PidByOpenFile(*path);
      }
      return std::nullopt;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view ToLabel(PidResolver pid_resolver) noexcept {
  switch (pid_resolver) {
    case PidResolver::kByName: {
      return " by name";
    }
    case PidResolver::kByPort: {
      return " by port";
    }
    case PidResolver::kBySocketFile: {
      return " by socket file";
    }
  }
  return "";
}

void ExpandCookiePath(ProtocolInfo& info, PidResolver pid_resolver,
                      const PidResolverKey& key,
                      const system::ProcessResolver& process_resolver,
                      const logger::Logger& logger) noexcept {
  try {
    const auto& cookie_path = info.cookie_path_;
    if (!cookie_path || !system::IsRelativePath(*cookie_path)) {
      return;
    }
    const auto pid = ResolvePid(pid_resolver, key, process_resolver);
    if (!pid) {
      TORCTL_LOG(logger, debug,
                 "unable to expand relative tor cookie path{}: pid lookup "
                 "failed",
                 ToLabel(pid_resolver));
      return;
    }
    const auto cwd = process_resolver.Cwd(*pid);
    if (!cwd) {
      TORCTL_LOG(logger, debug,
                 "unable to expand relative tor cookie path{}: cwd lookup "
                 "failed",
                 ToLabel(pid_resolver));
      return;
    }
    info.cookie_path_ = system::ExpandPath(*cookie_path, *cwd);
  } catch (const std::exception& ex) {
    TORCTL_LOG(logger, debug, "unable to expand relative tor cookie path{}: {}",
               ToLabel(pid_resolver), ex.what());
  }
}

}  // namespace torctl::protocol
