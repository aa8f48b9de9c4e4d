#include <torctl/system/process.hpp>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>
#include <utils/string_utils.hpp>

namespace torctl::system {

namespace fs = std::filesystem;

namespace {

using Inode = unsigned long;
using Inodes = std::set<Inode>;
using Pids = std::set<Pid>;

const fs::path kProcDir{"/proc"};
const std::string_view kSocketLinkPrefix{"socket:["};
constexpr std::string_view kTcpListenState{"0A"};
// Kernel truncates process names to TASK_COMM_LEN - 1 characters.
constexpr size_t kMaxCommLen{15};

template <typename T>
std::optional<T> ParseNumber(std::string_view sv, int base = 10) noexcept {
  T value{};
  const auto [ptr, ec] =
      std::from_chars(sv.data(), sv.data() + sv.size(), value, base);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> Fields(const std::string& line) {
  std::istringstream stream{line};
  std::vector<std::string> fields;
  std::string field;
  while (stream >> field) {
    fields.push_back(std::move(field));
  }
  return fields;
}

template <typename Handler>
void ForEachPid(Handler&& handler) {
  std::error_code ec;
  for (fs::directory_iterator it{kProcDir, ec}, end; !ec && it != end;
       it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (!utils::IsDigits(name)) {
      continue;
    }
    if (const auto pid = ParseNumber<Pid>(name)) {
      handler(*pid, it->path());
    }
  }
}

PidOpt SinglePid(const Pids& pids) noexcept {
  if (pids.size() != 1) {
    return std::nullopt;
  }
  return *pids.begin();
}

// Listening sockets on the port, from /proc/net/tcp or /proc/net/tcp6.
void ReadTcpListenInodes(const fs::path& table, unsigned short port,
                         Inodes& inodes) {
  std::ifstream file{table};
  std::string line;
  std::getline(file, line);
  while (std::getline(file, line)) {
    // sl local_address rem_address st tx_queue:rx_queue tr:tm->when retrnsmt
    // uid timeout inode
    const auto fields = Fields(line);
    if (fields.size() < 10 || fields[3] != kTcpListenState) {
      continue;
    }
    const auto& local_addr = fields[1];
    const auto colon = local_addr.rfind(':');
    if (colon == std::string::npos) {
      continue;
    }
    const auto local_port = ParseNumber<unsigned int>(
        std::string_view{local_addr}.substr(colon + 1), 16);
    if (!local_port || *local_port != port) {
      continue;
    }
    if (const auto inode = ParseNumber<Inode>(fields[9]); inode && *inode) {
      inodes.insert(*inode);
    }
  }
}

// Unix sockets bound at the path, from /proc/net/unix.
void ReadUnixSocketInodes(std::string_view path, Inodes& inodes) {
  std::ifstream file{kProcDir / "net" / "unix"};
  std::string line;
  std::getline(file, line);
  while (std::getline(file, line)) {
    // Num RefCount Protocol Flags Type St Inode Path
    const auto fields = Fields(line);
    if (fields.size() < 8 || fields[7] != path) {
      continue;
    }
    if (const auto inode = ParseNumber<Inode>(fields[6]); inode && *inode) {
      inodes.insert(*inode);
    }
  }
}

std::optional<Inode> SocketInode(const std::string& link) noexcept {
  std::string_view sv{link};
  if (!sv.starts_with(kSocketLinkPrefix) || !sv.ends_with(']')) {
    return std::nullopt;
  }
  sv.remove_prefix(kSocketLinkPrefix.size());
  sv.remove_suffix(1);
  return ParseNumber<Inode>(sv);
}

// Processes with an open descriptor that is one of the sockets, or the file.
Pids PidsHolding(const Inodes& inodes, const std::string& file_path) {
  Pids pids;
  ForEachPid([&](Pid pid, const fs::path& proc_path) {
    std::error_code ec;
    for (fs::directory_iterator it{proc_path / "fd", ec}, end;
         !ec && it != end; it.increment(ec)) {
      std::error_code link_ec;
      const auto target = fs::read_symlink(it->path(), link_ec);
      if (link_ec) {
        continue;
      }
      const auto link = target.string();
      const auto inode = SocketInode(link);
      if ((inode && inodes.contains(*inode)) ||
          (!file_path.empty() && link == file_path)) {
        pids.insert(pid);
        break;
      }
    }
  });
  return pids;
}

}  // namespace

PidOpt PidByName(std::string_view process_name) noexcept {
  try {
    if (process_name.empty()) {
      return std::nullopt;
    }
    const auto comm_name = process_name.substr(0, kMaxCommLen);
    Pids pids;
    ForEachPid([&](Pid pid, const fs::path& proc_path) {
      std::ifstream comm{proc_path / "comm"};
      std::string name;
      if (std::getline(comm, name) && name == comm_name) {
        pids.insert(pid);
      }
    });
    return SinglePid(pids);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

PidOpt PidByPort(unsigned short port) noexcept {
  try {
    Inodes inodes;
    ReadTcpListenInodes(kProcDir / "net" / "tcp", port, inodes);
    ReadTcpListenInodes(kProcDir / "net" / "tcp6", port, inodes);
    if (inodes.empty()) {
      return std::nullopt;
    }
    return SinglePid(PidsHolding(inodes, {}));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

PidOpt PidByOpenFile(std::string_view path) noexcept {
  try {
    if (path.empty()) {
      return std::nullopt;
    }
    Inodes inodes;
    ReadUnixSocketInodes(path, inodes);
    std::error_code ec;
    auto file_path = fs::weakly_canonical(fs::path{path}, ec).string();
    if (ec) {
      file_path = std::string{path};
    }
    return SinglePid(PidsHolding(inodes, file_path));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

PathOpt Cwd(Pid pid) noexcept {
  try {
    std::error_code ec;
    const auto cwd =
        fs::read_symlink(kProcDir / std::to_string(pid) / "cwd", ec);
    if (ec || cwd.empty()) {
      return std::nullopt;
    }
    return cwd.string();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

bool IsRelativePath(std::string_view path) noexcept {
  return !path.empty() && path.front() != '/';
}

std::string ExpandPath(std::string_view path, std::string_view cwd) {
  fs::path expanded{path};
  if (IsRelativePath(path)) {
    expanded = fs::path{cwd} / expanded;
  }
  return expanded.lexically_normal().string();
}

PidOpt SystemProcessResolver::PidByName(
    std::string_view process_name) const noexcept {
  return system::PidByName(process_name);
}

PidOpt SystemProcessResolver::PidByPort(unsigned short port) const noexcept {
  return system::PidByPort(port);
}

PidOpt SystemProcessResolver::PidByOpenFile(
    std::string_view path) const noexcept {
  return system::PidByOpenFile(path);
}

PathOpt SystemProcessResolver::Cwd(Pid pid) const noexcept {
  return system::Cwd(pid);
}

const ProcessResolver& GetSystemProcessResolver() noexcept {
  static const SystemProcessResolver resolver;
  return resolver;
}

}  // namespace torctl::system
