#pragma once

#include <map>
#include <string>
#include <torctl/system/process.hpp>

namespace torctl::test {

class FakeProcessResolver final : public system::ProcessResolver {
 public:
  system::PidOpt PidByName(std::string_view process_name) const noexcept override {
    return Find(by_name, std::string{process_name});
  }

  system::PidOpt PidByPort(unsigned short port) const noexcept override {
    return Find(by_port, port);
  }

  system::PidOpt PidByOpenFile(std::string_view path) const noexcept override {
    return Find(by_open_file, std::string{path});
  }

  system::PathOpt Cwd(system::Pid pid) const noexcept override {
    return Find(cwd, pid);
  }

  std::map<std::string, system::Pid> by_name;
  std::map<unsigned short, system::Pid> by_port;
  std::map<std::string, system::Pid> by_open_file;
  std::map<system::Pid, std::string> cwd;

 private:
  template <typename Map, typename Key>
  static std::optional<typename Map::mapped_type> Find(const Map& map,
                                                       const Key& key) {
    if (const auto it = map.find(key); it != map.end()) {
      return it->second;
    }
    return std::nullopt;
  }
};

}  // namespace torctl::test
