#include <gtest/gtest.h>
#include <unistd.h>
#include <filesystem>
#include <torctl/common/asio.hpp>
#include <torctl/system/process.hpp>

namespace torctl::system {

namespace fs = std::filesystem;

TEST(ProcessTest, PidByPortFindsOwnListener) {
  asio::io_context io_context;
  tcp::acceptor acceptor{io_context,
                         tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}};
  const auto pid = PidByPort(acceptor.local_endpoint().port());
  ASSERT_TRUE(pid);
  EXPECT_EQ(*pid, getpid());
  EXPECT_EQ(GetSystemProcessResolver().PidByPort(
                acceptor.local_endpoint().port()),
            getpid());
}

TEST(ProcessTest, PidByPortWithoutListener) {
  asio::io_context io_context;
  unsigned short port{};
  {
    tcp::acceptor acceptor{
        io_context, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}};
    port = acceptor.local_endpoint().port();
  }
  EXPECT_FALSE(PidByPort(port));
}

TEST(ProcessTest, PidByOpenFileFindsOwnUnixSocket) {
  const auto path =
      (fs::temp_directory_path() /
       ("torctl_process_test_" + std::to_string(getpid()) + ".sock"))
          .string();
  fs::remove(path);
  asio::io_context io_context;
  local::acceptor acceptor{io_context, local::endpoint{path}};
  const auto pid = PidByOpenFile(path);
  acceptor.close();
  fs::remove(path);
  ASSERT_TRUE(pid);
  EXPECT_EQ(*pid, getpid());
}

TEST(ProcessTest, PidByOpenFileWithoutHolder) {
  EXPECT_FALSE(PidByOpenFile("/nonexistent/torctl/control"));
}

TEST(ProcessTest, PidByNameWithoutMatch) {
  EXPECT_FALSE(PidByName("torctl-no-such"));
}

TEST(ProcessTest, CwdOfSelf) {
  const auto cwd = Cwd(getpid());
  ASSERT_TRUE(cwd);
  EXPECT_EQ(fs::path{*cwd}, fs::current_path());
}

TEST(ProcessTest, CwdOfMissingProcess) {
  EXPECT_FALSE(Cwd(-1));
}

TEST(ProcessTest, RelativePaths) {
  EXPECT_TRUE(IsRelativePath("control_auth_cookie"));
  EXPECT_TRUE(IsRelativePath("./data/cookie"));
  EXPECT_FALSE(IsRelativePath("/var/lib/tor/cookie"));
  EXPECT_FALSE(IsRelativePath(""));
}

TEST(ProcessTest, ExpandPath) {
  EXPECT_EQ(ExpandPath("cookie", "/var/lib/tor"), "/var/lib/tor/cookie");
  EXPECT_EQ(ExpandPath("../cookie", "/var/lib/tor/"), "/var/lib/cookie");
  EXPECT_EQ(ExpandPath("/tmp//x", "/var/lib/tor"), "/tmp/x");
}

}  // namespace torctl::system
