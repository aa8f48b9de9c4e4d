#include <gtest/gtest.h>
#include <stdexcept>
#include <fmt/core.h>
#include <torctl/protocol/cookie_path.hpp>
#include <torctl/protocol/protocol_info.hpp>
#include <test_utils/capture_logger.hpp>
#include <test_utils/fake_process_resolver.hpp>

namespace torctl::protocol {

class CookiePathTest : public testing::Test {
 protected:
  ProtocolInfo MakeInfo(std::string_view cookie_file) {
    auto [err, info] = ParseProtocolInfo(
        ControlMessage::FromLines(
            {"PROTOCOLINFO 1",
             fmt::format("AUTH METHODS=COOKIE COOKIEFILE=\"{}\"", cookie_file),
             "OK"}),
        ParseContext{logger::MakeNullLogger(), resolver_});
    if (err) {
      throw std::runtime_error{err->Msg()};
    }
    return std::move(*info);
  }

  void Expand(ProtocolInfo& info, PidResolver pid_resolver,
              const PidResolverKey& key) {
    ExpandCookiePath(info, pid_resolver, key, resolver_,
                     test::MakeCaptureLogger(records_));
  }

  test::FakeProcessResolver resolver_;
  test::LogRecordsPtr records_{std::make_shared<test::LogRecords>()};
};

TEST_F(CookiePathTest, Labels) {
  EXPECT_EQ(ToLabel(PidResolver::kByName), " by name");
  EXPECT_EQ(ToLabel(PidResolver::kByPort), " by port");
  EXPECT_EQ(ToLabel(PidResolver::kBySocketFile), " by socket file");
}

TEST_F(CookiePathTest, ExpandByPort) {
  resolver_.by_port[9051] = 42;
  resolver_.cwd[42] = "/var/lib/tor";
  auto info = MakeInfo("control_auth_cookie");
  Expand(info, PidResolver::kByPort, static_cast<unsigned short>(9051));
  EXPECT_EQ(info.CookiePath(), "/var/lib/tor/control_auth_cookie");
  EXPECT_TRUE(records_->empty());
}

TEST_F(CookiePathTest, ExpandBySocketFile) {
  resolver_.by_open_file["/run/tor/control"] = 7;
  resolver_.cwd[7] = "/home/tor/";
  auto info = MakeInfo("./data/../cookie");
  Expand(info, PidResolver::kBySocketFile, std::string{"/run/tor/control"});
  EXPECT_EQ(info.CookiePath(), "/home/tor/cookie");
}

TEST_F(CookiePathTest, AbsolutePathIsNoOp) {
  resolver_.by_port[9051] = 42;
  resolver_.cwd[42] = "/var/lib/tor";
  auto info = MakeInfo("/tmp/x");
  Expand(info, PidResolver::kByPort, static_cast<unsigned short>(9051));
  Expand(info, PidResolver::kByName, std::string{"tor"});
  EXPECT_EQ(info.CookiePath(), "/tmp/x");
  EXPECT_TRUE(records_->empty());
}

TEST_F(CookiePathTest, MissingPathIsNoOp) {
  auto [err, info] = ParseProtocolInfo(
      ControlMessage::FromLines({"PROTOCOLINFO 1", "AUTH METHODS=NULL", "OK"}));
  ASSERT_FALSE(err);
  Expand(*info, PidResolver::kByPort, static_cast<unsigned short>(9051));
  EXPECT_FALSE(info->CookiePath());
  EXPECT_TRUE(records_->empty());
}

TEST_F(CookiePathTest, PidLookupFailureLogged) {
  auto info = MakeInfo("control_auth_cookie");
  Expand(info, PidResolver::kByPort, static_cast<unsigned short>(9051));
  EXPECT_EQ(info.CookiePath(), "control_auth_cookie");
  ASSERT_EQ(records_->size(), 1u);
  EXPECT_EQ(records_->front().lvl, logger::debug);
  EXPECT_EQ(records_->front().msg,
            "unable to expand relative tor cookie path by port: pid lookup "
            "failed");
}

TEST_F(CookiePathTest, CwdLookupFailureLogged) {
  resolver_.by_open_file["/run/tor/control"] = 7;
  auto info = MakeInfo("control_auth_cookie");
  Expand(info, PidResolver::kBySocketFile, std::string{"/run/tor/control"});
  EXPECT_EQ(info.CookiePath(), "control_auth_cookie");
  ASSERT_EQ(records_->size(), 1u);
  EXPECT_EQ(records_->front().msg,
            "unable to expand relative tor cookie path by socket file: cwd "
            "lookup failed");
}

TEST_F(CookiePathTest, PortResolutionAfterFailedNameResolution) {
  resolver_.by_port[9051] = 2;
  resolver_.cwd[2] = "/by/port";
  auto info = MakeInfo("cookie");
  EXPECT_EQ(info.CookiePath(), "cookie");
  Expand(info, PidResolver::kByPort, static_cast<unsigned short>(9051));
  EXPECT_EQ(info.CookiePath(), "/by/port/cookie");
}

TEST_F(CookiePathTest, NameResolutionLeavesNothingToExpand) {
  resolver_.by_name["tor"] = 1;
  resolver_.cwd[1] = "/by/name";
  resolver_.by_port[9051] = 2;
  resolver_.cwd[2] = "/by/port";
  auto info = MakeInfo("cookie");
  EXPECT_EQ(info.CookiePath(), "/by/name/cookie");
  Expand(info, PidResolver::kByPort, static_cast<unsigned short>(9051));
  EXPECT_EQ(info.CookiePath(), "/by/name/cookie");
}

}  // namespace torctl::protocol
