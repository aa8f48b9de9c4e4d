#include <gtest/gtest.h>
#include <torctl/protocol/protocol_info.hpp>
#include <test_utils/assert_macro.hpp>
#include <test_utils/capture_logger.hpp>
#include <test_utils/fake_process_resolver.hpp>

namespace torctl::protocol {

class ProtocolInfoTest : public testing::Test {
 protected:
  ProtocolInfoOrError Parse(const std::vector<std::string>& lines) {
    return ParseProtocolInfo(ControlMessage::FromLines(lines),
                             ParseContext{test::MakeCaptureLogger(records_),
                                          resolver_});
  }

  bool Logged(logger::Level lvl, std::string_view text) const {
    for (const auto& record : *records_) {
      if (record.lvl == lvl && record.msg.find(text) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  test::FakeProcessResolver resolver_;
  test::LogRecordsPtr records_{std::make_shared<test::LogRecords>()};
};

TEST_F(ProtocolInfoTest, CookieReply) {
  const auto [err, info] =
      Parse({"PROTOCOLINFO 1", "AUTH METHODS=COOKIE COOKIEFILE=\"/tmp/x\"",
             "VERSION Tor=\"0.2.1.30\"", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->ProtocolVersion(), 1u);
  EXPECT_EQ(info->AuthMethods(), std::vector<AuthMethod>{AuthMethod::kCookie});
  EXPECT_TRUE(info->UnknownAuthMethods().empty());
  EXPECT_EQ(info->CookiePath(), "/tmp/x");
  ASSERT_TRUE(info->TorVersion());
  EXPECT_EQ(info->TorVersion()->ToString(), "0.2.1.30");
  EXPECT_EQ(*info->TorVersion()->Patch(), 30u);
  EXPECT_EQ(info->Message().Content().size(), 4u);
}

TEST_F(ProtocolInfoTest, MissingMethodsIsMalformed) {
  const auto [err, info] =
      Parse({"PROTOCOLINFO 1", "AUTH COOKIEFILE=\"/tmp/x\"", "OK"});
  EXPECT_CONTROL_ERROR(err, error::Error::kMalformedReply);
  EXPECT_FALSE(info);
}

TEST_F(ProtocolInfoTest, AllKnownMethods) {
  const auto [err, info] =
      Parse({"PROTOCOLINFO 1", "AUTH METHODS=NULL,HASHEDPASSWORD,COOKIE",
             "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->AuthMethods(),
            (std::vector<AuthMethod>{AuthMethod::kNone, AuthMethod::kPassword,
                                     AuthMethod::kCookie}));
  EXPECT_FALSE(info->HasAuthMethod(AuthMethod::kUnknown));
  EXPECT_FALSE(info->CookiePath());
  EXPECT_FALSE(info->TorVersion());
}

TEST_F(ProtocolInfoTest, UnknownMethodsCollapse) {
  const auto [err, info] =
      Parse({"PROTOCOLINFO 1", "AUTH METHODS=NULL,FOO,BAR", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->AuthMethods(),
            (std::vector<AuthMethod>{AuthMethod::kNone, AuthMethod::kUnknown}));
  EXPECT_EQ(info->UnknownAuthMethods(),
            (std::vector<std::string>{"FOO", "BAR"}));
  EXPECT_TRUE(Logged(logger::info, "unrecognized authentication method: FOO"));
  EXPECT_TRUE(Logged(logger::info, "unrecognized authentication method: BAR"));
}

TEST_F(ProtocolInfoTest, ProtocolVersionParsed) {
  const auto [err, info] = Parse({"PROTOCOLINFO 7", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->ProtocolVersion(), 7u);
  EXPECT_TRUE(info->AuthMethods().empty());
  EXPECT_TRUE(Logged(logger::warn, "got a version 7 response"));
}

TEST_F(ProtocolInfoTest, NoWarningForRequestedVersion) {
  const auto [err, info] = Parse({"PROTOCOLINFO 1", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_FALSE(Logged(logger::warn, "PROTOCOLINFO"));
}

TEST_F(ProtocolInfoTest, NonNumericProtocolVersion) {
  for (const auto* header : {"PROTOCOLINFO 1a", "PROTOCOLINFO -1",
                             "PROTOCOLINFO x", "PROTOCOLINFO"}) {
    const auto [err, info] = Parse({header, "OK"});
    EXPECT_CONTROL_ERROR(err, error::Error::kMalformedReply);
  }
}

TEST_F(ProtocolInfoTest, OutOfRangeProtocolVersion) {
  const auto [err, info] = Parse({"PROTOCOLINFO 99999999999", "OK"});
  EXPECT_CONTROL_ERROR(err, error::Error::kMalformedReply);
  EXPECT_EQ(err->Detail(),
            "PROTOCOLINFO response version is out of range: 99999999999");

  const auto [max_err, max_info] = Parse({"PROTOCOLINFO 4294967295", "OK"});
  ASSERT_FALSE(max_err) << max_err->Msg();
  EXPECT_EQ(max_info->ProtocolVersion(), 4294967295u);
}

TEST_F(ProtocolInfoTest, NotProtocolInfoReply) {
  const auto [err, info] = Parse({"VERSION Tor=\"0.4.8.10\"", "OK"});
  EXPECT_CONTROL_ERROR(err, error::Error::kMalformedReply);
  EXPECT_EQ(err->Detail(), "Message is not a PROTOCOLINFO response");
  const auto [empty_err, empty_info] = Parse({});
  EXPECT_CONTROL_ERROR(empty_err, error::Error::kMalformedReply);
}

TEST_F(ProtocolInfoTest, VersionLineErrors) {
  const auto [missing_err, missing] =
      Parse({"PROTOCOLINFO 1", "VERSION 0.4.8.10", "OK"});
  EXPECT_CONTROL_ERROR(missing_err, error::Error::kMalformedReply);
  const auto [unquoted_err, unquoted] =
      Parse({"PROTOCOLINFO 1", "VERSION Tor=0.4.8.10", "OK"});
  EXPECT_CONTROL_ERROR(unquoted_err, error::Error::kMalformedReply);
  const auto [invalid_err, invalid] =
      Parse({"PROTOCOLINFO 1", "VERSION Tor=\"0.4.eight\"", "OK"});
  EXPECT_CONTROL_ERROR(invalid_err, error::Error::kMalformedReply);
  EXPECT_NE(invalid_err->Detail().find("0.4.eight"), std::string::npos);
}

TEST_F(ProtocolInfoTest, UnknownLineTypesIgnored) {
  const auto [err, info] =
      Parse({"PROTOCOLINFO 1", "FUTURE-FIELD something=new", "",
             "AUTH METHODS=NULL", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->AuthMethods(), std::vector<AuthMethod>{AuthMethod::kNone});
  EXPECT_TRUE(Logged(logger::debug, "FUTURE-FIELD"));
}

TEST_F(ProtocolInfoTest, StopsAtOk) {
  const auto [err, info] = Parse(
      {"PROTOCOLINFO 1", "OK", "AUTH this-line-is-never-parsed", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_TRUE(info->AuthMethods().empty());
}

TEST_F(ProtocolInfoTest, EscapedCookiePath) {
  const auto [err, info] = Parse(
      {"PROTOCOLINFO 1",
       R"(AUTH METHODS=COOKIE COOKIEFILE="/tmp/my \"tor\" dir/cookie")",
       "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->CookiePath(), "/tmp/my \"tor\" dir/cookie");
}

TEST_F(ProtocolInfoTest, RelativeCookiePathExpandedByName) {
  resolver_.by_name["tor"] = 1234;
  resolver_.cwd[1234] = "/var/lib/tor";
  const auto [err, info] = Parse(
      {"PROTOCOLINFO 1",
       "AUTH METHODS=COOKIE COOKIEFILE=\"data/control_auth_cookie\"", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->CookiePath(), "/var/lib/tor/data/control_auth_cookie");
}

TEST_F(ProtocolInfoTest, RelativeCookiePathKeptWhenDaemonNotFound) {
  const auto [err, info] = Parse(
      {"PROTOCOLINFO 1",
       "AUTH METHODS=COOKIE COOKIEFILE=\"control_auth_cookie\"", "OK"});
  ASSERT_FALSE(err) << err->Msg();
  EXPECT_EQ(info->CookiePath(), "control_auth_cookie");
  EXPECT_TRUE(Logged(logger::debug,
                     "unable to expand relative tor cookie path by name: pid "
                     "lookup failed"));
}

TEST(AuthMethodTest, ToString) {
  EXPECT_EQ(ToString(AuthMethod::kNone), "NONE");
  EXPECT_EQ(ToString(AuthMethod::kPassword), "PASSWORD");
  EXPECT_EQ(ToString(AuthMethod::kCookie), "COOKIE");
  EXPECT_EQ(ToString(AuthMethod::kUnknown), "UNKNOWN");
}

}  // namespace torctl::protocol
