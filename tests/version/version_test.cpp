#include <gtest/gtest.h>
#include <stdexcept>
#include <torctl/version/version.hpp>
#include <test_utils/assert_macro.hpp>

namespace torctl::version {

namespace {

Version Parse(std::string_view str) {
  auto [err, version] = ParseVersion(str);
  if (err) {
    throw std::runtime_error{err->Msg()};
  }
  return std::move(*version);
}

}  // namespace

TEST(VersionTest, ParseFullVersion) {
  const auto version = Parse("0.2.2.23-alpha");
  EXPECT_EQ(version.Major(), 0u);
  EXPECT_EQ(version.Minor(), 2u);
  EXPECT_EQ(version.Micro(), 2u);
  ASSERT_TRUE(version.Patch());
  EXPECT_EQ(*version.Patch(), 23u);
  ASSERT_TRUE(version.Status());
  EXPECT_EQ(*version.Status(), "alpha");
  EXPECT_EQ(version.ToString(), "0.2.2.23-alpha");
}

TEST(VersionTest, ParseWithoutPatch) {
  const auto version = Parse("0.4.8");
  EXPECT_FALSE(version.Patch());
  EXPECT_FALSE(version.Status());
}

TEST(VersionTest, ParseDashedStatus) {
  const auto version = Parse("0.4.9.1-alpha-dev");
  EXPECT_EQ(*version.Status(), "alpha-dev");
}

TEST(VersionTest, RejectsMalformed) {
  for (const auto* str : {"", "1.2", "1.2.3.4.5", "1.2.a", "1.2.3 ",
                          " 1.2.3", "1..3", "x.y.z", "1.2.3.-rc"}) {
    const auto [err, version] = ParseVersion(str);
    EXPECT_CONTROL_ERROR(err, error::Error::kInvalidVersion);
    EXPECT_FALSE(version) << str;
  }
}

TEST(VersionTest, ErrorNamesInput) {
  const auto [err, version] = ParseVersion("1.2.a");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->Detail(), "'1.2.a' isn't a properly formatted tor version");
}

TEST(VersionTest, Ordering) {
  EXPECT_LT(Parse("0.2.1.30"), Parse("0.2.2.1"));
  EXPECT_LT(Parse("0.4.8"), Parse("0.4.8.0"));
  EXPECT_LT(Parse("0.4.8.1-rc"), Parse("0.4.8.1"));
  EXPECT_LT(Parse("0.4.8.1-alpha"), Parse("0.4.8.1-rc"));
  EXPECT_GT(Parse("1.0.0"), Parse("0.9.9.9"));
  EXPECT_EQ(Parse("0.4.8.10"), Parse("0.4.8.10"));
  EXPECT_NE(Parse("0.4.8.10"), Parse("0.4.8.10-dev"));
}

}  // namespace torctl::version
