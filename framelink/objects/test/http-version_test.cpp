#include "framelink/http-version.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace framelink::http {

TEST(HttpVersionTest, ParsesSupportedVersions) {
  EXPECT_EQ(ParseVersion("HTTP/1.1"), Version::Http11);
  EXPECT_EQ(ParseVersion("HTTP/1.0"), Version::Http10);
}

TEST(HttpVersionTest, WellFormedButUnknownIsOther) {
  int major = -1;
  EXPECT_EQ(ParseVersion("HTTP/1.2", &major), Version::Other);
  EXPECT_EQ(major, 1);
  EXPECT_EQ(ParseVersion("HTTP/2.0", &major), Version::Other);
  EXPECT_EQ(major, 2);
  EXPECT_EQ(ParseVersion("HTTP/0.9"), Version::Other);
}

TEST(HttpVersionTest, MalformedTokens) {
  EXPECT_EQ(ParseVersion(""), std::nullopt);
  EXPECT_EQ(ParseVersion("HTTP/"), std::nullopt);
  EXPECT_EQ(ParseVersion("HTTP/1"), std::nullopt);
  EXPECT_EQ(ParseVersion("HTTP/1."), std::nullopt);
  EXPECT_EQ(ParseVersion("HTTP/.1"), std::nullopt);
  EXPECT_EQ(ParseVersion("http/1.1"), std::nullopt);
  EXPECT_EQ(ParseVersion("HTTP/1.1 "), std::nullopt);
  EXPECT_EQ(ParseVersion("HTTP/1.x"), std::nullopt);
}

TEST(HttpVersionTest, VersionToStr) {
  EXPECT_EQ(VersionToStr(Version::Http10), "HTTP/1.0");
  EXPECT_EQ(VersionToStr(Version::Http11), "HTTP/1.1");
  EXPECT_EQ(VersionToStr(Version::Other), "HTTP/1.1");
}

}  // namespace framelink::http
