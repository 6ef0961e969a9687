#include "kubeclient/client/http/media_type.hpp"

#include "gtest/gtest.h"

using namespace kubeclient;
using namespace kubeclient::http;

TEST(MediaTypeTest, PlainType) {
  auto media = parse_media_type("application/json");
  ASSERT_TRUE(media.has_value());
  EXPECT_EQ(media->type, "application/json");
  EXPECT_FALSE(media->charset.has_value());
  EXPECT_EQ(charset_or_default(*media), "utf-8");
}

TEST(MediaTypeTest, TypeIsLowercasedAndTrimmed) {
  auto media = parse_media_type("  Application/JSON ;charset=UTF-8");
  ASSERT_TRUE(media.has_value());
  EXPECT_EQ(media->type, "application/json");
  EXPECT_EQ(media->charset, "UTF-8");
}

TEST(MediaTypeTest, CharsetParameterIsCaseInsensitiveAndUnquoted) {
  auto media =
      parse_media_type(R"(application/json; stream=watch; Charset="iso-8859-1")");
  ASSERT_TRUE(media.has_value());
  EXPECT_EQ(media->charset, "iso-8859-1");
  EXPECT_EQ(charset_or_default(*media), "iso-8859-1");
}

TEST(MediaTypeTest, IgnoresParametersWithoutValue) {
  auto media = parse_media_type("text/plain; flag; charset=us-ascii");
  ASSERT_TRUE(media.has_value());
  EXPECT_EQ(media->charset, "us-ascii");
}

TEST(MediaTypeTest, EmptyCharsetFallsBackToDefault) {
  auto media = parse_media_type("application/json; charset=");
  ASSERT_TRUE(media.has_value());
  EXPECT_FALSE(media->charset.has_value());
}

TEST(MediaTypeTest, RejectsMalformedValues) {
  EXPECT_EQ(parse_media_type("").error(), make_error_code(Error::ParseError));
  EXPECT_EQ(parse_media_type("json").error(),
            make_error_code(Error::ParseError));
  EXPECT_EQ(parse_media_type("; charset=utf-8").error(),
            make_error_code(Error::ParseError));
}
