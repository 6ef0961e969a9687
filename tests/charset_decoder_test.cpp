#include "kubeclient/text/charset_decoder.hpp"

#include "gtest/gtest.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace kubeclient;
using kubeclient::text::CharsetDecoder;

namespace {

auto raw(std::string_view text) -> std::vector<std::uint8_t> {
  return {text.begin(), text.end()};
}

} // namespace

TEST(CharsetDecoderTest, Utf8PassesThrough) {
  auto decoder = CharsetDecoder::create("utf-8");
  ASSERT_TRUE(decoder.has_value());
  std::string out;
  decoder->decode(raw("hello \xE2\x9C\x93"), out);
  EXPECT_EQ(out, "hello \xE2\x9C\x93");
  EXPECT_EQ(decoder->pending_bytes(), 0U);
}

TEST(CharsetDecoderTest, EmptyNameMeansUtf8) {
  auto decoder = CharsetDecoder::create("");
  ASSERT_TRUE(decoder.has_value());
  EXPECT_EQ(decoder->charset(), "UTF-8");
}

TEST(CharsetDecoderTest, HoldsBackIncompleteSequence) {
  auto decoder = CharsetDecoder::create("UTF-8");
  ASSERT_TRUE(decoder.has_value());
  std::string out;
  decoder->decode(raw("ab\xE2\x9C"), out);
  EXPECT_EQ(out, "ab");
  EXPECT_EQ(decoder->pending_bytes(), 2U);
  decoder->decode(raw("\x93"), out);
  EXPECT_EQ(out, "ab\xE2\x9C\x93");
  EXPECT_EQ(decoder->pending_bytes(), 0U);
}

TEST(CharsetDecoderTest, InvalidByteBecomesReplacementCharacter) {
  auto decoder = CharsetDecoder::create("UTF-8");
  ASSERT_TRUE(decoder.has_value());
  std::string out;
  decoder->decode(raw("a\xFF"
                      "b"),
                  out);
  EXPECT_EQ(out, "a\xEF\xBF\xBD"
                 "b");
}

TEST(CharsetDecoderTest, FinishReplacesLeftoverBytes) {
  auto decoder = CharsetDecoder::create("UTF-8");
  ASSERT_TRUE(decoder.has_value());
  std::string out;
  decoder->decode(raw("z\xE2\x9C"), out);
  decoder->finish(out);
  EXPECT_EQ(out, "z\xEF\xBF\xBD");
  EXPECT_EQ(decoder->pending_bytes(), 0U);
}

TEST(CharsetDecoderTest, ConvertsLatin1) {
  auto decoder = CharsetDecoder::create("iso-8859-1");
  ASSERT_TRUE(decoder.has_value());
  std::string out;
  decoder->decode(raw("na\xEFve"), out);
  EXPECT_EQ(out, "na\xC3\xAFve");
}

TEST(CharsetDecoderTest, ConvertsUtf16AcrossOddChunks) {
  auto decoder = CharsetDecoder::create("UTF-16LE");
  ASSERT_TRUE(decoder.has_value());
  std::string out;
  // "hi" in UTF-16LE, split inside the first code unit.
  decoder->decode(raw(std::string_view("h", 1)), out);
  EXPECT_TRUE(out.empty());
  decoder->decode(raw(std::string_view("\0i\0", 3)), out);
  EXPECT_EQ(out, "hi");
}

TEST(CharsetDecoderTest, MovedDecoderKeepsState) {
  auto decoder = CharsetDecoder::create("UTF-8");
  ASSERT_TRUE(decoder.has_value());
  std::string out;
  decoder->decode(raw("\xC3"), out);
  CharsetDecoder moved = std::move(*decoder);
  moved.decode(raw("\xA9"), out);
  EXPECT_EQ(out, "\xC3\xA9");
}

TEST(CharsetDecoderTest, UnknownCharset) {
  auto decoder = CharsetDecoder::create("klingon-8");
  ASSERT_FALSE(decoder.has_value());
  EXPECT_EQ(decoder.error(), make_error_code(Error::UnsupportedCharset));
}
