#include "kubeclient/text/line_decoder.hpp"

#include "gtest/gtest.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace kubeclient;
using kubeclient::text::LineDecoder;

namespace {

auto utf8_decoder() -> LineDecoder {
  auto decoder = LineDecoder::for_charset("utf-8");
  EXPECT_TRUE(decoder.has_value());
  return std::move(*decoder);
}

using Lines = std::vector<std::string>;

auto decode_all(const std::vector<std::string_view> &chunks) -> Lines {
  auto decoder = utf8_decoder();
  Lines lines;
  for (auto chunk : chunks) {
    for (auto &line : decoder.decode(chunk)) {
      lines.push_back(std::move(line));
    }
  }
  if (auto last = decoder.flush()) {
    lines.push_back(std::move(*last));
  }
  return lines;
}

} // namespace

TEST(LineDecoderTest, SplitsCompleteLines) {
  auto decoder = utf8_decoder();
  EXPECT_EQ(decoder.decode("first\nsecond\n"), (Lines{"first", "second"}));
  EXPECT_FALSE(decoder.flush().has_value());
}

TEST(LineDecoderTest, HoldsPartialLineUntilTerminated) {
  auto decoder = utf8_decoder();
  EXPECT_TRUE(decoder.decode("{\"type\":").empty());
  EXPECT_EQ(decoder.pending(), "{\"type\":");
  EXPECT_EQ(decoder.decode("\"ADDED\"}\nnext"), (Lines{"{\"type\":\"ADDED\"}"}));
  EXPECT_EQ(decoder.pending(), "next");
}

TEST(LineDecoderTest, AcceptsAllTerminatorStyles) {
  auto decoder = utf8_decoder();
  EXPECT_EQ(decoder.decode("a\r\nb\rc\nd"), (Lines{"a", "b", "c"}));
  EXPECT_EQ(decoder.flush(), std::optional<std::string>("d"));
}

TEST(LineDecoderTest, CrLfSplitAcrossChunksIsOneTerminator) {
  auto decoder = utf8_decoder();
  EXPECT_EQ(decoder.decode("one\r"), (Lines{"one"}));
  EXPECT_EQ(decoder.decode("\ntwo\n"), (Lines{"two"}));
}

TEST(LineDecoderTest, KeepsEmptyLines) {
  auto decoder = utf8_decoder();
  EXPECT_EQ(decoder.decode("a\n\nb\n"), (Lines{"a", "", "b"}));
}

TEST(LineDecoderTest, ReassemblesMultiByteCharacterAcrossChunks) {
  auto decoder = utf8_decoder();
  // "é" is 0xC3 0xA9.
  const std::string text = "caf\xC3\xA9\n";
  EXPECT_TRUE(decoder.decode(text.substr(0, 4)).empty());
  EXPECT_EQ(decoder.decode(text.substr(4)), (Lines{"caf\xC3\xA9"}));
}

TEST(LineDecoderTest, FlushEmitsTrailingLineOnce) {
  auto decoder = utf8_decoder();
  EXPECT_TRUE(decoder.decode("tail").empty());
  EXPECT_EQ(decoder.flush(), std::optional<std::string>("tail"));
  EXPECT_FALSE(decoder.flush().has_value());
}

TEST(LineDecoderTest, FlushReplacesTruncatedCharacter) {
  auto decoder = utf8_decoder();
  EXPECT_TRUE(decoder.decode("x\xC3").empty());
  EXPECT_EQ(decoder.flush(), std::optional<std::string>("x\xEF\xBF\xBD"));
}

TEST(LineDecoderTest, DecodesDeclaredCharset) {
  auto decoder = LineDecoder::for_charset("ISO-8859-1");
  ASSERT_TRUE(decoder.has_value());
  // Latin-1 0xE9 is "é".
  EXPECT_EQ(decoder->decode("caf\xE9\n"), (Lines{"caf\xC3\xA9"}));
}

TEST(LineDecoderTest, UnknownCharsetIsRejected) {
  auto decoder = LineDecoder::for_charset("x-no-such-charset");
  ASSERT_FALSE(decoder.has_value());
  EXPECT_EQ(decoder.error(), make_error_code(Error::UnsupportedCharset));
}

TEST(LineDecoderTest, EmptyStreamYieldsNoLines) {
  auto decoder = utf8_decoder();
  EXPECT_TRUE(decoder.decode("").empty());
  EXPECT_FALSE(decoder.flush().has_value());
  EXPECT_TRUE(decode_all({}).empty());
}

TEST(LineDecoderTest, ChunkBoundariesNeverChangeTheLines) {
  const std::string_view text = "a\r\nb\rc\n\r\ncaf\xC3\xA9\r\r\n"
                                "\xE2\x82\xACx\rtail";
  const auto expected = decode_all({text});
  ASSERT_EQ(expected, (Lines{"a", "b", "c", "", "caf\xC3\xA9", "",
                             "\xE2\x82\xACx", "tail"}));

  for (std::size_t i = 0; i <= text.size(); ++i) {
    for (std::size_t j = i; j <= text.size(); ++j) {
      auto lines = decode_all(
          {text.substr(0, i), text.substr(i, j - i), text.substr(j)});
      EXPECT_EQ(lines, expected) << "split at " << i << " and " << j;
    }
  }
}
