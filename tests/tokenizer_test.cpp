//! # Tokenizer and Creation Flag Tests

#include "card/creation_flags.hpp"
#include "card/tokenizer.hpp"

#include <gtest/gtest.h>

using namespace pjsk;
using namespace pjsk::card;

// ============================================================================
// Token Splitting
// ============================================================================

TEST(TokenizerTest, ExtractFirstToken) {
    auto split = extract_first_token("  字号.大   2  ");
    EXPECT_EQ(split.token, "字号.大");
    EXPECT_EQ(split.remainder, "2");

    auto single = extract_first_token("曲线");
    EXPECT_EQ(single.token, "曲线");
    EXPECT_EQ(single.remainder, "");

    auto blank = extract_first_token("   ");
    EXPECT_EQ(blank.token, "");
    EXPECT_EQ(blank.remainder, "");
}

TEST(TokenizerTest, ExtractFirstTokenOnIdeographicSpace) {
    auto split = extract_first_token("文本\xE3\x80\x80你好 世界");
    EXPECT_EQ(split.token, "文本");
    EXPECT_EQ(split.remainder, "你好 世界");
}

TEST(TokenizerTest, SplitDotted) {
    auto dotted = split_dotted("位置.上.2");
    EXPECT_EQ(dotted.head, "位置");
    ASSERT_EQ(dotted.variants.size(), 2u);
    EXPECT_EQ(dotted.variants[0], "上");
    EXPECT_EQ(dotted.variants[1], "2");

    auto sparse = split_dotted(".字号..大.");
    EXPECT_EQ(sparse.head, "字号");
    ASSERT_EQ(sparse.variants.size(), 1u);
    EXPECT_EQ(sparse.variants[0], "大");

    auto empty = split_dotted("...");
    EXPECT_EQ(empty.head, "");
    EXPECT_TRUE(empty.variants.empty());
}

TEST(TokenizerTest, SplitArgsHonorsQuotes) {
    auto args = split_args(R"(-n "hello world" -r 'hatsune miku' -c)");
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[1], "hello world");
    EXPECT_EQ(args[3], "hatsune miku");
    EXPECT_EQ(args[4], "-c");
}

TEST(TokenizerTest, SplitArgsHonorsCjkQuotes) {
    auto args = split_args("-n “你好 世界”");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[1], "你好 世界");
}

TEST(TokenizerTest, UnterminatedQuoteStaysLiteral) {
    auto args = split_args(R"(-n "open ended)");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[1], "\"open");
    EXPECT_EQ(args[2], "ended");
}

// ============================================================================
// Number Parsing
// ============================================================================

TEST(NumberParsingTest, ParseIntAcceptsLooseForms) {
    EXPECT_EQ(unwrap(parse_int("48")), 48);
    EXPECT_EQ(unwrap(parse_int("48PX")), 48);
    EXPECT_EQ(unwrap(parse_int("-12")), -12);
    EXPECT_EQ(unwrap(parse_int("＋5")), 5);
    EXPECT_EQ(unwrap(parse_int("－5")), -5);
    EXPECT_EQ(unwrap(parse_int("3.9")), 3);
    EXPECT_EQ(unwrap(parse_int("-3.9")), -3);
}

TEST(NumberParsingTest, ParseIntRejectsGarbage) {
    auto result = parse_int("abc");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, AdjustErrorKind::Validation);
    EXPECT_NE(unwrap_err(result).message.find("abc"), std::string::npos);

    EXPECT_TRUE(is_err(parse_int("")));
    EXPECT_TRUE(is_err(parse_int("1 2")));
}

TEST(NumberParsingTest, ParseIntSaturatesOversizedValues) {
    EXPECT_EQ(unwrap(parse_int("99999999999999999999")), 9000000000000000000LL);
    EXPECT_EQ(unwrap(parse_int("-99999999999999999999")), -9000000000000000000LL);
    EXPECT_EQ(unwrap(parse_positive_int("99999999999999999999")), 9000000000000000000LL);
    EXPECT_TRUE(is_err(parse_int("1e999")));
}

TEST(NumberParsingTest, ParsePositiveInt) {
    EXPECT_EQ(unwrap(parse_positive_int("3")), 3);
    EXPECT_TRUE(is_err(parse_positive_int("0")));
    EXPECT_TRUE(is_err(parse_positive_int("-2")));
}

TEST(NumberParsingTest, ParseFloat) {
    EXPECT_DOUBLE_EQ(unwrap(parse_float("1.5")), 1.5);
    EXPECT_DOUBLE_EQ(unwrap(parse_float("1.5倍")), 1.5);
    EXPECT_DOUBLE_EQ(unwrap(parse_float("2x")), 2.0);
    EXPECT_DOUBLE_EQ(unwrap(parse_float("1,8")), 1.8);
    EXPECT_TRUE(is_err(parse_float("wide")));
}

// ============================================================================
// Creation Flags
// ============================================================================

TEST(CreationFlagsTest, ParsesEveryFlag) {
    auto flags = parse_creation_flags(
        split_args(R"(-n "hi there" -s 48 -l 1.8 -c -x 12 -y -6 -r miku --daf)"));
    EXPECT_EQ(flags.text, "hi there");
    EXPECT_EQ(flags.font_size, 48);
    ASSERT_TRUE(flags.line_spacing.has_value());
    EXPECT_DOUBLE_EQ(*flags.line_spacing, 1.8);
    EXPECT_TRUE(flags.curve);
    EXPECT_EQ(flags.offset_x, 12);
    EXPECT_EQ(flags.offset_y, -6);
    EXPECT_EQ(flags.role, "miku");
    EXPECT_TRUE(flags.default_font);
    EXPECT_FALSE(flags.random_role());
}

TEST(CreationFlagsTest, SkipsUnknownAndInvalidValues) {
    auto flags = parse_creation_flags({"--bold", "-s", "big", "-x", "1.5", "-c"});
    EXPECT_FALSE(flags.font_size.has_value());
    EXPECT_FALSE(flags.offset_x.has_value());
    EXPECT_TRUE(flags.curve);
}

TEST(CreationFlagsTest, TrailingFlagWithoutValueIsSkipped) {
    auto flags = parse_creation_flags({"-c", "-n"});
    EXPECT_TRUE(flags.curve);
    EXPECT_FALSE(flags.text.has_value());
}

TEST(CreationFlagsTest, RandomMarkers) {
    EXPECT_TRUE(is_random_marker("random"));
    EXPECT_TRUE(is_random_marker("RANDOM"));
    EXPECT_TRUE(is_random_marker("随机"));
    EXPECT_TRUE(is_random_marker("-r"));
    EXPECT_FALSE(is_random_marker("miku"));

    auto flags = parse_creation_flags({"-r", "随机"});
    EXPECT_TRUE(flags.random_role());
}

TEST(CreationFlagsTest, FlagStyleDetection) {
    EXPECT_TRUE(is_flag_style("-n hello"));
    EXPECT_TRUE(is_flag_style("  --daf"));
    EXPECT_FALSE(is_flag_style("hello -n"));
    EXPECT_FALSE(is_flag_style("-z 1"));
    EXPECT_FALSE(is_flag_style(""));
}

TEST(CreationFlagsTest, EmptyWhenNothingRecognized) {
    EXPECT_TRUE(parse_creation_flags({}).empty());
    EXPECT_TRUE(parse_creation_flags({"--unknown"}).empty());
    EXPECT_FALSE(parse_creation_flags({"-c"}).empty());
}
