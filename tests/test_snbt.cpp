/**
 * @file test_snbt.cpp
 * @brief Unit tests for stringified NBT rendering and parsing
 */

#include <gtest/gtest.h>

#include "nbtcraft/snbt.hpp"

#include "utils/TestHelpers.hpp"

#include <string>

using namespace nbtcraft;
using namespace nbtcraft::test;

// =============================================================================
// Rendering Tests
// =============================================================================

class SnbtRenderTest : public ::testing::Test {};

TEST_F(SnbtRenderTest, Scalars) {
    EXPECT_EQ("1b", to_snbt(static_cast<sbyte_t>(1)));
    EXPECT_EQ("-2s", to_snbt(static_cast<short_t>(-2)));
    EXPECT_EQ("3", to_snbt(3));
    EXPECT_EQ("4l", to_snbt(long_t{4}));
    EXPECT_EQ("0.5f", to_snbt(0.5f));
    EXPECT_EQ("2.25d", to_snbt(2.25));
}

TEST_F(SnbtRenderTest, StringsAreQuotedAndEscaped) {
    EXPECT_EQ("\"plain\"", to_snbt("plain"));
    EXPECT_EQ(R"("say \"hi\" \\o/")", to_snbt(R"(say "hi" \o/)"));
}

TEST_F(SnbtRenderTest, Arrays) {
    EXPECT_EQ("[B;1b,-1b]", to_snbt(ByteArray{1, -1}));
    EXPECT_EQ("[I;1,2,3]", to_snbt(IntArray{1, 2, 3}));
    EXPECT_EQ("[L;9l]", to_snbt(LongArray{9}));
    EXPECT_EQ("[I;]", to_snbt(IntArray{}));
}

TEST_F(SnbtRenderTest, CompoundKeysQuotedOnlyWhenNeeded) {
    Compound compound{{"simple_key.1", 1}, {"has space", 2}, {"", 3}};
    EXPECT_EQ(R"({simple_key.1:1,"has space":2,"":3})", to_snbt(compound));
}

TEST_F(SnbtRenderTest, SortedKeys) {
    Compound compound{{"b", 1}, {"a", List(TAG_INT, {NBTTag(1), NBTTag(2)})}};
    EXPECT_EQ("{b:1,a:[1,2]}", to_snbt(compound));
    EXPECT_EQ("{a:[1,2],b:1}", to_snbt(compound, true));
}

// =============================================================================
// Parsing Tests
// =============================================================================

class SnbtParseTest : public ::testing::Test {};

TEST_F(SnbtParseTest, NumberSuffixes) {
    EXPECT_EQ(NBTTag(static_cast<sbyte_t>(-3)), parse_snbt("-3b"));
    EXPECT_EQ(NBTTag(static_cast<short_t>(300)), parse_snbt("300S"));
    EXPECT_EQ(NBTTag(7), parse_snbt("7"));
    EXPECT_EQ(NBTTag(long_t{-9000000000}), parse_snbt("-9000000000l"));
    EXPECT_EQ(NBTTag(1.5f), parse_snbt("1.5f"));
    EXPECT_EQ(NBTTag(2.0), parse_snbt("2d"));
    EXPECT_EQ(NBTTag(0.25), parse_snbt("0.25"));
    EXPECT_EQ(NBTTag(1e3), parse_snbt("1e3d"));
}

TEST_F(SnbtParseTest, BooleansAreBytes) {
    EXPECT_EQ(NBTTag(static_cast<sbyte_t>(1)), parse_snbt("true"));
    EXPECT_EQ(NBTTag(static_cast<sbyte_t>(0)), parse_snbt("false"));
}

TEST_F(SnbtParseTest, Strings) {
    EXPECT_EQ(NBTTag("a \"b\""), parse_snbt(R"("a \"b\"")"));
    EXPECT_EQ(NBTTag("it's"), parse_snbt(R"('it\'s')"));
    EXPECT_EQ(NBTTag("minecraft_stone"), parse_snbt("minecraft_stone"));
}

TEST_F(SnbtParseTest, NestedStructures) {
    NBTTag tag = parse_snbt(R"( { Pos : [1.0d, 2.0d, 3.5d], "Custom Name": 'x', Tags: [], Data: [I; 1, -2] } )");
    ASSERT_EQ(TAG_COMPOUND, tag.type());
    EXPECT_EQ(3u, tag.at("Pos").size());
    EXPECT_EQ(TAG_DOUBLE, tag.at("Pos").get<List>().element_type());
    EXPECT_EQ("x", tag.at("Custom Name").get<std::string>());
    EXPECT_EQ(TAG_END, tag.at("Tags").get<List>().element_type());
    EXPECT_EQ((IntArray{1, -2}), tag.at("Data").get<IntArray>());
}

TEST_F(SnbtParseTest, MixedListIsTypeMismatch) {
    ExpectError(errc::type_mismatch, [] { parse_snbt("[1, 2b]"); });
}

TEST_F(SnbtParseTest, SyntaxErrors) {
    ExpectError(errc::invalid_snbt, [] { parse_snbt(""); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("{a:1"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("{a:1} extra"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("[1 2]"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("\"open"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("{a 1}"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("[I;1b]"); });
}

TEST_F(SnbtParseTest, OutOfRangeIntegers) {
    ExpectError(errc::invalid_snbt, [] { parse_snbt("128b"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("40000s"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("3000000000"); });
    ExpectError(errc::invalid_snbt, [] { parse_snbt("[B;300b]"); });
}

TEST_F(SnbtParseTest, NestingIsBounded) {
    decode_options options;
    options.max_depth = 3;
    EXPECT_NO_THROW(parse_snbt("[[[[]]]]", options));
    ExpectError(errc::depth_exceeded, [&] { parse_snbt("[[[[[]]]]]", options); });
}

// =============================================================================
// Round Trip Tests
// =============================================================================

TEST(SnbtRoundTripTest, RenderedTreeParsesBack) {
    Compound root{
        {"byte", static_cast<sbyte_t>(-128)},
        {"short", static_cast<short_t>(32767)},
        {"int", -2147483647 - 1},
        {"long", long_t{9223372036854775807}},
        {"float", 0.1f},
        {"double", 1.0 / 3.0},
        {"text", "quote \" and backslash \\"},
        {"bytes", ByteArray{1, 2}},
        {"ints", IntArray{}},
        {"longs", LongArray{-1}},
        {"list", List(TAG_COMPOUND, {NBTTag(Compound{{"k", "v"}}), NBTTag(Compound{})})},
        {"empty", List()},
        {"weird key!", Compound{{"nested", 1.0f}}},
    };
    EXPECT_EQ(NBTTag(root), parse_snbt(to_snbt(root)));
    EXPECT_EQ(NBTTag(root), parse_snbt(to_snbt(root, true)));
}
