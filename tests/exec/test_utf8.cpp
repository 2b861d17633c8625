/*
 * test_utf8.cpp - Tests for lossy UTF-8 decoding
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "exec/utf8.hpp"

#include <string>

using namespace runway::exec;

namespace {
const std::string kFffd(utf8::kReplacement);
}

// ============================================================================
// Valid Input
// ============================================================================

TEST(Utf8DecodeTest, AsciiPassesThrough) {
    EXPECT_EQ(utf8::decodeLossy("hello\nworld"), "hello\nworld");
    EXPECT_TRUE(utf8::isValid("hello"));
}

TEST(Utf8DecodeTest, EmptyInput) {
    EXPECT_EQ(utf8::decodeLossy(""), "");
    EXPECT_TRUE(utf8::isValid(""));
}

TEST(Utf8DecodeTest, MultiByteSequencesPassThrough) {
    const std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_TRUE(utf8::isValid(text));
    EXPECT_EQ(utf8::decodeLossy(text), text);
}

TEST(Utf8DecodeTest, EmbeddedNulIsKept) {
    const std::string text("a\0b", 3);
    EXPECT_EQ(utf8::decodeLossy(text), text);
}

// ============================================================================
// Invalid Input
// ============================================================================

TEST(Utf8DecodeTest, LoneContinuationByte) {
    EXPECT_FALSE(utf8::isValid("a\x80z"));
    EXPECT_EQ(utf8::decodeLossy("a\x80z"), "a" + kFffd + "z");
}

TEST(Utf8DecodeTest, InvalidLeadBytes) {
    EXPECT_EQ(utf8::decodeLossy("\xC0\xAF"), kFffd + kFffd);
    EXPECT_EQ(utf8::decodeLossy("\xFF"), kFffd);
}

TEST(Utf8DecodeTest, TruncatedSequenceIsOneReplacement) {
    // A maximal valid prefix collapses into a single U+FFFD.
    EXPECT_EQ(utf8::decodeLossy("\xE2\x82"), kFffd);
    EXPECT_EQ(utf8::decodeLossy("x\xF0\x9F\x98"), "x" + kFffd);
}

TEST(Utf8DecodeTest, TruncatedSequenceFollowedByAscii) {
    EXPECT_EQ(utf8::decodeLossy("\xE2\x82!"), kFffd + "!");
}

TEST(Utf8DecodeTest, SurrogatesAreRejected) {
    EXPECT_FALSE(utf8::isValid("\xED\xA0\x80"));
    EXPECT_EQ(utf8::decodeLossy("\xED\xA0\x80"), kFffd + kFffd + kFffd);
}

TEST(Utf8DecodeTest, OverlongThreeByteIsRejected) {
    EXPECT_EQ(utf8::decodeLossy("\xE0\x80\xAF"), kFffd + kFffd + kFffd);
}

TEST(Utf8DecodeTest, AboveMaxCodePointIsRejected) {
    EXPECT_FALSE(utf8::isValid("\xF4\x90\x80\x80"));
}

TEST(Utf8DecodeTest, OutputIsAlwaysValid) {
    const std::string garbage = "\xFE\xC3\x28\xE2\x28\xA1\xF0\x28\x8C\xBC ok";
    EXPECT_TRUE(utf8::isValid(utf8::decodeLossy(garbage)));
}
