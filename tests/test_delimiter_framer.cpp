//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_delimiter_framer.cpp
// Purpose: Tests for newline-delimited framing and framing mode names
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpengine/Framer.h"

using namespace mcpengine;

TEST(DelimiterFramerTest, EncodeAppendsDelimiter) {
    auto framer = MakeDelimiterFramer();
    EXPECT_EQ(framer->encode("{}"), "{}\n");
    EXPECT_EQ(framer->mode(), FramingMode::Delimiter);
}

TEST(DelimiterFramerTest, DecodesOneLineAndStripsCarriageReturn) {
    auto framer = MakeDelimiterFramer();
    auto r = framer->tryDecodeEx("{\"a\":1}\r\n{\"b\":2}\n");
    ASSERT_EQ(r.status, FrameStatus::Ok);
    EXPECT_EQ(*r.payload, "{\"a\":1}");
    EXPECT_EQ(r.bytesConsumed, 9u);
}

TEST(DelimiterFramerTest, WaitsForDelimiter) {
    auto framer = MakeDelimiterFramer();
    EXPECT_EQ(framer->tryDecodeEx("{\"partial\":").status, FrameStatus::Incomplete);
}

TEST(DelimiterFramerTest, BlankLineReadsAsEndOfStreamAndIsConsumed) {
    auto framer = MakeDelimiterFramer();
    auto r = framer->tryDecodeEx(" \t\r\n{}\n");
    EXPECT_EQ(r.status, FrameStatus::EndOfStream);
    EXPECT_FALSE(r.payload.has_value());
    EXPECT_EQ(r.bytesConsumed, 4u);
}

TEST(DelimiterFramerTest, OverlongLineIsTooLarge) {
    auto framer = MakeDelimiterFramer('\n', 8);
    EXPECT_EQ(framer->tryDecodeEx("0123456789\n").status, FrameStatus::MessageTooLarge);
    EXPECT_EQ(framer->tryDecodeEx("0123456789").status, FrameStatus::MessageTooLarge);
    EXPECT_EQ(framer->tryDecodeEx("01234567\n").status, FrameStatus::Ok);
}

TEST(DelimiterFramerTest, FinishReturnsUnterminatedFinalLine) {
    auto framer = MakeDelimiterFramer();
    auto r = framer->finish("{\"last\":true}");
    ASSERT_EQ(r.status, FrameStatus::Ok);
    EXPECT_EQ(*r.payload, "{\"last\":true}");
    EXPECT_EQ(r.bytesConsumed, 13u);
}

TEST(DelimiterFramerTest, FinishOnEmptyBufferIsEndOfStream) {
    auto framer = MakeDelimiterFramer();
    auto r = framer->finish("");
    EXPECT_EQ(r.status, FrameStatus::EndOfStream);
    EXPECT_EQ(r.bytesConsumed, 0u);
}

TEST(DelimiterFramerTest, CustomDelimiter) {
    auto framer = MakeDelimiterFramer('\0');
    std::string buffer = framer->encode("a") + framer->encode("b");
    EXPECT_EQ(buffer.size(), 4u);
    auto a = framer->tryDecode(buffer);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, "a");
    auto b = framer->tryDecode(buffer);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, "b");
}

TEST(FramingModeTest, NamesAndAliases) {
    EXPECT_STREQ(FramingModeName(FramingMode::ContentLength), "content-length");
    EXPECT_STREQ(FramingModeName(FramingMode::Delimiter), "newline");
    EXPECT_EQ(FramingModeFromString("content-length"), FramingMode::ContentLength);
    EXPECT_EQ(FramingModeFromString("length"), FramingMode::ContentLength);
    EXPECT_EQ(FramingModeFromString("newline"), FramingMode::Delimiter);
    EXPECT_EQ(FramingModeFromString("ndjson"), FramingMode::Delimiter);
    EXPECT_FALSE(FramingModeFromString("xml").has_value());
    EXPECT_EQ(MakeFramer(FramingMode::Delimiter)->mode(), FramingMode::Delimiter);
}

TEST(FrameStatusTest, CleanDisconnects) {
    EXPECT_TRUE(IsCleanDisconnect(FrameStatus::EndOfStream));
    EXPECT_TRUE(IsCleanDisconnect(FrameStatus::BrokenPipe));
    EXPECT_FALSE(IsCleanDisconnect(FrameStatus::InvalidHeader));
    EXPECT_FALSE(IsCleanDisconnect(FrameStatus::IoError));
}
