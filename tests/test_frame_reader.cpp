//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_frame_reader.cpp
// Purpose: Tests for FrameReader/FrameWriter over byte streams
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "mcpengine/ByteStream.h"
#include "mcpengine/Framer.h"

using namespace mcpengine;

namespace {

// Stream whose writes always fail with a fixed status.
class FailingStream : public IByteStream {
public:
    explicit FailingStream(IoStatus s) : status(s) {}
    IoResult read(char*, std::size_t) override { return { IoStatus::EndOfStream, 0, {} }; }
    IoResult write(const char*, std::size_t) override { return { status, 0, "refused" }; }
    void close() override {}
    std::string describe() const override { return "failing"; }

private:
    IoStatus status;
};

} // namespace

TEST(FrameReaderTest, ReadsFramesSplitAcrossSingleByteReads) {
    auto framer = MakeContentLengthFramer();
    std::istringstream in(framer->encode("{\"id\":1}") + framer->encode("{\"id\":2}"));
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameReader reader(*stream, *framer, 1);

    auto first = reader.next();
    ASSERT_EQ(first.status, FrameStatus::Ok);
    EXPECT_EQ(first.payload, "{\"id\":1}");
    auto second = reader.next();
    ASSERT_EQ(second.status, FrameStatus::Ok);
    EXPECT_EQ(second.payload, "{\"id\":2}");
    EXPECT_EQ(reader.next().status, FrameStatus::EndOfStream);
}

TEST(FrameReaderTest, SeveralFramesInOneRead) {
    auto framer = MakeDelimiterFramer();
    std::istringstream in("a\nb\nc\n");
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameReader reader(*stream, *framer, 4096);
    EXPECT_EQ(reader.next().payload, "a");
    EXPECT_EQ(reader.buffered(), 4u);
    EXPECT_EQ(reader.next().payload, "b");
    EXPECT_EQ(reader.next().payload, "c");
    EXPECT_EQ(reader.next().status, FrameStatus::EndOfStream);
}

TEST(FrameReaderTest, TruncatedBodyAtEofIsEndOfStream) {
    auto framer = MakeContentLengthFramer();
    std::istringstream in("Content-Length: 50\r\n\r\n{\"short\":");
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameReader reader(*stream, *framer);
    EXPECT_EQ(reader.next().status, FrameStatus::EndOfStream);
}

TEST(FrameReaderTest, BlankLineEndsInputByDefault) {
    auto framer = MakeDelimiterFramer();
    std::istringstream in("{\"a\":1}\n\n{\"b\":2}\n");
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameReader reader(*stream, *framer);
    EXPECT_EQ(reader.next().payload, "{\"a\":1}");
    auto blank = reader.next();
    EXPECT_EQ(blank.status, FrameStatus::EndOfStream);
    EXPECT_EQ(blank.detail, "blank line");
}

TEST(FrameReaderTest, BlankLinesSkippedWhenEnabled) {
    auto framer = MakeDelimiterFramer();
    std::istringstream in("{\"a\":1}\n\n  \n{\"b\":2}");
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameReader reader(*stream, *framer);
    reader.setSkipBlankLines(true);
    EXPECT_EQ(reader.next().payload, "{\"a\":1}");
    auto b = reader.next();
    ASSERT_EQ(b.status, FrameStatus::Ok);
    EXPECT_EQ(b.payload, "{\"b\":2}");
    EXPECT_EQ(reader.next().status, FrameStatus::EndOfStream);
}

TEST(FrameReaderTest, FramingErrorIsReportedWithDetail) {
    auto framer = MakeContentLengthFramer();
    std::istringstream in("Content-Type: text/plain\r\n\r\n{}");
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameReader reader(*stream, *framer);
    auto r = reader.next();
    EXPECT_EQ(r.status, FrameStatus::MissingContentLength);
    EXPECT_NE(r.detail.find("iostream"), std::string::npos);
}

TEST(FrameWriterTest, WritesEncodedFrame) {
    auto framer = MakeContentLengthFramer();
    std::istringstream in;
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameWriter writer(*stream, *framer);
    EXPECT_EQ(writer.write("{\"ok\":true}"), FrameStatus::Ok);
    EXPECT_EQ(out.str(), "Content-Length: 11\r\n\r\n{\"ok\":true}");
}

TEST(FrameWriterTest, MapsStreamFailures) {
    auto framer = MakeDelimiterFramer();
    FailingStream broken(IByteStream::IoStatus::BrokenPipe);
    FrameWriter toBroken(broken, *framer);
    EXPECT_EQ(toBroken.write("{}"), FrameStatus::BrokenPipe);

    FailingStream failing(IByteStream::IoStatus::Error);
    FrameWriter toFailing(failing, *framer);
    EXPECT_EQ(toFailing.write("{}"), FrameStatus::IoError);
}

TEST(FrameWriterTest, ClosedStreamRejectsWrites) {
    auto framer = MakeDelimiterFramer();
    std::istringstream in;
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    stream->close();
    FrameWriter writer(*stream, *framer);
    EXPECT_EQ(writer.write("{}"), FrameStatus::BrokenPipe);
    EXPECT_TRUE(out.str().empty());
}
