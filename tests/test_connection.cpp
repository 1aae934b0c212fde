//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection.cpp
// Purpose: End-to-end tests of a connection: framing, dispatch, responses and in-session cancellation
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "mcpengine/ByteStream.h"
#include "mcpengine/Server.h"
#include "mcpengine/Transport.h"
#include "mcpengine/tools/DemoContent.h"

using namespace mcpengine;

namespace {

class ConnectionTest : public ::testing::Test {
protected:
    ConnectionTest() : info("conn-test", "0.1") {
        tools::RegisterDemoContent(registries, info);
        server = std::make_unique<ProtocolServer>(info, registries);
    }

    // Splits written output back into payloads.
    static std::vector<JSONValue> decodeAll(const IFramer& framer, const std::string& wire) {
        std::vector<JSONValue> out;
        std::string buffer = wire;
        while (auto payload = framer.tryDecode(buffer)) {
            out.push_back(ParseJSON(*payload));
        }
        return out;
    }

    Implementation info;
    Registries registries;
    std::unique_ptr<ProtocolServer> server;
};

// Reads newline-terminated lines from a pipe with a deadline.
class LineReader {
public:
    explicit LineReader(int fd) : fd(fd) {}

    std::optional<std::string> next(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            const std::size_t nl = buffer.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer.substr(0, nl);
                buffer.erase(0, nl + 1);
                return line;
            }
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return std::nullopt;
            }
            struct pollfd pfd { fd, POLLIN, 0 };
            if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) {
                continue;
            }
            char chunk[1024];
            ssize_t n = ::read(fd, chunk, sizeof(chunk));
            if (n <= 0) {
                return std::nullopt;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
        }
    }

private:
    int fd;
    std::string buffer;
};

bool writeAll(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n <= 0) {
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

TEST_F(ConnectionTest, FullSessionOverContentLengthFraming) {
    auto framer = MakeContentLengthFramer();
    std::istringstream in(
        framer->encode(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})") +
        framer->encode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})") +
        framer->encode(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})") +
        framer->encode(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"add","arguments":{"a":10,"b":20}}})") +
        framer->encode(R"({"jsonrpc":"2.0","id":4,"method":"shutdown"})"));
    std::ostringstream out;

    Connection connection(*server, MakeIostreamByteStream(in, out), *framer);
    const FrameStatus status = connection.run();
    EXPECT_TRUE(status == FrameStatus::Ok || IsCleanDisconnect(status)) << FrameStatusName(status);

    auto responses = decodeAll(*framer, out.str());
    ASSERT_EQ(responses.size(), 4u);
    for (int64_t i = 0; i < 4; ++i) {
        EXPECT_EQ(GetInteger(responses[i], "id"), std::optional<int64_t>(i + 1));
        EXPECT_NE(FindMember(responses[i], "result"), nullptr);
    }
    const auto& content = std::get<JSONValue::Array>(FindMember(*FindMember(responses[2], "result"), "content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(GetString(*content.front(), "text"), std::optional<std::string>("30"));

    ConnectionStats stats = connection.stats();
    EXPECT_EQ(stats.messagesIn, 5u);
    EXPECT_EQ(stats.responsesOut, 4u);
    EXPECT_TRUE(connection.session().lifecycle().isTerminal());
    EXPECT_EQ(server->sessionCount(), 0u);

    // Every cycle leased an arena and serialized its response into it
    const MemoryStats mem = server->arenas().stats();
    EXPECT_EQ(mem.acquisitions, 5u);
    EXPECT_EQ(mem.releases, 5u);
    EXPECT_GT(mem.peakRequestBytes, 0u);
}

TEST_F(ConnectionTest, MalformedMessagesAreAnsweredAndServingContinues) {
    auto framer = MakeDelimiterFramer();
    std::istringstream in(
        "{not json\n"
        R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":8,"method":"initialize","params":{}})" "\n");
    std::ostringstream out;

    Connection connection(*server, MakeIostreamByteStream(in, out), *framer);
    EXPECT_EQ(connection.run(), FrameStatus::EndOfStream);

    auto responses = decodeAll(*framer, out.str());
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(GetInteger(*FindMember(responses[0], "error"), "code"), std::optional<int64_t>(JSONRPCErrorCodes::ParseError));
    EXPECT_EQ(GetInteger(*FindMember(responses[1], "error"), "code"),
              std::optional<int64_t>(JSONRPCErrorCodes::ServerNotInitialized));
    EXPECT_NE(FindMember(responses[2], "result"), nullptr);
}

TEST_F(ConnectionTest, FramingErrorIsReportedAndEndsConnection) {
    auto framer = MakeContentLengthFramer();
    std::istringstream in("Content-Length: abc\r\n\r\n{}");
    std::ostringstream out;

    Connection connection(*server, MakeIostreamByteStream(in, out), *framer);
    EXPECT_EQ(connection.run(), FrameStatus::InvalidContentLength);

    auto responses = decodeAll(*framer, out.str());
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_TRUE(FindMember(responses[0], "id")->isNull());
    const JSONValue* err = FindMember(responses[0], "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetInteger(*err, "code"), std::optional<int64_t>(JSONRPCErrorCodes::InvalidRequest));
    EXPECT_EQ(GetString(*err, "message"), std::optional<std::string>("Framing error: InvalidContentLength"));
}

TEST_F(ConnectionTest, BlankLineEndsInputUnlessSkipping) {
    const std::string input = std::string(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})") + "\n\n" +
                              R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" + "\n";
    auto framer = MakeDelimiterFramer();
    {
        std::istringstream in(input);
        std::ostringstream out;
        Connection connection(*server, MakeIostreamByteStream(in, out), *framer);
        EXPECT_EQ(connection.run(), FrameStatus::EndOfStream);
        EXPECT_EQ(decodeAll(*framer, out.str()).size(), 1u);
    }
    {
        std::istringstream in(input);
        std::ostringstream out;
        ConnectionOptions options;
        options.skipBlankLines = true;
        Connection connection(*server, MakeIostreamByteStream(in, out), *framer, options);
        connection.run();
        EXPECT_EQ(decodeAll(*framer, out.str()).size(), 2u);
    }
}

TEST_F(ConnectionTest, CancellationOnSameConnectionStopsRunningTool) {
    int toServer[2];
    int fromServer[2];
    ASSERT_EQ(::pipe(toServer), 0);
    ASSERT_EQ(::pipe(fromServer), 0);

    auto framer = MakeDelimiterFramer();
    Connection connection(*server, MakeFdByteStream(toServer[0], fromServer[1], true, "pipe"), *framer);
    FrameStatus status = FrameStatus::Ok;
    std::thread runner([&] { status = connection.run(); });

    LineReader lines(fromServer[0]);
    ASSERT_TRUE(writeAll(toServer[1], R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"));
    auto init = lines.next();
    ASSERT_TRUE(init.has_value());
    EXPECT_NE(init->find("\"protocolVersion\""), std::string::npos);

    ASSERT_TRUE(writeAll(toServer[1],
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"counter","arguments":{"count":1000,"intervalMs":10},"_meta":{"progressToken":"p7"}}})" "\n"));
    const RequestId id(int64_t{7});
    for (int i = 0; i < 500 && !connection.session().cancellations().isTracked(id); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    ASSERT_TRUE(connection.session().cancellations().isTracked(id));
    ASSERT_TRUE(writeAll(toServer[1],
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":7,"reason":"changed my mind"}})" "\n"));

    std::optional<JSONValue> response;
    int progressSeen = 0;
    while (!response) {
        auto line = lines.next();
        ASSERT_TRUE(line.has_value()) << "no response to the cancelled call";
        JSONValue msg = ParseJSON(*line);
        if (FindMember(msg, "id") != nullptr) {
            response = std::move(msg);
        } else if (GetString(msg, "method") == std::optional<std::string>("notifications/progress")) {
            ++progressSeen;
        }
    }
    EXPECT_EQ(GetInteger(*response, "id"), std::optional<int64_t>(7));
    const JSONValue* result = FindMember(*response, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetBool(*result, "isError"), std::optional<bool>(true));
    const auto& content = std::get<JSONValue::Array>(FindMember(*result, "content")->value);
    ASSERT_FALSE(content.empty());
    const std::string text = GetString(*content.front(), "text").value_or("");
    EXPECT_EQ(text.rfind("Cancelled after", 0), 0u) << text;
    EXPECT_NE(text.find("changed my mind"), std::string::npos);
    EXPECT_GE(progressSeen, 0);

    ::close(toServer[1]);
    runner.join();
    ::close(fromServer[0]);

    EXPECT_EQ(status, FrameStatus::EndOfStream);
    EXPECT_EQ(connection.stats().cancellationsSeen, 1u);
    EXPECT_FALSE(connection.session().cancellations().isTracked(id));
}

TEST_F(ConnectionTest, PipelinedRequestsAreHeldToTheQueueLimit) {
    int toServer[2];
    int fromServer[2];
    ASSERT_EQ(::pipe(toServer), 0);
    ASSERT_EQ(::pipe(fromServer), 0);

    auto framer = MakeDelimiterFramer();
    ConnectionOptions options;
    options.maxQueuedMessages = 2;
    Connection connection(*server, MakeFdByteStream(toServer[0], fromServer[1], true, "flood"), *framer, options);
    std::thread runner([&] { connection.run(); });

    std::string burst = R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})" "\n";
    const int calls = 10;
    for (int i = 1; i <= calls; ++i) {
        burst += R"({"jsonrpc":"2.0","id":)" + std::to_string(i) +
                 R"(,"method":"tools/call","params":{"name":"counter","arguments":{"count":2,"intervalMs":10}}})" "\n";
    }
    ASSERT_TRUE(writeAll(toServer[1], burst));

    LineReader lines(fromServer[0]);
    for (int64_t i = 0; i <= calls; ++i) {
        auto line = lines.next();
        ASSERT_TRUE(line.has_value()) << "missing response " << i;
        EXPECT_EQ(GetInteger(ParseJSON(*line), "id"), std::optional<int64_t>(i));
    }

    ::close(toServer[1]);
    runner.join();
    ::close(fromServer[0]);

    const ConnectionStats stats = connection.stats();
    EXPECT_EQ(stats.messagesIn, static_cast<std::uint64_t>(calls + 1));
    EXPECT_EQ(stats.responsesOut, static_cast<std::uint64_t>(calls + 1));
    EXPECT_GE(stats.peakQueueDepth, 1u);
    EXPECT_LE(stats.peakQueueDepth, 2u);
}

TEST_F(ConnectionTest, StopReleasesReaderWaitingOnFullQueue) {
    int toServer[2];
    int fromServer[2];
    ASSERT_EQ(::pipe(toServer), 0);
    ASSERT_EQ(::pipe(fromServer), 0);

    auto framer = MakeDelimiterFramer();
    ConnectionOptions options;
    options.maxQueuedMessages = 1;
    Connection connection(*server, MakeFdByteStream(toServer[0], fromServer[1], true, "full"), *framer, options);
    std::thread runner([&] { connection.run(); });

    std::string burst = R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})" "\n";
    for (int i = 1; i <= 4; ++i) {
        burst += R"({"jsonrpc":"2.0","id":)" + std::to_string(i) +
                 R"(,"method":"tools/call","params":{"name":"counter","arguments":{"count":5,"intervalMs":20}}})" "\n";
    }
    ASSERT_TRUE(writeAll(toServer[1], burst));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    connection.stop();
    runner.join();
    EXPECT_LE(connection.stats().peakQueueDepth, 1u);
    EXPECT_EQ(server->sessionCount(), 0u);
    ::close(toServer[1]);
    ::close(fromServer[0]);
}

TEST_F(ConnectionTest, StopUnblocksIdleReader) {
    int toServer[2];
    int fromServer[2];
    ASSERT_EQ(::pipe(toServer), 0);
    ASSERT_EQ(::pipe(fromServer), 0);

    auto framer = MakeDelimiterFramer();
    Connection connection(*server, MakeFdByteStream(toServer[0], fromServer[1], true, "idle"), *framer);
    std::thread runner([&] { connection.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(server->sessionCount(), 1u);

    connection.stop();
    runner.join();
    EXPECT_EQ(server->sessionCount(), 0u);
    ::close(toServer[1]);
    ::close(fromServer[0]);
}
