//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport adapters binding a byte stream to the framer/codec/server pipeline (stdio, TCP).
//==========================================================================================================

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "mcpengine/ByteStream.h"
#include "mcpengine/EnvelopeCodec.h"
#include "mcpengine/Framer.h"
#include "mcpengine/Progress.h"
#include "mcpengine/Server.h"

namespace mcpengine {

struct ConnectionOptions {
    std::size_t readChunkSize{4096};
    // Newline framing only: skip blank lines instead of treating them as end of input.
    bool skipBlankLines{false};
    // Decoded messages waiting for dispatch before the reader stops reading (at least 1).
    std::size_t maxQueuedMessages{32};
};

struct ConnectionStats {
    std::uint64_t messagesIn{0};
    std::uint64_t responsesOut{0};
    std::uint64_t notificationsOut{0};
    std::uint64_t cancellationsSeen{0};
    std::size_t peakQueueDepth{0};
};

//==========================================================================================================
// Connection
// Purpose: Serves one byte stream until the peer disconnects, a framing error, shutdown, or stop().
// Behavior:
//   - A reader thread decodes frames. notifications/cancelled is applied as soon as it is read, so a
//     busy handler on the same connection can observe it; everything else is queued in arrival order.
//   - The queue holds at most options.maxQueuedMessages; a full queue blocks the reader (and so the peer)
//     until the dispatcher takes the next message. Cancellation notices read before that are applied.
//   - The calling thread (run()) dispatches queued messages one at a time and writes each response
//     before taking the next, inside a fresh request arena.
//   - Progress and resource update notifications are written by the session's notifier thread through
//     the same FrameWriter.
//   - End of stream and broken pipe end the loop quietly. Any other framing error is answered with a
//     best-effort InvalidRequest (id null) and ends the connection.
// Returns (run):
//   The FrameStatus that ended the read side (Ok when the session shut down or stop() was called).
//==========================================================================================================
class Connection {
public:
    Connection(ProtocolServer& server, std::unique_ptr<IByteStream> stream, const IFramer& framer,
               ConnectionOptions options = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    FrameStatus run();
    void stop();

    Session& session() { return sessionState; }
    ConnectionStats stats() const;
    const std::string& peer() const { return peerName; }

private:
    struct Inbound {
        DecodeResult decoded;
    };

    void readLoop();
    void deliverNotification(const std::string& json);
    bool writeFrame(const std::string& payload);
    void finishReading(FrameStatus status);
    void wakeWaiters();

    ProtocolServer& server;
    std::unique_ptr<IByteStream> stream;
    const IFramer& framer;
    ConnectionOptions options;
    std::string peerName;

    Session sessionState;
    FrameWriter writer;
    ProgressNotifier notifier;

    mutable std::mutex queueMutex;
    std::condition_variable queueCv;
    std::condition_variable spaceCv;
    std::deque<Inbound> inbound;
    std::size_t peakQueueDepth{0};
    bool readerDone{false};
    FrameStatus readerStatus{FrameStatus::Ok};

    std::atomic<bool> stopping{false};
    std::thread reader;

    std::atomic<std::uint64_t> messagesIn{0};
    std::atomic<std::uint64_t> responsesOut{0};
    std::atomic<std::uint64_t> notificationsOut{0};
    std::atomic<std::uint64_t> cancellationsSeen{0};
};

//==========================================================================================================
// ServeStdio
// Purpose: Serves one session over stdin/stdout until end of input. Routes console logging to stderr
//          first so log lines cannot corrupt frames on stdout.
//==========================================================================================================
FrameStatus ServeStdio(ProtocolServer& server, const IFramer& framer, ConnectionOptions options = {});

//==========================================================================================================
// TcpServer
// Purpose: Boost.Asio listener that runs one Connection per accepted socket, each on its own thread.
// Notes:
//   start() resolves, binds and listens synchronously (throws std::runtime_error on failure) and then
//   accepts on an io thread. Port 0 binds an ephemeral port; boundPort() reports it.
//   stop() closes the listener, stops every live connection and joins all threads. Idempotent.
//==========================================================================================================
class TcpServer {
public:
    TcpServer(ProtocolServer& server, const IFramer& framer, std::string host, std::uint16_t port,
              ConnectionOptions options = {});
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    void start();
    void stop();
    bool isRunning() const;
    std::uint16_t boundPort() const;
    std::size_t activeConnections() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpengine
