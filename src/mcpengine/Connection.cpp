//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.cpp
// Purpose: Per-connection read/dispatch/write loop
//==========================================================================================================

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpengine/RequestScope.h"
#include "mcpengine/Transport.h"

namespace mcpengine {

Connection::Connection(ProtocolServer& srv, std::unique_ptr<IByteStream> s, const IFramer& f,
                       ConnectionOptions opts)
    : server(srv),
      stream(std::move(s)),
      framer(f),
      options(opts),
      peerName(stream->describe()),
      sessionState(peerName),
      writer(*stream, framer),
      notifier([this](const std::string& json) { deliverNotification(json); }) {}

Connection::~Connection() {
    stop();
    if (reader.joinable()) {
        reader.join();
    }
}

FrameStatus Connection::run() {
    LOG_INFO("Connection opened: {} ({} framing)", peerName, FramingModeName(framer.mode()));
    sessionState.setNotifier(&notifier);
    server.attachSession(sessionState);
    notifier.start();
    reader = std::thread([this]() { readLoop(); });

    while (true) {
        Inbound item;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueCv.wait(lock, [this]() { return !inbound.empty() || readerDone || stopping.load(); });
            if (stopping.load() || inbound.empty()) {
                break;
            }
            item = std::move(inbound.front());
            inbound.pop_front();
        }
        spaceCv.notify_one();

        ProtocolServer::Outcome outcome;
        {
            ScopedArena arena(server.arenas());
            outcome = server.handleDecoded(sessionState, item.decoded, arena.resource());
        }
        if (outcome.response.has_value()) {
            if (!writeFrame(*outcome.response)) {
                break;
            }
            ++responsesOut;
        }
        if (outcome.closeConnection) {
            LOG_INFO("Session {} ended by the protocol", peerName);
            break;
        }
    }

    stopping.store(true);
    server.detachSession(sessionState);
    sessionState.setNotifier(nullptr);
    // Flush queued notifications while the stream is still writable
    notifier.stopAndWait();
    stream->close();
    wakeWaiters();
    if (reader.joinable()) {
        reader.join();
    }
    sessionState.lifecycle().forceTerminate();

    FrameStatus status = FrameStatus::Ok;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (readerDone) {
            status = readerStatus;
        }
    }
    LOG_INFO("Connection closed: {} ({} in, {} responses, {} notifications)", peerName, messagesIn.load(),
             responsesOut.load(), notificationsOut.load());
    return status;
}

void Connection::stop() {
    if (stopping.exchange(true)) {
        return;
    }
    LOG_DEBUG("Stopping connection {}", peerName);
    stream->close();
    wakeWaiters();
}

ConnectionStats Connection::stats() const {
    ConnectionStats s;
    s.messagesIn = messagesIn.load();
    s.responsesOut = responsesOut.load();
    s.notificationsOut = notificationsOut.load();
    s.cancellationsSeen = cancellationsSeen.load();
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        s.peakQueueDepth = peakQueueDepth;
    }
    return s;
}

void Connection::readLoop() {
    FrameReader frames(*stream, framer, options.readChunkSize);
    frames.setSkipBlankLines(options.skipBlankLines);

    FrameStatus status = FrameStatus::Ok;
    while (!stopping.load()) {
        FrameReader::ReadResult frame = frames.next();
        if (frame.status != FrameStatus::Ok) {
            if (stopping.load()) {
                break;
            }
            status = frame.status;
            if (IsCleanDisconnect(frame.status)) {
                LOG_INFO("Peer {} disconnected ({})", peerName, FrameStatusName(frame.status));
            } else {
                LOG_ERROR("Framing error: {}", frame.detail);
                JSONRPCResponse resp = MakeErrorResponse(std::nullopt, JSONRPCErrorCodes::InvalidRequest,
                                                         fmt::format("Framing error: {}", FrameStatusName(frame.status)));
                writeFrame(resp.Serialize());
            }
            break;
        }

        ++messagesIn;
        DecodeResult decoded = DecodeEnvelope(frame.payload);
        if (ProtocolServer::IsCancellationNotice(decoded)) {
            ++cancellationsSeen;
            ProtocolServer::Outcome outcome = server.handleDecoded(sessionState, decoded);
            if (outcome.response.has_value()) {
                writeFrame(*outcome.response);
            }
            continue;
        }
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            const std::size_t limit = std::max<std::size_t>(options.maxQueuedMessages, 1);
            if (inbound.size() >= limit) {
                LOG_DEBUG("Inbound queue for {} is full ({}); pausing reads", peerName, inbound.size());
                spaceCv.wait(lock, [this, limit]() { return inbound.size() < limit || stopping.load(); });
                if (stopping.load()) {
                    break;
                }
            }
            inbound.push_back(Inbound{std::move(decoded)});
            peakQueueDepth = std::max(peakQueueDepth, inbound.size());
        }
        queueCv.notify_one();
    }
    finishReading(status);
}

void Connection::finishReading(FrameStatus status) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        readerDone = true;
        readerStatus = status;
    }
    queueCv.notify_all();
}

void Connection::wakeWaiters() {
    {
        // Both waiters test stopping under this lock
        std::lock_guard<std::mutex> lock(queueMutex);
    }
    queueCv.notify_all();
    spaceCv.notify_all();
}

bool Connection::writeFrame(const std::string& payload) {
    const FrameStatus status = writer.write(payload);
    if (status == FrameStatus::Ok) {
        return true;
    }
    if (IsCleanDisconnect(status)) {
        LOG_INFO("Peer {} went away while writing", peerName);
    } else {
        LOG_ERROR("Write to {} failed: {}", peerName, FrameStatusName(status));
    }
    return false;
}

void Connection::deliverNotification(const std::string& json) {
    if (writeFrame(json)) {
        ++notificationsOut;
    }
}

} // namespace mcpengine
