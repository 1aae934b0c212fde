//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Framer.h
// Purpose: Message framing over byte streams: Content-Length headers or a single-byte delimiter.
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "mcpengine/ByteStream.h"

namespace mcpengine {

inline constexpr std::size_t kDefaultMaxMessageSize = 16 * 1024 * 1024;

enum class FramingMode {
    ContentLength,
    Delimiter
};

// "content-length" / "newline"; parsing accepts "content-length", "length", "newline", "delimiter", "ndjson".
const char* FramingModeName(FramingMode mode);
std::optional<FramingMode> FramingModeFromString(const std::string& name);

enum class FrameStatus {
    Ok,
    Incomplete,
    EndOfStream,
    MissingContentLength,
    InvalidContentLength,
    MessageTooLarge,
    InvalidHeader,
    BrokenPipe,
    IoError
};

const char* FrameStatusName(FrameStatus status);

// EndOfStream and BrokenPipe end a connection quietly; everything else is a protocol or I/O failure.
inline bool IsCleanDisconnect(FrameStatus status) {
    return status == FrameStatus::EndOfStream || status == FrameStatus::BrokenPipe;
}

//========================================================================================================
// IFramer
// Purpose: Stateless encoder/decoder for one framing mode.
// Methods:
//   encode(payload): wire bytes for one message.
//   tryDecodeEx(buffer): decodes the first frame in buffer. Incomplete means "need more bytes";
//     on Ok, bytesConsumed is the full frame length to drop from the front of buffer.
//   tryDecode(buffer): convenience; erases the frame from buffer on success only.
//   finish(buffer): called once the stream has ended with the unconsumed remainder.
//========================================================================================================
class IFramer {
public:
    struct DecodeResult {
        FrameStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};
    };

    virtual ~IFramer() = default;
    virtual std::string encode(const std::string& payload) const = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) const = 0;
    virtual DecodeResult finish(const std::string& buffer) const = 0;
    virtual FramingMode mode() const = 0;

    std::optional<std::string> tryDecode(std::string& buffer) const;
};

std::unique_ptr<IFramer> MakeContentLengthFramer(std::size_t maxContentLength = kDefaultMaxMessageSize);
std::unique_ptr<IFramer> MakeDelimiterFramer(char delimiter = '\n', std::size_t maxMessageSize = kDefaultMaxMessageSize);
std::unique_ptr<IFramer> MakeFramer(FramingMode mode, std::size_t maxMessageSize = kDefaultMaxMessageSize);

//========================================================================================================
// FrameReader
// Purpose: Pulls bytes from a stream until one complete frame can be decoded. Frames may arrive split
//          across any number of reads, and several frames may arrive in one read.
//========================================================================================================
class FrameReader {
public:
    struct ReadResult {
        FrameStatus status{FrameStatus::Ok};
        std::string payload;
        std::string detail;
    };

    FrameReader(IByteStream& stream, const IFramer& framer, std::size_t chunkSize = 4096);

    ReadResult next();

    // Blank delimiter lines normally end the stream; when skipping they are dropped instead.
    void setSkipBlankLines(bool skip) { skipBlankLines = skip; }

    // Bytes received but not yet returned as a frame.
    std::size_t buffered() const { return buffer.size(); }

private:
    IByteStream& stream;
    const IFramer& framer;
    std::size_t chunkSize;
    std::string buffer;
    bool ended{false};
    bool skipBlankLines{false};
};

//========================================================================================================
// FrameWriter
// Purpose: Serialized frame output. Responses and asynchronous notifications may be written from
//          different threads; each frame is written atomically with respect to the others.
//========================================================================================================
class FrameWriter {
public:
    FrameWriter(IByteStream& stream, const IFramer& framer);

    FrameStatus write(const std::string& payload);

private:
    IByteStream& stream;
    const IFramer& framer;
    std::mutex writeMutex;
};

} // namespace mcpengine
