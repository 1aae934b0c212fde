//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Framer.cpp
// Purpose: Framer factory, status names, and the stream-backed frame reader/writer
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <vector>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpengine/Framer.h"

namespace mcpengine {

const char* FramingModeName(FramingMode mode) {
    switch (mode) {
        case FramingMode::ContentLength: return "content-length";
        case FramingMode::Delimiter: return "newline";
    }
    return "content-length";
}

std::optional<FramingMode> FramingModeFromString(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (n == "content-length" || n == "length") {
        return FramingMode::ContentLength;
    }
    if (n == "newline" || n == "delimiter" || n == "ndjson") {
        return FramingMode::Delimiter;
    }
    return std::nullopt;
}

const char* FrameStatusName(FrameStatus status) {
    switch (status) {
        case FrameStatus::Ok: return "Ok";
        case FrameStatus::Incomplete: return "Incomplete";
        case FrameStatus::EndOfStream: return "EndOfStream";
        case FrameStatus::MissingContentLength: return "MissingContentLength";
        case FrameStatus::InvalidContentLength: return "InvalidContentLength";
        case FrameStatus::MessageTooLarge: return "MessageTooLarge";
        case FrameStatus::InvalidHeader: return "InvalidHeader";
        case FrameStatus::BrokenPipe: return "BrokenPipe";
        case FrameStatus::IoError: return "IoError";
    }
    return "Unknown";
}

std::optional<std::string> IFramer::tryDecode(std::string& buffer) const {
    DecodeResult r = tryDecodeEx(buffer);
    if (r.status == FrameStatus::Ok && r.payload.has_value()) {
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        return r.payload;
    }
    return std::nullopt;
}

std::unique_ptr<IFramer> MakeFramer(FramingMode mode, std::size_t maxMessageSize) {
    if (mode == FramingMode::Delimiter) {
        return MakeDelimiterFramer('\n', maxMessageSize);
    }
    return MakeContentLengthFramer(maxMessageSize);
}

////////////////////////////////////////// FrameReader ///////////////////////////////////////////////

FrameReader::FrameReader(IByteStream& s, const IFramer& f, std::size_t chunk)
    : stream(s), framer(f), chunkSize(chunk == 0 ? 4096 : chunk) {}

FrameReader::ReadResult FrameReader::next() {
    std::vector<char> chunk(chunkSize);
    while (true) {
        IFramer::DecodeResult r = ended ? framer.finish(buffer) : framer.tryDecodeEx(buffer);

        if (r.status == FrameStatus::Ok) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            return { FrameStatus::Ok, std::move(r.payload).value_or(std::string()), {} };
        }
        if (r.status == FrameStatus::EndOfStream && r.bytesConsumed > 0) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            if (skipBlankLines) {
                continue;
            }
            return { FrameStatus::EndOfStream, {}, "blank line" };
        }
        if (r.status != FrameStatus::Incomplete) {
            if (ended) {
                buffer.clear();
            }
            return { r.status, {}, fmt::format("{} on {}", FrameStatusName(r.status), stream.describe()) };
        }

        IByteStream::IoResult io = stream.read(chunk.data(), chunk.size());
        switch (io.status) {
            case IByteStream::IoStatus::Ok:
                buffer.append(chunk.data(), io.bytes);
                break;
            case IByteStream::IoStatus::EndOfStream:
                ended = true;
                break;
            case IByteStream::IoStatus::BrokenPipe:
                return { FrameStatus::BrokenPipe, {}, io.detail };
            case IByteStream::IoStatus::Error:
                return { FrameStatus::IoError, {}, io.detail };
        }
    }
}

////////////////////////////////////////// FrameWriter ///////////////////////////////////////////////

FrameWriter::FrameWriter(IByteStream& s, const IFramer& f) : stream(s), framer(f) {}

FrameStatus FrameWriter::write(const std::string& payload) {
    const std::string frame = framer.encode(payload);
    std::lock_guard<std::mutex> lock(writeMutex);
    IByteStream::IoResult io = stream.write(frame.data(), frame.size());
    switch (io.status) {
        case IByteStream::IoStatus::Ok: return FrameStatus::Ok;
        case IByteStream::IoStatus::EndOfStream:
        case IByteStream::IoStatus::BrokenPipe:
            LOG_DEBUG("Peer {} gone while writing: {}", stream.describe(), io.detail);
            return FrameStatus::BrokenPipe;
        case IByteStream::IoStatus::Error:
            LOG_ERROR("Write to {} failed: {}", stream.describe(), io.detail);
            return FrameStatus::IoError;
    }
    return FrameStatus::IoError;
}

} // namespace mcpengine
