//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DelimiterFramer.cpp
// Purpose: Single-byte delimiter framing (newline-delimited JSON by default)
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpengine/Framer.h"

namespace mcpengine {

namespace {

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

class DelimiterFramer : public IFramer {
public:
    DelimiterFramer(char delim, std::size_t maxLen) : delimiter(delim), maxMessageSize(maxLen) {}

    std::string encode(const std::string& payload) const override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back(delimiter);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) const override {
        std::size_t pos = buffer.find(delimiter);
        if (pos == std::string::npos) {
            if (buffer.size() > maxMessageSize) {
                LOG_WARN("Delimited message exceeds {} bytes without a delimiter", maxMessageSize);
                return { FrameStatus::MessageTooLarge, std::nullopt, 0 };
            }
            return { FrameStatus::Incomplete, std::nullopt, 0 };
        }
        return takeLine(buffer.substr(0, pos), pos + 1);
    }

    DecodeResult finish(const std::string& buffer) const override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status != FrameStatus::Incomplete) {
            return r;
        }
        if (buffer.empty()) {
            return { FrameStatus::EndOfStream, std::nullopt, 0 };
        }
        // Unterminated final line
        return takeLine(buffer, buffer.size());
    }

    FramingMode mode() const override { return FramingMode::Delimiter; }

private:
    DecodeResult takeLine(std::string line, std::size_t consumed) const {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > maxMessageSize) {
            LOG_WARN("Delimited message of {} bytes exceeds limit {}", line.size(), maxMessageSize);
            return { FrameStatus::MessageTooLarge, std::nullopt, consumed };
        }
        if (isBlank(line)) {
            // A blank line reads as end of stream; bytesConsumed > 0 tells it apart from real EOF
            return { FrameStatus::EndOfStream, std::nullopt, consumed };
        }
        return { FrameStatus::Ok, std::make_optional(std::move(line)), consumed };
    }

    char delimiter;
    std::size_t maxMessageSize;
};

} // namespace

std::unique_ptr<IFramer> MakeDelimiterFramer(char delimiter, std::size_t maxMessageSize) {
    return std::make_unique<DelimiterFramer>(delimiter, maxMessageSize);
}

} // namespace mcpengine
