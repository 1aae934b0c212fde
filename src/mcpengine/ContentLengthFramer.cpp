//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length header framing (LSP/MCP style): "Content-Length: N\r\n\r\n" + N bytes
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpengine/Framer.h"

namespace mcpengine {

namespace {

// A header block that has not terminated within this many bytes is rejected.
constexpr std::size_t kMaxHeaderBytes = 8192;

std::string trimSpaces(const std::string& s) {
    std::size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) {
        return {};
    }
    std::size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

class ContentLengthFramer : public IFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) const override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) const override {
        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        std::size_t bodyStart = std::string::npos;

        // Header lines end in "\n"; a trailing "\r" is stripped. An empty line closes the block.
        while (true) {
            std::size_t eol = buffer.find('\n', pos);
            if (eol == std::string::npos) {
                if (buffer.size() > kMaxHeaderBytes) {
                    LOG_WARN("Content-Length header block exceeds {} bytes", kMaxHeaderBytes);
                    return { FrameStatus::InvalidHeader, std::nullopt, 0 };
                }
                return { FrameStatus::Incomplete, std::nullopt, 0 };
            }
            std::string line = buffer.substr(pos, eol - pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            pos = eol + 1;
            if (line.empty()) {
                bodyStart = pos;
                break;
            }

            auto colon = line.find(':');
            if (colon == std::string::npos || colon == 0) {
                LOG_WARN("Malformed header line: '{}'", line);
                return { FrameStatus::InvalidHeader, std::nullopt, 0 };
            }
            std::string name = toLower(trimSpaces(line.substr(0, colon)));
            if (name != "content-length") {
                continue; // unrelated headers (Content-Type, ...) are ignored
            }
            if (haveLength) {
                LOG_WARN("Duplicate Content-Length header");
                return { FrameStatus::InvalidHeader, std::nullopt, 0 };
            }
            FrameStatus st = parseLength(trimSpaces(line.substr(colon + 1)), contentLength);
            if (st != FrameStatus::Ok) {
                return { st, std::nullopt, 0 };
            }
            haveLength = true;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { FrameStatus::MissingContentLength, std::nullopt, 0 };
        }

        if (buffer.size() - bodyStart < contentLength) {
            return { FrameStatus::Incomplete, std::nullopt, 0 };
        }
        std::string payload = buffer.substr(bodyStart, contentLength);
        return { FrameStatus::Ok, std::make_optional(std::move(payload)), bodyStart + contentLength };
    }

    DecodeResult finish(const std::string& buffer) const override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == FrameStatus::Incomplete) {
            // Nothing, a partial header block or a truncated body: the stream ended
            return { FrameStatus::EndOfStream, std::nullopt, 0 };
        }
        return r;
    }

    FramingMode mode() const override { return FramingMode::ContentLength; }

private:
    FrameStatus parseLength(const std::string& value, std::size_t& out) const {
        if (value.empty()) {
            LOG_WARN("Empty Content-Length header");
            return FrameStatus::InvalidContentLength;
        }
        std::size_t start = (value[0] == '+' || value[0] == '-') ? 1 : 0;
        if (start == value.size() || !std::all_of(value.begin() + static_cast<std::ptrdiff_t>(start), value.end(),
                                                    [](unsigned char c){ return std::isdigit(c) != 0; })) {
            LOG_WARN("Invalid Content-Length header: {}", value);
            return FrameStatus::InvalidContentLength;
        }
        if (value[0] == '-') {
            // "-0" included: a sign is not part of a decimal length
            LOG_WARN("Negative Content-Length header: {}", value);
            return FrameStatus::InvalidContentLength;
        }
        std::size_t v = 0;
        for (std::size_t i = start; i < value.size(); ++i) {
            std::size_t digit = static_cast<std::size_t>(value[i] - '0');
            if (v > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
                LOG_WARN("Content-Length {} overflows", value);
                return FrameStatus::MessageTooLarge;
            }
            v = v * 10 + digit;
        }
        if (v > maxContentLength) {
            LOG_WARN("Content-Length {} exceeds limits (max={})", v, maxContentLength);
            return FrameStatus::MessageTooLarge;
        }
        out = v;
        return FrameStatus::Ok;
    }

    std::size_t maxContentLength;
};

} // namespace

std::unique_ptr<IFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace mcpengine
