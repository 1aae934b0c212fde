//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ByteStream.h
// Purpose: Ordered byte stream abstraction under the framers (stdio descriptors, sockets, test streams).
//==========================================================================================================

#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>

namespace mcpengine {

//==========================================================================================================
// IByteStream
// Purpose: Blocking, ordered, bidirectional byte stream owned by exactly one connection.
// Methods:
//   read(buf, len): Blocks until at least one byte, end of stream, or failure.
//   write(data, len): Writes all bytes or reports why it could not.
//   close(): Releases the underlying channel; later reads report EndOfStream. Idempotent.
//   describe(): Short peer description for logs (e.g. "stdio", "127.0.0.1:50544").
//==========================================================================================================
class IByteStream {
public:
    enum class IoStatus {
        Ok,
        EndOfStream,
        BrokenPipe,   // peer went away (EPIPE, ECONNRESET, ...); treated as a clean disconnect
        Error
    };

    struct IoResult {
        IoStatus status{IoStatus::Ok};
        std::size_t bytes{0};
        std::string detail;
    };

    virtual ~IByteStream() = default;
    virtual IoResult read(char* buf, std::size_t len) = 0;
    virtual IoResult write(const char* data, std::size_t len) = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;
};

//==========================================================================================================
// MakeFdByteStream
// Purpose: POSIX descriptor pair stream (stdin/stdout for the stdio transport).
// Args:
//   readFd/writeFd: descriptors to read from and write to.
//   ownsFds: when true, close() closes both descriptors.
//==========================================================================================================
std::unique_ptr<IByteStream> MakeFdByteStream(int readFd, int writeFd, bool ownsFds, std::string description);

//==========================================================================================================
// MakeIostreamByteStream
// Purpose: Adapts a std::istream/std::ostream pair; used by tests and in-process pipelines.
//          The streams must outlive the returned object.
//==========================================================================================================
std::unique_ptr<IByteStream> MakeIostreamByteStream(std::istream& in, std::ostream& out);

} // namespace mcpengine
