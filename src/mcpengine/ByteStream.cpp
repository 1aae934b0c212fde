//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ByteStream.cpp
// Purpose: Descriptor and iostream backed byte streams.
//==========================================================================================================

#include <atomic>
#include <cerrno>
#include <cstring>
#include <istream>
#include <ostream>
#include <string>

#include <poll.h>
#include <unistd.h>

#include "mcpengine/ByteStream.h"

namespace mcpengine {

namespace {

constexpr int kPollIntervalMs = 100;

bool isDisconnectErrno(int err) {
    return err == EPIPE || err == ECONNRESET || err == ENOTCONN || err == ESHUTDOWN;
}

class FdByteStream : public IByteStream {
public:
    FdByteStream(int r, int w, bool owns, std::string desc)
        : readFd(r), writeFd(w), ownsFds(owns), description(std::move(desc)) {}

    ~FdByteStream() override { close(); }

    IoResult read(char* buf, std::size_t len) override {
        if (closed.load()) {
            return { IoStatus::EndOfStream, 0, "closed" };
        }
        while (true) {
            // Wake periodically so close() from another thread ends a blocked read
            struct pollfd pfd { readFd, POLLIN, 0 };
            int ready = ::poll(&pfd, 1, kPollIntervalMs);
            if (closed.load()) {
                return { IoStatus::EndOfStream, 0, "closed" };
            }
            if (ready == 0 || (ready < 0 && errno == EINTR)) {
                continue;
            }
            if (ready < 0) {
                const int err = errno;
                return { IoStatus::Error, 0, std::strerror(err) };
            }
            ssize_t n = ::read(readFd, buf, len);
            if (n > 0) {
                return { IoStatus::Ok, static_cast<std::size_t>(n), {} };
            }
            if (n == 0) {
                return { IoStatus::EndOfStream, 0, {} };
            }
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            if (isDisconnectErrno(err)) {
                return { IoStatus::BrokenPipe, 0, std::strerror(err) };
            }
            return { IoStatus::Error, 0, std::strerror(err) };
        }
    }

    IoResult write(const char* data, std::size_t len) override {
        std::size_t written = 0;
        while (written < len) {
            ssize_t n = ::write(writeFd, data + written, len - written);
            if (n > 0) {
                written += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            const int err = errno;
            if (isDisconnectErrno(err)) {
                return { IoStatus::BrokenPipe, written, std::strerror(err) };
            }
            return { IoStatus::Error, written, std::strerror(err) };
        }
        return { IoStatus::Ok, written, {} };
    }

    void close() override {
        if (closed.exchange(true)) {
            return;
        }
        if (ownsFds) {
            ::close(readFd);
            if (writeFd != readFd) {
                ::close(writeFd);
            }
        }
    }

    std::string describe() const override { return description; }

private:
    int readFd;
    int writeFd;
    bool ownsFds;
    std::string description;
    std::atomic<bool> closed{false};
};

class IostreamByteStream : public IByteStream {
public:
    IostreamByteStream(std::istream& i, std::ostream& o) : in(i), out(o) {}

    IoResult read(char* buf, std::size_t len) override {
        if (closed || !in.good()) {
            return { IoStatus::EndOfStream, 0, {} };
        }
        // Deliver whatever is available up to len; a string stream reports EOF once drained
        in.read(buf, static_cast<std::streamsize>(len));
        std::size_t n = static_cast<std::size_t>(in.gcount());
        if (n == 0) {
            return { IoStatus::EndOfStream, 0, {} };
        }
        return { IoStatus::Ok, n, {} };
    }

    IoResult write(const char* data, std::size_t len) override {
        if (closed) {
            return { IoStatus::BrokenPipe, 0, "closed" };
        }
        out.write(data, static_cast<std::streamsize>(len));
        out.flush();
        if (!out.good()) {
            return { IoStatus::Error, 0, "ostream failure" };
        }
        return { IoStatus::Ok, len, {} };
    }

    void close() override { closed = true; }

    std::string describe() const override { return "iostream"; }

private:
    std::istream& in;
    std::ostream& out;
    std::atomic<bool> closed{false};
};

} // namespace

std::unique_ptr<IByteStream> MakeFdByteStream(int readFd, int writeFd, bool ownsFds, std::string description) {
    return std::make_unique<FdByteStream>(readFd, writeFd, ownsFds, std::move(description));
}

std::unique_ptr<IByteStream> MakeIostreamByteStream(std::istream& in, std::ostream& out) {
    return std::make_unique<IostreamByteStream>(in, out);
}

} // namespace mcpengine
