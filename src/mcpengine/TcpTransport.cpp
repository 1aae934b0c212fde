//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TcpTransport.cpp
// Purpose: TCP listener using Boost.Asio; one Connection thread per accepted socket
//==========================================================================================================

#include <atomic>
#include <list>
#include <stdexcept>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpengine/Transport.h"

namespace mcpengine {
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

bool isDisconnect(const boost::system::error_code& ec) {
    return ec == net::error::connection_reset || ec == net::error::broken_pipe ||
           ec == net::error::not_connected || ec == net::error::shut_down ||
           ec == net::error::connection_aborted;
}

//==========================================================================================================
// SocketByteStream
// Purpose: Blocking IByteStream over an accepted socket. close() shuts the socket down in both
//          directions, which wakes a reader blocked in read_some; the descriptor is released on destruction.
//==========================================================================================================
class SocketByteStream : public IByteStream {
public:
    explicit SocketByteStream(tcp::socket s) : socket(std::move(s)) {
        boost::system::error_code ec;
        auto ep = socket.remote_endpoint(ec);
        description = ec ? std::string("tcp:unknown") : fmt::format("{}:{}", ep.address().to_string(), ep.port());
        socket.set_option(tcp::no_delay(true), ec);
    }

    ~SocketByteStream() override {
        close();
        boost::system::error_code ec;
        socket.close(ec);
    }

    IoResult read(char* buf, std::size_t len) override {
        if (closed.load()) {
            return { IoStatus::EndOfStream, 0, "closed" };
        }
        boost::system::error_code ec;
        std::size_t n = socket.read_some(net::buffer(buf, len), ec);
        if (!ec) {
            return { IoStatus::Ok, n, {} };
        }
        if (ec == net::error::eof || closed.load()) {
            return { IoStatus::EndOfStream, 0, {} };
        }
        if (isDisconnect(ec)) {
            return { IoStatus::BrokenPipe, 0, ec.message() };
        }
        return { IoStatus::Error, 0, ec.message() };
    }

    IoResult write(const char* data, std::size_t len) override {
        if (closed.load()) {
            return { IoStatus::BrokenPipe, 0, "closed" };
        }
        boost::system::error_code ec;
        std::size_t n = net::write(socket, net::buffer(data, len), ec);
        if (!ec) {
            return { IoStatus::Ok, n, {} };
        }
        if (isDisconnect(ec)) {
            return { IoStatus::BrokenPipe, n, ec.message() };
        }
        return { IoStatus::Error, n, ec.message() };
    }

    void close() override {
        if (closed.exchange(true)) {
            return;
        }
        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    std::string describe() const override { return description; }

private:
    tcp::socket socket;
    std::string description;
    std::atomic<bool> closed{false};
};

} // namespace

class TcpServer::Impl {
public:
    Impl(ProtocolServer& s, const IFramer& f, std::string h, std::uint16_t p, ConnectionOptions o)
        : server(s), framer(f), host(std::move(h)), port(p), options(o) {}

    struct Worker {
        std::shared_ptr<Connection> connection;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    ProtocolServer& server;
    const IFramer& framer;
    std::string host;
    std::uint16_t port;
    ConnectionOptions options;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> bound{0};

    mutable std::mutex workersMutex;
    std::list<Worker> workers;

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                spawn(std::move(socket));
            }
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                LOG_ERROR("TCP accept on {}:{} failed: {}", host, bound.load(), e.what());
            } else {
                LOG_DEBUG("TCP accept loop ended: {}", e.what());
            }
        }
        co_return;
    }

    void spawn(tcp::socket socket) {
        auto connection = std::make_shared<Connection>(server, std::make_unique<SocketByteStream>(std::move(socket)),
                                                       framer, options);
        auto done = std::make_shared<std::atomic<bool>>(false);

        std::lock_guard<std::mutex> lock(workersMutex);
        reapFinished();
        Worker worker;
        worker.connection = connection;
        worker.done = done;
        worker.thread = std::thread([connection, done]() {
            try {
                connection->run();
            } catch (const std::exception& e) {
                LOG_ERROR("Connection {} failed: {}", connection->peer(), e.what());
            }
            done->store(true);
        });
        workers.push_back(std::move(worker));
        LOG_DEBUG("Accepted {}; {} connection(s) tracked", connection->peer(), workers.size());
    }

    // Caller holds workersMutex.
    void reapFinished() {
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done->load()) {
                if (it->thread.joinable()) {
                    it->thread.join();
                }
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }
};

TcpServer::TcpServer(ProtocolServer& server, const IFramer& framer, std::string host, std::uint16_t port,
                     ConnectionOptions options)
    : pImpl(std::make_unique<Impl>(server, framer, std::move(host), port, options)) {}

TcpServer::~TcpServer() {
    stop();
}

void TcpServer::start() {
    if (pImpl->running.load()) {
        return;
    }
    boost::system::error_code ec;
    auto fail = [this, &ec](const char* step) {
        if (ec) {
            throw std::runtime_error(fmt::format("TCP {} on {}:{} failed: {}", step, pImpl->host, pImpl->port,
                                                 ec.message()));
        }
    };

    tcp::resolver resolver(pImpl->ioc);
    auto results = resolver.resolve(pImpl->host, std::to_string(pImpl->port), ec);
    fail("resolve");
    if (results.empty()) {
        throw std::runtime_error(fmt::format("TCP resolve on {}:{} returned no endpoints", pImpl->host, pImpl->port));
    }
    tcp::endpoint ep = *results.begin();

    pImpl->acceptor = std::make_unique<tcp::acceptor>(pImpl->ioc);
    pImpl->acceptor->open(ep.protocol(), ec);
    fail("open");
    pImpl->acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    fail("setsockopt");
    pImpl->acceptor->bind(ep, ec);
    fail("bind");
    pImpl->acceptor->listen(net::socket_base::max_listen_connections, ec);
    fail("listen");
    pImpl->bound.store(pImpl->acceptor->local_endpoint(ec).port());
    fail("local_endpoint");

    pImpl->running.store(true);
    pImpl->ioc.restart();
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("TCP io thread failed: {}", e.what());
        }
    });
    LOG_INFO("Listening on {}:{} ({} framing)", pImpl->host, pImpl->bound.load(), FramingModeName(pImpl->framer.mode()));
}

void TcpServer::stop() {
    if (!pImpl->running.exchange(false)) {
        return;
    }
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }

    std::list<Impl::Worker> remaining;
    {
        std::lock_guard<std::mutex> lock(pImpl->workersMutex);
        remaining.swap(pImpl->workers);
    }
    for (auto& w : remaining) {
        w.connection->stop();
    }
    for (auto& w : remaining) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
    LOG_INFO("TCP server on {}:{} stopped ({} connection(s) closed)", pImpl->host, pImpl->bound.load(), remaining.size());
}

bool TcpServer::isRunning() const {
    return pImpl->running.load();
}

std::uint16_t TcpServer::boundPort() const {
    return pImpl->bound.load();
}

std::size_t TcpServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(pImpl->workersMutex);
    std::size_t active = 0;
    for (const auto& w : pImpl->workers) {
        if (!w.done->load()) {
            ++active;
        }
    }
    return active;
}

} // namespace mcpengine
