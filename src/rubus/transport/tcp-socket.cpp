// sockpp
#include <sockpp/tcp_connector.h>
#include <sockpp/inet_address.h>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_socket.h>
#include <sockpp/socket.h>

// Abseil
#include <absl/strings/str_format.h>

// plog
#include <plog/Log.h>
#include <plog/Severity.h>

// posix
#include <poll.h>
#include <sys/socket.h>

// standard
#include <system_error>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <memory>
#include <mutex>

// rubus
#include <common/exceptions.hpp>

// local
#include "tcp-socket.hpp"

using namespace rubus;
using namespace std::chrono;


namespace {

    std::once_flag sockppInit;

    void ensureSockppInitialized() {
        // also ignores SIGPIPE on posix systems
        std::call_once(sockppInit, []() {
            sockpp::initialize();
        });
    }

    // Returns true if handle became ready before timeout.
    bool waitReadable(int handle, milliseconds timeout) {
        pollfd descriptor {.fd = handle, .events = POLLIN, .revents = 0};
        auto deadline = steady_clock::now() + timeout;

        while (true) {
            int wait = -1;
            if (timeout.count() > 0) {
                auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
                wait = static_cast<int>(std::max<milliseconds::rep>(left.count(), 0));
            }

            int result = ::poll(&descriptor, 1, wait);
            if (result > 0) {
                return true;
            } else if (result == 0) {
                return false;
            } else if (errno != EINTR) {
                throw RubusSocketError(absl::StrFormat("poll failed: %s", std::strerror(errno)));
            }
        }
    }

}

std::shared_ptr<TcpSocket> TcpSocket::configure(sockpp::tcp_socket socket) {
    ensureSockppInitialized();
    return std::make_shared<TcpSocket>(std::move(socket), Private());
}

std::shared_ptr<TcpSocket> TcpSocket::connect(const std::string& host, std::uint16_t port, milliseconds timeout) {
    ensureSockppInitialized();

    sockpp::tcp_connector connector;
    try {
        sockpp::inet_address address (host, port);
        auto result = (timeout.count() > 0) 
            ? connector.connect(address, timeout) 
            : connector.connect(address);
        if (result.is_error()) {
            if (result.error() == std::errc::timed_out) {
                throw RubusTimeout(absl::StrFormat("connection to %s:%d timed out", host, port));
            }
            throw RubusSocketError(absl::StrFormat(
                "could not connect to %s:%d: %s", host, port, result.error_message()));
        }
    } catch (const std::system_error& error) {
        throw RubusSocketError(absl::StrFormat("could not resolve %s: %s", host, error.what()));
    }

    PLOG(plog::debug) << "[tcp] connected to " << host << ":" << port;
    return configure(sockpp::tcp_socket(connector.release()));
}

TcpSocket::TcpSocket(sockpp::tcp_socket socket, Private access)
: closed_(false)
, socket_(std::move(socket))
{
    try {
        peer_ = sockpp::inet_address(socket_.peer_address()).to_string();
    } catch (const std::exception& error) {
        PLOG(plog::warning) << "[tcp] could not query peer address: " << error.what();
        peer_ = "unknown";
    }
}

TcpSocket::~TcpSocket() {
    close();
    socket_.close();
}

std::size_t TcpSocket::read(char* dest, std::size_t size, milliseconds timeout) {
    if (closed_) {
        throw RubusSocketError("read on closed socket");
    }

    if (!waitReadable(socket_.handle(), timeout)) {
        throw RubusTimeout(absl::StrFormat("no data from %s in %dms", peer_, timeout.count()));
    }

    auto result = socket_.read(dest, size);
    if (result.is_error()) {
        throw RubusSocketError(absl::StrFormat("read from %s failed: %s", peer_, result.error_message()));
    }
    if (result.value() == 0) {
        throw RubusEndOfStream(absl::StrFormat("%s closed the stream", peer_));
    }

    timestamps_.markRead();
    return result.value();
}

void TcpSocket::write(const char* src, std::size_t size) {
    if (closed_) {
        throw RubusSocketError("write on closed socket");
    }

    auto result = socket_.write_n(src, size);
    if (result.is_error()) {
        throw RubusSocketError(absl::StrFormat("write to %s failed: %s", peer_, result.error_message()));
    }
    if (result.value() != size) {
        throw RubusSocketError(absl::StrFormat(
            "write to %s interrupted: %d of %d bytes sent", peer_, result.value(), size));
    }

    timestamps_.markWrite();
}

void TcpSocket::close() {
    if (closed_.exchange(true)) {
        return;
    }
    timestamps_.markClosed();
    // descriptor itself is released in destructor, so that concurrent
    // reader wakes up on shutdown instead of touching reused handle
    if (auto result = socket_.shutdown(SHUT_RDWR); result.is_error()) {
        PLOG(plog::debug) << "[tcp] shutdown of " << peer_ << " reported: " << result.error_message();
    }
    PLOG(plog::debug) << "[tcp] closed connection with " << peer_;
}

bool TcpSocket::isClosed() const {
    return closed_;
}

ISocket::clock::time_point TcpSocket::openTime() const {
    return timestamps_.openTime();
}

std::optional<ISocket::clock::time_point> TcpSocket::closeTime() const {
    return timestamps_.closeTime();
}

std::optional<ISocket::clock::time_point> TcpSocket::lastReadTime() const {
    return timestamps_.lastReadTime();
}

std::optional<ISocket::clock::time_point> TcpSocket::lastWriteTime() const {
    return timestamps_.lastWriteTime();
}

std::string TcpSocket::peer() const {
    return peer_;
}

std::shared_ptr<TcpServerSocket> TcpServerSocket::configure(Settings settings) {
    ensureSockppInitialized();
    return std::make_shared<TcpServerSocket>(std::move(settings), Private());
}

TcpServerSocket::TcpServerSocket(Settings settings, Private access)
: settings_(std::move(settings))
, initiated_(false)
, closed_(false)
{}

TcpServerSocket::~TcpServerSocket() {
    close();
}

void TcpServerSocket::init() {
    if (initiated_.exchange(true)) {
        throw RubusBadInit();
    }

    try {
        sockpp::inet_address address (settings_.address, settings_.port);
        if (auto result = acc_.open(address, settings_.backlog); result.is_error()) {
            throw RubusSocketError(absl::StrFormat(
                "could not listen on %s: %s", address.to_string(), result.error_message()));
        }
    } catch (const std::system_error& error) {
        throw RubusSocketError(absl::StrFormat("could not resolve %s: %s", settings_.address, error.what()));
    }

    PLOG(plog::info) << "[tcp] listening on " << settings_.address << ":" << port();
}

std::uint16_t TcpServerSocket::port() const {
    return sockpp::inet_address(acc_.address()).port();
}

std::shared_ptr<ISocket> TcpServerSocket::accept(milliseconds timeout) {
    if (!initiated_) {
        throw RubusNoInit();
    }
    if (closed_) {
        throw RubusSocketError("accept on closed server socket");
    }

    if (!waitReadable(acc_.handle(), timeout)) {
        throw RubusTimeout();
    }

    auto result = acc_.accept();
    if (result.is_error()) {
        if (result.error() == std::errc::resource_unavailable_try_again) {
            // peer gave up between poll and accept
            throw RubusTimeout();
        }
        throw RubusSocketError(absl::StrFormat("error accepting peer: %s", result.error_message()));
    }

    auto socket = TcpSocket::configure(result.release());
    PLOG(plog::info) << "[tcp] accepted new client " << socket->peer();
    return socket;
}

void TcpServerSocket::close() {
    if (closed_.exchange(true) || !initiated_) {
        return;
    }
    if (auto result = acc_.close(); result.is_error()) {
        PLOG(plog::warning) << "[tcp] error closing acceptor: " << result.error_message();
    }
}

bool TcpServerSocket::isClosed() const {
    return closed_;
}
