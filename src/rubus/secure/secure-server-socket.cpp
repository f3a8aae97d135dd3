// boost
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

// plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <condition_variable>
#include <chrono>
#include <memory>
#include <mutex>

// rubus
#include <common/exceptions.hpp>
#include <common/macros.hpp>

// local
#include "secure-server-socket.hpp"
#include "secure-session.hpp"

using namespace rubus;
using namespace std::chrono;


std::shared_ptr<SecureServerSocket> SecureServerSocket::configure(
    std::shared_ptr<IServerSocket> inner,
    std::shared_ptr<ICryptoProvider> crypto,
    Settings settings)
{
    RUBUS_ENSURE_NOT_NULL(inner);
    RUBUS_ENSURE_NOT_NULL(crypto);
    return std::make_shared<SecureServerSocket>(std::move(inner), std::move(crypto), std::move(settings), Private());
}

SecureServerSocket::SecureServerSocket(
    std::shared_ptr<IServerSocket> inner,
    std::shared_ptr<ICryptoProvider> crypto,
    Settings settings,
    Private access)
: inner_(std::move(inner))
, crypto_(std::move(crypto))
, settings_(std::move(settings))
, closed_(false)
, inFlight_(0)
{}

SecureServerSocket::~SecureServerSocket() {
    close();
}

void SecureServerSocket::init() {
    if (pool_) {
        throw RubusBadInit();
    }
    RUBUS_THROW_UNLESS(RubusBadInit, "certificate is required to accept secure connections", !settings_.certificate.empty());

    pool_ = std::make_unique<boost::asio::thread_pool>(std::max<std::size_t>(settings_.handshakeWorkers, 1));
    PLOG(plog::info) 
        << "[secure] accepting encrypted connections, plaintext fallback " 
        << ((settings_.secureConnectionRequired) ? "disabled" : "enabled");
}

std::shared_ptr<ISocket> SecureServerSocket::accept(milliseconds timeout) {
    if (!pool_) {
        throw RubusNoInit();
    }
    if (closed_) {
        throw RubusSocketError("accept on closed server socket");
    }

    auto deadline = steady_clock::now() + timeout;

    std::size_t admitted = (settings_.admitted) ? settings_.admitted() : 0;
    bool hasRoom = false;
    {
        std::unique_lock<std::mutex> locked(lock_);
        hasRoom = admitted + inFlight_ + ready_.size() < settings_.pendingLimit;
    }

    if (hasRoom) {
        try {
            startHandshake(inner_->accept(timeout));
        } catch (const RubusTimeout&) {
            // nothing to accept, maybe handshake finished meanwhile
        }
    }

    std::unique_lock<std::mutex> locked(lock_);
    auto available = [this]() {
        return !ready_.empty() || closed_;
    };
    if (timeout.count() > 0) {
        cv_.wait_until(locked, std::max(deadline, steady_clock::now()), available);
    } else if (!hasRoom) {
        cv_.wait(locked, available);
    }

    if (ready_.empty()) {
        throw RubusTimeout();
    }

    auto socket = std::move(ready_.front());
    ready_.pop_front();
    return socket;
}

void SecureServerSocket::startHandshake(std::shared_ptr<ISocket> socket) {
    {
        std::unique_lock<std::mutex> locked(lock_);
        ++inFlight_;
    }

    boost::asio::post(*pool_, [weakSelf = weak_from_this(), socket = std::move(socket)]() {
        if (auto self = weakSelf.lock()) {
            self->handshake(socket);
        } else {
            socket->close();
        }
    });
}

void SecureServerSocket::handshake(std::shared_ptr<ISocket> socket) {
    try {
        auto session = SecureSession::configure(socket, crypto_, SecureSession::Settings{
            .role = SecureSession::ERole::RESPONDER,
            .encryptionSupported = true,
            .handshakeTimeout = settings_.handshakeTimeout,
            .certificate = settings_.certificate
        });
        session->handshake();
        complete(session);
        return;
    } catch (const RubusHandshakeUnsupported& error) {
        if (!settings_.secureConnectionRequired) {
            PLOG(plog::info) << "[secure] " << socket->peer() << " continues without encryption: " << error.what();
            complete(socket);
            return;
        }
        PLOG(plog::warning) << "[secure] rejecting " << socket->peer() << ": " << error.what();
    } catch (const RubusException& error) {
        PLOG(plog::warning) << "[secure] handshake with " << socket->peer() << " failed: " << error.what();
    } catch (const std::exception& error) {
        PLOG(plog::error) << "[secure] unexpected error during handshake with " << socket->peer() << ": " << error.what();
    }

    socket->close();
    complete(nullptr);
}

void SecureServerSocket::complete(std::shared_ptr<ISocket> socket) {
    {
        std::unique_lock<std::mutex> locked(lock_);
        --inFlight_;
        if (socket) {
            if (closed_) {
                socket->close();
            } else {
                ready_.push_back(std::move(socket));
            }
        }
    }
    cv_.notify_all();
}

void SecureServerSocket::close() {
    if (closed_.exchange(true)) {
        return;
    }
    cv_.notify_all();

    inner_->close();
    if (pool_) {
        pool_->join();
    }

    std::unique_lock<std::mutex> locked(lock_);
    for (auto& socket : ready_) {
        socket->close();
    }
    ready_.clear();
}

bool SecureServerSocket::isClosed() const {
    return closed_;
}
