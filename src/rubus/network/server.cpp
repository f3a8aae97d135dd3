// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// standard
#include <algorithm>
#include <cstdint>
#include <memory>
#include <chrono>
#include <mutex>

// rubus
#include <common/macros.hpp>
#include <common/exceptions.hpp>
#include <common/thread-pool.hpp>
#include <rubus/transport/tcp-socket.hpp>
#include <rubus/secure/crypto.hpp>
#include <rubus/secure/secure-server-socket.hpp>
#include <rubus/auth/default-authenticator.hpp>
#include <rubus/handling/request-processor.hpp>

// local
#include "server.hpp"

using namespace rubus;
using namespace std::chrono;


std::shared_ptr<Server> Server::configure(
    std::shared_ptr<IServerSocket> listener,
    std::shared_ptr<ConnectionManager> manager,
    Settings settings) 
{
    return std::make_shared<Server>(std::move(listener), std::move(manager), std::move(settings), Private());
}

Server::Server(
    std::shared_ptr<IServerSocket> listener,
    std::shared_ptr<ConnectionManager> manager,
    Settings settings,
    Private access)
: settings_(std::move(settings))
, listener_(std::move(listener))
, manager_(std::move(manager))
, abort_(false)
, accepted_(0)
{
    RUBUS_ENSURE_NOT_NULL(listener_);
    RUBUS_ENSURE_NOT_NULL(manager_);
}

absl::StatusOr<std::shared_ptr<Server>> Server::create(
    const ServerSettings& settings, 
    std::shared_ptr<IMediaService> media) 
{
    auto tcp = TcpServerSocket::configure({
        .address = settings.bindAddress, 
        .port = settings.listeningPort
    });
    try {
        tcp->init();
    } catch (const RubusException& error) {
        return absl::UnavailableError(error.what());
    }
    PLOG(plog::info) << "[server] listening on " << settings.bindAddress << ":" << tcp->port();

    auto pool = ThreadPool::configure({
        .size = settings.availableThreadsLimit,
        .maxSize = std::max(ThreadPool::Settings{}.maxSize, settings.openConnectionsLimit)
    });
    pool->init();

    auto processor = RequestProcessor::configure(
        std::move(media), 
        std::make_shared<DefaultAuthenticator>(), 
        std::make_shared<BasicViewerAuthorizer>());

    auto manager = ConnectionManager::configure(
        pool, 
        processor, 
        makeRequestParser(settings.requestParser), 
        {
            .openConnectionsLimit = settings.openConnectionsLimit, 
            .handler = {.requestTimeout = settings.requestTimeout}
        });

    std::shared_ptr<IServerSocket> listener = tcp;
    if (settings.encryptionEnabled) {
        auto credentials = Credentials::load(
            settings.certificateLocation.value_or("").string(), 
            settings.privateKeyLocation.value_or("").string());
        if (!credentials.ok()) {
            tcp->close();
            manager->close();
            return credentials.status();
        }

        auto crypto = OpenSslCryptoProvider::configure({.privateKey = credentials->privateKey});
        if (auto status = crypto->init(); !status.ok()) {
            tcp->close();
            manager->close();
            return status;
        }

        auto secure = SecureServerSocket::configure(tcp, crypto, {
            .secureConnectionRequired = settings.secureConnectionRequired,
            .handshakeTimeout = settings.handshakeTimeout,
            .certificate = credentials->certificate,
            .pendingLimit = settings.openConnectionsLimit,
            .admitted = [weakManager = std::weak_ptr<ConnectionManager>(manager)]() -> std::size_t {
                auto live = weakManager.lock();
                return (live) ? live->openConnections() : 0;
            }
        });
        secure->init();
        listener = secure;
        PLOG(plog::info) 
            << "[server] encryption enabled, secure connection " 
            << ((settings.secureConnectionRequired) ? "required" : "optional");
    }

    auto server = Server::configure(listener, manager, {.acceptTimeout = settings.acceptTimeout});
    server->port_ = tcp->port();
    return server;
}

void Server::run() {
    PLOG(plog::info) << "[server] accept loop started";

    while (!abort_) {
        if (!manager_->hasCapacity()) {
            wait(settings_.acceptTimeout);
            continue;
        }

        try {
            auto socket = listener_->accept(settings_.acceptTimeout);
            ++accepted_;
            PLOG(plog::info) << "[server] accepted " << socket->peer();
            manager_->add(std::move(socket));
        } catch (const RubusTimeout&) {
            // nothing to accept
        } catch (const RubusSocketError& error) {
            if (abort_) {
                break;
            }
            PLOG(plog::error) << "[server] accept failed: " << error.what();
            wait(settings_.acceptTimeout);
        }
    }

    PLOG(plog::info) << "[server] accept loop stopped, accepted " << accepted_ << " connections";
}

void Server::terminate() {
    {
        std::unique_lock<std::mutex> locked(lock_);
        if (abort_.exchange(true)) {
            return;
        }
    }
    cv_.notify_all();

    listener_->close();
    manager_->close();
    PLOG(plog::info) << "[server] terminated";
}

void Server::wait(milliseconds timeout) {
    std::unique_lock<std::mutex> locked(lock_);
    cv_.wait_for(locked, timeout, [this]() {
        return abort_.load();
    });
}

std::optional<std::uint16_t> Server::port() const {
    return port_;
}

std::size_t Server::accepted() const {
    return accepted_;
}

const std::shared_ptr<ConnectionManager>& Server::manager() const {
    return manager_;
}
