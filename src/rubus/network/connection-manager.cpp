// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// standard
#include <cstddef>
#include <utility>
#include <memory>
#include <vector>
#include <mutex>

// rubus
#include <common/macros.hpp>
#include <common/exceptions.hpp>

// local
#include "connection-manager.hpp"

using namespace rubus;


std::shared_ptr<ConnectionManager> ConnectionManager::configure(
    std::shared_ptr<ThreadPool> pool,
    std::shared_ptr<RequestProcessor> processor,
    std::unique_ptr<IRequestParser> parserPrototype,
    Settings settings) 
{
    return std::make_shared<ConnectionManager>(
        std::move(pool), std::move(processor), std::move(parserPrototype), std::move(settings), Private());
}

ConnectionManager::ConnectionManager(
    std::shared_ptr<ThreadPool> pool,
    std::shared_ptr<RequestProcessor> processor,
    std::unique_ptr<IRequestParser> parserPrototype,
    Settings settings,
    Private access)
: settings_(std::move(settings))
, pool_(std::move(pool))
, processor_(std::move(processor))
, parserPrototype_(std::move(parserPrototype))
, open_(0)
, created_(0)
, terminated_(false)
{
    RUBUS_ENSURE_NOT_NULL(pool_);
    RUBUS_ENSURE_NOT_NULL(processor_);
    RUBUS_ENSURE_NOT_NULL(parserPrototype_);
    // every open connection keeps at most one task queued
    RUBUS_THROW_UNLESS(RubusBadInit, "worker pool queue is smaller than open connections limit", 
        pool_->capacity() >= settings_.openConnectionsLimit);
}

bool ConnectionManager::add(std::shared_ptr<ISocket> socket) {
    RUBUS_ENSURE_NOT_NULL(socket);

    std::shared_ptr<RequestHandler> handler;
    {
        std::unique_lock<std::mutex> locked(lock_);
        if (terminated_ || open_ >= settings_.openConnectionsLimit) {
            locked.unlock();
            PLOG(plog::warning) << "[manager] rejecting connection " << socket->peer();
            socket->close();
            return false;
        }

        ++open_;
        handler = acquireHandler();
        handler->assign(socket);
        registry_.emplace(handler.get(), socket);
    }

    PLOG(plog::debug) 
        << "[manager] serving " << socket->peer() << ", open connections: " << open_;
    if (!submit(handler)) {
        retire(std::move(handler));
        return false;
    }
    return true;
}

std::shared_ptr<RequestHandler> ConnectionManager::acquireHandler() {
    if (!idle_.empty()) {
        auto handler = std::move(idle_.front());
        idle_.pop();
        return handler;
    }

    ++created_;
    return RequestHandler::configure(processor_, parserPrototype_->clone(), weak_from_this(), settings_.handler);
}

bool ConnectionManager::submit(std::shared_ptr<RequestHandler> handler) {
    return pool_->query([handler]() {
        handler->run();
    }, weak_from_this());
}

void ConnectionManager::onHandlerDone(std::shared_ptr<RequestHandler> handler) {
    auto outcome = handler->outcome();
    if (outcome == RequestHandler::EOutcome::SUCCESS || outcome == RequestHandler::EOutcome::TIMED_OUT) {
        if (!terminated() && submit(handler)) {
            return;
        }
    }

    PLOG(plog::debug) << "[manager] retiring connection after " << toString(outcome);
    retire(std::move(handler));
}

void ConnectionManager::retire(std::shared_ptr<RequestHandler> handler) {
    std::shared_ptr<ISocket> socket;
    {
        std::unique_lock<std::mutex> locked(lock_);
        if (auto entry = registry_.find(handler.get()); entry != registry_.end()) {
            socket = std::move(entry->second);
            registry_.erase(entry);
        }
    }

    // whoever erased registry entry closes socket and releases slot
    if (socket) {
        socket->close();
        --open_;
        PLOG(plog::info) << "[manager] closed connection " << socket->peer() << ", open connections: " << open_;
    }

    handler->detach();
    std::unique_lock<std::mutex> locked(lock_);
    if (!terminated_) {
        idle_.push(std::move(handler));
    }
}

void ConnectionManager::close() {
    std::vector<std::shared_ptr<ISocket>> sockets;
    {
        std::unique_lock<std::mutex> locked(lock_);
        if (terminated_) {
            return;
        }
        terminated_ = true;

        sockets.reserve(registry_.size());
        for (auto& [handler, socket] : registry_) {
            sockets.push_back(std::move(socket));
        }
        registry_.clear();
        open_ -= sockets.size();

        while (!idle_.empty()) {
            idle_.pop();
        }
    }

    PLOG(plog::info) << "[manager] closing " << sockets.size() << " open connections";
    // unblocks handlers waiting on reads
    for (auto& socket : sockets) {
        socket->close();
    }
    pool_->terminate();
}

bool ConnectionManager::hasCapacity() const {
    return open_ < settings_.openConnectionsLimit;
}

std::size_t ConnectionManager::openConnections() const {
    return open_;
}

std::size_t ConnectionManager::idleHandlers() {
    std::unique_lock<std::mutex> locked(lock_);
    return idle_.size();
}

std::size_t ConnectionManager::createdHandlers() const {
    return created_;
}

bool ConnectionManager::terminated() {
    std::unique_lock<std::mutex> locked(lock_);
    return terminated_;
}
