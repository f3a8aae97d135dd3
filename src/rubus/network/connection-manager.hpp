#pragma once

// Abseil
#include <absl/container/flat_hash_map.h>

// standard
#include <cstddef>
#include <memory>
#include <atomic>
#include <queue>
#include <mutex>

// rubus
#include <common/thread-pool.hpp>
#include <rubus/transport/interfaces/i-socket.hpp>
#include <rubus/protocol/interfaces/i-request-parser.hpp>
#include <rubus/handling/interfaces/i-handler-master.hpp>
#include <rubus/handling/request-handler.hpp>
#include <rubus/handling/request-processor.hpp>


namespace rubus {

    // Runs request handlers of accepted connections on worker pool.
    // Handler finishing with SUCCESS or TIMED_OUT is queued again for the same
    // connection, any other outcome retires connection: socket is closed and
    // handler returns to idle list for reuse.
    class ConnectionManager 
        : public IHandlerMaster
        , public std::enable_shared_from_this<ConnectionManager> {
    private: struct Private { };
    public:

        struct Settings {
            std::size_t openConnectionsLimit = 64;
            RequestHandler::Settings handler;
        };

        static std::shared_ptr<ConnectionManager> configure(
            std::shared_ptr<ThreadPool> pool,
            std::shared_ptr<RequestProcessor> processor,
            std::unique_ptr<IRequestParser> parserPrototype,
            Settings settings
        );
        ConnectionManager(
            std::shared_ptr<ThreadPool> pool,
            std::shared_ptr<RequestProcessor> processor,
            std::unique_ptr<IRequestParser> parserPrototype,
            Settings settings,
            Private access
        );

        // Takes ownership of connection. Socket is closed and false is returned
        // if manager is closed or limit of open connections is reached.
        bool add(std::shared_ptr<ISocket> socket);
        // Closes every open connection and stops worker pool,
        // returns after all workers have exited.
        void close();

        // IHandlerMaster implementation
        void onHandlerDone(std::shared_ptr<RequestHandler> handler) override;

        bool hasCapacity() const;
        std::size_t openConnections() const;
        std::size_t idleHandlers();
        std::size_t createdHandlers() const;
        bool terminated();

    private:
        std::shared_ptr<RequestHandler> acquireHandler();
        bool submit(std::shared_ptr<RequestHandler> handler);
        void retire(std::shared_ptr<RequestHandler> handler);

    private:
        const Settings settings_;
        std::shared_ptr<ThreadPool> pool_;
        std::shared_ptr<RequestProcessor> processor_;
        std::unique_ptr<IRequestParser> parserPrototype_;

        std::atomic<std::size_t> open_;
        std::atomic<std::size_t> created_;

        std::mutex lock_;
        bool terminated_;
        std::queue<std::shared_ptr<RequestHandler>> idle_;
        absl::flat_hash_map<RequestHandler*, std::shared_ptr<ISocket>> registry_;
    };

}
