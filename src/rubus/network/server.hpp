#pragma once

// Abseil
#include <absl/status/statusor.h>

// standard
#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <atomic>
#include <memory>
#include <chrono>
#include <mutex>

// rubus
#include <rubus/macros.hpp>
#include <rubus/util/settings.hpp>
#include <rubus/transport/interfaces/i-socket.hpp>
#include <rubus/media/interfaces/i-media-service.hpp>

// local
#include "connection-manager.hpp"


namespace rubus {

    // Accept loop: takes connections from listener while connection manager
    // has free slots, otherwise waits for accept timeout.
    class Server 
        : public std::enable_shared_from_this<Server>
    {
    private: struct Private { };
    public:

        struct Settings {
            std::chrono::milliseconds acceptTimeout = DefaultAcceptTimeout;
        };

        static std::shared_ptr<Server> configure(
            std::shared_ptr<IServerSocket> listener,
            std::shared_ptr<ConnectionManager> manager,
            Settings settings
        );
        Server(
            std::shared_ptr<IServerSocket> listener,
            std::shared_ptr<ConnectionManager> manager,
            Settings settings,
            Private access
        );

        // Builds listening TCP socket (decorated with secure listener if encryption
        // is enabled), worker pool, request processing and connection manager.
        static absl::StatusOr<std::shared_ptr<Server>> create(
            const ServerSettings& settings, 
            std::shared_ptr<IMediaService> media
        );

        // Blocks until terminate() is called.
        void run();
        // Stops accept loop, closes listener and every open connection.
        void terminate();

        // Bound port, known for servers made by create().
        std::optional<std::uint16_t> port() const;
        std::size_t accepted() const;
        const std::shared_ptr<ConnectionManager>& manager() const;

    private:
        void wait(std::chrono::milliseconds timeout);

    private:
        const Settings settings_;
        std::shared_ptr<IServerSocket> listener_;
        std::shared_ptr<ConnectionManager> manager_;
        std::optional<std::uint16_t> port_;

        std::atomic<bool> abort_;
        std::atomic<std::size_t> accepted_;
        std::mutex lock_;
        std::condition_variable cv_;
    };

}
