#pragma once

// boost
#include <boost/asio/thread_pool.hpp>

// standard
#include <condition_variable>
#include <functional>
#include <cstddef>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <deque>
#include <mutex>

// rubus
#include <rubus/macros.hpp>
#include <rubus/transport/interfaces/i-socket.hpp>

// local
#include "interfaces/i-crypto-provider.hpp"


namespace rubus {

    // Listener decorator performing responder handshake on every accepted socket.
    // Handshakes run on separate pool, accept() hands out established sessions.
    class SecureServerSocket 
        : public IServerSocket
        , public std::enable_shared_from_this<SecureServerSocket>
    {
    private: struct Private { };
    public:

        struct Settings {
            // plain socket is handed out if peer does not support encryption
            bool secureConnectionRequired = false;
            std::chrono::milliseconds handshakeTimeout = DefaultHandshakeTimeout;
            std::string certificate;
            std::size_t handshakeWorkers = 2;
            // handshakes in flight, sessions waiting for accept() and admitted
            // connections together
            std::size_t pendingLimit = 64;
            // connections handed out earlier and still open, none if empty
            std::function<std::size_t()> admitted;
        };

        static std::shared_ptr<SecureServerSocket> configure(
            std::shared_ptr<IServerSocket> inner,
            std::shared_ptr<ICryptoProvider> crypto,
            Settings settings
        );
        SecureServerSocket(
            std::shared_ptr<IServerSocket> inner,
            std::shared_ptr<ICryptoProvider> crypto,
            Settings settings,
            Private access
        );
        ~SecureServerSocket() override;

        void init();

        // IServerSocket implementation
        std::shared_ptr<ISocket> accept(std::chrono::milliseconds timeout) override;
        void close() override;
        bool isClosed() const override;

    private:
        void startHandshake(std::shared_ptr<ISocket> socket);
        void handshake(std::shared_ptr<ISocket> socket);
        void complete(std::shared_ptr<ISocket> socket);

    private:
        std::shared_ptr<IServerSocket> inner_;
        std::shared_ptr<ICryptoProvider> crypto_;
        Settings settings_;

        std::unique_ptr<boost::asio::thread_pool> pool_;
        std::atomic<bool> closed_;

        std::mutex lock_;
        std::condition_variable cv_;
        std::size_t inFlight_;
        std::deque<std::shared_ptr<ISocket>> ready_;
    };

}
