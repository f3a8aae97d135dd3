#pragma once

// Abseil
#include <absl/status/statusor.h>

// standard
#include <string_view>
#include <cstdint>
#include <chrono>
#include <memory>
#include <string>
#include <mutex>

// rubus
#include <rubus/macros.hpp>
#include <rubus/transport/interfaces/i-socket.hpp>
#include <rubus/secure/interfaces/i-crypto-provider.hpp>

// proto
#include <protos/media/media.pb.h>

// local
#include "response.hpp"


namespace rubus {

    // Connection to rubus server. Transport failure closes connection,
    // next request opens new one.
    class Client 
        : public std::enable_shared_from_this<Client> {
    private: struct Private { };
    public:

        struct Settings {
            std::string host = "127.0.0.1";
            std::uint16_t port = DefaultPort;
            // server runs secure listener, handshake is performed on connect
            bool handshake = false;
            // local encryption support declared in handshake
            bool encryption = true;
            // continue in plaintext if either side refused encryption
            bool allowPlaintextFallback = true;
            std::chrono::milliseconds connectTimeout {2000};
            std::chrono::milliseconds handshakeTimeout = DefaultHandshakeTimeout;
            std::chrono::milliseconds responseTimeout {5000};
        };

        static std::shared_ptr<Client> configure(Settings settings);
        Client(Settings settings, Private access);

        // Throws RubusSocketError, RubusTimeout or handshake errors.
        void connect();
        bool connected();
        // Connection is encrypted.
        bool secure();
        void close();

        // Sends raw request and waits for complete response, connects if needed.
        // Throws on transport failure or malformed response.
        Response send(std::string_view request);

        absl::StatusOr<NRubus::TMediaList> list(std::string_view titleContains = ".*");
        absl::StatusOr<NRubus::TMediaInfo> info(std::string_view mediaId);
        absl::StatusOr<NRubus::TFetchedPieces> fetch(std::string_view mediaId, std::uint32_t firstPiece, std::uint32_t pieceCount);

    private:
        void connectLocked();
        std::string receive(std::chrono::milliseconds timeout);

    private:
        const Settings settings_;
        std::mutex lock_;
        std::shared_ptr<ICryptoProvider> crypto_;
        std::shared_ptr<ISocket> socket_;
        bool secure_;
    };

}
