#pragma once

// standard
#include <string_view>
#include <optional>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <mutex>

// rubus
#include <rubus/macros.hpp>
#include <rubus/transport/framing.hpp>
#include <rubus/transport/socket-timestamps.hpp>
#include <rubus/transport/interfaces/i-socket.hpp>

// local
#include "interfaces/i-crypto-provider.hpp"


namespace rubus {

    /*
     * Encrypted decorator over plain socket. Handshake:
     *   initiator -> responder: hello\nencryption-support:<bool>\n
     *   responder -> initiator: certificate (or refusing hello)
     *   initiator -> responder: RSA encrypted 64 byte nonce
     * nonce[0:32] is cipher key, nonce[32:64] is MAC key. Every message afterwards
     * is frame with IV || AES-CBC(payload || HMAC(payload)).
     */
    class SecureSession 
        : public ISocket
        , public std::enable_shared_from_this<SecureSession>
    {
    private: struct Private { };
    public:

        enum class ERole {
            INITIATOR,
            RESPONDER
        };

        enum class EState {
            IDLE,
            SENDING_HELLO,
            AWAITING_PEER_HELLO,
            SENDING_KEY_MATERIAL,
            AWAITING_KEY_MATERIAL,
            ESTABLISHED,
            FAILED
        };

        struct Settings {
            ERole role = ERole::INITIATOR;
            bool encryptionSupported = true;
            std::chrono::milliseconds handshakeTimeout = DefaultHandshakeTimeout;
            // responder only, sent to initiator as is
            std::string certificate;
        };

        static std::shared_ptr<SecureSession> configure(
            std::shared_ptr<ISocket> socket, 
            std::shared_ptr<ICryptoProvider> crypto, 
            Settings settings
        );
        SecureSession(
            std::shared_ptr<ISocket> socket, 
            std::shared_ptr<ICryptoProvider> crypto, 
            Settings settings, 
            Private access
        );

        // Runs handshake on dedicated thread under handshake timeout. On timeout
        // underlying socket is closed and RubusTimeout is thrown, other errors are
        // rethrown as is. May be called once.
        void handshake();

        EState state() const;
        ERole role() const;
        // Throws RubusNoInit until session is established.
        const SessionKeys& keys() const;
        std::shared_ptr<ISocket> underlying() const;

        // ISocket implementation
        std::size_t read(char* dest, std::size_t size, std::chrono::milliseconds timeout) override;
        void write(const char* src, std::size_t size) override;
        void close() override;
        bool isClosed() const override;
        clock::time_point openTime() const override;
        std::optional<clock::time_point> closeTime() const override;
        std::optional<clock::time_point> lastReadTime() const override;
        std::optional<clock::time_point> lastWriteTime() const override;
        std::string peer() const override;

        static std::string makeHello(bool encryptionSupported);
        // nullopt if payload is not a hello message
        static std::optional<bool> parseHello(std::string_view payload);

    private:
        void runHandshake();
        void initiate();
        void respond();
        void establish(std::string_view nonce);
        void transition(EState state);
        void ensureEstablished() const;
        std::chrono::milliseconds remaining() const;
        std::size_t drainRemainder(char* dest, std::size_t size);

    private:
        std::shared_ptr<ISocket> socket_;
        std::shared_ptr<ICryptoProvider> crypto_;
        Settings settings_;

        std::atomic<EState> state_;
        std::chrono::steady_clock::time_point deadline_;

        SessionKeys keys_;
        std::unique_ptr<IMessageProtector> protector_;
        std::unique_ptr<SocketTimestamps> timestamps_;

        std::mutex readLock_;
        std::mutex writeLock_;
        FrameReader reader_;
        std::string remainder_;
        std::size_t remainderOffset_;
    };

    std::string_view toString(SecureSession::EState state);

}
