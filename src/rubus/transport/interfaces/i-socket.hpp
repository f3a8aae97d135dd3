#pragma once

// standard
#include <cstddef>
#include <chrono>
#include <memory>
#include <optional>
#include <string>


namespace rubus {

    // Blocking duplex byte stream. Every timeout argument of zero
    // means that call waits without deadline.
    class ISocket {
    public:
        using clock = std::chrono::system_clock;

        // Reads at most size bytes, returns number of bytes read (> 0).
        // Throws RubusTimeout if nothing arrived before deadline, RubusEndOfStream
        // if peer has closed the stream and RubusSocketError if socket is closed.
        virtual std::size_t read(char* dest, std::size_t size, std::chrono::milliseconds timeout) = 0;
        // Writes all bytes or throws.
        virtual void write(const char* src, std::size_t size) = 0;
        // Idempotent, only first call has effect.
        virtual void close() = 0;
        virtual bool isClosed() const = 0;

        virtual clock::time_point openTime() const = 0;
        virtual std::optional<clock::time_point> closeTime() const = 0;
        virtual std::optional<clock::time_point> lastReadTime() const = 0;
        virtual std::optional<clock::time_point> lastWriteTime() const = 0;

        // Identity of remote side, used in logs and for authentication.
        virtual std::string peer() const = 0;

        virtual ~ISocket() = default;
    };

    // Listening endpoint producing connected sockets.
    class IServerSocket {
    public:
        // Waits for next connection, throws RubusTimeout if none arrived in time.
        virtual std::shared_ptr<ISocket> accept(std::chrono::milliseconds timeout) = 0;
        virtual void close() = 0;
        virtual bool isClosed() const = 0;

        virtual ~IServerSocket() = default;
    };

}
