#pragma once

// sockpp
#include <sockpp/tcp_socket.h>
#include <sockpp/tcp_acceptor.h>

// standard
#include <cstdint>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

// local
#include "interfaces/i-socket.hpp"
#include "socket-timestamps.hpp"


namespace rubus {

    // ISocket over connected TCP stream.
    class TcpSocket 
        : public ISocket
        , public std::enable_shared_from_this<TcpSocket>
    {
    private: struct Private { };
    public:

        static std::shared_ptr<TcpSocket> configure(sockpp::tcp_socket socket);
        // Connects to remote endpoint, throws RubusSocketError or RubusTimeout.
        static std::shared_ptr<TcpSocket> connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

        TcpSocket(sockpp::tcp_socket socket, Private access);
        ~TcpSocket() override;

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

    private:
        std::atomic<bool> closed_;
        sockpp::tcp_socket socket_;
        SocketTimestamps timestamps_;
        std::string peer_;
    };

    // IServerSocket over TCP acceptor.
    class TcpServerSocket 
        : public IServerSocket
        , public std::enable_shared_from_this<TcpServerSocket>
    {
    private: struct Private { };
    public:

        struct Settings {
            std::string address = "0.0.0.0";
            std::uint16_t port = 0;
            int backlog = 64;
        };

        static std::shared_ptr<TcpServerSocket> configure(Settings settings);
        TcpServerSocket(Settings settings, Private access);
        ~TcpServerSocket() override;

        // Binds and starts listening, throws RubusSocketError.
        void init();
        // Actual bound port, differs from configured one if it was 0.
        std::uint16_t port() const;

        // IServerSocket implementation
        std::shared_ptr<ISocket> accept(std::chrono::milliseconds timeout) override;
        void close() override;
        bool isClosed() const override;

    private:
        Settings settings_;
        std::atomic<bool> initiated_;
        std::atomic<bool> closed_;
        sockpp::tcp_acceptor acc_;
    };

}
