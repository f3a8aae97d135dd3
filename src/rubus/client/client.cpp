// Abseil
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>

// plog
#include <plog/Severity.h>
#include <plog/Log.h>

// standard
#include <string_view>
#include <chrono>
#include <memory>
#include <string>
#include <mutex>

// rubus
#include <common/exceptions.hpp>
#include <common/plain-buffer.hpp>
#include <rubus/protocol/request.hpp>
#include <rubus/transport/tcp-socket.hpp>
#include <rubus/secure/crypto.hpp>
#include <rubus/secure/secure-session.hpp>

// local
#include "client.hpp"
#include "request-builder.hpp"

using namespace rubus;
using namespace std::chrono;


std::shared_ptr<Client> Client::configure(Settings settings) {
    return std::make_shared<Client>(std::move(settings), Private());
}

Client::Client(Settings settings, Private access)
: settings_(std::move(settings))
, secure_(false)
{}

void Client::connect() {
    std::unique_lock<std::mutex> locked(lock_);
    connectLocked();
}

void Client::connectLocked() {
    if (socket_ && !socket_->isClosed()) {
        return;
    }
    socket_.reset();
    secure_ = false;

    auto tcp = TcpSocket::connect(settings_.host, settings_.port, settings_.connectTimeout);
    PLOG(plog::debug) << "[client] connected to " << tcp->peer();

    if (!settings_.handshake) {
        socket_ = std::move(tcp);
        return;
    }

    if (!crypto_) {
        auto crypto = OpenSslCryptoProvider::configure({});
        if (auto status = crypto->init(); !status.ok()) {
            throw RubusCryptoError(std::string(status.message()));
        }
        crypto_ = std::move(crypto);
    }

    auto session = SecureSession::configure(tcp, crypto_, {
        .role = SecureSession::ERole::INITIATOR,
        .encryptionSupported = settings_.encryption,
        .handshakeTimeout = settings_.handshakeTimeout
    });

    try {
        session->handshake();
    } catch (const RubusHandshakeUnsupported& error) {
        if (!settings_.allowPlaintextFallback) {
            tcp->close();
            throw;
        }
        PLOG(plog::info) << "[client] continuing in plaintext: " << error.what();
        socket_ = std::move(tcp);
        return;
    } catch (const RubusException&) {
        tcp->close();
        throw;
    }

    PLOG(plog::debug) << "[client] secure session with " << session->peer() << " established";
    socket_ = std::move(session);
    secure_ = true;
}

bool Client::connected() {
    std::unique_lock<std::mutex> locked(lock_);
    return socket_ && !socket_->isClosed();
}

bool Client::secure() {
    std::unique_lock<std::mutex> locked(lock_);
    return socket_ && secure_;
}

void Client::close() {
    std::unique_lock<std::mutex> locked(lock_);
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}

Response Client::send(std::string_view request) {
    std::unique_lock<std::mutex> locked(lock_);
    connectLocked();

    std::string raw;
    try {
        socket_->write(request.data(), request.size());
        raw = receive(settings_.responseTimeout);
    } catch (const RubusException& error) {
        PLOG(plog::warning) << "[client] request failed, dropping connection: " << error.what();
        socket_->close();
        socket_.reset();
        throw;
    }

    auto response = Response::parse(raw);
    if (!response.ok()) {
        socket_->close();
        socket_.reset();
        throw RubusCorruptMessage(std::string(response.status().message()));
    }
    return *std::move(response);
}

std::string Client::receive(milliseconds timeout) {
    PlainBuffer buffer (NetworkBufferSize, true);
    auto deadline = steady_clock::now() + timeout;

    while (true) {
        if (auto size = completeMessageSize(buffer.view())) {
            return std::string(buffer.view().substr(0, *size));
        }

        auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (left.count() <= 0) {
            throw RubusTimeout(absl::StrFormat("no complete response in %dms", timeout.count()));
        }

        buffer.reserve(NetworkBufferSize);
        std::size_t received = socket_->read(buffer.wPosition(), buffer.writableSize(), left);
        buffer.advance(PlainBuffer::EPosition::WPOS, received);
    }
}

absl::StatusOr<NRubus::TMediaList> Client::list(std::string_view titleContains) {
    return send(RequestBuilder::list(titleContains)).decode<NRubus::TMediaList>();
}

absl::StatusOr<NRubus::TMediaInfo> Client::info(std::string_view mediaId) {
    return send(RequestBuilder::info(mediaId)).decode<NRubus::TMediaInfo>();
}

absl::StatusOr<NRubus::TFetchedPieces> Client::fetch(std::string_view mediaId, std::uint32_t firstPiece, std::uint32_t pieceCount) {
    return send(RequestBuilder::fetch(mediaId, firstPiece, pieceCount)).decode<NRubus::TFetchedPieces>();
}
