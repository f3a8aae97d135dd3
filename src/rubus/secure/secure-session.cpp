// Abseil
#include <absl/strings/str_format.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/numbers.h>
#include <absl/strings/match.h>
#include <absl/strings/strip.h>

// plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <string_view>
#include <exception>
#include <algorithm>
#include <cstring>
#include <optional>
#include <future>
#include <thread>
#include <chrono>
#include <memory>
#include <string>

// rubus
#include <common/exceptions.hpp>
#include <common/macros.hpp>
#include <rubus/macros.hpp>
#include <rubus/transport/framing.hpp>

// local
#include "secure-session.hpp"

using namespace rubus;
using namespace std::chrono;


namespace {

    constexpr std::string_view HelloPrefix = "hello\n";
    constexpr std::string_view SupportKey = "encryption-support:";

    std::string_view flag(bool value) {
        return (value) ? "true" : "false";
    }

}

std::shared_ptr<SecureSession> SecureSession::configure(
    std::shared_ptr<ISocket> socket, 
    std::shared_ptr<ICryptoProvider> crypto, 
    Settings settings) 
{
    RUBUS_ENSURE_NOT_NULL(socket);
    RUBUS_ENSURE_NOT_NULL(crypto);
    RUBUS_THROW_UNLESS(RubusBadInit, "responder supporting encryption needs certificate", 
        settings.role == ERole::INITIATOR || !settings.encryptionSupported || !settings.certificate.empty());

    return std::make_shared<SecureSession>(std::move(socket), std::move(crypto), std::move(settings), Private());
}

SecureSession::SecureSession(
    std::shared_ptr<ISocket> socket, 
    std::shared_ptr<ICryptoProvider> crypto, 
    Settings settings, 
    Private access)
: socket_(std::move(socket))
, crypto_(std::move(crypto))
, settings_(std::move(settings))
, state_(EState::IDLE)
, remainderOffset_(0)
{}

void SecureSession::handshake() {
    EState expected = EState::IDLE;
    if (!state_.compare_exchange_strong(expected, (settings_.role == ERole::INITIATOR) 
        ? EState::SENDING_HELLO : EState::AWAITING_PEER_HELLO)) 
    {
        throw RubusBadInit("handshake was already performed on this session");
    }

    auto timeout = settings_.handshakeTimeout;
    deadline_ = steady_clock::now() + timeout;

    std::promise<void> completion;
    auto result = completion.get_future();
    std::thread worker([this, &completion]() {
        try {
            runHandshake();
            completion.set_value();
        } catch (const std::exception&) {
            transition(EState::FAILED);
            completion.set_exception(std::current_exception());
        }
    });

    if (timeout.count() > 0 && result.wait_for(timeout) == std::future_status::timeout) {
        PLOG(plog::warning) 
            << "[secure] handshake with " << socket_->peer() << " exceeded " 
            << timeout.count() << "ms in state " << toString(state_) << ", closing socket";
        socket_->close();
        worker.join();
        transition(EState::FAILED);
        throw RubusTimeout(absl::StrFormat("handshake did not complete in %dms", timeout.count()));
    }

    worker.join();
    try {
        // rethrows error raised by handshake body
        result.get();
    } catch (const RubusTimeout&) {
        socket_->close();
        throw;
    }

    PLOG(plog::debug) << "[secure] session with " << socket_->peer() << " established";
}

void SecureSession::runHandshake() {
    if (settings_.role == ERole::INITIATOR) {
        initiate();
    } else {
        respond();
    }
}

void SecureSession::initiate() {
    sendFrame(*socket_, {makeHello(settings_.encryptionSupported)});

    transition(EState::AWAITING_PEER_HELLO);
    std::string reply = receiveFrame(*socket_, remaining());

    if (auto peerSupport = parseHello(reply); peerSupport.has_value()) {
        // responder answers with hello only when it refuses
        if (!*peerSupport || !settings_.encryptionSupported) {
            throw RubusHandshakeUnsupported(absl::StrFormat(
                "encryption refused: local support %s, peer support %s", flag(settings_.encryptionSupported), flag(*peerSupport)));
        }
        throw RubusCorruptHandshake("responder sent hello instead of certificate");
    }
    if (!settings_.encryptionSupported) {
        throw RubusHandshakeUnsupported("encryption is not supported locally");
    }

    transition(EState::SENDING_KEY_MATERIAL);
    std::string nonce = crypto_->randomBytes(NonceLength);
    std::string encrypted = crypto_->encryptForCertificate(reply, nonce);
    sendFrame(*socket_, {encrypted});

    establish(nonce);
}

void SecureSession::respond() {
    std::string hello = receiveFrame(*socket_, remaining());
    auto peerSupport = parseHello(hello);
    if (!peerSupport.has_value()) {
        throw RubusCorruptHandshake("first handshake message is not hello");
    }

    transition(EState::SENDING_HELLO);
    if (!*peerSupport || !settings_.encryptionSupported) {
        sendFrame(*socket_, {makeHello(false)});
        throw RubusHandshakeUnsupported(absl::StrFormat(
            "encryption refused: local support %s, peer support %s", flag(settings_.encryptionSupported), flag(*peerSupport)));
    }
    sendFrame(*socket_, {settings_.certificate});

    transition(EState::AWAITING_KEY_MATERIAL);
    std::string encrypted = receiveFrame(*socket_, remaining());
    std::string nonce = crypto_->decryptWithPrivateKey(encrypted);
    if (nonce.size() != NonceLength) {
        throw RubusCorruptHandshake(absl::StrFormat(
            "key material has %d bytes, expected %d", nonce.size(), NonceLength));
    }

    establish(nonce);
}

void SecureSession::establish(std::string_view nonce) {
    keys_ = SessionKeys{
        .cipherKey = std::string(nonce.substr(0, CipherKeyLength)),
        .macKey = std::string(nonce.substr(CipherKeyLength, MacKeyLength))
    };
    protector_ = crypto_->makeProtector(keys_);
    timestamps_ = std::make_unique<SocketTimestamps>();
    transition(EState::ESTABLISHED);
}

void SecureSession::transition(EState state) {
    EState previous = state_.exchange(state);
    if (previous != state) {
        PLOG(plog::verbose) 
            << "[secure] " << socket_->peer() << ": " 
            << toString(previous) << " -> " << toString(state);
    }
}

milliseconds SecureSession::remaining() const {
    if (settings_.handshakeTimeout.count() <= 0) {
        return milliseconds(0);
    }
    // reads must stay bounded, timeout branch closes socket anyway
    auto left = duration_cast<milliseconds>(deadline_ - steady_clock::now());
    return std::max(left, milliseconds(1));
}

void SecureSession::ensureEstablished() const {
    if (state_ != EState::ESTABLISHED) {
        throw RubusSocketError(absl::StrFormat("secure session is %s", toString(state_)));
    }
}

std::size_t SecureSession::drainRemainder(char* dest, std::size_t size) {
    std::size_t count = std::min(size, remainder_.size() - remainderOffset_);
    std::memcpy(dest, remainder_.data() + remainderOffset_, count);
    remainderOffset_ += count;

    if (remainderOffset_ == remainder_.size()) {
        remainder_.clear();
        remainderOffset_ = 0;
    }

    timestamps_->markRead();
    return count;
}

std::size_t SecureSession::read(char* dest, std::size_t size, milliseconds timeout) {
    ensureEstablished();
    std::unique_lock<std::mutex> locked(readLock_);

    if (!remainder_.empty()) {
        return drainRemainder(dest, size);
    }

    auto deadline = steady_clock::now() + timeout;
    do {
        milliseconds wait {0};
        if (timeout.count() > 0) {
            wait = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (wait.count() <= 0) {
                throw RubusTimeout("no encrypted message before deadline");
            }
        }

        std::string sealed = reader_.receive(*socket_, wait);
        try {
            remainder_ = protector_->open(sealed);
        } catch (const RubusCorruptMessage& error) {
            PLOG(plog::warning) << "[secure] dropping session with " << socket_->peer() << ": " << error.what();
            transition(EState::FAILED);
            throw;
        }
        remainderOffset_ = 0;
    } while (remainder_.empty());

    return drainRemainder(dest, size);
}

void SecureSession::write(const char* src, std::size_t size) {
    ensureEstablished();
    if (!size) {
        return;
    }

    std::unique_lock<std::mutex> locked(writeLock_);
    std::string sealed = protector_->seal(std::string_view(src, size));
    sendFrame(*socket_, {sealed});
    timestamps_->markWrite();
}

void SecureSession::close() {
    socket_->close();
}

bool SecureSession::isClosed() const {
    return socket_->isClosed();
}

ISocket::clock::time_point SecureSession::openTime() const {
    if (state_ == EState::ESTABLISHED && timestamps_) {
        return timestamps_->openTime();
    }
    return socket_->openTime();
}

std::optional<ISocket::clock::time_point> SecureSession::closeTime() const {
    return socket_->closeTime();
}

std::optional<ISocket::clock::time_point> SecureSession::lastReadTime() const {
    return (timestamps_) ? timestamps_->lastReadTime() : std::nullopt;
}

std::optional<ISocket::clock::time_point> SecureSession::lastWriteTime() const {
    return (timestamps_) ? timestamps_->lastWriteTime() : std::nullopt;
}

std::string SecureSession::peer() const {
    return socket_->peer();
}

SecureSession::EState SecureSession::state() const {
    return state_;
}

SecureSession::ERole SecureSession::role() const {
    return settings_.role;
}

const SessionKeys& SecureSession::keys() const {
    if (state_ != EState::ESTABLISHED) {
        throw RubusNoInit("session keys are available only after handshake");
    }
    return keys_;
}

std::shared_ptr<ISocket> SecureSession::underlying() const {
    return socket_;
}

std::string SecureSession::makeHello(bool encryptionSupported) {
    return absl::StrCat(HelloPrefix, SupportKey, flag(encryptionSupported), "\n");
}

std::optional<bool> SecureSession::parseHello(std::string_view payload) {
    if (!absl::StartsWith(payload, HelloPrefix)) {
        return std::nullopt;
    }

    for (std::string_view line : absl::StrSplit(payload.substr(HelloPrefix.size()), '\n')) {
        if (absl::ConsumePrefix(&line, SupportKey)) {
            bool supported = false;
            if (absl::SimpleAtob(absl::StripAsciiWhitespace(line), &supported)) {
                return supported;
            }
            break;
        }
    }

    // hello without readable flag counts as refusal
    return false;
}

std::string_view rubus::toString(SecureSession::EState state) {
    switch (state) {
        case SecureSession::EState::IDLE: return "IDLE";
        case SecureSession::EState::SENDING_HELLO: return "SENDING_HELLO";
        case SecureSession::EState::AWAITING_PEER_HELLO: return "AWAITING_PEER_HELLO";
        case SecureSession::EState::SENDING_KEY_MATERIAL: return "SENDING_KEY_MATERIAL";
        case SecureSession::EState::AWAITING_KEY_MATERIAL: return "AWAITING_KEY_MATERIAL";
        case SecureSession::EState::ESTABLISHED: return "ESTABLISHED";
        case SecureSession::EState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}
