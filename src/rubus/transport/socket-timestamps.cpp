// standard
#include <algorithm>
#include <optional>
#include <chrono>
#include <mutex>

// local
#include "socket-timestamps.hpp"

using namespace rubus;


SocketTimestamps::SocketTimestamps()
: SocketTimestamps(clock::now())
{}

SocketTimestamps::SocketTimestamps(clock::time_point openTs)
: open_(openTs)
{}

SocketTimestamps::clock::time_point SocketTimestamps::monotonicNow(const std::optional<clock::time_point>& previous) const {
    // system clock may step back, recorded values must not
    auto now = std::max(clock::now(), open_);
    return (previous.has_value()) ? std::max(now, *previous) : now;
}

void SocketTimestamps::markRead() {
    std::unique_lock<std::mutex> locked(lock_);
    lastRead_ = monotonicNow(lastRead_);
}

void SocketTimestamps::markWrite() {
    std::unique_lock<std::mutex> locked(lock_);
    lastWrite_ = monotonicNow(lastWrite_);
}

bool SocketTimestamps::markClosed() {
    std::unique_lock<std::mutex> locked(lock_);
    if (close_.has_value()) {
        return false;
    }
    close_ = monotonicNow(std::max(lastRead_, lastWrite_));
    return true;
}

SocketTimestamps::clock::time_point SocketTimestamps::openTime() const {
    std::unique_lock<std::mutex> locked(lock_);
    return open_;
}

std::optional<SocketTimestamps::clock::time_point> SocketTimestamps::closeTime() const {
    std::unique_lock<std::mutex> locked(lock_);
    return close_;
}

std::optional<SocketTimestamps::clock::time_point> SocketTimestamps::lastReadTime() const {
    std::unique_lock<std::mutex> locked(lock_);
    return lastRead_;
}

std::optional<SocketTimestamps::clock::time_point> SocketTimestamps::lastWriteTime() const {
    std::unique_lock<std::mutex> locked(lock_);
    return lastWrite_;
}
