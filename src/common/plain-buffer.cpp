// std
#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>

// Abseil
#include <absl/strings/str_format.h>

#include "plain-buffer.hpp"

using namespace rubus;


PlainBuffer::PlainBuffer(std::size_t size, bool growable) 
: buffer_(std::make_unique<std::vector<char>>(size))
, wPos_(0)
, rPos_(0)
, growable_(growable)
{}

std::size_t PlainBuffer::writableSize() {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    return buffer_->size() - wPos_; 
}

std::size_t PlainBuffer::readableSize() {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    return wPos_ - rPos_;
}

std::size_t PlainBuffer::write(const char* src, std::size_t size) {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    if (growable_) {
        reserve(size);
    }

    std::size_t maxSize = writableSize();
    if (size > maxSize) {
        size = maxSize;
    }

    std::memcpy(buffer_->data() + wPos_, src, size);
    wPos_ += size;

    return size;
}

std::size_t PlainBuffer::read(char* dest, std::size_t size) {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    size = peek(dest, size);
    rPos_ += size;

    return size;
}

std::size_t PlainBuffer::peek(char* dest, std::size_t size) {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    std::size_t maxSize = readableSize();
    if (size > maxSize) {
        size = maxSize;
    }

    std::memcpy(dest, buffer_->data() + rPos_, size);

    return size;
}

std::size_t PlainBuffer::drop(std::size_t size) {
    return advance(EPosition::RPOS, size);
}

char* PlainBuffer::rPosition() {
    std::scoped_lock<std::recursive_mutex> locked(lock_);
    return buffer_->data() + rPos_;
}

char* PlainBuffer::wPosition() {
    std::scoped_lock<std::recursive_mutex> locked(lock_);
    return buffer_->data() + wPos_;
}

std::string_view PlainBuffer::view() {
    std::scoped_lock<std::recursive_mutex> locked(lock_);
    return std::string_view(buffer_->data() + rPos_, wPos_ - rPos_);
}

void PlainBuffer::reserve(std::size_t size) {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    if (writableSize() >= size) {
        return;
    }

    compact();
    if (writableSize() >= size) {
        return;
    }

    if (!growable_) {
        throw RubusOverrun(absl::StrFormat(
            "buffer of size %d cannot fit %d more bytes", buffer_->size(), size));
    }

    std::size_t required = wPos_ + size;
    buffer_->resize(std::max(required, buffer_->size() * 2));
}

std::size_t PlainBuffer::advance(EPosition position, std::size_t size) {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    std::size_t newPos = 0;
    std::size_t distance = 0;

    switch (position) {
        case EPosition::RPOS:
            newPos = std::min(wPos_, rPos_ + size);
            distance = newPos - rPos_;
            rPos_ = newPos;
            return distance;
        case EPosition::WPOS:
            newPos = std::min(buffer_->size(), wPos_ + size);
            distance = newPos - wPos_;
            wPos_ = newPos;
            return distance;
    }

    return 0;
}

void PlainBuffer::reset() {
    std::scoped_lock<std::recursive_mutex> locked(lock_);
    wPos_ = rPos_ = 0;
}

void PlainBuffer::shrink(std::size_t size) {
    std::scoped_lock<std::recursive_mutex> locked(lock_);

    compact();
    std::size_t target = std::max(size, wPos_);
    if (buffer_->size() <= target) {
        return;
    }

    auto shrunk = std::make_unique<std::vector<char>>(target);
    std::memcpy(shrunk->data(), buffer_->data(), wPos_);
    buffer_ = std::move(shrunk);
}

std::size_t PlainBuffer::capacity() {
    std::scoped_lock<std::recursive_mutex> locked(lock_);
    return buffer_->size();
}

void PlainBuffer::compact() {
    if (rPos_ == 0) {
        return;
    }

    std::size_t readable = wPos_ - rPos_;
    std::memmove(buffer_->data(), buffer_->data() + rPos_, readable);
    rPos_ = 0;
    wPos_ = readable;
}
